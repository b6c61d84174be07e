#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "server/http_server.hpp"
#include "store/store.hpp"

struct ProgramOptions {
  std::string config_path{"server_config.json"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config>]\n"
        << "Optional arguments:\n"
        << "  -c, --config  Server configuration file (default server_config.json)\n"
        << "Example: " << program_name << " -c /etc/pcloud/server_config.json\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);

    if (flag != "-c" && flag != "--config") {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    options.config_path = argv[i + 1];
  }

  options.valid = true;
  return options;
}

bool run_server(const std::string& config_path) {
  try {
    auto config = pcloud::config::load_server_config(config_path);
    pcloud::logger::init(config.log);

    pcloud::store::Store store(config.storage_path, config.scratch_path);
    pcloud::server::HttpServer server(config, store);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start server on " << config.listen_addr.host << ":"
                << config.listen_addr.port << '\n';
      return false;
    }

    // Block until SIGINT or SIGTERM, then drain and stop
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", shutting down";
      }
    });
    signal_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start server: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_server(options.config_path)) {
    return 1;
  }
  return 0;
}
