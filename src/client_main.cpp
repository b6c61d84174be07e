#include <iostream>
#include <string>
#include <vector>
#include "cli/cli.hpp"
#include "client/api.hpp"
#include "client/keystore.hpp"
#include "client/transfer_client.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"

struct ProgramOptions {
  std::string config_path{"client_config.json"};
  std::vector<std::string> command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config>] <command> [args]\n"
        << "Optional arguments:\n"
        << "  -c, --config  Client configuration file (default client_config.json)\n"
        << "Run '" << program_name << " help' for the list of commands\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  int i = 1;
  while (i < argc) {
    const std::string arg(argv[i]);
    if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << arg << '\n';
        print_usage(argv[0]);
        return options;
      }
      options.config_path = argv[i + 1];
      i += 2;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown argument: " << arg << '\n';
      print_usage(argv[0]);
      return options;
    } else {
      break;
    }
  }

  options.command.assign(argv + i, argv + argc);
  if (options.command.empty()) {
    std::cerr << "Error: A command is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

int run_client(const ProgramOptions& options) {
  // help works without a configuration file
  if (options.command.size() == 1 && options.command.front() == "help") {
    pcloud::cli::CLI::print_help(std::cout);
    return 0;
  }

  try {
    auto config = pcloud::config::load_client_config(options.config_path);
    pcloud::logger::init(config.log, std::cerr);

    pcloud::client::FileKeyStore keystore(config.key_path);
    pcloud::client::HttpClient api(config.server);
    pcloud::client::TransferClient transfer(api, keystore, config.download_dir, std::cout);
    pcloud::cli::CLI cli(keystore, transfer, std::cout, std::cerr);

    return cli.run(options.command);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  return run_client(options);
}
