#include "cli/cli.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "protocol/signed_request.hpp"

namespace pcloud {
namespace cli {

namespace {

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(client::KeyStore& keystore, client::TransferClient& transfer, std::ostream& out, std::ostream& err)
  : keystore_(keystore)
  , transfer_(transfer)
  , out_(out)
  , err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// EXECUTION
//==============================================

int CLI::run(const std::vector<std::string>& args) {
  if (args.empty()) {
    print_help(err_);
    return 1;
  }

  const std::string& command = args.front();
  std::vector<std::string> params(args.begin() + 1, args.end());

  try {
    process_command(command, params);
    return 0;
  } catch (const UsageError& e) {
    err_ << e.what() << std::endl;
    print_help(err_);
    return 1;
  } catch (const std::exception& e) {
    return log_and_display_error("Error running " + command, e.what());
  }
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& params) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << params.size() << " argument(s)";

  if (command == "help" && params.empty()) {
    print_help(out_);
  }
  else if (command == "regenerate-keys" && params.empty()) {
    handle_regenerate_keys_command();
  }
  else if (command == "pubkey" && params.empty()) {
    handle_pubkey_command();
  }
  else if (command == "push" && params.size() == 1) {
    handle_push_command(params[0]);
  }
  else if (command == "pull" && params.size() == 1) {
    handle_pull_command(params[0]);
  }
  else {
    throw UsageError("Unknown command or invalid arguments: " + command);
  }
}

void CLI::handle_regenerate_keys_command() {
  keystore_.regenerate_keypair();
  auto key = keystore_.get_signing_key();
  out_ << "Generated a new keypair" << std::endl;
  out_ << "Public key: " << protocol::encode_pubkey(key.verifying_key()) << std::endl;
}

void CLI::handle_push_command(const std::string& path) {
  transfer_.push(path);
}

void CLI::handle_pull_command(const std::string& filename) {
  transfer_.pull(filename);
}

void CLI::handle_pubkey_command() {
  auto key = keystore_.get_signing_key();
  out_ << protocol::encode_pubkey(key.verifying_key()) << std::endl;
}

void CLI::print_help(std::ostream& out) {
  out << "Usage: pcloud [-c <config>] <command>" << std::endl;
  out << "Available commands:" << std::endl;
  out << "  help               Display this help message" << std::endl;
  out << "  regenerate-keys    Create a new identity, replacing the current one" << std::endl;
  out << "  pubkey             Print the current identity" << std::endl;
  out << "  push <path>        Upload local <path> under its file name" << std::endl;
  out << "  pull <filename>    Download <filename> into the download directory" << std::endl;
}

int CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  err_ << message << ": " << error << std::endl;
  return 1;
}

} // namespace cli
} // namespace pcloud
