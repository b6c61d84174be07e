#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "client/keystore.hpp"
#include "client/transfer_client.hpp"

namespace pcloud {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR ----
    CLI(client::KeyStore& keystore, client::TransferClient& transfer, std::ostream& out, std::ostream& err);


    // ---- EXECUTION ----
    // Runs one command (name followed by its arguments) and returns the process exit status
    int run(const std::vector<std::string>& args);

    static void print_help(std::ostream& out);

private:
    // ---- PARAMETERS ----
    client::KeyStore& keystore_;
    client::TransferClient& transfer_;
    std::ostream& out_;
    std::ostream& err_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& params);
    void handle_regenerate_keys_command();
    void handle_push_command(const std::string& path);
    void handle_pull_command(const std::string& filename);
    void handle_pubkey_command();
    int log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace pcloud
