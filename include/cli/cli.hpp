#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "network/bootstrap.hpp"

namespace peerchunks {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(network::Bootstrap& node, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Interactive loop until quit, exit or end of input
    void run();
    // Runs a single command given as words, true on success
    bool execute(const std::vector<std::string>& args);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    network::Bootstrap& node_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    bool handle_upload_command(const std::string& file_path);
    bool handle_download_command(const std::string& file_id, const std::string& destination);
    bool handle_search_command(const std::string& file_id);
    bool handle_connect_command(const std::string& address);
    void handle_peers_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace peerchunks
