#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace peerchunks {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(network::Bootstrap& node, std::istream& input, std::ostream& output)
  : running_(false)
  , node_(node)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  output_ << "PeerChunks> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::vector<std::string> args;
    std::string word;
    while (iss >> word) {
      args.push_back(word);
    }

    if (!args.empty() && (args[0] == "quit" || args[0] == "exit")) {
      running_ = false;
      continue;
    }

    if (!args.empty()) {
      execute(args);
    }

    if (running_) {
      output_ << "PeerChunks> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::execute(const std::vector<std::string>& args) {
  if (args.empty()) {
    return false;
  }

  const std::string& command = args[0];
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() - 1 << " arguments";

  if (command == "upload" && args.size() == 2) {
    return handle_upload_command(args[1]);
  }
  else if (command == "download" && args.size() == 3) {
    return handle_download_command(args[1], args[2]);
  }
  else if (command == "search" && args.size() == 2) {
    return handle_search_command(args[1]);
  }
  else if (command == "connect" && args.size() == 2) {
    return handle_connect_command(args[1]);
  }
  else if (command == "peers" && args.size() == 1) {
    handle_peers_command();
    return true;
  }
  else if (command == "help" && args.size() == 1) {
    handle_help_command();
    return true;
  }

  output_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  return false;
}

bool CLI::handle_upload_command(const std::string& file_path) {
  try {
    file_server::UploadResult result = node_.get_file_server().upload(file_path);
    output_ << "Uploaded " << file_path << " as " << store::to_string(result.file_id)
            << " (" << result.chunk_count << " chunks)" << std::endl;
    if (!result.replicated) {
      output_ << "Replication incomplete: " << result.replication_error << std::endl;
    }
    return true;
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what());
    return false;
  }
}

bool CLI::handle_download_command(const std::string& file_id, const std::string& destination) {
  try {
    node_.get_file_server().download(file_id, destination);
    output_ << "Downloaded " << file_id << " to " << destination << std::endl;
    return true;
  } catch (const std::exception& e) {
    log_and_display_error("Error downloading file", e.what());
    return false;
  }
}

bool CLI::handle_search_command(const std::string& file_id) {
  std::vector<std::string> addresses = node_.get_file_server().search(file_id);
  if (addresses.empty()) {
    output_ << "No peers found for " << file_id << std::endl;
    return false;
  }

  output_ << "File " << file_id << " is held by:" << std::endl;
  for (const auto& address : addresses) {
    output_ << "  " << address << std::endl;
  }
  return true;
}

bool CLI::handle_connect_command(const std::string& address) {
  if (!network::split_address(address)) {
    output_ << "Invalid format. Usage: connect host:port (e.g., connect 127.0.0.1:3002)" << std::endl;
    return false;
  }

  bool success = node_.connect(address);
  output_ << (success ? "Successfully connected to " : "Failed to connect to ") << address << std::endl;
  return success;
}

void CLI::handle_peers_command() {
  output_ << "Known peers:" << std::endl;
  for (const auto& peer : node_.get_peer_manager().known_peers()) {
    output_ << "  " << peer.address << std::endl;
  }

  output_ << "Open sessions:" << std::endl;
  for (const auto& address : node_.get_peer_manager().session_addresses()) {
    output_ << "  " << address << std::endl;
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                    Display this help message" << std::endl;
  output_ << "  upload <file>           Split, store and replicate <file>" << std::endl;
  output_ << "  download <id> <dest>    Reassemble file <id> into <dest>" << std::endl;
  output_ << "  search <id>             List peers holding file <id>" << std::endl;
  output_ << "  connect <host:port>     Connect to the peer at <host:port>" << std::endl;
  output_ << "  peers                   List known peers and open sessions" << std::endl;
  output_ << "  quit, exit              Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace peerchunks
