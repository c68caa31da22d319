#include "network/bootstrap.hpp"
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <vector>
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string config_path;
  // Words of a one-shot command, empty for the interactive shell
  std::vector<std::string> command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -c <config.json> [command]\n"
        << "Required arguments:\n"
        << "  -c, --config  Path to the JSON configuration file\n"
        << "Optional one-shot commands:\n"
        << "  upload <file>\n"
        << "  download <file-id> <destination>\n"
        << "  search <file-id>\n"
        << "Example: " << program_name << " -c node1.json upload notes.txt\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> config_flags = {"-c", "--config"};

  ProgramOptions options;

  int i = 1;
  while (i < argc) {
    const std::string arg(argv[i]);

    if (config_flags.count(arg) > 0) {
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
      options.command.push_back(arg);
      ++i;
    }
  }

  if (options.config_path.empty()) {
    std::cerr << "Error: A configuration file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_node(const ProgramOptions& options) {
  peerchunks::config::NodeConfig config;
  try {
    config = peerchunks::config::load_config(options.config_path);
  } catch (const peerchunks::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }

  try {
    peerchunks::logger::init_logging(config.log_file, config.log_level, options.command.empty());

    peerchunks::network::Bootstrap node(config);
    peerchunks::cli::CLI cli(node);

    if (!node.start()) {
      std::cerr << "Error: Failed to start node\n";
      return false;
    }

    if (!options.command.empty()) {
      return cli.execute(options.command);
    }

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_node(options)) {
    return 1;
  }
  return 0;
}
