#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>

bool load_settings(const std::string& config_path, blobdvm::config::Config& config) {
  try {
    if (!config_path.empty()) {
      config = blobdvm::config::load_config(config_path);
    } else {
      config.validate();
    }
    blobdvm::logger::init_logging(config.logging.file,
                                  blobdvm::logger::parse_severity(config.logging.level),
                                  config.logging.console);
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = blobdvm::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  blobdvm::config::Config config;
  if (!load_settings(options.config_path, config)) {
    return 1;
  }

  blobdvm::cli::CLI cli(config);
  int status = cli.run(options);
  blobdvm::logger::shutdown_logging();
  return status;
}
