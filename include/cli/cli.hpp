#pragma once

#include <optional>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "protocol/messages.hpp"

namespace blobdvm {
namespace cli {

struct ProgramOptions {
  std::string command;
  std::vector<std::string> arguments;
  std::string config_path;
  std::optional<std::string> server;
  std::optional<std::string> output;
  bool valid{false};
};

// Parses "<command> [args] [-c file] [--server id] [-o file]"
ProgramOptions parse_command_line(int argc, const char* const argv[]);
void print_usage(const std::string& program_name);

class CLI {
public:
  // ---- CONSTRUCTOR ----
  explicit CLI(config::Config config);


  // ---- STARTUP ----
  // Executes the command, returns the process exit status
  int run(const ProgramOptions& options);

private:
  // ---- PARAMETERS ----
  config::Config config_;


  // ---- COMMAND PROCESSING ----
  int handle_relay_command();
  int handle_serve_command();
  int handle_upload_command(const std::string& path, const std::optional<std::string>& server);
  int handle_download_command(const std::string& hash, const std::optional<std::string>& output,
                              const std::optional<std::string>& server);
  int handle_delete_command(const std::string& hash, const std::optional<std::string>& server);
  int handle_list_servers_command();
  void log_and_display_error(const std::string& message, const std::string& error);

  // Blocks until SIGINT or SIGTERM
  static void wait_for_termination();
  static void print_announcement(const protocol::ServerAnnouncement& announcement);
};

} // namespace cli
} // namespace blobdvm
