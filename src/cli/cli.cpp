#include "cli/cli.hpp"
#include "client/blob_client.hpp"
#include "server/blob_server.hpp"
#include "transport/relay_server.hpp"
#include "transport/relay_transport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>

namespace blobdvm {
namespace cli {

namespace {

// Number of positional arguments each command takes
const std::map<std::string, std::size_t> COMMANDS = {
  {"relay", 0},
  {"serve", 0},
  {"upload", 1},
  {"download", 1},
  {"delete", 1},
  {"list-servers", 0}
};

bool read_file(const std::string& path, std::string& contents) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  contents.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return !file.bad();
}

std::string basename_of(const std::string& path) {
  auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace


//==============================================
// ARGUMENT PARSING
//==============================================

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " <command> [arguments] [options]\n"
            << "Commands:\n"
            << "  relay                     Run a message relay\n"
            << "  serve                     Run a blob storage server\n"
            << "  upload <file>             Store a file, prints its hash\n"
            << "  download <hash>           Retrieve a file by hash\n"
            << "  delete <hash>             Delete a stored file\n"
            << "  list-servers              List announced storage servers\n"
            << "Options:\n"
            << "  -c, --config <file>       YAML configuration file\n"
            << "  --server <identity>       Target server (default: first discovered)\n"
            << "  -o, --output <file>       Output file for download (default: <hash>)\n"
            << "Example: " << program_name << " upload photo.jpg -c blobdvm.yaml\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "blobdvm";

  if (argc < 2) {
    print_usage(program_name);
    return options;
  }

  options.command = argv[1];
  auto command = COMMANDS.find(options.command);
  if (command == COMMANDS.end()) {
    std::cerr << "Error: Unknown command: " << options.command << '\n';
    print_usage(program_name);
    return options;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg(argv[i]);
    const bool takes_value = arg == "-c" || arg == "--config" || arg == "--server" ||
                             arg == "-o" || arg == "--output";

    if (takes_value) {
      if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << arg << '\n';
        print_usage(program_name);
        return options;
      }
      const std::string value(argv[++i]);
      if (arg == "-c" || arg == "--config") {
        options.config_path = value;
      } else if (arg == "--server") {
        options.server = value;
      } else {
        options.output = value;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown argument: " << arg << '\n';
      print_usage(program_name);
      return options;
    } else {
      options.arguments.push_back(arg);
    }
  }

  if (options.arguments.size() != command->second) {
    std::cerr << "Error: " << options.command << " expects " << command->second << " argument(s)\n";
    print_usage(program_name);
    return options;
  }

  options.valid = true;
  return options;
}


//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(config::Config config)
  : config_(std::move(config)) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const ProgramOptions& options) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Running command " << options.command;

  try {
    if (options.command == "relay") {
      return handle_relay_command();
    }
    if (options.command == "serve") {
      return handle_serve_command();
    }
    if (options.command == "upload") {
      return handle_upload_command(options.arguments.at(0), options.server);
    }
    if (options.command == "download") {
      return handle_download_command(options.arguments.at(0), options.output, options.server);
    }
    if (options.command == "delete") {
      return handle_delete_command(options.arguments.at(0), options.server);
    }
    if (options.command == "list-servers") {
      return handle_list_servers_command();
    }
  } catch (const std::exception& e) {
    log_and_display_error(options.command + " failed", e.what());
    return 1;
  }

  std::cout << "Unknown command: " << options.command << std::endl;
  return 1;
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::handle_relay_command() {
  transport::RelayServer relay(config_.transport.relay_host, config_.transport.relay_port);
  if (!relay.start()) {
    std::cerr << "Error: Failed to start relay on " << config_.transport.relay_host << ":"
              << config_.transport.relay_port << std::endl;
    return 1;
  }

  std::cout << "Relay listening on " << config_.transport.relay_host << ":" << relay.port() << std::endl;
  wait_for_termination();
  relay.shutdown();
  return 0;
}

int CLI::handle_serve_command() {
  transport::RelayTransport transport(config_.transport.relay_host, config_.transport.relay_port);
  transport.connect();

  server::BlobServer server(transport, config_.storage, config_.server);
  server.start();

  std::cout << "Serving with identity " << server.identity() << std::endl;
  wait_for_termination();
  server.stop();
  transport.close();
  return 0;
}

int CLI::handle_upload_command(const std::string& path, const std::optional<std::string>& server) {
  std::string contents;
  if (!read_file(path, contents)) {
    std::cerr << "Error opening file: " << path << std::endl;
    return 1;
  }

  transport::RelayTransport transport(config_.transport.relay_host, config_.transport.relay_port);
  transport.connect();
  client::BlobClient client(transport, config_.client);

  std::cout << "Uploading " << path << " (" << contents.size() << " bytes)..." << std::endl;
  client::StoreReceipt receipt = client.store(contents, basename_of(path), server);

  std::cout << "File stored successfully\n"
            << "  Hash: " << crypto::to_hex(receipt.hash) << "\n"
            << "  Size: " << receipt.size << " bytes\n"
            << "  Chunks: " << receipt.chunk_count << "\n"
            << "  Expires: " << receipt.expires_at << " (unix time)\n"
            << "  Server: " << receipt.server << std::endl;
  return 0;
}

int CLI::handle_download_command(const std::string& hash, const std::optional<std::string>& output,
                                 const std::optional<std::string>& server) {
  transport::RelayTransport transport(config_.transport.relay_host, config_.transport.relay_port);
  transport.connect();
  client::BlobClient client(transport, config_.client);

  std::cout << "Downloading " << hash << "..." << std::endl;
  std::string contents = client.retrieve(hash, server);

  const std::string path = output.value_or(hash);
  std::ofstream file(path, std::ios::binary);
  if (!file || !file.write(contents.data(), static_cast<std::streamsize>(contents.size()))) {
    std::cerr << "Error writing file: " << path << std::endl;
    return 1;
  }

  std::cout << "Downloaded " << contents.size() << " bytes to " << path << std::endl;
  return 0;
}

int CLI::handle_delete_command(const std::string& hash, const std::optional<std::string>& server) {
  transport::RelayTransport transport(config_.transport.relay_host, config_.transport.relay_port);
  transport.connect();
  client::BlobClient client(transport, config_.client);

  client.remove(hash, server);
  std::cout << "File deleted successfully" << std::endl;
  return 0;
}

int CLI::handle_list_servers_command() {
  transport::RelayTransport transport(config_.transport.relay_host, config_.transport.relay_port);
  transport.connect();
  client::BlobClient client(transport, config_.client);

  std::cout << "Discovering BlobDVM servers..." << std::endl;
  auto servers = client.discover_servers();
  if (servers.empty()) {
    std::cout << "No servers found" << std::endl;
    return 0;
  }

  std::cout << "\nFound " << servers.size() << " server(s):\n" << std::endl;
  for (const auto& announcement : servers) {
    print_announcement(announcement);
  }
  return 0;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  std::cerr << "Error: " << message << ": " << error << std::endl;
}


//==============================================
// HELPERS
//==============================================

void CLI::wait_for_termination() {
  boost::asio::io_context io_context;
  boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(info) << "CLI: Received signal " << signal_number << ", shutting down";
    }
  });
  io_context.run();
}

void CLI::print_announcement(const protocol::ServerAnnouncement& announcement) {
  std::cout << "Server: " << announcement.identity << "\n";
  if (!announcement.name.empty()) {
    std::cout << "  Name: " << announcement.name << "\n";
  }
  if (!announcement.about.empty()) {
    std::cout << "  About: " << announcement.about << "\n";
  }
  std::cout << std::fixed << std::setprecision(1)
            << "  Max file size: " << announcement.max_file_size / (1024.0 * 1024.0) << " MB\n"
            << std::setprecision(0)
            << "  Chunk size: " << announcement.chunk_size / 1024.0 << " KB\n"
            << "  Retention: " << announcement.retention_seconds / 3600 << " hours\n"
            << std::endl;
}

} // namespace cli
} // namespace blobdvm
