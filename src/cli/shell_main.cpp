#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "rpc/node_client.hpp"
#include <cstddef>
#include <iostream>
#include <string>
#include <unordered_map>
#include <boost/log/trivial.hpp>

struct ShellOptions {
  std::string host;
  uint16_t port{0};
  std::size_t chunk_size{vault::rpc::NodeClient::DEFAULT_CHUNK_SIZE};
  std::string log_level{"warning"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -h <host> -p <port> [options]\n"
            << "Required arguments:\n"
            << "  -h, --host      Node host address\n"
            << "  -p, --port      Node port number\n"
            << "Optional arguments:\n"
            << "  --chunk-size    Upload chunk size in bytes (default 1048576)\n"
            << "  --log-level     Console log level (default warning)\n"
            << "Example: " << program_name << " -h 127.0.0.1 -p 5000\n";
}

bool parse_number(const std::string& text, unsigned long long max, unsigned long long& value) {
  if (text.empty() || text.size() > 19 ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  value = std::stoull(text);
  return value > 0 && value <= max;
}

ShellOptions parse_command_line(int argc, char* argv[]) {
  ShellOptions options;
  std::string port_str;
  std::string chunk_str;

  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-h", &options.host},
    {"--host", &options.host},
    {"-p", &port_str},
    {"--port", &port_str},
    {"--chunk-size", &chunk_str},
    {"--log-level", &options.log_level}
  };

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    *it->second = argv[i + 1];
  }

  unsigned long long number = 0;
  if (!parse_number(port_str, 65535, number)) {
    std::cerr << "Error: Invalid port number\n";
    print_usage(argv[0]);
    return options;
  }
  options.port = static_cast<uint16_t>(number);

  if (!chunk_str.empty()) {
    if (!parse_number(chunk_str, vault::rpc::DEFAULT_MAX_FRAME_BYTES, number)) {
      std::cerr << "Error: Invalid chunk size\n";
      print_usage(argv[0]);
      return options;
    }
    options.chunk_size = static_cast<std::size_t>(number);
  }

  if (options.host.empty()) {
    std::cerr << "Error: Both host and port are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

int main(int argc, char* argv[]) {
  const ShellOptions options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  vault::logging::severity_level level = vault::logging::severity_level::warning;
  if (!vault::logging::parse_severity(options.log_level, level)) {
    std::cerr << "Error: Unknown log level: " << options.log_level << '\n';
    return 1;
  }
  vault::logging::init_logging("", level);

  try {
    vault::rpc::NodeClient client(options.host, options.port);
    vault::cli::CLI cli(client, options.chunk_size);
    cli.run();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Shell: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
