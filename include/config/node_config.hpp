#ifndef VAULT_CONFIG_NODE_CONFIG_HPP
#define VAULT_CONFIG_NODE_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace vault {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct NodeConfig {
  // ---- NODE IDENTITY AND STORAGE ----
  std::string node_id;
  std::string node_name;
  std::string base_path;                      // Storage root, must already exist
  std::string temp_dir_name = "tmp";          // Created under base_path

  // ---- LIMITS ----
  std::size_t max_concurrent_uploads = 16;
  std::size_t max_concurrent_downloads = 32;
  std::size_t chunk_size_bytes = 262144;
  std::size_t shard_symbol_count = 2;
  std::size_t shard_level_count = 2;
  std::size_t lock_pool_size = 20;

  // ---- TRANSPORT ----
  std::string listen_address = "0.0.0.0";
  std::uint16_t port = 5000;                  // 0 picks an ephemeral port
  std::size_t io_worker_threads = 4;          // Threads for blocking file work
  std::size_t max_frame_bytes = 16 * 1024 * 1024;

  // ---- LOGGING ----
  std::string log_file;                       // Empty logs to the console only
  std::string log_level = "info";

  // Throws ConfigError describing the first problem found. Creates the temp
  // directory and checks that it shares a device with base_path.
  void validate() const;
};

struct ProgramOptions {
  NodeConfig config;
  bool show_help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out = std::cerr);

// Reads "--flag value" pairs. Problems are reported on err and leave
// valid == false. Does not run NodeConfig::validate().
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err = std::cerr);

} // namespace config
} // namespace vault

#endif // VAULT_CONFIG_NODE_CONFIG_HPP
