#include "config/node_config.hpp"
#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <limits>
#include <system_error>
#include <unordered_map>
#include <sys/stat.h>

namespace vault {
namespace config {

namespace {

using Setter = std::function<void(NodeConfig&, const std::string&)>;

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

std::size_t parse_count(const std::string& flag, const std::string& value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                    [](unsigned char c) { return std::isdigit(c); })) {
    throw ConfigError("Invalid number for " + flag + ": " + value);
  }
  try {
    return static_cast<std::size_t>(std::stoull(value));
  }
  catch (const std::out_of_range&) {
    throw ConfigError("Number out of range for " + flag + ": " + value);
  }
}

std::uint16_t parse_port(const std::string& flag, const std::string& value) {
  std::size_t port = parse_count(flag, value);
  if (port > std::numeric_limits<std::uint16_t>::max()) {
    throw ConfigError("Invalid port number: " + value);
  }
  return static_cast<std::uint16_t>(port);
}

const std::unordered_map<std::string, Setter>& flag_map() {
  static const std::unordered_map<std::string, Setter> flags = {
    {"--node-id",       [](NodeConfig& c, const std::string& v) { c.node_id = v; }},
    {"--node-name",     [](NodeConfig& c, const std::string& v) { c.node_name = v; }},
    {"--base-path",     [](NodeConfig& c, const std::string& v) { c.base_path = v; }},
    {"--temp-dir",      [](NodeConfig& c, const std::string& v) { c.temp_dir_name = v; }},
    {"--max-uploads",   [](NodeConfig& c, const std::string& v) { c.max_concurrent_uploads = parse_count("--max-uploads", v); }},
    {"--max-downloads", [](NodeConfig& c, const std::string& v) { c.max_concurrent_downloads = parse_count("--max-downloads", v); }},
    {"--chunk-size",    [](NodeConfig& c, const std::string& v) { c.chunk_size_bytes = parse_count("--chunk-size", v); }},
    {"--shard-symbols", [](NodeConfig& c, const std::string& v) { c.shard_symbol_count = parse_count("--shard-symbols", v); }},
    {"--shard-levels",  [](NodeConfig& c, const std::string& v) { c.shard_level_count = parse_count("--shard-levels", v); }},
    {"--lock-pool",     [](NodeConfig& c, const std::string& v) { c.lock_pool_size = parse_count("--lock-pool", v); }},
    {"--listen",        [](NodeConfig& c, const std::string& v) { c.listen_address = v; }},
    {"-p",              [](NodeConfig& c, const std::string& v) { c.port = parse_port("-p", v); }},
    {"--port",          [](NodeConfig& c, const std::string& v) { c.port = parse_port("--port", v); }},
    {"--io-threads",    [](NodeConfig& c, const std::string& v) { c.io_worker_threads = parse_count("--io-threads", v); }},
    {"--max-frame",     [](NodeConfig& c, const std::string& v) { c.max_frame_bytes = parse_count("--max-frame", v); }},
    {"--log-file",      [](NodeConfig& c, const std::string& v) { c.log_file = v; }},
    {"--log-level",     [](NodeConfig& c, const std::string& v) { c.log_level = v; }}
  };
  return flags;
}

void require_positive(std::size_t value, const std::string& name) {
  if (value == 0) {
    throw ConfigError(name + " must be positive");
  }
}

} // namespace

//==============================================
// VALIDATION
//==============================================

void NodeConfig::validate() const {
  if (is_blank(node_id)) {
    throw ConfigError("NodeId is required");
  }
  if (is_blank(node_name)) {
    throw ConfigError("NodeName is required");
  }
  if (is_blank(base_path)) {
    throw ConfigError("BasePath is required");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(base_path, ec)) {
    throw ConfigError("BasePath does not exist: " + base_path);
  }

  require_positive(max_concurrent_uploads, "MaxConcurrentUploads");
  require_positive(max_concurrent_downloads, "MaxConcurrentDownloads");
  require_positive(chunk_size_bytes, "ChunkSizeBytes");
  require_positive(shard_symbol_count, "ShardSymbolCount");
  require_positive(shard_level_count, "ShardLevelCount");
  require_positive(io_worker_threads, "IoWorkerThreads");
  require_positive(max_frame_bytes, "MaxFrameBytes");

  if (chunk_size_bytes > max_frame_bytes) {
    throw ConfigError("ChunkSizeBytes must not exceed MaxFrameBytes");
  }

  logging::severity_level level;
  if (!logging::parse_severity(log_level, level)) {
    throw ConfigError("Unknown log level: " + log_level);
  }

  std::filesystem::path temp_name(temp_dir_name);
  if (is_blank(temp_dir_name) || temp_name.is_absolute() || temp_name.has_parent_path() ||
      temp_name == "." || temp_name == "..") {
    throw ConfigError("TempDirName must be a single directory name: " + temp_dir_name);
  }

  auto temp_path = std::filesystem::path(base_path) / temp_name;
  std::filesystem::create_directories(temp_path, ec);
  if (ec) {
    throw ConfigError("Failed to create temp directory " + temp_path.string() + ": " + ec.message());
  }

  // The final rename is only atomic within one filesystem
  struct stat base_info {};
  struct stat temp_info {};
  if (::stat(base_path.c_str(), &base_info) != 0 || ::stat(temp_path.c_str(), &temp_info) != 0) {
    throw ConfigError("Failed to stat " + base_path + " or its temp directory");
  }
  if (base_info.st_dev != temp_info.st_dev) {
    throw ConfigError("Temp directory " + temp_path.string() + " is not on the same device as BasePath");
  }
}


//==============================================
// COMMAND LINE
//==============================================

void print_usage(const std::string& program_name, std::ostream& out) {
  NodeConfig defaults;
  out << "Usage: " << program_name << " --node-id <id> --node-name <name> --base-path <dir> [options]\n"
      << "Required arguments:\n"
      << "  --node-id        Unique identifier for this node\n"
      << "  --node-name      Human-readable node name\n"
      << "  --base-path      Existing storage root directory\n"
      << "Options:\n"
      << "  --temp-dir       Temp directory name under the base path (default " << defaults.temp_dir_name << ")\n"
      << "  --max-uploads    Concurrent upload limit (default " << defaults.max_concurrent_uploads << ")\n"
      << "  --max-downloads  Concurrent download limit (default " << defaults.max_concurrent_downloads << ")\n"
      << "  --chunk-size     Download chunk size in bytes (default " << defaults.chunk_size_bytes << ")\n"
      << "  --shard-symbols  Hex characters per shard directory (default " << defaults.shard_symbol_count << ")\n"
      << "  --shard-levels   Number of shard directory levels (default " << defaults.shard_level_count << ")\n"
      << "  --lock-pool      Reusable per-object lock entries (default " << defaults.lock_pool_size << ")\n"
      << "  --listen         Listen address (default " << defaults.listen_address << ")\n"
      << "  -p, --port       Listen port (default " << defaults.port << ")\n"
      << "  --io-threads     Threads for blocking file work (default " << defaults.io_worker_threads << ")\n"
      << "  --max-frame      Largest accepted frame in bytes (default " << defaults.max_frame_bytes << ")\n"
      << "  --log-file       Also log to this file, rotated at 10 MiB\n"
      << "  --log-level      trace, debug, info, warning, error or fatal (default " << defaults.log_level << ")\n"
      << "  -h, --help       Show this message\n"
      << "Example: " << program_name << " --node-id node-1 --node-name alpha --base-path /srv/vault -p 5000\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "vault_node";
  const auto& flags = flag_map();

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-h" || flag == "--help") {
      options.show_help = true;
      return options;
    }

    auto it = flags.find(flag);
    if (it == flags.end()) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    try {
      it->second(options.config, argv[++i]);
    }
    catch (const ConfigError& e) {
      err << "Error: " << e.what() << '\n';
      print_usage(program_name, err);
      return options;
    }
  }

  if (options.config.node_id.empty() || options.config.node_name.empty() || options.config.base_path.empty()) {
    err << "Error: --node-id, --node-name and --base-path are required\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace vault
