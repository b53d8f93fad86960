#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "node/status.hpp"
#include "node/timestamp.hpp"

namespace vault {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(rpc::NodeClient& client, std::size_t chunk_size)
  : client_(client)
  , chunk_size_(chunk_size)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run(std::istream& input, std::ostream& output) {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output << "vault> " << std::flush;

  while (running_ && std::getline(input, line)) {
    running_ = execute(line, output);
    if (running_) {
      output << "vault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line, std::ostream& output) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, args, output);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args,
                          std::ostream& output) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size()
                           << " argument(s)";

  if (command == "upload" && (args.size() == 2 || args.size() == 3)) {
    handle_upload_command(args, output);
  }
  else if (command == "download" && args.size() == 2) {
    handle_download_command(args[0], args[1], output);
  }
  else if (command == "fetch" && args.size() == 2) {
    handle_fetch_command(args[0], args[1], output);
  }
  else if (command == "delete" && args.size() == 1) {
    node::ObjectTarget target;
    target.object_id = args[0];
    handle_delete_command(target, output);
  }
  else if (command == "delete-path" && args.size() == 1) {
    node::ObjectTarget target;
    target.final_path = args[0];
    handle_delete_command(target, output);
  }
  else if (command == "health" && args.empty()) {
    handle_health_command(output);
  }
  else if (command == "help" && args.empty()) {
    handle_help_command(output);
  }
  else {
    output << "Unknown command or invalid arguments. Type 'help' for usage." << std::endl;
  }
}

void CLI::handle_upload_command(const std::vector<std::string>& args, std::ostream& output) {
  const std::string& local_file = args[1];
  std::ifstream file(local_file, std::ios::binary);
  if (!file) {
    output << "Error opening file: " << local_file << std::endl;
    return;
  }

  node::UploadMetadata metadata;
  metadata.object_id = args[0];
  metadata.created_at_utc = node::current_created_at();
  metadata.original_filename = std::filesystem::path(local_file).filename().string();
  if (args.size() == 3) {
    metadata.content_type = args[2];
  }

  try {
    node::UploadResult result = client_.upload(metadata, file, chunk_size_);
    if (result.success) {
      output << "Stored " << result.size << " bytes at " << result.final_path << std::endl;
      output << "SHA-256: " << result.checksum << std::endl;
    } else {
      output << "Upload rejected: " << result.error << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what(), output);
  }
}

void CLI::handle_download_command(const std::string& object_id, const std::string& local_file,
                                  std::ostream& output) {
  node::ObjectTarget target;
  target.object_id = object_id;
  save_object(target, local_file, output);
}

void CLI::handle_fetch_command(const std::string& final_path, const std::string& local_file,
                               std::ostream& output) {
  node::ObjectTarget target;
  target.final_path = final_path;
  save_object(target, local_file, output);
}

void CLI::handle_delete_command(const node::ObjectTarget& target, std::ostream& output) {
  try {
    if (client_.remove(target)) {
      output << "File deleted successfully" << std::endl;
    } else {
      output << "File not found" << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what(), output);
  }
}

void CLI::handle_health_command(std::ostream& output) {
  try {
    node::NodeStatus status = client_.health();
    output << "Node:  " << status.node_id << std::endl;
    output << "Alive: " << (status.alive ? "yes" : "no") << std::endl;
    output << "Free:  " << status.free_bytes << " of " << status.total_bytes << " bytes"
           << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error querying node health", e.what(), output);
  }
}

void CLI::handle_help_command(std::ostream& output) {
  output << "Available commands:" << std::endl;
  output << "  help                                   Display this help message" << std::endl;
  output << "  upload <id> <file> [content_type]      Store local <file> as object <id>" << std::endl;
  output << "  download <id> <file>                   Save object <id> to local <file>" << std::endl;
  output << "  fetch <final_path> <file>              Save the object at <final_path> to <file>" << std::endl;
  output << "  delete <id>                            Delete object <id>" << std::endl;
  output << "  delete-path <final_path>               Delete the object at <final_path>" << std::endl;
  output << "  health                                 Show node liveness and capacity" << std::endl;
  output << "  quit                                   Exit the shell" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error,
                                std::ostream& output) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output << message << ": " << error << std::endl;
}

void CLI::save_object(const node::ObjectTarget& target, const std::string& local_file,
                      std::ostream& output) {
  std::ofstream file(local_file, std::ios::binary | std::ios::trunc);
  if (!file) {
    output << "Error opening file: " << local_file << std::endl;
    return;
  }

  try {
    uint64_t bytes = client_.download(target, file);
    file.close();
    output << "Saved " << bytes << " bytes to " << local_file << std::endl;
  } catch (const std::exception& e) {
    file.close();
    // Leave no partial output behind
    std::error_code ignored;
    std::filesystem::remove(local_file, ignored);
    log_and_display_error("Error downloading file", e.what(), output);
  }
}

} // namespace cli
} // namespace vault
