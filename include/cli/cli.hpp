#ifndef VAULT_CLI_CLI_HPP
#define VAULT_CLI_CLI_HPP

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>
#include "rpc/node_client.hpp"

namespace vault {
namespace cli {

// Interactive shell that drives one storage node over its frame protocol
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(rpc::NodeClient& client, std::size_t chunk_size = rpc::NodeClient::DEFAULT_CHUNK_SIZE);


    // ---- STARTUP ----
    void run(std::istream& input = std::cin, std::ostream& output = std::cout);

    // Runs a single command line. Returns false once the shell should exit.
    bool execute(const std::string& line, std::ostream& output);

private:
    // ---- PARAMETERS ----
    rpc::NodeClient& client_;
    std::size_t chunk_size_;
    bool running_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args,
                         std::ostream& output);
    void handle_upload_command(const std::vector<std::string>& args, std::ostream& output);
    void handle_download_command(const std::string& object_id, const std::string& local_file,
                                 std::ostream& output);
    void handle_fetch_command(const std::string& final_path, const std::string& local_file,
                              std::ostream& output);
    void handle_delete_command(const node::ObjectTarget& target, std::ostream& output);
    void handle_health_command(std::ostream& output);
    void handle_help_command(std::ostream& output);
    void log_and_display_error(const std::string& message, const std::string& error,
                               std::ostream& output);

    void save_object(const node::ObjectTarget& target, const std::string& local_file,
                     std::ostream& output);
};

} // namespace cli
} // namespace vault

#endif // VAULT_CLI_CLI_HPP
