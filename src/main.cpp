#include "config/node_config.hpp"
#include "logger/logger.hpp"
#include "node/node_agent.hpp"
#include <iostream>
#include <string>
#include <boost/log/trivial.hpp>

bool run_node(const vault::config::NodeConfig& config) {
  try {
    vault::node::NodeAgent agent(config);

    if (!agent.start()) {
      std::cerr << "Error: Failed to start node\n";
      return false;
    }

    agent.wait();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Node: " << e.what();
    std::cerr << "Error: Failed to run node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = vault::config::parse_command_line(argc, argv);
  if (options.show_help) {
    vault::config::print_usage(argv[0], std::cout);
    return 0;
  }
  if (!options.valid) {
    return 1;
  }

  try {
    options.config.validate();
  } catch (const vault::config::ConfigError& e) {
    std::cerr << "Error: Configuration validation failed: " << e.what() << '\n';
    return 1;
  }

  vault::logging::severity_level level = vault::logging::severity_level::info;
  vault::logging::parse_severity(options.config.log_level, level);
  vault::logging::init_logging(options.config.log_file, level);

  BOOST_LOG_TRIVIAL(info) << "Node: Initialized " << options.config.node_id << " ("
                          << options.config.node_name << ") at " << options.config.base_path;

  return run_node(options.config) ? 0 : 1;
}
