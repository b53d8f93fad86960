#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "config/node_config.hpp"
#include "test_utils.hpp"

using namespace vault::config;

namespace {

ProgramOptions parse(std::vector<const char*> args, std::ostream& err) {
  args.insert(args.begin(), "vault_node");
  return parse_command_line(static_cast<int>(args.size()), args.data(), err);
}

} // namespace

class NodeConfigTest : public ::testing::Test {
protected:
  vault::test::TempDirectory dir{"node_config_test"};

  NodeConfig valid_config() const {
    NodeConfig config;
    config.node_id = "node-1";
    config.node_name = "alpha";
    config.base_path = dir.path().string();
    return config;
  }

  static void expect_invalid(const NodeConfig& config, const std::string& message) {
    try {
      config.validate();
      ADD_FAILURE() << "Expected ConfigError: " << message;
    } catch (const ConfigError& e) {
      EXPECT_NE(std::string(e.what()).find(message), std::string::npos) << e.what();
    }
  }
};

TEST_F(NodeConfigTest, DefaultsMatchDocumentedValues) {
  NodeConfig config;
  EXPECT_EQ(config.temp_dir_name, "tmp");
  EXPECT_EQ(config.max_concurrent_uploads, 16u);
  EXPECT_EQ(config.max_concurrent_downloads, 32u);
  EXPECT_EQ(config.chunk_size_bytes, 262144u);
  EXPECT_EQ(config.shard_symbol_count, 2u);
  EXPECT_EQ(config.shard_level_count, 2u);
  EXPECT_EQ(config.lock_pool_size, 20u);
}

TEST_F(NodeConfigTest, ValidConfigCreatesTempDirectory) {
  NodeConfig config = valid_config();
  EXPECT_NO_THROW(config.validate());
  EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "tmp"));
}

TEST_F(NodeConfigTest, RequiredFieldsAreChecked) {
  NodeConfig config = valid_config();
  config.node_id = " ";
  expect_invalid(config, "NodeId is required");

  config = valid_config();
  config.node_name = "";
  expect_invalid(config, "NodeName is required");

  config = valid_config();
  config.base_path = "";
  expect_invalid(config, "BasePath is required");

  config = valid_config();
  config.base_path = (dir.path() / "missing").string();
  expect_invalid(config, "BasePath does not exist");
}

TEST_F(NodeConfigTest, LimitsMustBePositive) {
  NodeConfig config = valid_config();
  config.max_concurrent_uploads = 0;
  expect_invalid(config, "MaxConcurrentUploads must be positive");

  config = valid_config();
  config.chunk_size_bytes = 0;
  expect_invalid(config, "ChunkSizeBytes must be positive");

  config = valid_config();
  config.shard_level_count = 0;
  expect_invalid(config, "ShardLevelCount must be positive");
}

TEST_F(NodeConfigTest, ChunksMustFitInAFrame) {
  NodeConfig config = valid_config();
  config.max_frame_bytes = 1024;
  config.chunk_size_bytes = 2048;
  expect_invalid(config, "ChunkSizeBytes must not exceed MaxFrameBytes");
}

TEST_F(NodeConfigTest, TempDirectoryMustBeOneComponent) {
  NodeConfig config = valid_config();
  config.temp_dir_name = "a/b";
  expect_invalid(config, "TempDirName must be a single directory name");

  config.temp_dir_name = "..";
  expect_invalid(config, "TempDirName must be a single directory name");
}

TEST_F(NodeConfigTest, UnknownLogLevelIsRejected) {
  NodeConfig config = valid_config();
  config.log_level = "chatty";
  expect_invalid(config, "Unknown log level");
}

TEST(CommandLineTest, ParsesAllFlags) {
  std::ostringstream err;
  ProgramOptions options = parse({"--node-id", "n1", "--node-name", "alpha", "--base-path", "/data",
                                  "--temp-dir", "staging", "--max-uploads", "4", "--max-downloads", "8",
                                  "--chunk-size", "4096", "--shard-symbols", "3", "--shard-levels", "1",
                                  "--lock-pool", "5", "--listen", "127.0.0.1", "-p", "7000",
                                  "--io-threads", "2", "--max-frame", "65536",
                                  "--log-file", "node.log", "--log-level", "debug"}, err);

  ASSERT_TRUE(options.valid) << err.str();
  const NodeConfig& config = options.config;
  EXPECT_EQ(config.node_id, "n1");
  EXPECT_EQ(config.node_name, "alpha");
  EXPECT_EQ(config.base_path, "/data");
  EXPECT_EQ(config.temp_dir_name, "staging");
  EXPECT_EQ(config.max_concurrent_uploads, 4u);
  EXPECT_EQ(config.max_concurrent_downloads, 8u);
  EXPECT_EQ(config.chunk_size_bytes, 4096u);
  EXPECT_EQ(config.shard_symbol_count, 3u);
  EXPECT_EQ(config.shard_level_count, 1u);
  EXPECT_EQ(config.lock_pool_size, 5u);
  EXPECT_EQ(config.listen_address, "127.0.0.1");
  EXPECT_EQ(config.port, 7000);
  EXPECT_EQ(config.io_worker_threads, 2u);
  EXPECT_EQ(config.max_frame_bytes, 65536u);
  EXPECT_EQ(config.log_file, "node.log");
  EXPECT_EQ(config.log_level, "debug");
}

TEST(CommandLineTest, HelpShortCircuits) {
  std::ostringstream err;
  ProgramOptions options = parse({"--help"}, err);
  EXPECT_TRUE(options.show_help);
  EXPECT_FALSE(options.valid);
}

TEST(CommandLineTest, ReportsProblems) {
  std::ostringstream err;
  EXPECT_FALSE(parse({"--node-id", "n1", "--bogus", "x"}, err).valid);
  EXPECT_NE(err.str().find("Unknown argument: --bogus"), std::string::npos);

  err.str("");
  EXPECT_FALSE(parse({"--node-id", "n1", "--node-name", "a", "--base-path", "/d", "--port"}, err).valid);
  EXPECT_NE(err.str().find("Missing value for --port"), std::string::npos);

  err.str("");
  EXPECT_FALSE(parse({"--node-id", "n1", "--node-name", "a", "--base-path", "/d", "-p", "70000"}, err).valid);
  EXPECT_NE(err.str().find("Invalid port number"), std::string::npos);

  err.str("");
  EXPECT_FALSE(parse({"--node-id", "n1", "--node-name", "a", "--base-path", "/d", "--max-uploads", "-3"}, err).valid);
  EXPECT_NE(err.str().find("Invalid number for --max-uploads"), std::string::npos);

  err.str("");
  EXPECT_FALSE(parse({"--node-id", "n1"}, err).valid);
  EXPECT_NE(err.str().find("are required"), std::string::npos);
}
