#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/asio/thread_pool.hpp>
#include "node/deletion_handler.hpp"
#include "node/status.hpp"
#include "storage/local_file_store.hpp"
#include "storage/storage_error.hpp"
#include "node_fakes.hpp"
#include "test_utils.hpp"

using namespace vault::node;
using namespace vault::test;
using vault::sync::CancellationSignal;
using vault::sync::CancelReason;
using ::testing::_;
using ::testing::NiceMock;

class DeletionHandlerTest : public ::testing::Test {
protected:
  TempDirectory dir{"deletion_handler_test"};
  boost::asio::io_context io_context;
  boost::asio::thread_pool pool{1};
  vault::storage::LocalFileStore store{pool};
  vault::storage::PathMapper paths{dir.path(), "tmp", 2, 2};
  DeletionHandler handler{store, paths};

  bool remove(const ObjectTarget& target, CancellationSignal& cancel) {
    bool deleted = false;
    run_coroutine(io_context, [&](boost::asio::yield_context yield) {
      deleted = handler.remove(target, cancel, yield);
    });
    return deleted;
  }

  bool remove(const ObjectTarget& target) {
    CancellationSignal cancel;
    return remove(target, cancel);
  }

  StatusCode expect_fault(const ObjectTarget& target, CancellationSignal& cancel) {
    try {
      remove(target, cancel);
    } catch (const RpcError& e) {
      return e.code();
    }
    ADD_FAILURE() << "Delete did not fail";
    return StatusCode::OK;
  }
};

TEST_F(DeletionHandlerTest, RemovesObjectById) {
  write_file(paths.final_path("doomed"), "bytes");
  ObjectTarget target;
  target.object_id = "doomed";

  EXPECT_TRUE(remove(target));
  EXPECT_FALSE(std::filesystem::exists(paths.final_path("doomed")));
  EXPECT_FALSE(remove(target));
}

TEST_F(DeletionHandlerTest, RemovesObjectByRelativePath) {
  write_file(dir.path() / "ab" / "cd" / "thing_1.txt", "v1");
  ObjectTarget target;
  target.final_path = "ab/cd/thing_1.txt";

  EXPECT_TRUE(remove(target));
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "ab" / "cd" / "thing_1.txt"));
}

TEST_F(DeletionHandlerTest, PathToDirectoryDeletesNothing) {
  write_file(paths.final_path("kept"), "bytes");
  ObjectTarget kept;
  kept.object_id = "kept";
  ASSERT_TRUE(remove(kept));

  // The emptied shard directory and the temp directory are not objects
  const auto shard = paths.final_path("kept").parent_path();
  std::filesystem::create_directories(dir.path() / "tmp");
  ObjectTarget shard_target;
  shard_target.final_path = paths.relative_to_base(shard);
  ObjectTarget temp_target;
  temp_target.final_path = "tmp";

  EXPECT_FALSE(remove(shard_target));
  EXPECT_FALSE(remove(temp_target));
  EXPECT_TRUE(std::filesystem::is_directory(shard));
  EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "tmp"));
}

TEST_F(DeletionHandlerTest, MissingObjectIsNotAnError) {
  ObjectTarget target;
  target.object_id = "never-stored";
  EXPECT_FALSE(remove(target));
}

TEST_F(DeletionHandlerTest, InvalidTargetsAreRejected) {
  CancellationSignal cancel;
  ObjectTarget empty;
  ObjectTarget escaping;
  escaping.final_path = "../outside";

  EXPECT_EQ(expect_fault(empty, cancel), StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(expect_fault(escaping, cancel), StatusCode::INVALID_ARGUMENT);
}

TEST_F(DeletionHandlerTest, CancelledCallDeletesNothing) {
  write_file(paths.final_path("kept"), "bytes");
  ObjectTarget target;
  target.object_id = "kept";
  CancellationSignal cancel;
  cancel.cancel(CancelReason::DEADLINE);

  EXPECT_EQ(expect_fault(target, cancel), StatusCode::DEADLINE_EXCEEDED);
  EXPECT_TRUE(std::filesystem::exists(paths.final_path("kept")));
}

TEST(DeletionHandlerFailureTest, StorageErrorsMapToInternal) {
  boost::asio::io_context io_context;
  NiceMock<MockFileStore> store;
  vault::storage::PathMapper paths{"/srv/vault", "tmp", 2, 2};
  DeletionHandler handler{store, paths};

  EXPECT_CALL(store, remove(paths.final_path("busy"), _))
    .WillOnce([](const std::filesystem::path&, boost::asio::yield_context) -> bool {
      throw vault::storage::StorageError("Failed to delete", std::make_error_code(std::errc::device_or_resource_busy));
    });

  ObjectTarget target;
  target.object_id = "busy";
  CancellationSignal cancel;

  try {
    run_coroutine(io_context, [&](boost::asio::yield_context yield) {
      handler.remove(target, cancel, yield);
    });
    FAIL() << "Delete did not fail";
  } catch (const RpcError& e) {
    EXPECT_EQ(e.code(), StatusCode::INTERNAL);
    EXPECT_THAT(e.what(), ::testing::StartsWith("Delete error: "));
  }
}
