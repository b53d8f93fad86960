#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/asio/thread_pool.hpp>
#include "node/download_streamer.hpp"
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
using ::testing::Return;

class DownloadStreamerTest : public ::testing::Test {
protected:
  TempDirectory dir{"download_streamer_test"};
  boost::asio::io_context io_context;
  boost::asio::thread_pool pool{2};
  vault::storage::LocalFileStore store{pool};
  vault::storage::PathMapper paths{dir.path(), "tmp", 2, 2};
  vault::sync::ConcurrencyAdmission admission{io_context, 2, 2};
  DownloadStreamer streamer{admission, store, paths, 4};

  std::uint64_t download(const ObjectTarget& target, CollectingSink& sink, CancellationSignal& cancel) {
    std::uint64_t total = 0;
    run_coroutine(io_context, [&](boost::asio::yield_context yield) {
      total = streamer.download(target, sink, cancel, yield);
    });
    return total;
  }

  StatusCode expect_fault(const ObjectTarget& target, CollectingSink& sink, CancellationSignal& cancel) {
    try {
      download(target, sink, cancel);
    } catch (const RpcError& e) {
      return e.code();
    }
    ADD_FAILURE() << "Download did not fail";
    return StatusCode::OK;
  }

  static ObjectTarget by_id(const std::string& object_id) {
    ObjectTarget target;
    target.object_id = object_id;
    return target;
  }

  static ObjectTarget by_path(const std::string& final_path) {
    ObjectTarget target;
    target.final_path = final_path;
    return target;
  }
};

TEST_F(DownloadStreamerTest, StreamsFileInOrderedChunks) {
  write_file(paths.final_path("doc"), "hello world");
  CollectingSink sink;
  CancellationSignal cancel;

  EXPECT_EQ(download(by_id("doc"), sink, cancel), 11u);
  EXPECT_EQ(sink.data, "hello world");
  ASSERT_EQ(sink.chunks.size(), 3u);
  EXPECT_EQ(sink.chunks[0].size(), 4u);
  EXPECT_EQ(sink.chunks[2].size(), 3u);
  EXPECT_EQ(admission.available_downloads(), 2u);
}

TEST_F(DownloadStreamerTest, FinalPathTakesPrecedenceOverObjectId) {
  write_file(dir.path() / "custom" / "report_1.pdf", "versioned");
  ObjectTarget target = by_path("custom/report_1.pdf");
  target.object_id = "does-not-exist";
  CollectingSink sink;
  CancellationSignal cancel;

  EXPECT_EQ(download(target, sink, cancel), 9u);
  EXPECT_EQ(sink.data, "versioned");
}

TEST_F(DownloadStreamerTest, EmptyFileSendsNothing) {
  write_file(paths.final_path("empty"), "");
  CollectingSink sink;
  CancellationSignal cancel;

  EXPECT_EQ(download(by_id("empty"), sink, cancel), 0u);
  EXPECT_TRUE(sink.chunks.empty());
}

TEST_F(DownloadStreamerTest, MissingFileIsNotFound) {
  CollectingSink sink;
  CancellationSignal cancel;

  EXPECT_EQ(expect_fault(by_id("ghost"), sink, cancel), StatusCode::NOT_FOUND);
  EXPECT_EQ(admission.available_downloads(), 2u);
}

TEST_F(DownloadStreamerTest, BadTargetsAreInvalidArguments) {
  CollectingSink sink;
  CancellationSignal cancel;

  EXPECT_EQ(expect_fault(ObjectTarget{}, sink, cancel), StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(expect_fault(by_id("  "), sink, cancel), StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(expect_fault(by_path("../../etc/passwd"), sink, cancel), StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(expect_fault(by_path("/etc/passwd"), sink, cancel), StatusCode::INVALID_ARGUMENT);
}

TEST_F(DownloadStreamerTest, CancellationStopsTheStream) {
  write_file(paths.final_path("long"), std::string(40, 'x'));
  CollectingSink sink;
  CancellationSignal cancel;
  sink.on_write = [&](std::size_t written) {
    if (written == 2) {
      cancel.cancel(CancelReason::CLIENT);
    }
  };

  EXPECT_EQ(expect_fault(by_id("long"), sink, cancel), StatusCode::CANCELLED);
  EXPECT_EQ(sink.chunks.size(), 3u);
  EXPECT_EQ(admission.available_downloads(), 2u);
}

TEST_F(DownloadStreamerTest, DeadlineReportsDeadlineExceeded) {
  write_file(paths.final_path("slow"), std::string(40, 'x'));
  CollectingSink sink;
  CancellationSignal cancel;
  sink.on_write = [&](std::size_t) { cancel.cancel(CancelReason::DEADLINE); };

  EXPECT_EQ(expect_fault(by_id("slow"), sink, cancel), StatusCode::DEADLINE_EXCEEDED);
}

TEST_F(DownloadStreamerTest, RejectsZeroChunkSize) {
  EXPECT_THROW(DownloadStreamer(admission, store, paths, 0), std::invalid_argument);
}

TEST(DownloadStreamerFailureTest, ReadErrorsMapToInternal) {
  boost::asio::io_context io_context;
  NiceMock<MockFileStore> store;
  vault::storage::PathMapper paths{"/srv/vault", "tmp", 2, 2};
  vault::sync::ConcurrencyAdmission admission{io_context, 1, 1};
  DownloadStreamer streamer{admission, store, paths, 16};

  ON_CALL(store, exists(_, _)).WillByDefault(Return(true));
  EXPECT_CALL(store, read(_, 16, _))
    .WillOnce([](const std::filesystem::path&, std::size_t, boost::asio::yield_context)
                -> std::unique_ptr<vault::storage::ByteSource> {
      throw vault::storage::StorageError("Failed to open", std::make_error_code(std::errc::permission_denied));
    });

  ObjectTarget target;
  target.object_id = "locked";
  CollectingSink sink;
  CancellationSignal cancel;

  try {
    run_coroutine(io_context, [&](boost::asio::yield_context yield) {
      streamer.download(target, sink, cancel, yield);
    });
    FAIL() << "Download did not fail";
  } catch (const RpcError& e) {
    EXPECT_EQ(e.code(), StatusCode::INTERNAL);
    EXPECT_THAT(e.what(), ::testing::StartsWith("Download error: "));
  }
  EXPECT_EQ(admission.available_downloads(), 1u);
}
