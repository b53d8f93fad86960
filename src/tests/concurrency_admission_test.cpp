#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include "sync/concurrency_admission.hpp"

using namespace vault::sync;

class ConcurrencyAdmissionTest : public ::testing::Test {
protected:
  boost::asio::io_context io_context;
  ConcurrencyAdmission admission{io_context, 1, 2};
};

TEST_F(ConcurrencyAdmissionTest, StartsWithConfiguredCapacity) {
  EXPECT_EQ(admission.available_uploads(), 1u);
  EXPECT_EQ(admission.available_downloads(), 2u);
  EXPECT_EQ(admission.queued_uploads(), 0u);
  EXPECT_EQ(admission.queued_downloads(), 0u);
}

TEST_F(ConcurrencyAdmissionTest, SaturatedUploadsDoNotBlockDownloads) {
  CancellationSignal upload_cancel;
  bool second_upload_admitted = false;
  int downloads_admitted = 0;
  AsyncSemaphore::Permit held_upload;

  boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
    CancellationSignal cancel;
    held_upload = admission.acquire_upload(cancel, yield);
  });
  boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
    try {
      auto permit = admission.acquire_upload(upload_cancel, yield);
      second_upload_admitted = true;
    } catch (const OperationCancelled&) {
    }
  });
  for (int i = 0; i < 2; ++i) {
    boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
      CancellationSignal cancel;
      auto permit = admission.acquire_download(cancel, yield);
      ++downloads_admitted;
    });
  }

  io_context.poll();
  EXPECT_EQ(downloads_admitted, 2);
  EXPECT_FALSE(second_upload_admitted);
  EXPECT_EQ(admission.queued_uploads(), 1u);
  EXPECT_EQ(admission.available_downloads(), 2u);

  held_upload.release();
  io_context.run();
  EXPECT_TRUE(second_upload_admitted);
  EXPECT_EQ(admission.available_uploads(), 1u);
}

TEST_F(ConcurrencyAdmissionTest, QueuedCallerCanBeCancelled) {
  AsyncSemaphore::Permit first;
  CancellationSignal waiting_cancel;
  bool cancelled = false;

  boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
    CancellationSignal cancel;
    first = admission.acquire_upload(cancel, yield);
  });
  boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
    try {
      admission.acquire_upload(waiting_cancel, yield);
    } catch (const OperationCancelled&) {
      cancelled = true;
    }
  });

  io_context.poll();
  EXPECT_EQ(admission.queued_uploads(), 1u);

  waiting_cancel.cancel();
  io_context.run();
  EXPECT_TRUE(cancelled);
  EXPECT_EQ(admission.queued_uploads(), 0u);
  EXPECT_EQ(admission.available_uploads(), 0u);

  first.release();
  EXPECT_EQ(admission.available_uploads(), 1u);
}
