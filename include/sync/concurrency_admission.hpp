#ifndef VAULT_SYNC_CONCURRENCY_ADMISSION_HPP
#define VAULT_SYNC_CONCURRENCY_ADMISSION_HPP

#include <cstddef>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include "sync/async_semaphore.hpp"
#include "sync/cancellation.hpp"

namespace vault::sync {

// Two independent admission gates. Saturated uploads never hold back
// downloads and the other way round.
class ConcurrencyAdmission {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ConcurrencyAdmission(boost::asio::io_context& io_context,
                       std::size_t max_uploads, std::size_t max_downloads);


  // ---- ADMISSION ----
  AsyncSemaphore::Permit acquire_upload(CancellationSignal& cancel, boost::asio::yield_context yield);
  AsyncSemaphore::Permit acquire_download(CancellationSignal& cancel, boost::asio::yield_context yield);


  // ---- QUERY OPERATIONS ----
  std::size_t available_uploads() const { return upload_gate_.available(); }
  std::size_t available_downloads() const { return download_gate_.available(); }
  std::size_t queued_uploads() const { return upload_gate_.waiting(); }
  std::size_t queued_downloads() const { return download_gate_.waiting(); }

private:
  // ---- PARAMETERS ----
  AsyncSemaphore upload_gate_;
  AsyncSemaphore download_gate_;
};

} // namespace vault::sync

#endif // VAULT_SYNC_CONCURRENCY_ADMISSION_HPP
