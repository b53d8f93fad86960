#include "sync/concurrency_admission.hpp"
#include <boost/log/trivial.hpp>

namespace vault::sync {

ConcurrencyAdmission::ConcurrencyAdmission(boost::asio::io_context& io_context,
                                           std::size_t max_uploads, std::size_t max_downloads)
  : upload_gate_(io_context, max_uploads)
  , download_gate_(io_context, max_downloads) {
  BOOST_LOG_TRIVIAL(info) << "Admission: Upload slots: " << max_uploads
                          << ", download slots: " << max_downloads;
}

AsyncSemaphore::Permit ConcurrencyAdmission::acquire_upload(CancellationSignal& cancel,
                                                            boost::asio::yield_context yield) {
  if (upload_gate_.available() == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Admission: Upload gate saturated, " << upload_gate_.waiting() << " queued";
  }
  return upload_gate_.acquire(cancel, yield);
}

AsyncSemaphore::Permit ConcurrencyAdmission::acquire_download(CancellationSignal& cancel,
                                                              boost::asio::yield_context yield) {
  if (download_gate_.available() == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Admission: Download gate saturated, " << download_gate_.waiting() << " queued";
  }
  return download_gate_.acquire(cancel, yield);
}

} // namespace vault::sync
