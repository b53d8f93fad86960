#include "sync/cancellation.hpp"
#include <string>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace vault::sync {

const char* cancel_reason_to_string(CancelReason reason) {
  switch (reason) {
    case CancelReason::CLIENT:   return "cancelled by client";
    case CancelReason::DEADLINE: return "deadline exceeded";
    default:                     return "cancelled";
  }
}

OperationCancelled::OperationCancelled(CancelReason reason)
  : std::runtime_error(std::string("Operation ") + cancel_reason_to_string(reason))
  , reason_(reason) {}


//==============================================
// REGISTRATION
//==============================================

CancellationSignal::Registration::Registration(Registration&& other) noexcept
  : signal_(std::exchange(other.signal_, nullptr))
  , id_(std::exchange(other.id_, 0)) {}

CancellationSignal::Registration&
CancellationSignal::Registration::operator=(Registration&& other) noexcept {
  if (this != &other) {
    reset();
    signal_ = std::exchange(other.signal_, nullptr);
    id_ = std::exchange(other.id_, 0);
  }
  return *this;
}

CancellationSignal::Registration::~Registration() {
  reset();
}

void CancellationSignal::Registration::reset() {
  if (signal_) {
    signal_->remove(id_);
    signal_ = nullptr;
  }
}


//==============================================
// CANCELLATION CONTROL
//==============================================

void CancellationSignal::cancel(CancelReason reason) {
  if (cancelled_) {
    return;
  }

  cancelled_ = true;
  reason_ = reason;
  BOOST_LOG_TRIVIAL(debug) << "Cancellation: Call " << cancel_reason_to_string(reason)
                           << ", waking " << callbacks_.size() << " waiter(s)";

  // Callbacks may drop their own registration while running
  std::vector<Callback> pending;
  pending.reserve(callbacks_.size());
  for (auto& entry : callbacks_) {
    pending.push_back(std::move(entry.second));
  }
  callbacks_.clear();

  for (auto& callback : pending) {
    callback();
  }
}

CancellationSignal::Registration CancellationSignal::on_cancel(Callback callback) {
  if (cancelled_) {
    callback();
    return Registration();
  }

  std::size_t id = next_id_++;
  callbacks_.emplace(id, std::move(callback));
  return Registration(this, id);
}

void CancellationSignal::throw_if_cancelled() const {
  if (cancelled_) {
    throw OperationCancelled(reason_);
  }
}

void CancellationSignal::remove(std::size_t id) {
  callbacks_.erase(id);
}

} // namespace vault::sync
