#include "sync/async_semaphore.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <boost/log/trivial.hpp>

namespace vault::sync {

//==============================================
// PERMIT
//==============================================

AsyncSemaphore::Permit::Permit(Permit&& other) noexcept
  : owner_(std::exchange(other.owner_, nullptr)) {}

AsyncSemaphore::Permit& AsyncSemaphore::Permit::operator=(Permit&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
  }
  return *this;
}

AsyncSemaphore::Permit::~Permit() {
  release();
}

void AsyncSemaphore::Permit::release() {
  if (owner_) {
    AsyncSemaphore* owner = std::exchange(owner_, nullptr);
    owner->release_slot();
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AsyncSemaphore::AsyncSemaphore(boost::asio::io_context& io_context, std::size_t capacity)
  : io_context_(io_context)
  , capacity_(capacity)
  , available_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("Semaphore: Capacity must be positive");
  }
}

AsyncSemaphore::~AsyncSemaphore() {
  if (!waiters_.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Semaphore: Destroyed with " << waiters_.size() << " waiter(s) queued";
  }
}


//==============================================
// SLOT ACQUISITION
//==============================================

AsyncSemaphore::Permit AsyncSemaphore::acquire(CancellationSignal& cancel,
                                               boost::asio::yield_context yield) {
  cancel.throw_if_cancelled();

  if (auto permit = try_acquire()) {
    return std::move(*permit);
  }

  auto waiter = std::make_shared<Waiter>(io_context_);
  waiter->timer.expires_at(boost::asio::steady_timer::time_point::max());
  waiters_.push_back(waiter);
  BOOST_LOG_TRIVIAL(trace) << "Semaphore: Saturated, " << waiters_.size() << " waiter(s) queued";

  {
    auto registration = cancel.on_cancel([waiter]() { waiter->timer.cancel(); });

    // The timer only fires through cancel(), either from a release or from
    // the cancellation callback
    while (!waiter->granted && !cancel.is_cancelled()) {
      boost::system::error_code ec;
      waiter->timer.async_wait(yield[ec]);
    }
  }

  if (waiter->granted) {
    Permit permit(this);
    // Granted and cancelled in the same turn: pass the slot on
    cancel.throw_if_cancelled();
    return permit;
  }

  drop_waiter(waiter);
  throw OperationCancelled(cancel.reason());
}

std::optional<AsyncSemaphore::Permit> AsyncSemaphore::try_acquire() {
  if (available_ == 0 || !waiters_.empty()) {
    return std::nullopt;
  }
  --available_;
  return Permit(this);
}


//==============================================
// SLOT RELEASE
//==============================================

void AsyncSemaphore::release_slot() {
  if (!waiters_.empty()) {
    auto next = waiters_.front();
    waiters_.pop_front();
    next->granted = true;
    next->timer.cancel();
    return;
  }

  if (available_ >= capacity_) {
    BOOST_LOG_TRIVIAL(error) << "Semaphore: Release without a matching acquire";
    return;
  }
  ++available_;
}

void AsyncSemaphore::drop_waiter(const std::shared_ptr<Waiter>& waiter) {
  waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
}

} // namespace vault::sync
