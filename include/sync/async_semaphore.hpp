#ifndef VAULT_SYNC_ASYNC_SEMAPHORE_HPP
#define VAULT_SYNC_ASYNC_SEMAPHORE_HPP

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include "sync/cancellation.hpp"

namespace vault::sync {

// Counting gate for coroutines spawned on a single io_context. Waiters
// suspend on a timer and are woken in FIFO order. Not thread-safe.
class AsyncSemaphore {
public:
  // Move-only handle for one slot; the slot is returned exactly once
  class Permit {
  public:
    Permit() = default;
    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;
    ~Permit();

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    // Returns the slot early. Safe to call more than once.
    void release();
    bool owns_slot() const { return owner_ != nullptr; }

  private:
    friend class AsyncSemaphore;
    explicit Permit(AsyncSemaphore* owner) : owner_(owner) {}

    AsyncSemaphore* owner_ = nullptr;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  AsyncSemaphore(boost::asio::io_context& io_context, std::size_t capacity);
  ~AsyncSemaphore();

  AsyncSemaphore(const AsyncSemaphore&) = delete;
  AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;


  // ---- SLOT ACQUISITION ----
  // Suspends until a slot is free. Throws OperationCancelled, without
  // consuming a slot, if the signal fires first.
  Permit acquire(CancellationSignal& cancel, boost::asio::yield_context yield);
  // Takes a slot only if one is free and nobody is queued
  std::optional<Permit> try_acquire();


  // ---- QUERY OPERATIONS ----
  std::size_t capacity() const { return capacity_; }
  std::size_t available() const { return available_; }
  std::size_t waiting() const { return waiters_.size(); }

private:
  struct Waiter {
    explicit Waiter(boost::asio::io_context& io_context) : timer(io_context) {}
    boost::asio::steady_timer timer;
    bool granted = false;
  };

  // ---- PARAMETERS ----
  boost::asio::io_context& io_context_;
  std::size_t capacity_;
  std::size_t available_;
  std::deque<std::shared_ptr<Waiter>> waiters_;

  // Hands the slot to the oldest waiter, or back to the pool
  void release_slot();
  void drop_waiter(const std::shared_ptr<Waiter>& waiter);
};

} // namespace vault::sync

#endif // VAULT_SYNC_ASYNC_SEMAPHORE_HPP
