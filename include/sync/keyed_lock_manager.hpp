#ifndef VAULT_SYNC_KEYED_LOCK_MANAGER_HPP
#define VAULT_SYNC_KEYED_LOCK_MANAGER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include "sync/async_semaphore.hpp"
#include "sync/cancellation.hpp"

namespace vault::sync {

// Per-key mutual exclusion for coroutines on one io_context.
//
// Each key maps to a reference counted entry holding a one-slot semaphore.
// An entry lives only while it is held or awaited; released entries go to a
// bounded free pool, so memory follows the number of keys in use rather than
// the number of keys ever seen.
class KeyedLockManager {
public:
  // Move-only scoped handle. Unlocks when destroyed or released.
  class KeyLock {
  public:
    KeyLock() = default;
    KeyLock(KeyLock&& other) noexcept;
    KeyLock& operator=(KeyLock&& other) noexcept;
    ~KeyLock();

    KeyLock(const KeyLock&) = delete;
    KeyLock& operator=(const KeyLock&) = delete;

    void release();
    bool owns_lock() const { return manager_ != nullptr; }
    const std::string& key() const { return key_; }

  private:
    friend class KeyedLockManager;
    KeyLock(KeyedLockManager* manager, std::string key, AsyncSemaphore::Permit permit);

    KeyedLockManager* manager_ = nullptr;
    std::string key_;
    AsyncSemaphore::Permit permit_;
  };

  static constexpr std::size_t DEFAULT_POOL_SIZE = 20;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit KeyedLockManager(boost::asio::io_context& io_context,
                            std::size_t pool_size = DEFAULT_POOL_SIZE);
  ~KeyedLockManager();

  KeyedLockManager(const KeyedLockManager&) = delete;
  KeyedLockManager& operator=(const KeyedLockManager&) = delete;


  // ---- LOCKING ----
  // Suspends until the key is free. Throws OperationCancelled if the signal
  // fires first.
  KeyLock lock(const std::string& key, CancellationSignal& cancel,
               boost::asio::yield_context yield);


  // ---- QUERY OPERATIONS ----
  // Number of keys currently held or awaited
  std::size_t size() const { return entries_.size(); }
  // Number of idle entries kept for reuse
  std::size_t pooled() const { return pool_.size(); }
  bool is_locked(const std::string& key) const;

private:
  struct Entry {
    explicit Entry(boost::asio::io_context& io_context) : gate(io_context, 1) {}
    AsyncSemaphore gate;
    std::size_t refs = 0;
  };

  // ---- PARAMETERS ----
  boost::asio::io_context& io_context_;
  std::size_t pool_size_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
  std::vector<std::unique_ptr<Entry>> pool_;

  // ---- ENTRY LIFECYCLE ----
  Entry& retain(const std::string& key);
  void unref(const std::string& key);
};

} // namespace vault::sync

#endif // VAULT_SYNC_KEYED_LOCK_MANAGER_HPP
