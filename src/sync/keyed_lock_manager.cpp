#include "sync/keyed_lock_manager.hpp"
#include <utility>
#include <boost/log/trivial.hpp>

namespace vault::sync {

//==============================================
// KEY LOCK HANDLE
//==============================================

KeyedLockManager::KeyLock::KeyLock(KeyedLockManager* manager, std::string key,
                                   AsyncSemaphore::Permit permit)
  : manager_(manager)
  , key_(std::move(key))
  , permit_(std::move(permit)) {}

KeyedLockManager::KeyLock::KeyLock(KeyLock&& other) noexcept
  : manager_(std::exchange(other.manager_, nullptr))
  , key_(std::move(other.key_))
  , permit_(std::move(other.permit_)) {}

KeyedLockManager::KeyLock& KeyedLockManager::KeyLock::operator=(KeyLock&& other) noexcept {
  if (this != &other) {
    release();
    manager_ = std::exchange(other.manager_, nullptr);
    key_ = std::move(other.key_);
    permit_ = std::move(other.permit_);
  }
  return *this;
}

KeyedLockManager::KeyLock::~KeyLock() {
  release();
}

void KeyedLockManager::KeyLock::release() {
  if (!manager_) {
    return;
  }
  KeyedLockManager* manager = std::exchange(manager_, nullptr);
  // Wake the next waiter before dropping our reference to the entry
  permit_.release();
  manager->unref(key_);
  BOOST_LOG_TRIVIAL(trace) << "Keyed lock: Released key: " << key_;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

KeyedLockManager::KeyedLockManager(boost::asio::io_context& io_context, std::size_t pool_size)
  : io_context_(io_context)
  , pool_size_(pool_size) {
  pool_.reserve(pool_size_);
}

KeyedLockManager::~KeyedLockManager() {
  if (!entries_.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Keyed lock: Destroyed with " << entries_.size() << " key(s) still in use";
  }
}


//==============================================
// LOCKING
//==============================================

KeyedLockManager::KeyLock KeyedLockManager::lock(const std::string& key,
                                                 CancellationSignal& cancel,
                                                 boost::asio::yield_context yield) {
  Entry& entry = retain(key);

  AsyncSemaphore::Permit permit;
  try {
    permit = entry.gate.acquire(cancel, yield);
  }
  catch (const OperationCancelled&) {
    BOOST_LOG_TRIVIAL(debug) << "Keyed lock: Wait cancelled for key: " << key;
    unref(key);
    throw;
  }

  BOOST_LOG_TRIVIAL(trace) << "Keyed lock: Acquired key: " << key;
  return KeyLock(this, key, std::move(permit));
}

bool KeyedLockManager::is_locked(const std::string& key) const {
  auto it = entries_.find(key);
  return it != entries_.end() && it->second->gate.available() == 0;
}


//==============================================
// ENTRY LIFECYCLE
//==============================================

KeyedLockManager::Entry& KeyedLockManager::retain(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    std::unique_ptr<Entry> entry;
    if (!pool_.empty()) {
      entry = std::move(pool_.back());
      pool_.pop_back();
    } else {
      entry = std::make_unique<Entry>(io_context_);
    }
    it = entries_.emplace(key, std::move(entry)).first;
  }

  ++it->second->refs;
  return *it->second;
}

void KeyedLockManager::unref(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Keyed lock: Unknown key released: " << key;
    return;
  }

  if (--it->second->refs > 0) {
    return;
  }

  // Nobody holds or awaits the key anymore
  std::unique_ptr<Entry> idle = std::move(it->second);
  entries_.erase(it);
  if (pool_.size() < pool_size_) {
    pool_.push_back(std::move(idle));
  }
}

} // namespace vault::sync
