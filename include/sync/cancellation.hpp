#ifndef VAULT_SYNC_CANCELLATION_HPP
#define VAULT_SYNC_CANCELLATION_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <stdexcept>

namespace vault::sync {

enum class CancelReason {
  CLIENT,     // Caller went away or aborted the call
  DEADLINE    // Call deadline expired
};

const char* cancel_reason_to_string(CancelReason reason);

class OperationCancelled : public std::runtime_error {
public:
  explicit OperationCancelled(CancelReason reason = CancelReason::CLIENT);

  CancelReason reason() const { return reason_; }

private:
  CancelReason reason_;
};

// Per-call cancellation flag with callbacks that wake suspended waiters.
// Not thread-safe: owned and fired on the io_context thread running the call.
class CancellationSignal {
public:
  using Callback = std::function<void()>;

  // Removes its callback from the signal when destroyed
  class Registration {
  public:
    Registration() = default;
    Registration(Registration&& other) noexcept;
    Registration& operator=(Registration&& other) noexcept;
    ~Registration();

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

    void reset();

  private:
    friend class CancellationSignal;
    Registration(CancellationSignal* signal, std::size_t id) : signal_(signal), id_(id) {}

    CancellationSignal* signal_ = nullptr;
    std::size_t id_ = 0;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CancellationSignal() = default;
  CancellationSignal(const CancellationSignal&) = delete;
  CancellationSignal& operator=(const CancellationSignal&) = delete;


  // ---- CANCELLATION CONTROL ----
  // Marks the call cancelled and runs every registered callback once.
  // Later calls are ignored.
  void cancel(CancelReason reason = CancelReason::CLIENT);
  // Runs callback on cancellation, or right away when already cancelled
  Registration on_cancel(Callback callback);


  // ---- QUERY OPERATIONS ----
  bool is_cancelled() const { return cancelled_; }
  CancelReason reason() const { return reason_; }
  // Throws OperationCancelled when the call has been cancelled
  void throw_if_cancelled() const;

private:
  // ---- PARAMETERS ----
  bool cancelled_ = false;
  CancelReason reason_ = CancelReason::CLIENT;
  std::size_t next_id_ = 1;
  std::map<std::size_t, Callback> callbacks_;

  void remove(std::size_t id);
};

} // namespace vault::sync

#endif // VAULT_SYNC_CANCELLATION_HPP
