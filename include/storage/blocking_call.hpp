#ifndef VAULT_STORAGE_BLOCKING_CALL_HPP
#define VAULT_STORAGE_BLOCKING_CALL_HPP

#include <exception>
#include <type_traits>
#include <utility>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/thread_pool.hpp>

namespace vault {
namespace storage {

namespace detail {

template <typename T>
struct BlockingOutcome {
  T value{};
  std::exception_ptr error;
};

template <typename Result, typename Function>
Result run_on_pool(boost::asio::thread_pool& pool, Function work, boost::asio::yield_context yield) {
  using Outcome = BlockingOutcome<Result>;

  Outcome outcome = boost::asio::async_initiate<boost::asio::yield_context,
                                                void(boost::system::error_code, Outcome)>(
    [&pool, work = std::move(work)](auto handler) mutable {
      auto guard = boost::asio::make_work_guard(boost::asio::get_associated_executor(handler));

      boost::asio::post(pool,
        [work = std::move(work), handler = std::move(handler), guard = std::move(guard)]() mutable {
          Outcome result;
          try {
            result.value = work();
          }
          catch (...) {
            // Carried back and rethrown inside the coroutine
            result.error = std::current_exception();
          }

          auto executor = guard.get_executor();
          boost::asio::post(executor,
            [handler = std::move(handler), result = std::move(result)]() mutable {
              handler(boost::system::error_code(), std::move(result));
            });
          guard.reset();
        });
    },
    yield);

  if (outcome.error) {
    std::rethrow_exception(outcome.error);
  }
  return std::move(outcome.value);
}

} // namespace detail

// Runs work on the blocking pool and suspends the calling coroutine until it
// finishes. The coroutine resumes on its own executor and exceptions thrown by
// work are rethrown there. Non-void results must be default constructible.
template <typename Function>
auto run_blocking(boost::asio::thread_pool& pool, Function work, boost::asio::yield_context yield)
    -> typename std::decay<decltype(work())>::type {
  using Result = typename std::decay<decltype(work())>::type;

  if constexpr (std::is_void<Result>::value) {
    detail::run_on_pool<bool>(pool, [work = std::move(work)]() mutable { work(); return true; }, yield);
  }
  else {
    return detail::run_on_pool<Result>(pool, std::move(work), yield);
  }
}

} // namespace storage
} // namespace vault

#endif // VAULT_STORAGE_BLOCKING_CALL_HPP
