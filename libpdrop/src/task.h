/**
 * @file task.h
 * @brief Bounded worker tasks for backend lifecycle calls
 *
 * Internal header. A lifecycle call runs on its own detached thread so the
 * caller can stop waiting after a deadline. Whatever the task captures must
 * stay valid on its own (shared ownership), since an abandoned task may
 * outlive the orchestrator.
 */

#ifndef PDROP_TASK_H
#define PDROP_TASK_H

#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>

namespace pdrop {
namespace detail {

/**
 * @brief Run fn on a detached thread
 * @return Future for fn's result; dropping it does not block
 */
template <typename F>
auto launch_detached(F &&fn) -> std::future<std::invoke_result_t<F &>> {
  using R = std::invoke_result_t<F &>;
  auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
  std::future<R> future = task->get_future();
  std::thread([task]() { (*task)(); }).detach();
  return future;
}

/**
 * @brief Who owns the outcome of a bounded task
 *
 * Exactly one side wins the handoff: either the task completes first and
 * the waiter consumes the result, or the waiter gives up first and the
 * task must clean up after itself when it returns.
 */
class Handoff {
public:
  /// Called by the task when its work is done
  /// @return false if the waiter already abandoned it
  bool complete() {
    int expected = Pending;
    return state_.compare_exchange_strong(expected, Completed);
  }

  /// Called by the waiter on timeout
  /// @return false if the task completed in the meantime
  bool abandon() {
    int expected = Pending;
    return state_.compare_exchange_strong(expected, Abandoned);
  }

private:
  enum : int { Pending = 0, Completed = 1, Abandoned = 2 };
  std::atomic<int> state_{Pending};
};

} // namespace detail
} // namespace pdrop

#endif // PDROP_TASK_H
