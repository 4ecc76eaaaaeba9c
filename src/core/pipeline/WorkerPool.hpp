#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

#include "core/errors/Errors.hpp"

namespace rpub {

// Fixed-size pool. Jobs are value-captured callables; each submit returns a
// future carrying either the job's result or the exception it threw. Jobs
// still queued when shutdown times out fail with ShutdownError.
class WorkerPool {
public:
  explicit WorkerPool(size_t workers);
  // Waits for running jobs, even after a shutdown that gave up on them.
  ~WorkerPool();
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

  // Stops accepting work, then waits up to timeout for queued and running
  // jobs. Returns false if it had to abandon queued jobs or leave running
  // ones behind.
  bool shutdown(std::chrono::milliseconds timeout);

  // Blocks until nothing is queued or running. Also covers jobs left behind
  // by a shutdown that timed out.
  void wait_idle() const;

  size_t worker_count() const { return workers_.size(); }
  size_t active_threads() const;
  size_t pending_tasks() const;

private:
  struct Task {
    std::function<void()> run;
    std::function<void()> abandon;
  };

  // Shared with the worker threads so detached workers outlive the pool safely.
  struct State {
    mutable std::mutex mu;
    std::condition_variable work_cv;
    std::condition_variable idle_cv;
    std::deque<Task> queue;
    size_t active = 0;
    bool accepting = true;
    bool stop = false;
  };

  static void workerLoop(std::shared_ptr<State> state);
  void enqueue(Task task);

  std::shared_ptr<State> state_;
  std::vector<std::thread> workers_;
  bool joined_ = false;
};

template <typename F>
auto WorkerPool::submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
  using R = std::invoke_result_t<std::decay_t<F>>;
  auto promise = std::make_shared<std::promise<R>>();
  auto future = promise->get_future();

  Task task;
  task.run = [promise, job = std::forward<F>(fn)]() mutable {
    try {
      if constexpr (std::is_void_v<R>) {
        job();
        promise->set_value();
      } else {
        promise->set_value(job());
      }
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  };
  task.abandon = [promise] {
    promise->set_exception(std::make_exception_ptr(ShutdownError("job abandoned at shutdown")));
  };
  enqueue(std::move(task));
  return future;
}

} // namespace rpub
