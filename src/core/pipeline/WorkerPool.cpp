#include "WorkerPool.hpp"

#include <spdlog/spdlog.h>

namespace rpub {

WorkerPool::WorkerPool(size_t workers) : state_(std::make_shared<State>()) {
  if (workers == 0) workers = 1;
  workers_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    workers_.emplace_back(&WorkerPool::workerLoop, state_);
  }
}

WorkerPool::~WorkerPool() {
  if (joined_) {
    wait_idle();
    return;
  }
  {
    std::unique_lock<std::mutex> lock(state_->mu);
    state_->accepting = false;
    state_->idle_cv.wait(lock, [this] { return state_->queue.empty() && state_->active == 0; });
    state_->stop = true;
  }
  state_->work_cv.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::workerLoop(std::shared_ptr<State> state) {
  for (;;) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(state->mu);
      state->work_cv.wait(lock, [&] { return state->stop || !state->queue.empty(); });
      if (state->queue.empty()) return; // stop requested and nothing left
      task = std::move(state->queue.front());
      state->queue.pop_front();
      ++state->active;
    }
    task.run();
    {
      std::lock_guard<std::mutex> lock(state->mu);
      --state->active;
    }
    state->idle_cv.notify_all();
  }
}

void WorkerPool::enqueue(Task task) {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->accepting) {
      state_->queue.push_back(std::move(task));
      state_->work_cv.notify_one();
      return;
    }
  }
  task.abandon();
}

bool WorkerPool::shutdown(std::chrono::milliseconds timeout) {
  if (joined_) return true;
  std::deque<Task> abandoned;
  bool drained = false;
  {
    std::unique_lock<std::mutex> lock(state_->mu);
    state_->accepting = false;
    drained = state_->idle_cv.wait_for(lock, timeout, [this] {
      return state_->queue.empty() && state_->active == 0;
    });
    state_->stop = true;
    abandoned.swap(state_->queue);
  }
  state_->work_cv.notify_all();

  for (auto& t : abandoned) t.abandon();
  if (!abandoned.empty()) {
    spdlog::warn("worker pool shutdown: {} queued job(s) abandoned", abandoned.size());
  }

  if (drained) {
    for (auto& t : workers_) {
      if (t.joinable()) t.join();
    }
  } else {
    const size_t still_running = active_threads();
    if (still_running > 0) {
      spdlog::warn("worker pool shutdown: {} job(s) still running after {} ms; leaving them behind",
                   still_running, timeout.count());
    }
    for (auto& t : workers_) {
      if (t.joinable()) t.detach();
    }
  }
  joined_ = true;
  return drained && abandoned.empty();
}

void WorkerPool::wait_idle() const {
  std::unique_lock<std::mutex> lock(state_->mu);
  state_->idle_cv.wait(lock, [this] { return state_->queue.empty() && state_->active == 0; });
}

size_t WorkerPool::active_threads() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->active;
}

size_t WorkerPool::pending_tasks() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->queue.size();
}

} // namespace rpub
