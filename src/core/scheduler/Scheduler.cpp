#include "Scheduler.hpp"

#include <spdlog/spdlog.h>
#include <exception>

namespace rpub {

Scheduler::Scheduler(std::chrono::milliseconds interval, CycleFn cycle)
  : interval_(interval), cycle_(std::move(cycle)), state_(std::make_shared<State>()) {}

Scheduler::~Scheduler() {
  stop(std::chrono::milliseconds(0));
}

void Scheduler::start() {
  if (started_) return;
  started_ = true;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->stopping = false;
  }
  spdlog::info("Starting scheduler loop (interval {} ms)", interval_.count());
  timer_ = std::thread([this] { timerLoop(); });
}

void Scheduler::timerLoop() {
  auto next = std::chrono::steady_clock::now();
  for (;;) {
    tick();
    next += interval_;
    std::unique_lock<std::mutex> lock(state_->mu);
    if (state_->timer_cv.wait_until(lock, next, [this] { return state_->stopping; })) return;
  }
}

bool Scheduler::tick() {
  const uint64_t number = ++state_->ticks;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->stopping && started_) return false;
    if (state_->running) {
      ++state_->skipped;
      spdlog::warn("tick {} skipped: previous cycle still running ({} skipped so far)",
                   number, state_->skipped.load());
      return false;
    }
    state_->running = true;
  }

  std::lock_guard<std::mutex> lock(cycle_thread_mu_);
  if (cycle_thread_.joinable()) cycle_thread_.join(); // already finished, running was false
  cycle_thread_ = std::thread(&Scheduler::runCycle, state_, cycle_, number);
  return true;
}

void Scheduler::runCycle(std::shared_ptr<State> state, CycleFn cycle, uint64_t number) {
  const auto started = std::chrono::steady_clock::now();
  spdlog::debug("cycle {} started", number);
  try {
    cycle();
    ++state->completed;
  } catch (const std::exception& e) {
    ++state->failed;
    spdlog::error("cycle {} failed: {}", number, e.what());
  } catch (...) {
    ++state->failed;
    spdlog::error("cycle {} failed with a non-standard exception", number);
  }
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started).count();
  spdlog::info("cycle {} finished in {} ms", number, ms);
  {
    std::lock_guard<std::mutex> lock(state->mu);
    state->running = false;
  }
  state->idle_cv.notify_all();
}

bool Scheduler::isCycleRunning() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->running;
}

bool Scheduler::waitIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_->mu);
  return state_->idle_cv.wait_for(lock, timeout, [this] { return !state_->running; });
}

bool Scheduler::stop(std::chrono::milliseconds grace) {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->stopping = true;
  }
  state_->timer_cv.notify_all();
  if (timer_.joinable()) timer_.join();

  const bool finished = waitIdle(grace);
  std::lock_guard<std::mutex> lock(cycle_thread_mu_);
  if (cycle_thread_.joinable()) {
    if (finished) {
      cycle_thread_.join();
    } else {
      spdlog::error("cycle still running after {} ms grace; abandoning it", grace.count());
      cycle_thread_.detach();
    }
  }
  return finished;
}

} // namespace rpub
