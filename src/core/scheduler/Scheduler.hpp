#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace rpub {

// Runs a cycle function on a fixed wall-clock interval. Cycles never
// overlap: a tick that arrives while a cycle is still running is skipped and
// counted, not queued. Exceptions thrown by a cycle are caught and counted
// here; the timer keeps going.
class Scheduler {
public:
  using CycleFn = std::function<void()>;

  Scheduler(std::chrono::milliseconds interval, CycleFn cycle);
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Starts the timer; the first tick fires immediately.
  void start();

  // Stops the timer, then waits up to grace for an in-flight cycle. Returns
  // false if the cycle was still running and had to be left behind.
  bool stop(std::chrono::milliseconds grace);

  // One timer tick: starts a cycle unless one is running.
  // Returns true if a cycle was started.
  bool tick();

  uint64_t ticks() const { return state_->ticks.load(); }
  uint64_t skippedTicks() const { return state_->skipped.load(); }
  uint64_t completedCycles() const { return state_->completed.load(); }
  uint64_t failedCycles() const { return state_->failed.load(); }
  bool isCycleRunning() const;

  // Blocks until no cycle is running or the timeout expires.
  bool waitIdle(std::chrono::milliseconds timeout) const;

private:
  struct State {
    mutable std::mutex mu;
    std::condition_variable timer_cv;
    mutable std::condition_variable idle_cv;
    bool stopping = false;
    bool running = false;
    std::atomic<uint64_t> ticks{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> failed{0};
  };

  static void runCycle(std::shared_ptr<State> state, CycleFn cycle, uint64_t number);
  void timerLoop();

  std::chrono::milliseconds interval_;
  CycleFn cycle_;
  std::shared_ptr<State> state_;
  std::thread timer_;
  std::thread cycle_thread_;
  std::mutex cycle_thread_mu_;
  bool started_ = false;
};

} // namespace rpub
