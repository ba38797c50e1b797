#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace orchestra::core {
class Dispatcher;
}

namespace orchestra::reconcile {

struct CycleResult {
  std::size_t unassigned_before = 0;
  std::size_t available         = 0;
  std::size_t assigned          = 0;
  bool        triggered         = false;
};

/*
  Background loop that re-runs the assignment sweep while there is
  unassigned work and at least one Idle worker.

  Running -> cycle -> wait(interval) -> Running ... -> Stopped

  A failed cycle is logged and followed by error_backoff instead of the
  normal interval. Stop() interrupts the wait and joins; Stopped is final.
*/
class ReconciliationLoop {
 public:
  struct Options {
    std::chrono::milliseconds interval{2000};
    std::chrono::milliseconds error_backoff{20000};
  };

  ReconciliationLoop(std::shared_ptr<core::Dispatcher> dispatcher, Options options);
  ~ReconciliationLoop();

  ReconciliationLoop(const ReconciliationLoop&)            = delete;
  ReconciliationLoop& operator=(const ReconciliationLoop&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const {
    return running_;
  }

  // One cycle on the caller's thread. Propagates dispatcher errors.
  CycleResult RunCycle();

  std::uint64_t CyclesCompleted() const {
    return cycles_completed_;
  }
  std::uint64_t CyclesFailed() const {
    return cycles_failed_;
  }

 private:
  void Run(std::stop_token stop);

  std::shared_ptr<core::Dispatcher> dispatcher_;
  Options                           options_;

  std::mutex                  wait_mutex_;
  std::condition_variable_any wait_cv_;
  std::jthread                thread_;

  std::atomic<bool>          running_{false};
  std::atomic<bool>          stopped_{false};
  std::atomic<std::uint64_t> cycles_completed_{0};
  std::atomic<std::uint64_t> cycles_failed_{0};
};

} // namespace orchestra::reconcile
