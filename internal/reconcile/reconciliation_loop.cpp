#include "reconciliation_loop.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/core/dispatcher.hpp"
#include "internal/observability/logging.hpp"

namespace orchestra::reconcile {

using observability::IntField;
using observability::StringField;

namespace {

std::size_t CountUnassigned(const model::Snapshot& snapshot) {
  return static_cast<std::size_t>(
      std::count_if(snapshot.tasks.begin(), snapshot.tasks.end(), [](const model::Task& task) { return task.worker_id.empty(); }));
}

std::size_t CountIdle(const model::Snapshot& snapshot) {
  return static_cast<std::size_t>(std::count_if(snapshot.workers.begin(), snapshot.workers.end(),
                                                [](const model::Worker& worker) { return worker.status == model::WorkerStatus::kIdle; }));
}

} // namespace

ReconciliationLoop::ReconciliationLoop(std::shared_ptr<core::Dispatcher> dispatcher, Options options)
    : dispatcher_(std::move(dispatcher)), options_(options) {
  if (!dispatcher_) {
    throw std::invalid_argument("reconciliation loop requires a dispatcher");
  }
  if (options_.interval.count() <= 0 || options_.error_backoff.count() <= 0) {
    throw std::invalid_argument("reconciliation loop intervals must be positive");
  }
}

ReconciliationLoop::~ReconciliationLoop() {
  Stop();
}

void ReconciliationLoop::Start() {
  if (stopped_) {
    throw std::logic_error("reconciliation loop cannot be restarted after Stop()");
  }
  if (running_.exchange(true)) {
    return;
  }

  thread_ = std::jthread([this](std::stop_token stop) { Run(stop); });
  ORCHESTRA_LOG_INFO("Reconciliation loop started", {IntField("interval_ms", options_.interval.count()),
                                                     IntField("error_backoff_ms", options_.error_backoff.count())});
}

void ReconciliationLoop::Stop() {
  stopped_ = true;
  if (!thread_.joinable()) {
    return;
  }

  thread_.request_stop();
  wait_cv_.notify_all();
  thread_.join();
  running_ = false;
  ORCHESTRA_LOG_INFO("Reconciliation loop stopped", {IntField("cycles", static_cast<int64_t>(cycles_completed_.load()))});
}

CycleResult ReconciliationLoop::RunCycle() {
  CycleResult result;

  const auto before        = dispatcher_->GetSnapshot();
  result.unassigned_before = CountUnassigned(before);
  result.available         = CountIdle(before);

  if (result.unassigned_before == 0) {
    return result;
  }
  if (result.available == 0) {
    ORCHESTRA_LOG_DEBUG("Unassigned tasks waiting for an idle worker", {IntField("unassigned", static_cast<int64_t>(result.unassigned_before))});
    return result;
  }

  dispatcher_->TriggerAssignment();
  result.triggered = true;

  const auto after       = dispatcher_->GetSnapshot();
  const auto still_open  = CountUnassigned(after);
  result.assigned        = result.unassigned_before > still_open ? result.unassigned_before - still_open : 0;

  if (result.assigned > 0) {
    ORCHESTRA_LOG_INFO("Reconciliation assigned tasks", {IntField("assigned", static_cast<int64_t>(result.assigned)),
                                                         IntField("still_unassigned", static_cast<int64_t>(still_open))});
  }
  return result;
}

void ReconciliationLoop::Run(std::stop_token stop) {
  while (!stop.stop_requested()) {
    auto wait = options_.interval;

    try {
      RunCycle();
      ++cycles_completed_;
    } catch (const std::exception& e) {
      ++cycles_failed_;
      wait = options_.error_backoff;
      ORCHESTRA_LOG_ERROR("Reconciliation cycle failed", {StringField("error", e.what()), IntField("backoff_ms", wait.count())});
    }

    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, stop, wait, [] { return false; });
  }
}

} // namespace orchestra::reconcile
