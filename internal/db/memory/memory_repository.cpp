#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace orchestra::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::ReplaceWorkers(Transaction& t, const std::vector<model::WorkerRecord>& records) {
  std::map<std::string, model::WorkerRecord> workers;
  for (const auto& r : records) {
    if (!workers.emplace(r.id, r).second) return Result::Err(ErrorCode::ConstraintViolation, "duplicate worker id " + r.id);
  }
  TX(t).workers_ = std::move(workers);
  return Result::Ok();
}

std::vector<model::WorkerRecord> MemoryRepository::ListWorkers(Transaction& t) {
  auto& tx = TX(t);

  std::vector<model::WorkerRecord> records;
  std::lock_guard                  lock(mutex_);
  const auto&                      source = tx.workers_ ? *tx.workers_ : workers_;
  records.reserve(source.size());
  for (const auto& [_, record] : source) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpsertTask(Transaction& t, const model::TaskRecord& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "task id is empty");
  TX(t).tasks_[r.id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (auto it = tx.tasks_.find(id); it != tx.tasks_.end()) return it->second;

  std::lock_guard lock(mutex_);
  auto            it = tasks_.find(id);
  if (it == tasks_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasks(Transaction& t) {
  auto& tx = TX(t);

  std::vector<model::TaskRecord> records;
  {
    std::lock_guard lock(mutex_);
    records.reserve(tasks_.size() + tx.tasks_.size());
    for (const auto& [id, record] : tasks_) {
      if (!tx.tasks_.contains(id)) records.push_back(record);
    }
  }
  for (const auto& [_, record] : tx.tasks_) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const model::TaskRecord& a, const model::TaskRecord& b) { return a.sequence < b.sequence; });
  return records;
}

} // namespace orchestra::db::memory
