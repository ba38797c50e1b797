#include "memory_tx.hpp"

#include <stdexcept>

namespace orchestra::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

void MemoryTransaction::Commit() {
  if (done_) {
    throw std::logic_error("memory transaction already finished");
  }

  std::lock_guard lock(repo_.mutex_);
  if (workers_) {
    repo_.workers_ = std::move(*workers_);
  }
  for (auto& [id, record] : tasks_) {
    repo_.tasks_[id] = std::move(record);
  }
  done_ = true;
}

void MemoryTransaction::Rollback() {
  workers_.reset();
  tasks_.clear();
  done_ = true;
}

} // namespace orchestra::db::memory
