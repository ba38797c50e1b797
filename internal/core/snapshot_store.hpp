#pragma once

#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/snapshot.hpp"

namespace orchestra::core {

/*
  Durable sink for engine snapshots.

  Save replaces the stored worker set and upserts the given tasks in one
  transaction; a failed write throws and leaves the stored state intact.
  Callers pass only the tasks that changed. Load returns tasks in enqueue
  order.
*/
class SnapshotStore {
 public:
  explicit SnapshotStore(std::shared_ptr<db::Repository> repository);

  void            Save(const std::vector<model::Worker>& workers, const std::vector<model::Task>& tasks);
  model::Snapshot Load();

 private:
  std::shared_ptr<db::Repository> repository_;
};

db::model::WorkerRecord ToWorkerRecord(const model::Worker& worker);
model::Worker           FromWorkerRecord(const db::model::WorkerRecord& record);

db::model::TaskRecord ToTaskRecord(const model::Task& task);
model::Task           FromTaskRecord(const db::model::TaskRecord& record);

} // namespace orchestra::core
