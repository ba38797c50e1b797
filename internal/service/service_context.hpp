#pragma once

#include <memory>

namespace orchestra::core { class AssignmentEngine; }
namespace orchestra::registry { class WorkerRegistry; }
namespace orchestra::discovery { class DiscoveryPoller; class SessionDirectoryProvider; }

namespace orchestra::service {

/*
  Dependency container shared by all services.

  poller and sessions are null when discovery is disabled.
*/
struct ServiceContext {
  std::shared_ptr<orchestra::core::AssignmentEngine> engine;
  std::shared_ptr<orchestra::registry::WorkerRegistry> registry;
  std::shared_ptr<orchestra::discovery::DiscoveryPoller> poller;
  std::shared_ptr<orchestra::discovery::SessionDirectoryProvider> sessions;
};

} // namespace orchestra::service
