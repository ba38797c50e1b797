#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace orchestra::core { class AssignmentEngine; }
namespace orchestra::db { class Repository; }
namespace orchestra::discovery { class DiscoveryPoller; }
namespace orchestra::reconcile { class ReconciliationLoop; }

namespace orchestra::factory {

/*
  Application

  Owns every long-lived component of the server. Background workers are
  already running when Build returns; call Stop before destruction to join
  them in dependency order.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<core::AssignmentEngine>       engine;
  std::shared_ptr<reconcile::ReconciliationLoop> loop;
  std::shared_ptr<discovery::DiscoveryPoller>   poller;  // null when discovery is disabled

  void Stop();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  This is the composition root of the application and the only place
  that knows concrete repository types.
*/
Application Build(const orchestra::runtime::config::RuntimeConfig& config);

} // namespace orchestra::factory
