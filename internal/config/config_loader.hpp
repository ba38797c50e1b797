#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"

namespace orchestra::config {

inline constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static orchestra::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

struct AssignmentTiming {
  std::chrono::milliseconds reconcile_interval{2000};
  std::chrono::milliseconds error_backoff{20000};
};

struct DiscoverySettings {
  bool                      enabled = false;
  std::string               sessions_root;
  std::chrono::milliseconds refresh_interval{30000};
  std::chrono::milliseconds activity_window{120000};
  std::string               worker_kind = "claude-code";
};

// Unset durations fall back to defaults; error_backoff defaults to
// ten reconcile intervals.
AssignmentTiming ResolveAssignmentTiming(const orchestra::runtime::config::RuntimeConfig& config);

// Throws std::invalid_argument when discovery is enabled without a sessions_root.
DiscoverySettings ResolveDiscoverySettings(const orchestra::runtime::config::RuntimeConfig& config);

} // namespace orchestra::config
