#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace std::chrono_literals;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "orchestra_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "/var/lib/orchestra/state.db"
logging:
  level: debug
assignment:
  reconcile_interval: 0.5s
  error_backoff: 3s
discovery:
  enabled: true
  sessions_root: /home/me/.claude/projects
  refresh_interval: 15s
  activity_window: 90s
  worker_kind: "claude-code"
)");

  auto config = orchestra::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/orchestra/state.db");
  assert(config.logging().level() == "debug");

  const auto timing = orchestra::config::ResolveAssignmentTiming(config);
  assert(timing.reconcile_interval == 500ms);
  assert(timing.error_backoff == 3s);

  const auto discovery = orchestra::config::ResolveDiscoverySettings(config);
  assert(discovery.enabled);
  assert(discovery.sessions_root == "/home/me/.claude/projects");
  assert(discovery.refresh_interval == 15s);
  assert(discovery.activity_window == 90s);
  assert(discovery.worker_kind == "claude-code");
}

void TestDefaultsApplyWhenSectionsAreMissing() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(database:
  memory: {}
)");

  auto config = orchestra::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == orchestra::config::kDefaultBindAddress);
  assert(config.database().has_memory());

  const auto timing = orchestra::config::ResolveAssignmentTiming(config);
  assert(timing.reconcile_interval == 2s);
  assert(timing.error_backoff == 20s);

  const auto discovery = orchestra::config::ResolveDiscoverySettings(config);
  assert(!discovery.enabled);
  assert(discovery.refresh_interval == 30s);
  assert(discovery.activity_window == 120s);
  assert(discovery.worker_kind == "claude-code");
}

void TestBackoffDefaultsToTenIntervals() {
  const auto yaml_path = WriteYaml("backoff",
                                   R"(assignment:
  reconcile_interval: 1s
)");

  auto       config = orchestra::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  const auto timing = orchestra::config::ResolveAssignmentTiming(config);
  assert(timing.reconcile_interval == 1s);
  assert(timing.error_backoff == 10s);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\orchestra\\\"quoted\"\\db.sqlite"
)");

  auto config = orchestra::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\orchestra\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)orchestra::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestDiscoveryRequiresSessionsRoot() {
  const auto yaml_path = WriteYaml("discovery_without_root",
                                   R"(discovery:
  enabled: true
)");

  auto config = orchestra::config::ConfigLoader::LoadFromYaml(yaml_path.string());

  bool threw = false;
  try {
    (void)orchestra::config::ResolveDiscoverySettings(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestNonPositiveIntervalIsRejected() {
  const auto yaml_path = WriteYaml("zero_interval",
                                   R"(assignment:
  reconcile_interval: 0s
)");

  auto config = orchestra::config::ConfigLoader::LoadFromYaml(yaml_path.string());

  bool threw = false;
  try {
    (void)orchestra::config::ResolveAssignmentTiming(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestNonPositiveActivityWindowIsRejected() {
  for (const auto* window : {"0s", "-30s"}) {
    const auto yaml_path = WriteYaml(std::string("activity_window_") + (window[0] == '-' ? "negative" : "zero"),
                                     std::string(R"(discovery:
  enabled: true
  sessions_root: /tmp/sessions
  activity_window: )") + window + "\n");

    auto config = orchestra::config::ConfigLoader::LoadFromYaml(yaml_path.string());

    bool threw = false;
    try {
      (void)orchestra::config::ResolveDiscoverySettings(config);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)orchestra::config::ConfigLoader::LoadFromYaml("/definitely/missing/orchestra.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestDefaultsApplyWhenSectionsAreMissing();
  TestBackoffDefaultsToTenIntervals();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestDiscoveryRequiresSessionsRoot();
  TestNonPositiveIntervalIsRejected();
  TestNonPositiveActivityWindowIsRejected();
  TestMissingFileIsReported();

  std::cout << "orchestra_unit_config_loader: pass\n";
  return 0;
}
