#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/discovery/discovery_provider.hpp"

namespace orchestra::discovery {

// One conversation turn read back from a session file.
struct SessionHistoryEntry {
  std::chrono::system_clock::time_point timestamp;
  std::string                           type;
  std::string                           content;
};

/*
  Discovers workers from an agent session directory.

  Layout:
    <root>/<encoded repository path>/<session id>.jsonl

  The directory name is the repository path with every character other
  than [A-Za-z0-9] replaced by '-' ("/home/me/my-proj" becomes
  "-home-me-my-proj"). A drive form "C--Users-me-proj" maps to
  "C:\Users\me\proj". Each .jsonl file is one worker.
*/
class SessionDirectoryProvider final : public DiscoveryProvider {
 public:
  SessionDirectoryProvider(std::filesystem::path root, std::string worker_kind);

  std::vector<WorkerDescriptor> DiscoverAll() override;

  // Decodes a project directory name into an existing repository path.
  // POSIX names are resolved against the filesystem so that '-', '.' and
  // '_' inside components survive. Returns nullopt when nothing matches.
  static std::optional<std::string> DecodeProjectDirectory(const std::string& encoded);

  // Drive-letter form only; no filesystem access.
  static std::optional<std::string> DecodeDriveForm(const std::string& encoded);

  // True when one of the last lines is a JSON object with type "assistant".
  static bool HasRecentAssistantTurn(const std::filesystem::path& session_file, std::size_t tail_lines = 5);

  static constexpr std::size_t kDefaultHistoryEntries  = 50;
  static constexpr std::size_t kMaxHistoryContentBytes = 500;

  // Turns from the last max_entries lines of a session, oldest first.
  // Lines without a type, a timestamp or any text are skipped. Throws
  // util::InvalidArgument for a malformed reference and util::NotFound
  // when no session file matches.
  std::vector<SessionHistoryEntry> ReadHistory(const std::string& session_ref, std::size_t max_entries = kDefaultHistoryEntries) const;

  // Searches the whole root; nullopt when absent.
  std::optional<std::filesystem::path> FindSessionFile(const std::string& session_ref) const;

  static std::optional<SessionHistoryEntry> ParseHistoryLine(const std::string& line);

 private:
  void DiscoverProject(const std::filesystem::path& project, std::vector<WorkerDescriptor>& out) const;
  std::optional<WorkerDescriptor> DescribeSession(const std::filesystem::path& session_file, const std::string& repository) const;

  std::filesystem::path root_;
  std::string           worker_kind_;
};

} // namespace orchestra::discovery
