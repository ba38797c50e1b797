#include "session_directory_provider.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/time.hpp"

namespace orchestra::discovery {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kTailChunkBytes = 64 * 1024;

std::string EncodeComponent(const std::string& name) {
  std::string out(name);
  std::replace_if(out.begin(), out.end(), [](unsigned char c) { return !std::isalnum(c); }, '-');
  return out;
}

std::vector<std::string> SplitDashes(const std::string& value) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  for (;;) {
    const auto pos = value.find('-', start);
    if (pos == std::string::npos) {
      parts.push_back(value.substr(start));
      return parts;
    }
    parts.push_back(value.substr(start, pos - start));
    start = pos + 1;
  }
}

// Depth-first match of encoded tokens against real directory entries.
std::optional<fs::path> ResolveTokens(const fs::path& dir, const std::vector<std::string>& tokens, std::size_t start) {
  std::error_code ec;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return std::nullopt;
  }

  for (const auto& entry : it) {
    const auto entry_tokens = SplitDashes(EncodeComponent(entry.path().filename().string()));
    if (start + entry_tokens.size() > tokens.size()) continue;
    if (!std::equal(entry_tokens.begin(), entry_tokens.end(), tokens.begin() + static_cast<std::ptrdiff_t>(start))) continue;

    const auto next = start + entry_tokens.size();
    if (next == tokens.size()) {
      if (entry.is_directory(ec)) return entry.path();
      continue;
    }
    if (entry.is_directory(ec)) {
      if (auto found = ResolveTokens(entry.path(), tokens, next)) return found;
    }
  }
  return std::nullopt;
}

// Non-blank lines of buffer. The first segment is dropped when it may be cut.
std::vector<std::string> SplitLines(const std::string& buffer, bool first_is_partial) {
  std::vector<std::string> lines;
  std::size_t              pos = 0;
  if (first_is_partial) {
    pos = buffer.find('\n');
    if (pos == std::string::npos) return lines;
    ++pos;
  }
  while (pos < buffer.size()) {
    auto end = buffer.find('\n', pos);
    if (end == std::string::npos) end = buffer.size();
    if (buffer.find_first_not_of(" \t\r", pos) < end) {
      lines.push_back(buffer.substr(pos, end - pos));
    }
    pos = end + 1;
  }
  return lines;
}

// Last count non-blank lines. The window grows backwards until it holds
// enough complete lines or reaches the start of the file.
std::vector<std::string> ReadTail(const fs::path& file, std::size_t count) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw util::Unavailable("cannot open session file " + file.string());
  }
  if (count == 0) {
    return {};
  }

  in.seekg(0, std::ios::end);
  const auto size = static_cast<std::size_t>(std::max<std::streamoff>(in.tellg(), 0));

  std::vector<std::string> lines;
  for (std::size_t window = kTailChunkBytes;; window *= 2) {
    const auto start = size > window ? size - window : 0;

    std::string buffer(size - start, '\0');
    in.clear();
    in.seekg(static_cast<std::streamoff>(start));
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    buffer.resize(static_cast<std::size_t>(in.gcount()));

    lines = SplitLines(buffer, start > 0);
    if (lines.size() >= count || start == 0) break;
  }

  if (lines.size() > count) {
    lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
  }
  return lines;
}

std::optional<google::protobuf::Struct> ParseObject(const std::string& line) {
  google::protobuf::Struct                 object;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(line, &object, options).ok()) {
    return std::nullopt;
  }
  return object;
}

bool IsAssistantTurn(const std::string& line) {
  const auto object = ParseObject(line);
  if (!object) {
    return false;
  }

  const auto& fields = object->fields();
  auto        it     = fields.find("type");
  return it != fields.end() && it->second.string_value() == "assistant";
}

// message.content is either plain text or a list of blocks.
std::string MessageContent(const google::protobuf::Struct& object) {
  const auto& fields  = object.fields();
  auto        message = fields.find("message");
  if (message == fields.end() || message->second.kind_case() != google::protobuf::Value::kStructValue) {
    return {};
  }

  const auto& message_fields = message->second.struct_value().fields();
  auto        content        = message_fields.find("content");
  if (content == message_fields.end()) {
    return {};
  }

  if (content->second.kind_case() == google::protobuf::Value::kStringValue) {
    return content->second.string_value();
  }
  if (content->second.kind_case() != google::protobuf::Value::kListValue) {
    return {};
  }

  std::string joined;
  for (const auto& block : content->second.list_value().values()) {
    if (block.kind_case() != google::protobuf::Value::kStructValue) continue;

    const auto& block_fields = block.struct_value().fields();
    auto        type         = block_fields.find("type");
    if (type == block_fields.end()) continue;

    std::string part;
    if (type->second.string_value() == "text") {
      auto text = block_fields.find("text");
      if (text != block_fields.end()) part = text->second.string_value();
    } else if (type->second.string_value() == "tool_use") {
      auto name = block_fields.find("name");
      if (name != block_fields.end()) part = "[Tool: " + name->second.string_value() + "]";
    }

    if (part.empty()) continue;
    if (!joined.empty()) joined.push_back(' ');
    joined += part;
  }
  return joined;
}

// Cuts at a UTF-8 boundary at or below limit bytes.
std::string Truncate(std::string content, std::size_t limit) {
  if (content.size() <= limit) {
    return content;
  }
  auto cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(content[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  content.resize(cut);
  content += "...";
  return content;
}

bool IsValidSessionRef(const std::string& session_ref) {
  return !session_ref.empty() && std::all_of(session_ref.begin(), session_ref.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
  }) && session_ref.find("..") == std::string::npos;
}

std::chrono::system_clock::time_point ModifiedAt(const fs::path& file) {
  const auto ftime = fs::last_write_time(file);
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(ftime));
}

} // namespace

SessionDirectoryProvider::SessionDirectoryProvider(fs::path root, std::string worker_kind)
    : root_(std::move(root)), worker_kind_(std::move(worker_kind)) {
}

std::optional<std::string> SessionDirectoryProvider::DecodeDriveForm(const std::string& encoded) {
  if (encoded.size() < 3 || !std::isalpha(static_cast<unsigned char>(encoded[0])) || encoded[1] != '-' || encoded[2] != '-') {
    return std::nullopt;
  }

  std::string path;
  path.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(encoded[0]))));
  path += ":\\";
  for (std::size_t i = 3; i < encoded.size(); ++i) {
    path.push_back(encoded[i] == '-' ? '\\' : encoded[i]);
  }
  return path;
}

std::optional<std::string> SessionDirectoryProvider::DecodeProjectDirectory(const std::string& encoded) {
  if (encoded.empty()) {
    return std::nullopt;
  }

  if (auto drive = DecodeDriveForm(encoded)) {
    std::error_code ec;
    if (fs::is_directory(*drive, ec)) return drive;
    return std::nullopt;
  }

  if (encoded.front() != '-') {
    return std::nullopt;
  }

  const auto tokens = SplitDashes(encoded.substr(1));
  if (auto found = ResolveTokens(fs::path("/"), tokens, 0)) {
    return found->string();
  }
  return std::nullopt;
}

bool SessionDirectoryProvider::HasRecentAssistantTurn(const fs::path& session_file, std::size_t tail_lines) {
  const auto lines = ReadTail(session_file, tail_lines);
  return std::any_of(lines.begin(), lines.end(), IsAssistantTurn);
}

std::optional<SessionHistoryEntry> SessionDirectoryProvider::ParseHistoryLine(const std::string& line) {
  const auto object = ParseObject(line);
  if (!object) {
    return std::nullopt;
  }

  const auto& fields    = object->fields();
  auto        type      = fields.find("type");
  auto        timestamp = fields.find("timestamp");
  if (type == fields.end() || timestamp == fields.end()) {
    return std::nullopt;
  }

  auto content = MessageContent(*object);
  if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
    return std::nullopt;
  }

  SessionHistoryEntry entry;
  entry.type    = type->second.string_value();
  entry.content = Truncate(std::move(content), kMaxHistoryContentBytes);

  google::protobuf::Timestamp parsed;
  entry.timestamp = google::protobuf::util::TimeUtil::FromString(timestamp->second.string_value(), &parsed) ? util::FromProto(parsed) : util::Now();
  return entry;
}

std::optional<fs::path> SessionDirectoryProvider::FindSessionFile(const std::string& session_ref) const {
  if (!IsValidSessionRef(session_ref)) {
    throw util::InvalidArgument("invalid session reference: " + session_ref);
  }

  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    return std::nullopt;
  }

  const auto                       file_name = session_ref + ".jsonl";
  fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->path().filename() == file_name && it->is_regular_file(ec)) {
      return it->path();
    }
  }
  if (ec) {
    throw util::Unavailable("cannot list session root " + root_.string() + ": " + ec.message());
  }
  return std::nullopt;
}

std::vector<SessionHistoryEntry> SessionDirectoryProvider::ReadHistory(const std::string& session_ref, std::size_t max_entries) const {
  const auto file = FindSessionFile(session_ref);
  if (!file) {
    throw util::NotFound("session not found: " + session_ref);
  }

  std::vector<SessionHistoryEntry> entries;
  for (const auto& line : ReadTail(*file, max_entries)) {
    if (auto entry = ParseHistoryLine(line)) {
      entries.push_back(std::move(*entry));
    }
  }

  std::stable_sort(entries.begin(), entries.end(), [](const SessionHistoryEntry& a, const SessionHistoryEntry& b) {
    return a.timestamp < b.timestamp;
  });

  ORCHESTRA_LOG_DEBUG("Session history read", {StringField("session", session_ref), IntField("entries", static_cast<int64_t>(entries.size()))});
  return entries;
}

std::optional<WorkerDescriptor> SessionDirectoryProvider::DescribeSession(const fs::path& session_file, const std::string& repository) const {
  const auto session_id = session_file.stem().string();
  if (session_id.empty()) {
    return std::nullopt;
  }

  const auto repo_name = util::ContextBaseName(repository);

  WorkerDescriptor descriptor;
  descriptor.id                       = repo_name + "_" + session_id;
  descriptor.name                     = worker_kind_ + " - " + repo_name + " (" + session_id.substr(0, 8) + ")";
  descriptor.kind                     = worker_kind_;
  descriptor.resource_context         = repository;
  descriptor.session_ref              = session_id;
  descriptor.last_activity            = ModifiedAt(session_file);
  descriptor.recent_executor_activity = HasRecentAssistantTurn(session_file);
  return descriptor;
}

void SessionDirectoryProvider::DiscoverProject(const fs::path& project, std::vector<WorkerDescriptor>& out) const {
  const auto encoded    = project.filename().string();
  const auto repository = DecodeProjectDirectory(encoded);
  if (!repository) {
    ORCHESTRA_LOG_DEBUG("Skipping project without a matching repository", {StringField("project", encoded)});
    return;
  }

  std::error_code        ec;
  fs::directory_iterator sessions(project, ec);
  if (ec) {
    throw util::Unavailable("cannot list project sessions: " + ec.message());
  }

  for (const auto& session : sessions) {
    if (!session.is_regular_file(ec) || session.path().extension() != ".jsonl") continue;

    try {
      if (auto descriptor = DescribeSession(session.path(), *repository)) {
        out.push_back(std::move(*descriptor));
      }
    } catch (const std::exception& e) {
      ORCHESTRA_LOG_WARN("Skipping unreadable session", {StringField("session", session.path().string()), StringField("error", e.what())});
    }
  }
}

std::vector<WorkerDescriptor> SessionDirectoryProvider::DiscoverAll() {
  std::vector<WorkerDescriptor> descriptors;

  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    ORCHESTRA_LOG_DEBUG("Session root not found", {StringField("root", root_.string())});
    return descriptors;
  }

  fs::directory_iterator projects(root_, ec);
  if (ec) {
    throw util::Unavailable("cannot list session root " + root_.string() + ": " + ec.message());
  }

  for (const auto& project : projects) {
    if (!project.is_directory(ec)) continue;

    try {
      DiscoverProject(project.path(), descriptors);
    } catch (const std::exception& e) {
      ORCHESTRA_LOG_WARN("Skipping unreadable project", {StringField("project", project.path().string()), StringField("error", e.what())});
    }
  }

  ORCHESTRA_LOG_DEBUG("Session discovery finished", {StringField("root", root_.string()), IntField("sessions", static_cast<int64_t>(descriptors.size()))});
  return descriptors;
}

} // namespace orchestra::discovery
