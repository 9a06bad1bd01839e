#include "taskweave/sync/line_merge.hpp"

#include "taskweave/process/subprocess.hpp"
#include "taskweave/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>

#include <stdlib.h>

namespace taskweave {

namespace fs = std::filesystem;

namespace {

inline constexpr int MAX_CONFLICT_EXIT = 127;

// mkdtemp directory, removed with everything in it on destruction.
class ScratchDir {
public:
  static auto create() -> Result<ScratchDir> {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
      tmp = "/tmp";
    }
    std::string pattern = (tmp / "taskweave-merge-XXXXXX").string();
    if (mkdtemp(pattern.data()) == nullptr) {
      log::error("mkdtemp failed for {}: {}", pattern, std::strerror(errno));
      return fail(Error::MergeToolFailed);
    }
    return ScratchDir{fs::path{pattern}};
  }

  ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
  }
  auto operator=(ScratchDir&&) -> ScratchDir& = delete;
  ScratchDir(const ScratchDir&) = delete;
  auto operator=(const ScratchDir&) -> ScratchDir& = delete;

  ~ScratchDir() {
    if (path_.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
      log::warn("Failed to remove scratch dir {}: {}", path_.string(),
                ec.message());
    }
  }

  [[nodiscard]] auto path() const -> const fs::path& { return path_; }

private:
  explicit ScratchDir(fs::path path) : path_(std::move(path)) {}

  fs::path path_;
};

auto write_file(const fs::path& path, std::string_view content) -> bool {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return static_cast<bool>(out);
}

auto read_file(const fs::path& path) -> std::optional<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

auto line_starts_with(std::string_view text, std::string_view marker) -> bool {
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto end = text.find('\n', pos);
    auto line = text.substr(pos, end == std::string_view::npos
                                     ? std::string_view::npos
                                     : end - pos);
    if (line.starts_with(marker)) {
      return true;
    }
    if (end == std::string_view::npos) {
      break;
    }
    pos = end + 1;
  }
  return false;
}

}  // namespace

auto merge_three_way(std::string_view base, std::string_view ours,
                     std::string_view theirs, const MergeLabels& labels)
    -> Result<MergeResult> {
  auto scratch = ScratchDir::create();
  if (!scratch) {
    return fail(scratch.error());
  }

  const auto& dir = scratch->path();
  if (!write_file(dir / "base", base) || !write_file(dir / "ours", ours) ||
      !write_file(dir / "theirs", theirs)) {
    log::error("Failed to write merge inputs under {}", dir.string());
    return fail(Error::MergeToolFailed);
  }

  ProcessOptions options;
  options.working_dir = dir.string();
  auto run = run_process({"git", "merge-file", "-L", labels.ours, "-L",
                          labels.base, "-L", labels.theirs, "ours", "base",
                          "theirs"},
                         options);
  if (!run) {
    log::error("git merge-file could not be started");
    return fail(Error::MergeToolFailed);
  }

  int status = run->exit_code;
  if (status < 0 || status > MAX_CONFLICT_EXIT) {
    log::error("git merge-file failed (exit {}): {}", status,
               run->stderr_output);
    return fail(Error::MergeToolFailed);
  }

  auto merged = read_file(dir / "ours");
  if (!merged) {
    log::error("Cannot read merge output under {}", dir.string());
    return fail(Error::MergeToolFailed);
  }

  MergeResult result;
  result.content = std::move(*merged);
  result.has_conflicts = status > 0;
  result.success = status == 0;
  result.conflict_count = status;
  if (result.has_conflicts) {
    log::debug("Line merge produced {} conflicting hunk(s)", status);
  }
  return result;
}

auto has_conflict_markers(std::string_view text) -> bool {
  return line_starts_with(text, "<<<<<<<") &&
         line_starts_with(text, "=======") && line_starts_with(text, ">>>>>>>");
}

}  // namespace taskweave
