#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/executor/executor.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct EngineConfig {
  std::size_t max_concurrent{3};
  ExecutorType executor{ExecutorType::Process};
  std::vector<std::string> agent_command{"claude", "--print", "--output-format",
                                         "stream-json"};
  // Zero means no timeout.
  std::chrono::seconds default_timeout{1800};
  int default_max_retries{0};
  std::chrono::milliseconds kill_grace{DEFAULT_KILL_GRACE};
};

// Basename of an append-only structured log and the entity type it holds.
struct StructuredLogRule {
  std::string name;
  std::string entity;
};

struct SyncConfig {
  std::string repo_path{"."};
  std::string tag_prefix{"taskweave-sync-before-"};
  std::string worktree_root{".taskweave/worktrees"};
  std::string branch_prefix{"taskweave/"};
  std::vector<StructuredLogRule> structured_logs{{"issues.jsonl", "issue"},
                                                 {"specs.jsonl", "spec"}};
};

struct StorageConfig {
  std::string db_file{"taskweave.db"};
};

struct Config {
  LogConfig log;
  EngineConfig engine;
  SyncConfig sync;
  StorageConfig storage;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<Config>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<Config>;

  [[nodiscard]] static auto to_string(const Config& config) -> std::string;
  [[nodiscard]] static auto save_to_file(const Config& config,
                                         std::string_view path) -> Result<void>;
};

}  // namespace taskweave
