#include "taskweave/config/config.hpp"

#include "taskweave/config/yaml_utils.hpp"
#include "taskweave/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskweave::LogConfig> {
  static bool decode(const Node& node, taskweave::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = taskweave::yaml_get_or<std::string>(node, "level", "info");
    l.file = taskweave::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<taskweave::EngineConfig> {
  static bool decode(const Node& node, taskweave::EngineConfig& e) {
    if (!node.IsMap()) {
      return false;
    }
    taskweave::EngineConfig defaults;
    auto max_concurrent = taskweave::yaml_get_or<long long>(
        node, "max_concurrent",
        static_cast<long long>(defaults.max_concurrent));
    auto timeout = taskweave::yaml_get_or<long long>(
        node, "default_timeout", defaults.default_timeout.count());
    auto retries = taskweave::yaml_get_or(node, "default_max_retries",
                                          defaults.default_max_retries);
    auto grace = taskweave::yaml_get_or<long long>(node, "kill_grace_ms",
                                                   defaults.kill_grace.count());
    if (max_concurrent < 0 || timeout < 0 || retries < 0 || grace < 0) {
      return false;
    }
    e.max_concurrent = static_cast<std::size_t>(max_concurrent);
    e.default_timeout = std::chrono::seconds(timeout);
    e.default_max_retries = retries;
    e.kill_grace = std::chrono::milliseconds(grace);
    e.executor = taskweave::parse_executor_type(
        taskweave::yaml_get_or<std::string>(node, "executor", "process"));
    e.agent_command = taskweave::yaml_get_or(node, "agent_command",
                                             defaults.agent_command);
    return true;
  }
};

template <>
struct convert<taskweave::StructuredLogRule> {
  static bool decode(const Node& node, taskweave::StructuredLogRule& r) {
    if (!node.IsMap() || !node["name"] || !node["entity"]) {
      return false;
    }
    r.name = node["name"].as<std::string>();
    r.entity = node["entity"].as<std::string>();
    return !r.name.empty() && !r.entity.empty();
  }
};

template <>
struct convert<taskweave::SyncConfig> {
  static bool decode(const Node& node, taskweave::SyncConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    taskweave::SyncConfig defaults;
    s.repo_path =
        taskweave::yaml_get_or<std::string>(node, "repo_path", defaults.repo_path);
    s.tag_prefix = taskweave::yaml_get_or<std::string>(node, "tag_prefix",
                                                       defaults.tag_prefix);
    s.worktree_root = taskweave::yaml_get_or<std::string>(
        node, "worktree_root", defaults.worktree_root);
    s.branch_prefix = taskweave::yaml_get_or<std::string>(
        node, "branch_prefix", defaults.branch_prefix);
    s.structured_logs = taskweave::yaml_get_or(node, "structured_logs",
                                               defaults.structured_logs);
    return !s.tag_prefix.empty();
  }
};

template <>
struct convert<taskweave::StorageConfig> {
  static bool decode(const Node& node, taskweave::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file =
        taskweave::yaml_get_or<std::string>(node, "db_file", "taskweave.db");
    return true;
  }
};

template <>
struct convert<taskweave::Config> {
  static bool decode(const Node& node, taskweave::Config& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto log = node["log"]) {
      c.log = log.as<taskweave::LogConfig>();
    }
    if (auto engine = node["engine"]) {
      c.engine = engine.as<taskweave::EngineConfig>();
    }
    if (auto sync = node["sync"]) {
      c.sync = sync.as<taskweave::SyncConfig>();
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<taskweave::StorageConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskweave {

namespace {

void to_yaml(YAML::Emitter& out, const LogConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  yaml_emit_if_not_empty(out, "file", l.file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const EngineConfig& e) {
  out << YAML::BeginMap;
  yaml_emit(out, "max_concurrent", e.max_concurrent);
  if (e.executor != ExecutorType::Process) {
    yaml_emit(out, "executor", std::string(to_string_view(e.executor)));
  }
  yaml_emit_flow_seq(out, "agent_command", e.agent_command);
  yaml_emit(out, "default_timeout", e.default_timeout.count());
  yaml_emit(out, "default_max_retries", e.default_max_retries);
  if (e.kill_grace != DEFAULT_KILL_GRACE) {
    yaml_emit(out, "kill_grace_ms", e.kill_grace.count());
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const SyncConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "repo_path", s.repo_path);
  yaml_emit(out, "tag_prefix", s.tag_prefix);
  yaml_emit(out, "worktree_root", s.worktree_root);
  yaml_emit(out, "branch_prefix", s.branch_prefix);
  out << YAML::Key << "structured_logs" << YAML::Value << YAML::BeginSeq;
  for (const auto& rule : s.structured_logs) {
    out << YAML::Flow << YAML::BeginMap;
    yaml_emit(out, "name", rule.name);
    yaml_emit(out, "entity", rule.entity);
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "db_file", s.db_file);
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path) -> Result<Config> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<Config> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    // An empty document is a valid "all defaults" config.
    if (!root.IsDefined() || root.IsNull()) {
      return ok(Config{});
    }
    Config config = root.as<Config>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const Config& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "log" << YAML::Value;
  to_yaml(out, config.log);
  out << YAML::Key << "engine" << YAML::Value;
  to_yaml(out, config.engine);
  out << YAML::Key << "sync" << YAML::Value;
  to_yaml(out, config.sync);
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::EndMap;
  return out.c_str();
}

auto ConfigLoader::save_to_file(const Config& config, std::string_view path)
    -> Result<void> {
  std::ofstream file{std::string(path)};
  if (!file.is_open()) {
    log::error("Failed to open {} for writing", path);
    return fail(Error::FileOpenFailed);
  }
  file << to_string(config) << '\n';
  if (!file) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

}  // namespace taskweave
