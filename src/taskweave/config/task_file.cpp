#include "taskweave/config/task_file.hpp"

#include "taskweave/config/yaml_utils.hpp"
#include "taskweave/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskweave::Task> {
  static bool decode(const Node& node, taskweave::Task& t) {
    if (!node.IsMap() || !node["id"]) {
      return false;
    }
    t.id = taskweave::TaskId{node["id"].as<std::string>()};
    t.type = taskweave::yaml_get_or<std::string>(node, "type", "");
    t.prompt = taskweave::yaml_get_or<std::string>(node, "prompt", "");
    t.work_dir = taskweave::yaml_get_or<std::string>(node, "work_dir", "");
    t.priority = taskweave::yaml_get_or(node, "priority", 0);

    for (const auto& dep : taskweave::yaml_get_or<std::vector<std::string>>(
             node, "depends_on", {})) {
      t.dependencies.emplace_back(dep);
    }

    if (auto retries = node["max_retries"]) {
      auto n = retries.as<int>();
      if (n < 0) {
        return false;
      }
      t.config.max_retries = n;
    }
    if (auto timeout = node["timeout"]) {
      auto secs = timeout.as<long long>();
      if (secs < 0) {
        return false;
      }
      t.config.timeout = std::chrono::seconds(secs);
    }
    t.config.command = taskweave::yaml_get_or<std::vector<std::string>>(
        node, "command", {});
    if (auto env = node["env"]; env && env.IsMap()) {
      for (const auto& kv : env) {
        t.config.env.emplace_back(kv.first.as<std::string>(),
                                  kv.second.as<std::string>());
      }
    }
    return true;
  }
};

}  // namespace YAML

namespace taskweave {

auto TaskFileLoader::load_from_file(std::string_view path)
    -> Result<std::vector<Task>> {
  std::ifstream file{std::string(path)};
  if (!file.is_open()) {
    log::error("Failed to open task file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto TaskFileLoader::load_from_string(std::string_view yaml_str)
    -> Result<std::vector<Task>> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    auto tasks = root["tasks"];
    if (!tasks || !tasks.IsSequence()) {
      log::error("Task file has no 'tasks' list");
      return fail(Error::ParseError);
    }
    std::vector<Task> out;
    out.reserve(tasks.size());
    for (const auto& node : tasks) {
      out.push_back(node.as<Task>());
    }
    return ok(std::move(out));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace taskweave
