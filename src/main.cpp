#include "taskweave/config/config.hpp"
#include "taskweave/config/task_file.hpp"
#include "taskweave/executor/executor.hpp"
#include "taskweave/git/worktree_manager.hpp"
#include "taskweave/scheduler/engine.hpp"
#include "taskweave/storage/execution_store.hpp"
#include "taskweave/sync/conflict_detector.hpp"
#include "taskweave/sync/jsonl_resolver.hpp"
#include "taskweave/sync/line_merge.hpp"
#include "taskweave/sync/worktree_sync.hpp"
#include "taskweave/util/log.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace taskweave;

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("taskweave - parallel agent tasks in isolated git worktrees");
  std::println("Usage: {} [OPTIONS] <command> [ARGS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  run <tasks.yaml>                   Run a task batch");
  std::println(
      "  conflicts <branch-a> <branch-b>    Predict conflicts of a merge");
  std::println(
      "  merge-file <base> <ours> <theirs>  Three-way line merge to stdout");
  std::println(
      "  resolve-jsonl <file>               Resolve a conflicted JSONL file");
  std::println(
      "  worktree create <id> <base>        Create an execution worktree");
  std::println("  worktree remove <id>               Remove it and its branch");
  std::println("  executions                         List execution records");
  std::println("  set-status <id> <status>           Update an execution");
  std::println("  preview <id>                       Preview a sync");
  std::println("  sync <id> [-m <message>]           Squash-merge into target");
  std::println("  sync-preserve <id> [-m <message>]  Merge keeping branch history");
  std::println(
      "  sync-stage <id> [--uncommitted]    Stage the changes, no commit");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --log-level <level>   trace, debug, info, warn, error");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
}

void print_version() {
  std::println("taskweave v0.1.0");
}

struct Options {
  std::string config_file;
  std::string log_level;
  std::string command;
  std::vector<std::string> args;
};

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  int i = 1;
  for (; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        std::println(stderr, "Error: --log-level requires an argument");
        std::exit(1);
      }
      opts.log_level = argv[i];
    } else if (arg.starts_with("-")) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else {
      break;
    }
  }

  if (i >= argc) {
    print_usage(argv[0]);
    std::exit(1);
  }
  opts.command = argv[i++];
  for (; i < argc; ++i) {
    opts.args.emplace_back(argv[i]);
  }
  return opts;
}

auto require_args(const Options& opts, std::size_t n, std::string_view usage)
    -> bool {
  if (opts.args.size() < n) {
    std::println(stderr, "Usage: taskweave {}", usage);
    return false;
  }
  return true;
}

auto read_file(const std::string& path) -> std::optional<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

auto open_store(const Config& config) -> std::unique_ptr<SqliteExecutionStore> {
  auto store = std::make_unique<SqliteExecutionStore>(config.storage.db_file);
  if (auto r = store->open(); !r) {
    std::println(stderr, "Error: cannot open {}: {}", config.storage.db_file,
                 r.error().message());
    return nullptr;
  }
  return store;
}

auto cmd_run(const Config& config, const Options& opts) -> int {
  if (!require_args(opts, 1, "run <tasks.yaml>")) {
    return 1;
  }
  auto tasks = TaskFileLoader::load_from_file(opts.args[0]);
  if (!tasks) {
    std::println(stderr, "Error: failed to load {}: {}", opts.args[0],
                 tasks.error().message());
    return 1;
  }

  // Declared first so it outlives the engine.
  auto executor = config.engine.executor == ExecutorType::Noop
                      ? create_noop_executor()
                      : create_process_executor(config.engine.kill_grace);
  Engine engine(*executor, config.engine);

  std::vector<TaskId> ids;
  for (const auto& t : *tasks) {
    ids.push_back(t.id);
  }
  auto submitted = engine.submit_tasks(std::move(*tasks));
  if (!submitted) {
    std::println(stderr, "Error: batch rejected: {}",
                 submitted.error().message());
    return 1;
  }

  std::vector<std::future<TaskOutcome>> futures;
  for (const auto& id : ids) {
    futures.push_back(engine.wait_for_task(id));
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int failures = 0;
  bool cancelling = false;
  for (std::size_t i = 0; i < futures.size(); ++i) {
    while (futures[i].wait_for(std::chrono::milliseconds(100)) !=
           std::future_status::ready) {
      if (!cancelling &&
          g_shutdown_requested.load(std::memory_order_acquire)) {
        log::info("Received shutdown signal, cancelling tasks...");
        cancelling = true;
        for (const auto& id : ids) {
          // Finished tasks reject the cancel; nothing to do for them.
          if (auto r = engine.cancel_task(id); !r) {
            log::debug("Cancel {} skipped: {}", id, r.error().message());
          }
        }
      }
    }

    auto outcome = futures[i].get();
    if (outcome) {
      std::println("{}  completed  {} attempt(s), {} ms", outcome->task_id,
                   outcome->attempts, outcome->duration.count());
      if (!outcome->output.empty()) {
        std::println("{}", outcome->output);
      }
    } else {
      ++failures;
      std::println("{}  failed  {}", outcome.error().task_id,
                   outcome.error().message);
    }
  }

  auto m = engine.get_metrics();
  std::println("");
  std::println("completed {}  failed {}  cancelled {}  retries {}",
               m.completed_tasks, m.failed_tasks, m.cancelled_tasks,
               m.retried_attempts);
  std::println("success rate {:.1f}%  average {} ms  spawned {}",
               m.success_rate * 100.0, m.average_duration.count(),
               m.total_processes_spawned);
  return failures == 0 ? 0 : 2;
}

auto cmd_conflicts(const Config& config, const Options& opts) -> int {
  if (!require_args(opts, 2, "conflicts <branch-a> <branch-b>")) {
    return 1;
  }
  ConflictDetector detector(GitCli{config.sync.repo_path},
                            StructuredLogMatcher{config.sync.structured_logs});
  auto report = detector.detect_conflicts(opts.args[0], opts.args[1]);
  if (!report) {
    std::println(stderr, "Error: {}", report.error().message());
    return 1;
  }
  std::println("{}", report->summary);
  for (const auto& c : report->jsonl_conflicts) {
    std::println("  jsonl  {} ({})", c.file_path, c.entity_type);
  }
  for (const auto& c : report->code_conflicts) {
    std::println("  {}  {}: {}", to_string_view(c.conflict_type), c.file_path,
                 c.description);
  }
  return report->code_conflicts.empty() ? 0 : 2;
}

auto cmd_merge_file(const Options& opts) -> int {
  if (!require_args(opts, 3, "merge-file <base> <ours> <theirs>")) {
    return 1;
  }
  std::array<std::string, 3> blobs;
  for (std::size_t i = 0; i < blobs.size(); ++i) {
    auto content = read_file(opts.args[i]);
    if (!content) {
      std::println(stderr, "Error: cannot read {}", opts.args[i]);
      return 1;
    }
    blobs[i] = std::move(*content);
  }
  auto merged = merge_three_way(blobs[0], blobs[1], blobs[2]);
  if (!merged) {
    std::println(stderr, "Error: {}", merged.error().message());
    return 1;
  }
  std::print("{}", merged->content);
  return merged->has_conflicts ? 2 : 0;
}

auto cmd_resolve_jsonl(const Options& opts) -> int {
  if (!require_args(opts, 1, "resolve-jsonl <file>")) {
    return 1;
  }
  const auto& path = opts.args[0];
  auto content = read_file(path);
  if (!content) {
    std::println(stderr, "Error: cannot read {}", path);
    return 1;
  }
  auto resolved = resolve_jsonl(*content);
  if (!resolved) {
    std::println(stderr, "Error: {}: {}", path, resolved.error().message());
    return 1;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << *resolved;
  if (!out) {
    std::println(stderr, "Error: cannot write {}", path);
    return 1;
  }
  return 0;
}

auto cmd_worktree(const Config& config, const Options& opts) -> int {
  if (!require_args(opts, 2, "worktree create <id> <base> | remove <id>")) {
    return 1;
  }
  auto store = open_store(config);
  if (!store) {
    return 1;
  }
  GitCli git{config.sync.repo_path};
  WorktreeManager manager(git, config.sync);
  ExecutionId id{opts.args[1]};

  if (opts.args[0] == "create") {
    if (!require_args(opts, 3, "worktree create <id> <base>")) {
      return 1;
    }
    const auto& base = opts.args[2];
    auto before = git.rev_parse(base);
    if (!before) {
      std::println(stderr, "Error: unknown base {}", base);
      return 1;
    }
    auto info = manager.create(id, base);
    if (!info) {
      std::println(stderr, "Error: {}", info.error().message());
      return 1;
    }
    ExecutionRecord record;
    record.id = id;
    record.status = ExecutionStatus::Pending;
    record.worktree_path = info->path;
    record.branch_name = info->branch;
    record.target_branch = base;
    record.before_commit = *before;
    if (auto r = store->save(record); !r) {
      std::println(stderr, "Error: {}", r.error().message());
      return 1;
    }
    std::println("{}  {}", info->branch, info->path);
    return 0;
  }

  if (opts.args[0] == "remove") {
    auto record = store->get(id);
    if (!record) {
      std::println(stderr, "Error: execution {} not found", id);
      return 1;
    }
    if (auto r = manager.remove(
            WorktreeInfo{record->worktree_path, record->branch_name}, true);
        !r) {
      std::println(stderr, "Error: {}", r.error().message());
      return 1;
    }
    return 0;
  }

  std::println(stderr, "Unknown worktree command: {}", opts.args[0]);
  return 1;
}

auto cmd_executions(const Config& config) -> int {
  auto store = open_store(config);
  if (!store) {
    return 1;
  }
  auto records = store->list();
  if (!records) {
    std::println(stderr, "Error: {}", records.error().message());
    return 1;
  }
  for (const auto& r : *records) {
    std::println("{}  {}  {} -> {}  {}", r.id, to_string_view(r.status),
                 r.branch_name, r.target_branch,
                 r.after_commit.empty() ? "-" : r.after_commit);
  }
  return 0;
}

auto cmd_set_status(const Config& config, const Options& opts) -> int {
  if (!require_args(opts, 2, "set-status <id> <status>")) {
    return 1;
  }
  auto status = parse_execution_status(opts.args[1]);
  if (!status) {
    std::println(stderr, "Error: unknown status {}", opts.args[1]);
    return 1;
  }
  auto store = open_store(config);
  if (!store) {
    return 1;
  }
  if (auto r = store->update_status(ExecutionId{opts.args[0]}, *status); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  return 0;
}

auto print_warnings(const std::vector<std::string>& warnings) -> void {
  for (const auto& w : warnings) {
    std::println("  warning: {}", w);
  }
}

auto cmd_preview(const Config& config, const Options& opts) -> int {
  if (!require_args(opts, 1, "preview <id>")) {
    return 1;
  }
  auto store = open_store(config);
  if (!store) {
    return 1;
  }
  WorktreeSynchronizer sync(*store, config.sync);
  auto preview = sync.preview_sync(ExecutionId{opts.args[0]});
  if (!preview) {
    std::println(stderr, "Error: {}", preview.error().message());
    return 1;
  }
  std::println("can sync: {}", preview->can_sync ? "yes" : "no");
  if (!preview->merge_base.empty()) {
    std::println("merge base: {}", preview->merge_base);
    std::println("{} commit(s), {} file(s), +{} -{}", preview->commits.size(),
                 preview->diff.files.size(), preview->diff.additions,
                 preview->diff.deletions);
    for (const auto& c : preview->commits) {
      std::println("  {} {}", c.sha.substr(0, 8), c.message);
    }
    std::println("conflicts: {}", preview->conflicts.summary);
  }
  print_warnings(preview->warnings);
  return preview->can_sync ? 0 : 2;
}

auto cmd_sync(const Config& config, const Options& opts, SyncMode mode)
    -> int {
  const char* usage = "sync <id> [-m <message>]";
  if (mode == SyncMode::Stage) {
    usage = "sync-stage <id> [--uncommitted]";
  } else if (mode == SyncMode::Preserve) {
    usage = "sync-preserve <id> [-m <message>]";
  }
  if (!require_args(opts, 1, usage)) {
    return 1;
  }
  SyncOptions options;
  options.mode = mode;
  for (std::size_t i = 1; i < opts.args.size(); ++i) {
    const auto& arg = opts.args[i];
    if ((arg == "-m" || arg == "--message") && mode != SyncMode::Stage &&
        i + 1 < opts.args.size()) {
      options.message = opts.args[++i];
    } else if (arg == "--uncommitted" && mode == SyncMode::Stage) {
      options.include_uncommitted = true;
    } else {
      std::println(stderr, "Usage: taskweave {}", usage);
      return 1;
    }
  }
  auto store = open_store(config);
  if (!store) {
    return 1;
  }
  WorktreeSynchronizer sync(*store, config.sync);
  auto result = sync.sync(ExecutionId{opts.args[0]}, options);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  if (result->success) {
    if (mode == SyncMode::Stage) {
      std::println("staged {} file(s) ({} uncommitted)", result->files_changed,
                   result->uncommitted_files);
    } else {
      std::println("synced as {} ({} file(s))", result->final_commit,
                   result->files_changed);
    }
    std::println("backup tag: {}", result->backup_tag.value_or("-"));
    for (const auto& path : result->resolved_logs) {
      std::println("  auto-resolved {}", path);
    }
  } else {
    std::println("sync failed: {}", result->error);
  }
  print_warnings(result->warnings);
  return result->success ? 0 : 2;
}

auto dispatch(const Config& config, const Options& opts) -> int {
  const auto& cmd = opts.command;
  if (cmd == "run") {
    return cmd_run(config, opts);
  }
  if (cmd == "conflicts") {
    return cmd_conflicts(config, opts);
  }
  if (cmd == "merge-file") {
    return cmd_merge_file(opts);
  }
  if (cmd == "resolve-jsonl") {
    return cmd_resolve_jsonl(opts);
  }
  if (cmd == "worktree") {
    return cmd_worktree(config, opts);
  }
  if (cmd == "executions") {
    return cmd_executions(config);
  }
  if (cmd == "set-status") {
    return cmd_set_status(config, opts);
  }
  if (cmd == "preview") {
    return cmd_preview(config, opts);
  }
  if (cmd == "sync") {
    return cmd_sync(config, opts, SyncMode::Squash);
  }
  if (cmd == "sync-preserve") {
    return cmd_sync(config, opts, SyncMode::Preserve);
  }
  if (cmd == "sync-stage") {
    return cmd_sync(config, opts, SyncMode::Stage);
  }
  std::println(stderr, "Unknown command: {}", cmd);
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  Config config;
  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return 1;
    }
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config: {}",
                   loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  }
  if (!opts.log_level.empty()) {
    config.log.level = opts.log_level;
  }

  log::set_level(config.log.level);
  if (!config.log.file.empty() && !log::set_file(config.log.file)) {
    std::println(stderr, "Warning: cannot open log file {}", config.log.file);
  }
  log::start();

  int rc = dispatch(config, opts);

  log::stop();
  return rc;
}
