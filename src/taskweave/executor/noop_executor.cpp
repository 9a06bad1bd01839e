#include "taskweave/executor/executor.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace taskweave {

namespace {

// Completes every request successfully, but from its own thread so callers
// never observe the callback re-entrantly inside execute().
class NoopExecutor : public IExecutor {
public:
  NoopExecutor() : worker_([this] { run(); }) {}

  ~NoopExecutor() override {
    {
      std::lock_guard lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_one();
    worker_.join();
  }

  auto execute(const std::string& instance_id, const ExecutorConfig& config,
               ExecutorCallback callback) -> void override {
    (void)config;
    {
      std::lock_guard lock(mutex_);
      pending_.emplace_back(instance_id, std::move(callback));
    }
    cv_.notify_one();
  }

  auto cancel(std::string_view instance_id) -> void override {
    (void)instance_id;
  }

private:
  auto run() -> void {
    std::unique_lock lock(mutex_);
    for (;;) {
      cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
      if (pending_.empty()) {
        return;
      }
      auto [id, callback] = std::move(pending_.front());
      pending_.pop_front();
      lock.unlock();
      callback(id, ExecutorResult{});
      lock.lock();
    }
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::pair<std::string, ExecutorCallback>> pending_;
  bool stopping_{false};
  std::thread worker_;
};

}  // namespace

auto create_noop_executor() -> std::unique_ptr<IExecutor> {
  return std::make_unique<NoopExecutor>();
}

}  // namespace taskweave
