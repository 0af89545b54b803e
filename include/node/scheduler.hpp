// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_NODE_SCHEDULER_HPP
#define CODL3_NODE_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace codl3 {
namespace node {

/**
 * Scheduler - owner of the node's periodic background tasks
 *
 * Every task gets its own thread that runs the body, then waits for its
 * interval or for Stop(), whichever comes first. The shared running flag
 * is checked before each tick, so Stop() returns once every in-flight body
 * has finished; no body is interrupted mid-way.
 *
 * Failure policy inside a body:
 * - network::TransientNetworkError: logged as a warning, retried next tick
 * - other std::exception: logged as an error, retried next tick
 * - std::system_error: not caught (lock failure; terminates the process)
 */
class Scheduler {
public:
  using TaskBody = std::function<void()>;

  Scheduler() = default;
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  // Register before Start(); false on a duplicate name or after Start()
  bool AddTask(const std::string &name, std::chrono::milliseconds interval,
               TaskBody body);

  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  /**
   * Run one tick of `name` on the calling thread
   *
   * Applies the same failure policy as the task thread. Lets tests drive
   * task bodies without sleeping.
   * @return false if no task has that name
   */
  bool RunTaskOnce(const std::string &name);

  std::vector<std::string> GetTaskNames() const;
  uint64_t GetRunCount(const std::string &name) const;
  uint64_t GetFailureCount(const std::string &name) const;

private:
  struct TaskEntry {
    std::string name;
    std::chrono::milliseconds interval;
    TaskBody body;
    std::atomic<uint64_t> runs{0};
    std::atomic<uint64_t> failures{0};
  };

  void TaskLoop(TaskEntry &entry);
  void RunBody(TaskEntry &entry);
  TaskEntry *FindTask(const std::string &name) const;

  std::vector<std::unique_ptr<TaskEntry>> tasks_;
  std::vector<std::thread> threads_;

  std::atomic<bool> running_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace node
} // namespace codl3

#endif // CODL3_NODE_SCHEDULER_HPP
