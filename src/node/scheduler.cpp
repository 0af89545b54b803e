// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "node/scheduler.hpp"
#include "network/http_jsonrpc_client.hpp"
#include "util/logging.hpp"
#include <system_error>

namespace codl3 {
namespace node {

Scheduler::~Scheduler() { Stop(); }

bool Scheduler::AddTask(const std::string &name,
                        std::chrono::milliseconds interval, TaskBody body) {
  if (running_.load()) {
    LOG_APP_ERROR("Scheduler: cannot add task '{}' while running", name);
    return false;
  }
  if (FindTask(name)) {
    LOG_APP_ERROR("Scheduler: duplicate task '{}'", name);
    return false;
  }

  auto entry = std::make_unique<TaskEntry>();
  entry->name = name;
  entry->interval = interval;
  entry->body = std::move(body);
  tasks_.push_back(std::move(entry));
  return true;
}

bool Scheduler::Start() {
  if (running_.exchange(true)) {
    LOG_APP_WARN("Scheduler: already running");
    return false;
  }

  for (auto &entry : tasks_) {
    LOG_APP_INFO("Scheduler: starting task '{}' (every {} ms)", entry->name,
                 entry->interval.count());
    TaskEntry *task = entry.get();
    threads_.emplace_back([this, task]() { TaskLoop(*task); });
  }
  return true;
}

void Scheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wait_cv_.notify_all();

  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();

  LOG_APP_INFO("Scheduler: all tasks stopped");
}

void Scheduler::TaskLoop(TaskEntry &entry) {
  while (running_.load()) {
    RunBody(entry);

    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, entry.interval,
                      [this]() { return !running_.load(); });
  }
  LOG_APP_DEBUG("Scheduler: task '{}' exited after {} runs", entry.name,
                entry.runs.load());
}

void Scheduler::RunBody(TaskEntry &entry) {
  entry.runs.fetch_add(1);
  try {
    entry.body();
  } catch (const network::TransientNetworkError &e) {
    entry.failures.fetch_add(1);
    LOG_APP_WARN("Task '{}': {} (retrying next tick)", entry.name, e.what());
  } catch (const std::system_error &) {
    throw;
  } catch (const std::exception &e) {
    entry.failures.fetch_add(1);
    LOG_APP_ERROR("Task '{}' failed: {}", entry.name, e.what());
  }
}

bool Scheduler::RunTaskOnce(const std::string &name) {
  TaskEntry *entry = FindTask(name);
  if (!entry) {
    return false;
  }
  RunBody(*entry);
  return true;
}

Scheduler::TaskEntry *Scheduler::FindTask(const std::string &name) const {
  for (const auto &entry : tasks_) {
    if (entry->name == name) {
      return entry.get();
    }
  }
  return nullptr;
}

std::vector<std::string> Scheduler::GetTaskNames() const {
  std::vector<std::string> names;
  names.reserve(tasks_.size());
  for (const auto &entry : tasks_) {
    names.push_back(entry->name);
  }
  return names;
}

uint64_t Scheduler::GetRunCount(const std::string &name) const {
  TaskEntry *entry = FindTask(name);
  return entry ? entry->runs.load() : 0;
}

uint64_t Scheduler::GetFailureCount(const std::string &name) const {
  TaskEntry *entry = FindTask(name);
  return entry ? entry->failures.load() : 0;
}

} // namespace node
} // namespace codl3
