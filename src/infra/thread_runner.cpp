#include "infra/thread_runner.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace toon {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

// Destructor safely stops thread on death
ThreadRunner::~ThreadRunner() {
  stop();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  global_stop_ = global_stop;
  running_.store(true, std::memory_order_release);

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    // An escaping exception would terminate the process; report it and end this worker only
    try {
      fn(global_stop_, local_stop_);
    } catch (const std::exception& e) {
      std::cerr << name_ << " worker failed: " << e.what() << "\n";
    }
    running_.store(false, std::memory_order_release);
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

void ThreadRunner::stop() {
  request_stop();
  join();
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace toon
