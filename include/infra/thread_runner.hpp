#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread (the camera capture loop). It provides:
        - Consistent start/stop behavior, restartable after join() so a camera can be switched off and on
        - A local_stop flag for stopping the singular worker thread
        - Read-only access to a global_stop flag for stopping on entire process shutdowns
        - A running() flag that drops when the worker returns, including when it throws
*/

namespace toon {

class ThreadRunner {
public:
  // Any callable that takes a global stop token and a local stop flag, and returns nothing
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  // Remove copy/move
  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Start the thread. Throws if a previous worker was not joined yet
  void start(StopToken global_stop, Fn fn);

  // Request this specific thread to stop. Does NOT affect other threads
  void request_stop();

  // request_stop() + join()
  void stop();

  void join();
  bool joinable() const;

  // True from start() until the worker function returns
  bool running() const { return running_.load(std::memory_order_acquire); }

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};    // Flag that stops this thread only
  std::atomic_bool running_{false};
  StopToken global_stop_{};               // View of the process-wide StopSource
  std::string name_{"thread"};            // Used in log lines
};

} // namespace toon
