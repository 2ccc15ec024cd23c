// Repository: KitchenSync
// Component: Background Task
// Purpose: Supervised worker thread with a cooperative stop token.
// Copyright (c) 2025 RetroVue

#ifndef KITCHENSYNC_RUNTIME_BACKGROUND_TASK_HPP_
#define KITCHENSYNC_RUNTIME_BACKGROUND_TASK_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace kitchensync::runtime {

// StopToken is handed to the task body. The body polls StopRequested() or
// sleeps through WaitFor(), which returns early as soon as a stop arrives.
class StopToken {
 public:
  bool StopRequested() const { return stop_.load(std::memory_order_acquire); }

  // Sleeps up to `timeout`. Returns true if a stop was requested.
  bool WaitFor(std::chrono::duration<double> timeout) const;

 private:
  friend class BackgroundTask;

  void Request();
  void Reset();

  std::atomic<bool> stop_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

// BackgroundTask owns one std::thread running `body(token)`.
//
// Lifecycle:
//   1. Start(body) spawns the thread (refused if already running)
//   2. RequestStop() signals the token; the body is expected to return
//      within one polling interval
//   3. Join() waits for the thread; Stop() does both
//   4. Destructor calls Stop()
//
// An exception escaping the body is logged; the task then counts as finished.
class BackgroundTask {
 public:
  using Body = std::function<void(const StopToken&)>;

  explicit BackgroundTask(std::string name);
  ~BackgroundTask();

  BackgroundTask(const BackgroundTask&) = delete;
  BackgroundTask& operator=(const BackgroundTask&) = delete;

  // Returns false if the task is already running.
  bool Start(Body body);

  void RequestStop();
  void Join();
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  const std::string& name() const { return name_; }

 private:
  void Run(Body body);

  std::string name_;
  StopToken token_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace kitchensync::runtime

#endif  // KITCHENSYNC_RUNTIME_BACKGROUND_TASK_HPP_
