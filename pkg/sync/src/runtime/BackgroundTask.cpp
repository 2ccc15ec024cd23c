// Repository: KitchenSync
// Component: Background Task Implementation
// Copyright (c) 2025 RetroVue

#include "kitchensync/runtime/BackgroundTask.hpp"

#include <exception>
#include <utility>

#include "kitchensync/util/Logger.hpp"

namespace kitchensync::runtime {

using util::Logger;

bool StopToken::WaitFor(std::chrono::duration<double> timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return StopRequested(); });
}

void StopToken::Request() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

void StopToken::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  stop_.store(false, std::memory_order_release);
}

BackgroundTask::BackgroundTask(std::string name) : name_(std::move(name)) {}

BackgroundTask::~BackgroundTask() { Stop(); }

bool BackgroundTask::Start(Body body) {
  if (thread_.joinable()) {
    if (running_.load(std::memory_order_acquire)) {
      return false;
    }
    // Previous run finished on its own; reap it before reuse.
    thread_.join();
  }
  token_.Reset();
  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&BackgroundTask::Run, this, std::move(body));
  return true;
}

void BackgroundTask::RequestStop() { token_.Request(); }

void BackgroundTask::Join() {
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void BackgroundTask::Stop() {
  RequestStop();
  Join();
}

void BackgroundTask::Run(Body body) {
  Logger::Debug("[" + name_ + "] Task started");
  try {
    body(token_);
  } catch (const std::exception& e) {
    Logger::Error("[" + name_ + "] Task terminated by exception: " + e.what());
  }
  running_.store(false, std::memory_order_release);
  Logger::Debug("[" + name_ + "] Task stopped");
}

}  // namespace kitchensync::runtime
