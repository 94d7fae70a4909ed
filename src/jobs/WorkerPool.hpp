#pragma once

#include <thread>
#include <vector>
#include <deque>
#include <functional>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

// Fixed set of worker threads draining a FIFO task queue.
// stop() lets queued tasks finish before joining.
class WorkerPool {
public:
  explicit WorkerPool(size_t numThreads) : stop_(false) {
    if (numThreads == 0) numThreads = defaultThreadCount();
    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      workers_.emplace_back([this] { this->workerLoop(); });
    }
  }
  ~WorkerPool() { stop(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  static size_t defaultThreadCount() {
    const unsigned hc = std::thread::hardware_concurrency();
    return hc > 0 ? hc : 2;
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (stop_) return;
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) if (t.joinable()) t.join();
  }

  void submit(std::function<void()> task) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (stop_) throw std::runtime_error("WorkerPool: submit after stop");
      tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
  }

  size_t size() const { return workers_.size(); }

  size_t pending() const {
    std::lock_guard<std::mutex> lock(m_);
    return tasks_.size();
  }

private:
  void workerLoop() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
        if (stop_ && tasks_.empty()) return;
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      task();
    }
  }

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> tasks_;
  mutable std::mutex m_;
  std::condition_variable cv_;
  bool stop_;
};
