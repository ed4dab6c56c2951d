/**
 * @file thread_pool.cpp
 * @brief Thread pool implementation
 */

#include "utils/thread_pool.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

#include "utils/structured_log.h"

namespace tastemix::utils {

ThreadPool::ThreadPool(size_t num_threads, size_t queue_size) : max_queue_size_(queue_size) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4;  // Fallback
    }
  }

  spdlog::debug("Creating thread pool with {} workers, queue size: {}", num_threads,
                queue_size == 0 ? "unbounded" : std::to_string(queue_size));

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerThread, this);
  }
}

ThreadPool::~ThreadPool() { Shutdown(); }

bool ThreadPool::Submit(Task task) {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    if (shutdown_) {
      return false;
    }

    if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_) {
      return false;  // Queue is full
    }

    tasks_.push(std::move(task));
  }

  condition_.notify_one();
  return true;
}

void ThreadPool::WaitIdle() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  idle_condition_.wait(lock, [this] { return tasks_.empty() && active_workers_ == 0; });
}

size_t ThreadPool::GetQueueSize() const {
  std::scoped_lock lock(queue_mutex_);
  return tasks_.size();
}

void ThreadPool::Shutdown(bool graceful) {
  {
    std::scoped_lock lock(queue_mutex_);
    if (shutdown_) {
      return;  // Already shutting down
    }

    if (!graceful && !tasks_.empty()) {
      StructuredLog()
          .Event("thread_pool_warning")
          .Field("type", "non_graceful_shutdown")
          .Field("pending_tasks", static_cast<uint64_t>(tasks_.size()))
          .Warn();
      while (!tasks_.empty()) {
        tasks_.pop();
      }
    }

    shutdown_ = true;
  }

  condition_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  idle_condition_.notify_all();
  spdlog::debug("Thread pool shut down ({})", graceful ? "graceful" : "immediate");
}

void ThreadPool::WorkerThread() {
  while (true) {
    Task task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] { return shutdown_ || !tasks_.empty(); });

      // Exit if shutting down and no more tasks
      if (shutdown_ && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
      ++active_workers_;
    }

    try {
      task();
    } catch (const std::exception& e) {
      StructuredLog().Event("thread_pool_error").Field("type", "task_exception").Field("error", e.what()).Error();
    }

    {
      std::scoped_lock lock(queue_mutex_);
      --active_workers_;
      if (tasks_.empty() && active_workers_ == 0) {
        idle_condition_.notify_all();
      }
    }
  }
}

}  // namespace tastemix::utils
