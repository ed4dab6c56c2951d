/**
 * @file thread_pool.h
 * @brief Fixed-size worker pool for bulk extraction jobs
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tastemix::utils {

/**
 * @brief Thread pool for executing tasks concurrently
 *
 * Features:
 * - Fixed number of worker threads
 * - Bounded task queue with backpressure
 * - WaitIdle() barrier for batch jobs
 * - Graceful shutdown
 */
class ThreadPool {
 public:
  using Task = std::function<void()>;

  /**
   * @brief Construct thread pool
   * @param num_threads Number of worker threads (0 = CPU count)
   * @param queue_size Maximum queue size (0 = unbounded)
   */
  explicit ThreadPool(size_t num_threads = 0, size_t queue_size = 0);

  /**
   * @brief Destructor - waits for all tasks to complete
   */
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  /**
   * @brief Submit task to pool
   * @param task Task to execute
   * @return true if submitted, false if queue is full or the pool is shut down
   */
  bool Submit(Task task);

  /**
   * @brief Block until the queue is empty and no task is running
   */
  void WaitIdle();

  size_t GetThreadCount() const { return workers_.size(); }

  size_t GetQueueSize() const;

  bool IsShutdown() const { return shutdown_; }

  /**
   * @brief Shutdown pool and join workers
   * @param graceful If true, run pending tasks first. If false, drop them.
   */
  void Shutdown(bool graceful = true);

 private:
  void WorkerThread();

  std::vector<std::thread> workers_;
  std::queue<Task> tasks_;

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::condition_variable idle_condition_;
  std::atomic<bool> shutdown_{false};
  size_t active_workers_ = 0;  // Guarded by queue_mutex_

  size_t max_queue_size_;
};

}  // namespace tastemix::utils
