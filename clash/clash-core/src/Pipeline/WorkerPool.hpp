// Ticket: 0009_parallel_narrow_phase

#ifndef CLASH_CORE_PIPELINE_WORKER_POOL_HPP
#define CLASH_CORE_PIPELINE_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace clash_core
{

/**
 * @brief Fixed set of std::jthread workers running queued tasks in FIFO order
 *
 * Tasks receive the pool's stop_token so that long batches can bail out
 * once the pool shuts down. A task must not throw: the caller owns error
 * reporting (the sampler forwards failures through its result channel).
 *
 * Destruction requests stop, drops tasks not yet started and joins every
 * worker.
 *
 * @ticket 0009_parallel_narrow_phase
 */
class WorkerPool
{
public:
  using Task = std::function<void(std::stop_token)>;

  /**
   * @param threadCount Number of workers; 0 selects
   * std::thread::hardware_concurrency() (at least 1)
   */
  explicit WorkerPool(size_t threadCount = 0);

  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  void submit(Task task);

  /**
   * @brief Block until the queue is empty and no task is running
   */
  void waitIdle();

  size_t threadCount() const
  {
    return workers_.size();
  }

private:
  void workerMain(std::stop_token stopToken);

  std::mutex mutex_;
  std::condition_variable_any taskAvailable_;
  std::condition_variable idle_;
  std::deque<Task> tasks_;
  size_t running_{0};
  // Declared last: workers start after, and join before, the members above
  std::vector<std::jthread> workers_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_PIPELINE_WORKER_POOL_HPP
