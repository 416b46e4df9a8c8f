// Ticket: 0009_parallel_narrow_phase

#include "clash-core/src/Pipeline/WorkerPool.hpp"

#include <algorithm>
#include <utility>

namespace clash_core
{

WorkerPool::WorkerPool(size_t threadCount)
{
  if (threadCount == 0)
  {
    threadCount = std::max<size_t>(std::thread::hardware_concurrency(), 1);
  }

  workers_.reserve(threadCount);
  for (size_t i = 0; i < threadCount; ++i)
  {
    workers_.emplace_back([this](std::stop_token st) { workerMain(std::move(st)); });
  }
}

WorkerPool::~WorkerPool()
{
  for (auto& worker : workers_)
  {
    worker.request_stop();
  }
  // Each jthread joins on destruction
  workers_.clear();
}

void WorkerPool::submit(Task task)
{
  {
    std::scoped_lock lock{mutex_};
    tasks_.push_back(std::move(task));
  }
  taskAvailable_.notify_one();
}

void WorkerPool::waitIdle()
{
  std::unique_lock lock{mutex_};
  idle_.wait(lock, [this] { return tasks_.empty() && running_ == 0; });
}

void WorkerPool::workerMain(std::stop_token stopToken)
{
  while (true)
  {
    Task task;
    {
      std::unique_lock lock{mutex_};
      if (!taskAvailable_.wait(lock, stopToken, [this] { return !tasks_.empty(); }))
      {
        // Stop requested: abandon queued work
        tasks_.clear();
        idle_.notify_all();
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
      ++running_;
    }

    task(stopToken);

    {
      std::scoped_lock lock{mutex_};
      --running_;
    }
    idle_.notify_all();
  }
}

}  // namespace clash_core
