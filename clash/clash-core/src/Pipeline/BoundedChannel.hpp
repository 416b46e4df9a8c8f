// Ticket: 0009_parallel_narrow_phase

#ifndef CLASH_CORE_PIPELINE_BOUNDED_CHANNEL_HPP
#define CLASH_CORE_PIPELINE_BOUNDED_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <utility>

namespace clash_core
{

/**
 * @brief Fixed-capacity multi-producer queue drained by one consumer
 *
 * push() blocks while the channel is full and pop() blocks while it is
 * empty. Both give up when the supplied stop_token is triggered, and push()
 * also gives up once the channel is closed. A closed channel still hands
 * out the items it holds.
 *
 * @tparam T Item type (movable)
 *
 * @ticket 0009_parallel_narrow_phase
 */
template <typename T>
class BoundedChannel
{
public:
  /**
   * @throws std::invalid_argument if capacity is 0
   */
  explicit BoundedChannel(size_t capacity) : capacity_{capacity}
  {
    if (capacity_ == 0)
    {
      throw std::invalid_argument("BoundedChannel: capacity must be positive");
    }
  }

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  /**
   * @return false if the item was not queued (stop requested or closed)
   */
  bool push(T item, std::stop_token stopToken)
  {
    std::unique_lock lock{mutex_};
    const bool ready = notFull_.wait(lock,
                                     stopToken,
                                     [this]
                                     { return closed_ || items_.size() < capacity_; });
    if (!ready || closed_)
    {
      return false;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    notEmpty_.notify_one();
    return true;
  }

  /**
   * @return The oldest item, or std::nullopt once stop is requested or the
   * channel is closed and empty
   */
  std::optional<T> pop(std::stop_token stopToken)
  {
    std::unique_lock lock{mutex_};
    const bool ready =
      notEmpty_.wait(lock, stopToken, [this] { return closed_ || !items_.empty(); });
    if (!ready || items_.empty())
    {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    notFull_.notify_one();
    return item;
  }

  void close()
  {
    {
      std::scoped_lock lock{mutex_};
      closed_ = true;
    }
    notFull_.notify_all();
    notEmpty_.notify_all();
  }

  size_t size() const
  {
    std::scoped_lock lock{mutex_};
    return items_.size();
  }

  size_t capacity() const
  {
    return capacity_;
  }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable_any notFull_;
  std::condition_variable_any notEmpty_;
  std::deque<T> items_;
  bool closed_{false};
};

}  // namespace clash_core

#endif  // CLASH_CORE_PIPELINE_BOUNDED_CHANNEL_HPP
