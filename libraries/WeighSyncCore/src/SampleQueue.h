/**
 * SampleQueue.h - Bounded multi-producer / single-consumer channel
 *
 * Node producers call send() from their own threads; it never waits. When
 * the queue is full the item is dropped and counted, so a slow consumer can
 * never stall a radio callback. The consumer calls receive() with a short
 * timeout so it can run periodic work (frame timeout, liveness sweep) while
 * no data arrives.
 *
 * close() wakes a blocked receiver and discards everything still queued.
 * After close() send() fails and receive() returns false immediately.
 */

#ifndef SAMPLE_QUEUE_H
#define SAMPLE_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stddef.h>
#include <stdint.h>

template <typename T, size_t Capacity>
class SampleQueue
{
  static_assert(Capacity > 0, "SampleQueue needs at least one slot");

public:
  SampleQueue() : head(0), count(0), closed(false), droppedCount(0) {}

  SampleQueue(const SampleQueue &) = delete;
  SampleQueue &operator=(const SampleQueue &) = delete;

  // Non-blocking. false if full (dropped) or closed.
  bool send(const T &item)
  {
    {
      std::lock_guard<std::mutex> guard(_lock);
      if (closed)
        return false;
      if (count == Capacity)
      {
        droppedCount++;
        return false;
      }
      items[(head + count) % Capacity] = item;
      count++;
    }
    notEmpty.notify_one();
    return true;
  }

  /**
   * Wait up to timeoutMs for an item
   * @return true if out was filled, false on timeout or after close()
   */
  bool receive(T &out, uint32_t timeoutMs)
  {
    std::unique_lock<std::mutex> guard(_lock);
    if (!notEmpty.wait_for(guard, std::chrono::milliseconds(timeoutMs),
                           [this] { return closed || count > 0; }))
    {
      return false;
    }
    if (closed)
      return false;

    out = items[head];
    head = (head + 1) % Capacity;
    count--;
    return true;
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> guard(_lock);
      closed = true;
      head = 0;
      count = 0;
    }
    notEmpty.notify_all();
  }

  bool isClosed() const
  {
    std::lock_guard<std::mutex> guard(_lock);
    return closed;
  }

  size_t spacesAvailable() const
  {
    std::lock_guard<std::mutex> guard(_lock);
    return Capacity - count;
  }

  uint32_t getDroppedCount() const
  {
    std::lock_guard<std::mutex> guard(_lock);
    return droppedCount;
  }

  static constexpr size_t capacity() { return Capacity; }

private:
  mutable std::mutex _lock;
  std::condition_variable notEmpty;
  T items[Capacity];
  size_t head;
  size_t count;
  bool closed;
  uint32_t droppedCount;
};

#endif // SAMPLE_QUEUE_H
