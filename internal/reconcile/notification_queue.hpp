#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/reconcile/notification.hpp"

namespace payday::reconcile {

/*
  Bounded, thread-safe blocking queue feeding the reconciler.

  Enqueue blocks while the queue is full, so a burst of node
  notifications slows the producer instead of growing memory.
*/
class NotificationQueue {
 public:
  explicit NotificationQueue(std::size_t capacity = 1024);

  // false once Shutdown() was called
  bool Enqueue(Notification notification);

  // false when full or shut down
  bool TryEnqueue(Notification notification);

  // blocking wait; nullopt after Shutdown() once drained
  std::optional<Notification> Dequeue();

  // as Dequeue, but also nullopt when nothing arrives within timeout
  std::optional<Notification> DequeueFor(std::chrono::milliseconds timeout);

  void Shutdown();

  bool IsShutdown() const;

  std::size_t Size() const;

 private:
  std::size_t                     capacity_;
  mutable std::mutex              mutex_;
  std::condition_variable         not_empty_;
  std::condition_variable         not_full_;
  std::deque<Notification>        queue_;
  bool                            shutdown_ = false;
};

} // namespace payday::reconcile
