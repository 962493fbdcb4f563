#include "internal/reconcile/notification_queue.hpp"

namespace payday::reconcile {

NotificationQueue::NotificationQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool NotificationQueue::Enqueue(Notification notification) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return shutdown_ || queue_.size() < capacity_; });
    if (shutdown_) return false;
    queue_.push_back(std::move(notification));
  }
  not_empty_.notify_one();
  return true;
}

bool NotificationQueue::TryEnqueue(Notification notification) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push_back(std::move(notification));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<Notification> NotificationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  Notification notification = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return notification;
}

std::optional<Notification> NotificationQueue::DequeueFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  not_empty_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  Notification notification = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return notification;
}

void NotificationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool NotificationQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t NotificationQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace payday::reconcile
