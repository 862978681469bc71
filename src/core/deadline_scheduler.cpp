#include "core/deadline_scheduler.h"

DeadlineScheduler::DeadlineScheduler() : thread_([this] { run(); }) {}

DeadlineScheduler::~DeadlineScheduler() {
  stop();
}

DeadlineScheduler::TimerId DeadlineScheduler::schedule_after(uint32_t delay_ms, Task task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopping_) return 0;
  const TimerId id = next_id_++;
  tasks_.emplace(id, std::move(task));
  queue_.push(Entry{Clock::now() + std::chrono::milliseconds(delay_ms), id});
  cv_.notify_all();
  return id;
}

bool DeadlineScheduler::cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  // The queue entry stays behind and is skipped when it reaches the top.
  return tasks_.erase(id) > 0;
}

void DeadlineScheduler::clear() {
  std::unique_lock<std::mutex> lock(mutex_);
  tasks_.clear();
  if (thread_.get_id() == std::this_thread::get_id()) return;
  idle_cv_.wait(lock, [this] { return !in_callback_; });
}

void DeadlineScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ && !thread_.joinable()) return;
    stopping_ = true;
    tasks_.clear();
    cv_.notify_all();
  }
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
}

size_t DeadlineScheduler::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void DeadlineScheduler::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (queue_.empty()) {
      cv_.wait(lock);
      continue;
    }

    const Entry next = queue_.top();
    auto it = tasks_.find(next.id);
    if (it == tasks_.end()) {
      queue_.pop();
      continue;
    }

    if (Clock::now() < next.due) {
      cv_.wait_until(lock, next.due);
      continue;
    }

    queue_.pop();
    Task task = std::move(it->second);
    tasks_.erase(it);
    in_callback_ = true;
    lock.unlock();
    task();
    lock.lock();
    in_callback_ = false;
    idle_cv_.notify_all();
  }
}
