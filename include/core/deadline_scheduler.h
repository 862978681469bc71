#pragma once

#include <stddef.h>
#include <stdint.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// One background task running deferred callbacks at their deadlines. Callbacks run
// without the scheduler lock held, so they may schedule or cancel themselves.
class DeadlineScheduler {
public:
  using TimerId = uint64_t;  // 0 is never a valid id
  using Task = std::function<void()>;

  DeadlineScheduler();
  ~DeadlineScheduler();

  DeadlineScheduler(const DeadlineScheduler&) = delete;
  DeadlineScheduler& operator=(const DeadlineScheduler&) = delete;

  TimerId schedule_after(uint32_t delay_ms, Task task);

  // False if the timer already fired or was cancelled.
  bool cancel(TimerId id);

  // Drops pending timers and waits for a callback that is already running. Owners call
  // this before destroying anything a callback touches.
  void clear();

  // Drops pending timers and joins the task. Later schedule_after() calls are ignored.
  void stop();

  size_t pending() const;

private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    Clock::time_point due;
    TimerId id;
    bool operator>(const Entry& other) const {
      return due == other.due ? id > other.id : due > other.due;
    }
  };

  void run();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue_;
  std::map<TimerId, Task> tasks_;
  TimerId next_id_ {1};
  bool stopping_ {false};
  bool in_callback_ {false};
  std::thread thread_;
};
