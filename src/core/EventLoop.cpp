/* @file EventLoop.cpp
 * @brief cooperative task/timer loop that serializes all cover activity
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Elero headers
#include "core/EventLoop.hpp"

using namespace elero::core;

EventLoop::EventLoop(std::shared_ptr<const Clock> clock) : clock_(std::move(clock)) {
  if (!clock_)
    throw std::invalid_argument("[EventLoop] clock is nullptr");
}

void EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

Scheduler::TimerId EventLoop::callLater(Seconds delay, Task task) {
  if (delay < Seconds::zero())
    delay = Seconds::zero();

  const auto deadline =
      clock_->now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay);

  TimerId id = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    id = nextId_++;
    timers_.emplace(TimerKey{ deadline, id }, std::move(task));
    deadlines_.emplace(id, deadline);
  }
  cv_.notify_one();
  return id;
}

bool EventLoop::cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = deadlines_.find(id);
  if (it == deadlines_.end())
    return false;
  timers_.erase(TimerKey{ it->second, id });
  deadlines_.erase(it);
  return true;
}

// -------------------------------------------------------------------
// EventLoop::popNext
// Posted tasks first (arrival order), then the earliest due timer.
// -------------------------------------------------------------------
bool EventLoop::popNext(Task& out) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!tasks_.empty()) {
    out = std::move(tasks_.front());
    tasks_.pop_front();
    return true;
  }
  if (timers_.empty())
    return false;

  auto first = timers_.begin();
  if (first->first.first > clock_->now())
    return false;

  out = std::move(first->second);
  deadlines_.erase(first->first.second);
  timers_.erase(first);
  return true;
}

std::size_t EventLoop::runPending() {
  std::size_t executed = 0;
  Task task;
  while (popNext(task)) {
    task(); // lock released: tasks may post or arm timers
    ++executed;
  }
  return executed;
}

void EventLoop::run() {
  running_ = true;
  while (running_) {
    runPending();

    std::unique_lock<std::mutex> lock(mtx_);
    if (!running_ || !tasks_.empty())
      continue;

    if (timers_.empty()) {
      cv_.wait(lock, [this] { return !running_ || !tasks_.empty() || !timers_.empty(); });
    } else {
      // woken early by post()/callLater()/stop(); the outer loop re-evaluates
      const auto wait = timers_.begin()->first.first - clock_->now();
      cv_.wait_for(lock, wait);
    }
  }
}

void EventLoop::stop() {
  running_ = false;
  cv_.notify_all();
}

std::size_t EventLoop::pendingTimers() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return timers_.size();
}
