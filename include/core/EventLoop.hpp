#pragma once
/** @file  EventLoop.hpp
 *  @brief Single-threaded cooperative loop: posted tasks plus one-shot timers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

// Elero headers
#include "core/Scheduler.hpp"

namespace elero {
  namespace core {

    /**
 * @class EventLoop
 * @brief Serializes every command, status callback and timer of the process.
 *
 *  * post()/callLater()/cancel() are thread-safe (a Transmitter reader thread may post).
 *  * Work only ever executes on the thread calling runPending() or run().
 *  * Posted tasks run FIFO and ahead of due timers; timers run in deadline order.
 */
    class EventLoop : public Scheduler {
    public:
      explicit EventLoop(std::shared_ptr<const Clock> clock);
      ~EventLoop() override = default;

      //---Scheduler--------------------------------------------------------
      void post(Task task) override;
      TimerId callLater(Seconds delay, Task task) override;
      bool cancel(TimerId id) override;

      //---public API-------------------------------------------------------
      /// Run everything runnable right now; returns the number of tasks executed.
      std::size_t runPending();

      /// Block running work until stop() is called.
      void run();
      void stop();

      std::size_t pendingTimers() const;

      EventLoop(const EventLoop&) = delete;
      EventLoop& operator=(const EventLoop&) = delete;

    private:
      using TimerKey = std::pair<TimePoint, TimerId>;

      bool popNext(Task& out);

      std::shared_ptr<const Clock> clock_;
      std::deque<Task> tasks_;
      std::map<TimerKey, Task> timers_; ///< ordered by deadline, then arm order
      std::unordered_map<TimerId, TimePoint> deadlines_;
      TimerId nextId_{ 1 };
      std::atomic<bool> running_{ false };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace elero
