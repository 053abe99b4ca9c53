#pragma once
/** @file  Scheduler.hpp
 *  @brief Deferred-execution seam between the cover controllers and the event loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>

// Elero headers
#include "core/Clock.hpp"

namespace elero {
  namespace core {

    class Scheduler {
    public:
      using Task = std::function<void()>;
      using TimerId = std::uint64_t;

      virtual ~Scheduler() = default;

      /// Queue \p task behind everything already posted.
      virtual void post(Task task) = 0;

      /// Run \p task once \p delay has elapsed.
      virtual TimerId callLater(Seconds delay, Task task) = 0;

      /// Drop a timer that has not fired yet; false if it is unknown or already gone.
      virtual bool cancel(TimerId id) = 0;
    };

  } // namespace core
} // namespace elero
