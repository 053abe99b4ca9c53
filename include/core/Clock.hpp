#pragma once
/** @file  Clock.hpp
 *  @brief Monotonic time source shared by the event loop and the cover controllers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>

namespace elero {
  namespace core {

    using TimePoint = std::chrono::steady_clock::time_point;
    using Seconds = std::chrono::duration<double>;

    class Clock {
    public:
      virtual ~Clock() = default;
      virtual TimePoint now() const = 0;
    };

    class SteadyClock : public Clock {
    public:
      TimePoint now() const override { return std::chrono::steady_clock::now(); }
    };

  } // namespace core
} // namespace elero
