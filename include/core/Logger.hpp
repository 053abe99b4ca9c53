#pragma once
/** @file  Logger.hpp
 *  @brief CSV transition log: one row per command issued or status reconciled.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <memory>
#include <optional>
#include <string>

// Elero headers
#include "core/Clock.hpp"
#include "io/FileLogger.hpp"

namespace elero {
  namespace core {

    struct LogEvent {
      std::string unit;  ///< cover unique id
      std::string event; ///< command name or raw status text
      std::string state; ///< composite state label afterwards
      std::optional<int> position;
    };

    class Logger {

    public:
      explicit Logger(std::shared_ptr<const Clock> clock);
      ~Logger();

      // --- public API ---
      bool startNewRun(const std::string& path); ///< open file + write the header row
      void log(const LogEvent& event);            ///< append a row (dropped when no run is open)
      void finishRun();                           ///< flush + close

      bool running() const { return running_; }

    private:
      std::shared_ptr<const Clock> clock_;
      io::FileLogger csvFile_;
      TimePoint runStart_{};
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace elero
