/* @file ErrorMonitor.cpp
 * @brief logs fault reports and escalates each unique one once
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>
#include <sstream>

// Elero headers
#include "core/ErrorMonitor.hpp"

namespace elero {
  namespace core {

    const char* toString(FaultKind kind) {
      switch (kind) {
      case FaultKind::ConfigurationError:
        return "ConfigurationError";
      case FaultKind::InvalidCommand:
        return "InvalidCommand";
      case FaultKind::DeviceFault:
        return "DeviceFault";
      case FaultKind::UnhandledStatus:
        return "UnhandledStatus";
      default:
        return "Unknown";
      }
    }

    std::string FaultReport::describe() const {
      std::ostringstream out;
      out << toString(kind) << ": Transmitter: '" << transmitter << "' ch: '" << channel
          << "' " << detail;
      return out.str();
    }

    void ErrorMonitor::registerEscalation(std::function<void(const FaultReport&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const FaultReport& report) {
      std::cerr << "[ErrorMonitor] " << report.describe() << "\n";
      forwardIfNew(report);
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return count_;
    }

    void ErrorMonitor::forwardIfNew(const FaultReport& report) {
      std::function<void(const FaultReport&)> escalate;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++count_;
        auto message = report.describe();
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(std::move(message));
        escalate = escalation_;
      }
      if (escalate)
        escalate(report); // outside the lock: the callback may report again
    }

  } // namespace core
} // namespace elero
