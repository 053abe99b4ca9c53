#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace elero::core {

  enum class FaultKind { ConfigurationError, InvalidCommand, DeviceFault, UnhandledStatus };

  const char* toString(FaultKind kind);

  /// One diagnostic report; channel is 0 when the fault is not tied to a channel.
  struct FaultReport {
    FaultKind kind;
    std::string transmitter;
    int channel{ 0 };
    std::string detail;

    /// Human readable one-liner: kind, transmitter, channel and detail.
    std::string describe() const;
  };

  /**
 * @class ErrorMonitor
 * @brief Controllers call `notifyFailure()`; we log every report and call the
 *        registered escalation callback exactly once per unique report.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the operator doesn't get spammed.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the operator.
    void registerEscalation(std::function<void(const FaultReport&)> cb);

    /// Called by controllers on fault; logs, then forwards to the escalation callback.
    virtual void notifyFailure(const FaultReport& report);

    /// Total reports received, duplicates included.
    std::size_t failureCount() const;

  private:
    void forwardIfNew(const FaultReport& report);

    std::function<void(const FaultReport&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::size_t count_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace elero::core
