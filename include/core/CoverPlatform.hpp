#pragma once
/** @file  CoverPlatform.hpp
 *  @brief Setup routine: configuration document → one controller per cover.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <vector>

// third-party headers
#include <nlohmann/json_fwd.hpp>

namespace elero::core {

  class Clock;
  class CoverChannelController;
  class ErrorMonitor;
  class Scheduler;
  class StateStore;
  class TransmitterRegistry;

  /**
 * @class CoverPlatform
 * @brief Builds cover controllers from the "covers" section of the configuration.
 *
 *  * Keeps the composition root decoupled from CoverConfig parsing details.
 *  * A bad or orphaned cover is reported and skipped; the rest are still created.
 *  * Nothing escapes `setup()`: configuration problems only ever become reports.
 */
  class CoverPlatform {
  public:
    using Controllers = std::vector<std::unique_ptr<CoverChannelController>>;

    CoverPlatform(std::shared_ptr<Scheduler> scheduler, std::shared_ptr<const Clock> clock,
                  std::shared_ptr<ErrorMonitor> errorMonitor);

    /// Create, restore (when \p store is given) and initially poll every configured cover.
    Controllers setup(const nlohmann::json& config, const TransmitterRegistry& registry,
                      const StateStore* store = nullptr) const;

  private:
    void restoreFrom(const StateStore& store, CoverChannelController& cover) const;

    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
  };

} // namespace elero::core
