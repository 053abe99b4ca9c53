/* @file CoverPlatform.cpp
 * @brief turns the covers configuration into running channel controllers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// Elero headers
#include "core/CoverChannelController.hpp"
#include "core/CoverConfig.hpp"
#include "core/CoverPlatform.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/StateStore.hpp"
#include "core/TransmitterRegistry.hpp"

using namespace elero::core;

CoverPlatform::CoverPlatform(std::shared_ptr<Scheduler> scheduler,
                             std::shared_ptr<const Clock> clock,
                             std::shared_ptr<ErrorMonitor> errorMonitor)
    : scheduler_(std::move(scheduler)), clock_(std::move(clock)),
      errorMonitor_(std::move(errorMonitor)) {
  if (!scheduler_ || !clock_ || !errorMonitor_)
    throw std::invalid_argument("[CoverPlatform] missing collaborator");
}

// A malformed persisted record leaves the cover at its unknown defaults.
void CoverPlatform::restoreFrom(const StateStore& store, CoverChannelController& cover) const {
  try {
    if (auto saved = store.get(cover.uniqueId()))
      cover.restore(*saved);
  } catch (const nlohmann::json::exception& e) {
    errorMonitor_->notifyFailure(FaultReport{ FaultKind::ConfigurationError, "", cover.channel(),
                                              cover.uniqueId() + ": bad persisted state: " +
                                                  e.what() });
  } catch (const std::invalid_argument& e) {
    errorMonitor_->notifyFailure(FaultReport{ FaultKind::ConfigurationError, "", cover.channel(),
                                              cover.uniqueId() + ": " + e.what() });
  }
}

CoverPlatform::Controllers CoverPlatform::setup(const nlohmann::json& config,
                                                const TransmitterRegistry& registry,
                                                const StateStore* store) const {
  Controllers covers;

  if (!config.is_object() || !config.contains("covers") || !config.at("covers").is_object()) {
    errorMonitor_->notifyFailure(FaultReport{ FaultKind::ConfigurationError, "", 0,
                                              "configuration has no 'covers' object" });
    return covers;
  }

  for (const auto& [slug, entry] : config.at("covers").items()) {
    try {
      auto cfg = CoverConfig::fromJson(slug, entry);

      auto transmitter = registry.find(cfg.transmitterSerial);
      if (!transmitter) {
        errorMonitor_->notifyFailure(FaultReport{
            FaultKind::ConfigurationError, cfg.transmitterSerial, cfg.channel,
            "the transmitter of the '" + cfg.name + "' channel is non-existent transmitter!" });
        continue;
      }

      auto cover = std::make_unique<CoverChannelController>(std::move(cfg), std::move(transmitter),
                                                            scheduler_, clock_, errorMonitor_);
      if (store)
        restoreFrom(*store, *cover);
      cover->update();
      covers.push_back(std::move(cover));
    } catch (const ConfigurationError& e) {
      const std::string serial =
          entry.is_object() && entry.contains("transmitter_serial_number") &&
                  entry.at("transmitter_serial_number").is_string()
              ? entry.at("transmitter_serial_number").get<std::string>()
              : std::string();
      errorMonitor_->notifyFailure(
          FaultReport{ FaultKind::ConfigurationError, serial, 0, e.what() });
    }
  }

  std::cerr << "[CoverPlatform] " << covers.size() << " cover(s) set up\n";
  return covers;
}
