/* @file TransmitterRegistry.cpp
 * @brief explicit registry of the transmitters known to this process
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <string>

// Elero headers
#include "core/TransmitterRegistry.hpp"

using namespace elero::core;

TransmitterRegistry::TransmitterRegistry(std::shared_ptr<ErrorMonitor> errorMonitor)
    : errorMonitor_(std::move(errorMonitor)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[TransmitterRegistry] error monitor is nullptr");
}

bool TransmitterRegistry::add(std::shared_ptr<io::Transmitter> transmitter) {
  if (!transmitter) {
    errorMonitor_->notifyFailure(
        FaultReport{ FaultKind::ConfigurationError, "", 0, "null transmitter not registered" });
    return false;
  }

  auto serial = transmitter->getSerialNumber();
  if (transmitters_.count(serial) != 0) {
    errorMonitor_->notifyFailure(FaultReport{ FaultKind::ConfigurationError, serial, 0,
                                              "duplicate transmitter serial number" });
    return false;
  }

  std::cerr << "[TransmitterRegistry] transmitter '" << serial << "' registered\n";
  transmitters_.emplace(std::move(serial), std::move(transmitter));
  return true;
}

std::shared_ptr<elero::io::Transmitter> TransmitterRegistry::find(const std::string& serial) const {
  auto it = transmitters_.find(serial);
  if (it == transmitters_.end())
    return nullptr;
  return it->second;
}
