#pragma once
/** @file  CoverConfig.hpp
 *  @brief Validated construction parameters of one cover channel.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

// third-party headers
#include <nlohmann/json_fwd.hpp>

namespace elero {
  namespace core {

    constexpr int kMinChannel = 1;
    constexpr int kMaxChannel = 15; // transmitter mishandles channels above 15
    constexpr double kDefaultTravelTime = 50.0;

    /// Raised while building a channel; the channel is then not created.
    class ConfigurationError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    enum class DeviceCategory { Window, Garage };

    const char* toString(DeviceCategory c);

    enum class Feature : std::uint32_t {
      Open = 1u << 0,
      Close = 1u << 1,
      Stop = 1u << 2,
      SetPosition = 1u << 3,
      OpenTilt = 1u << 4,
      CloseTilt = 1u << 5,
      StopTilt = 1u << 6,
      SetTiltPosition = 1u << 7,
    };

    using FeatureSet = std::uint32_t;

    inline FeatureSet operator|(FeatureSet set, Feature f) {
      return set | static_cast<FeatureSet>(f);
    }

    /// Case-insensitive device class lookup ("Roller Shutter" -> Window).
    std::optional<DeviceCategory> categoryForDeviceClass(std::string_view deviceClass);

    /// Feature token lookup; "up"/"open" and "down"/"close" are aliases.
    std::optional<Feature> featureFromToken(std::string_view token);

    struct CoverConfig {
      std::string name;
      int channel{ 0 };
      std::string deviceClass;
      DeviceCategory category{ DeviceCategory::Window };
      FeatureSet features{ 0 };
      std::string transmitterSerial;
      double travelTime{ kDefaultTravelTime };

      bool supports(Feature f) const { return (features & static_cast<FeatureSet>(f)) != 0; }

      /// Throws ConfigurationError on a bad channel or travel time, or a device class
      /// unknown or inconsistent with `category`.
      void validate() const;

      /// Parse and validate one entry of the "covers" object keyed by \p slug.
      static CoverConfig fromJson(const std::string& slug, const nlohmann::json& j);
    };

  } // namespace core
} // namespace elero
