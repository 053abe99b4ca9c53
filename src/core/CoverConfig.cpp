/* @file CoverConfig.cpp
 * @brief schema checks for the cover section of the configuration
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <string>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// Elero headers
#include "core/CoverConfig.hpp"

namespace elero {
  namespace core {

    namespace {
      constexpr std::array<std::pair<const char*, DeviceCategory>, 5> kDeviceClasses{ {
          { "awning", DeviceCategory::Window },
          { "interior shading", DeviceCategory::Window },
          { "roller shutter", DeviceCategory::Window },
          { "rolling door", DeviceCategory::Garage },
          { "venetian blind", DeviceCategory::Window },
      } };

      constexpr std::array<std::pair<const char*, Feature>, 10> kFeatureTokens{ {
          { "up", Feature::Open },
          { "open", Feature::Open },
          { "down", Feature::Close },
          { "close", Feature::Close },
          { "stop", Feature::Stop },
          { "set_position", Feature::SetPosition },
          { "open_tilt", Feature::OpenTilt },
          { "close_tilt", Feature::CloseTilt },
          { "stop_tilt", Feature::StopTilt },
          { "set_tilt_position", Feature::SetTiltPosition },
      } };

      std::string lower(std::string_view text) {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return out;
      }

      [[noreturn]] void fail(const std::string& slug, const std::string& what) {
        throw ConfigurationError("[CoverConfig] cover '" + slug + "': " + what);
      }

      int channelFromJson(const std::string& slug, const nlohmann::json& value) {
        // range-check before narrowing: 4294967297 must not wrap to channel 1
        if (value.is_number_unsigned()) {
          const auto raw = value.get<std::uint64_t>();
          if (raw > static_cast<std::uint64_t>(kMaxChannel))
            fail(slug, "channel " + std::to_string(raw) + " outside [1,15]");
          return static_cast<int>(raw);
        }
        if (value.is_number_integer()) {
          const auto raw = value.get<std::int64_t>();
          if (raw < kMinChannel || raw > kMaxChannel)
            fail(slug, "channel " + std::to_string(raw) + " outside [1,15]");
          return static_cast<int>(raw);
        }
        if (value.is_string()) { // coerced like the original schema did
          const auto& text = value.get_ref<const std::string&>();
          const bool digits = std::all_of(text.begin(), text.end(),
                                          [](unsigned char ch) { return std::isdigit(ch) != 0; });
          if (digits && !text.empty() && text.size() < 4)
            return std::stoi(text);
        }
        fail(slug, "'channel' must be an integer");
      }
    } // namespace

    const char* toString(DeviceCategory c) {
      switch (c) {
      case DeviceCategory::Window:
        return "window";
      case DeviceCategory::Garage:
        return "garage";
      default:
        return "unknown";
      }
    }

    std::optional<DeviceCategory> categoryForDeviceClass(std::string_view deviceClass) {
      const auto key = lower(deviceClass);
      for (const auto& [name, category] : kDeviceClasses) {
        if (key == name)
          return category;
      }
      return std::nullopt;
    }

    std::optional<Feature> featureFromToken(std::string_view token) {
      for (const auto& [name, feature] : kFeatureTokens) {
        if (token == name)
          return feature;
      }
      return std::nullopt;
    }

    void CoverConfig::validate() const {
      if (channel < kMinChannel || channel > kMaxChannel)
        fail(name, "channel " + std::to_string(channel) + " outside [1,15]");
      if (!(travelTime > 0.0))
        fail(name, "travel_time must be positive");
      const auto expected = categoryForDeviceClass(deviceClass);
      if (!expected)
        fail(name, "unsupported device_class '" + deviceClass + "'");
      if (*expected != category)
        fail(name, "device_class '" + deviceClass + "' is a " + toString(*expected) +
                       " cover, not a " + toString(category) + " one");
      if (transmitterSerial.empty())
        fail(name, "missing transmitter_serial_number");
    }

    CoverConfig CoverConfig::fromJson(const std::string& slug, const nlohmann::json& j) {
      if (!j.is_object())
        fail(slug, "entry must be an object");

      for (const char* key :
           { "channel", "device_class", "name", "supported_features", "transmitter_serial_number" }) {
        if (!j.contains(key))
          fail(slug, std::string("missing required '") + key + "'");
      }

      CoverConfig cfg;
      cfg.channel = channelFromJson(slug, j.at("channel"));

      if (!j.at("device_class").is_string() || !j.at("name").is_string() ||
          !j.at("transmitter_serial_number").is_string())
        fail(slug, "'device_class', 'name' and 'transmitter_serial_number' must be strings");

      cfg.deviceClass = lower(j.at("device_class").get<std::string>());
      cfg.name = j.at("name").get<std::string>();
      cfg.transmitterSerial = j.at("transmitter_serial_number").get<std::string>();

      const auto category = categoryForDeviceClass(cfg.deviceClass);
      if (!category)
        fail(slug, "unsupported device_class '" + cfg.deviceClass + "'");
      cfg.category = *category;

      // a single token is accepted as a one-element list
      auto features = j.at("supported_features");
      if (features.is_string())
        features = nlohmann::json::array({ features });
      if (!features.is_array())
        fail(slug, "'supported_features' must be a list");
      for (const auto& token : features) {
        if (!token.is_string())
          fail(slug, "feature tokens must be strings");
        const auto feature = featureFromToken(token.get<std::string>());
        if (!feature)
          fail(slug, "unsupported feature '" + token.get<std::string>() + "'");
        cfg.features = cfg.features | *feature;
      }

      if (j.contains("travel_time")) {
        if (!j.at("travel_time").is_number())
          fail(slug, "'travel_time' must be a number");
        cfg.travelTime = j.at("travel_time").get<double>();
      }

      cfg.validate();
      return cfg;
    }

  } // namespace core
} // namespace elero
