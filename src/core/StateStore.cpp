/* @file StateStore.cpp
 * @brief JSON persistence of the restorable cover attributes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

// Elero headers
#include "core/ConfigLoader.hpp"
#include "core/CoverState.hpp"
#include "core/StateStore.hpp"

namespace elero {
  namespace core {

    namespace {
      template <typename T> std::optional<T> readOr(const nlohmann::json& j, const char* key, T fallback) {
        if (!j.contains(key))
          return fallback;
        const auto& value = j.at(key);
        if (value.is_null())
          return std::nullopt;
        return value.get<T>();
      }

      template <typename T> nlohmann::json orNull(const std::optional<T>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
      }

      // clamped as a double first: 1e20 must not reach an int conversion
      std::optional<int> readPosition(const nlohmann::json& j, const char* key) {
        const auto raw = readOr<double>(j, key, kPositionUndefined);
        if (!raw)
          return std::nullopt;
        const double bounded = std::clamp(*raw, static_cast<double>(kPositionClosed),
                                          static_cast<double>(kPositionOpen));
        return static_cast<int>(std::lround(bounded));
      }
    } // namespace

    RestoredAttributes RestoredAttributes::fromJson(const nlohmann::json& j) {
      if (!j.is_object())
        throw std::invalid_argument("[StateStore] persisted record must be an object");

      RestoredAttributes a;
      a.position = readPosition(j, "position");
      a.lastKnownPosition = readPosition(j, "last_known_position");
      a.tmpPosition = readOr<double>(j, "tmp_position", kPositionUndefined);
      if (a.tmpPosition)
        a.tmpPosition = std::clamp(*a.tmpPosition, 0.0, 100.0);
      a.isOpening = readOr<bool>(j, "is_opening", false).value_or(false);
      a.isClosing = readOr<bool>(j, "is_closing", false).value_or(false);
      a.closed = readOr<bool>(j, "closed", false);
      a.tiltPosition = readPosition(j, "tilt_position");
      if (j.contains("elero_state") && j.at("elero_state").is_string())
        a.eleroState = j.at("elero_state").get<std::string>();
      if (a.isOpening && a.isClosing) // contradictory record: trust neither flag
        a.isOpening = a.isClosing = false;
      return a;
    }

    nlohmann::json RestoredAttributes::toJson() const {
      return nlohmann::json{
        { "position", orNull(position) },
        { "last_known_position", orNull(lastKnownPosition) },
        { "tmp_position", orNull(tmpPosition) },
        { "is_opening", isOpening },
        { "is_closing", isClosing },
        { "closed", orNull(closed) },
        { "tilt_position", orNull(tiltPosition) },
        { "elero_state", orNull(eleroState) },
      };
    }

    void StateStore::set(const std::string& uniqueId, const RestoredAttributes& attrs) {
      std::lock_guard<std::mutex> lock(mtx_);
      records_[uniqueId] = attrs.toJson();
    }

    std::optional<RestoredAttributes> StateStore::get(const std::string& uniqueId) const {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = records_.find(uniqueId);
      if (it == records_.end())
        return std::nullopt;
      return RestoredAttributes::fromJson(it->second);
    }

    bool StateStore::load(const std::string& path) {
      if (!std::filesystem::exists(path))
        return false;

      const auto doc = ConfigLoader(path).load();
      if (!doc.is_object())
        throw std::runtime_error("[StateStore] " + path + ": top level must be an object");

      std::lock_guard<std::mutex> lock(mtx_);
      records_.clear();
      for (const auto& [id, record] : doc.items())
        records_[id] = record;
      return true;
    }

    void StateStore::save(const std::string& path) const {
      nlohmann::json doc = nlohmann::json::object();
      {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& [id, record] : records_)
          doc[id] = record;
      }

      std::ofstream file(path, std::ios::trunc);
      if (!file.is_open())
        throw std::runtime_error("[StateStore] cannot write " + path);
      file << doc.dump(2) << '\n';
      if (!file)
        throw std::runtime_error("[StateStore] write failed for " + path);
    }

  } // namespace core
} // namespace elero
