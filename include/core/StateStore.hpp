#pragma once
/** @file  StateStore.hpp
 *  @brief Restorable per-channel attributes that survive a process restart.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// third-party headers
#include <nlohmann/json.hpp>

namespace elero {
  namespace core {

    /**
 * @struct RestoredAttributes
 * @brief The attribute set a channel persists.
 *
 *  (Absent numbers restore as 50, absent booleans as false; an explicit JSON null
 *   restores as unknown.)
 */
    struct RestoredAttributes {
      std::optional<int> position;
      std::optional<int> lastKnownPosition;
      std::optional<double> tmpPosition;
      bool isOpening{ false };
      bool isClosing{ false };
      std::optional<bool> closed;
      std::optional<int> tiltPosition;
      std::optional<std::string> eleroState;

      static RestoredAttributes fromJson(const nlohmann::json& j);
      nlohmann::json toJson() const;
    };

    /** @class StateStore
 *  @brief Lock-protected map of <cover unique id → persisted attributes>.
 *
 *  * Whole store is (de)serialized as one JSON object keyed by unique id.
 */
    class StateStore {

    public:
      StateStore() = default;
      ~StateStore() = default;

      void set(const std::string& uniqueId, const RestoredAttributes& attrs);

      /// std::nullopt when nothing was persisted for \p uniqueId.
      std::optional<RestoredAttributes> get(const std::string& uniqueId) const;

      /// Replace the contents with \p path; false if the file does not exist, throws on bad JSON.
      bool load(const std::string& path);

      /// Write the contents to \p path or throw `std::runtime_error`.
      void save(const std::string& path) const;

    private:
      mutable std::mutex mtx_;
      std::unordered_map<std::string, nlohmann::json> records_;
    };

  } // namespace core
} // namespace elero
