#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Reads a JSON document (cover configuration or persisted state) from disk.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

// third-party headers
#include <nlohmann/json_fwd.hpp>

namespace elero::core {

  /**
 * @class ConfigLoader
 * @brief Parses one file per `load()` call; the result is not cached.
 *
 *  * Schema checks belong to the consumer: CoverConfig for "covers", StateStore for records.
 */
  class ConfigLoader {
  public:
    explicit ConfigLoader(std::string configPath);

    /// Throws `std::runtime_error` naming the path when the file is unreadable or not JSON.
    nlohmann::json load() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace elero::core
