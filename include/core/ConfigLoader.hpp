#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace huelink::core {

  /// Upper bound for every configured timeout (24 h).
  inline constexpr std::chrono::milliseconds kMaxTimeout{ std::chrono::hours{ 24 } };

  /**
 * @struct ClientConfig
 * @brief Settings the embedding application passes to discovery and bridge calls.
 */
  struct ClientConfig {
    std::chrono::milliseconds discoveryTimeout{ 5000 };
    std::string deviceType{ "huelink#client" }; ///< "devicetype" sent on registration
    std::chrono::milliseconds httpTimeout{ 5000 };
  };

  /// Applies `discovery_timeout_ms`, `device_type`, `http_timeout_ms` where present.
  /// Throws `std::invalid_argument` on wrong types or timeouts outside (0, kMaxTimeout].
  void from_json(const nlohmann::json& j, ClientConfig& cfg);

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching, every call to `load()` re-reads the file.
 *  * Schema validation lives in `from_json(…, ClientConfig&)`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `load()` applied on top of the defaults.
    ClientConfig loadClientConfig() const;

  private:
    std::string path_;
  };

} // namespace huelink::core
