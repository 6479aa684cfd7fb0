/* @file ConfigLoader.cpp
 * @brief JSON config file reader and ClientConfig mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// huelink headers
#include "core/ConfigLoader.hpp"

namespace huelink::core {

  namespace {
    std::chrono::milliseconds positiveMillis(const nlohmann::json& j, const char* key) {
      const auto& v = j.at(key);
      if (!v.is_number_integer() || v.get<long long>() <= 0 || v.get<long long>() > kMaxTimeout.count())
        throw std::invalid_argument(std::string("[ConfigLoader] ") + key + " must be an integer in 1.." +
                                    std::to_string(kMaxTimeout.count()));
      return std::chrono::milliseconds{ v.get<long long>() };
    }
  } // namespace

  void from_json(const nlohmann::json& j, ClientConfig& cfg) {
    if (!j.is_object())
      throw std::invalid_argument("[ConfigLoader] configuration must be a JSON object");

    if (j.contains("discovery_timeout_ms"))
      cfg.discoveryTimeout = positiveMillis(j, "discovery_timeout_ms");
    if (j.contains("http_timeout_ms"))
      cfg.httpTimeout = positiveMillis(j, "http_timeout_ms");
    if (j.contains("device_type")) {
      const auto& v = j.at("device_type");
      if (!v.is_string() || v.get<std::string>().empty())
        throw std::invalid_argument("[ConfigLoader] device_type must be a non-empty string");
      cfg.deviceType = v.get<std::string>();
    }
  }

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  nlohmann::json ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in)
      throw std::runtime_error("[ConfigLoader] cannot open " + path_);

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded())
      throw std::runtime_error("[ConfigLoader] " + path_ + " is not valid JSON");
    return doc;
  }

  ClientConfig ConfigLoader::loadClientConfig() const {
    ClientConfig cfg;
    from_json(load(), cfg);
    return cfg;
  }

} // namespace huelink::core
