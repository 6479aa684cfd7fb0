/* @file Lamp.cpp
 * @brief JSON mapping for lamp records
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <limits>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// huelink headers
#include "protocols/Lamp.hpp"

namespace huelink::protocols {

  namespace {
    // reads an optional unsigned field, rejecting values outside T instead of wrapping
    template <typename T> T boundedField(const nlohmann::json& j, const char* key) {
      auto it = j.find(key);
      if (it == j.end())
        return T{ 0 };
      const auto v = it->get<std::int64_t>();
      if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
        throw std::out_of_range(std::string("[Lamp] ") + key + " out of range: " + it->dump());
      return static_cast<T>(v);
    }
  } // namespace

  void from_json(const nlohmann::json& j, LampState& s) {
    s.on = j.value("on", false);
    s.bri = boundedField<std::uint8_t>(j, "bri");
    s.ct = boundedField<std::uint16_t>(j, "ct");
    s.alert = j.value("alert", std::string{});
    s.colorMode = j.value("colormode", std::string{});
    s.mode = j.value("mode", std::string{});
    s.reachable = j.value("reachable", false);
  }

  void from_json(const nlohmann::json& j, LampRecord& r) {
    r.uniqueId = j.value("uniqueid", std::string{});
    r.type = j.value("type", std::string{});
    r.name = j.value("name", std::string{});
    r.modelId = j.value("modelid", std::string{});
    r.manufacturerName = j.value("manufacturername", std::string{});
    r.productId = j.value("productid", std::string{});
    if (auto it = j.find("state"); it != j.end())
      r.state = it->get<LampState>();
    r.swVersion = j.value("swversion", std::string{});
    r.swConfigId = j.value("swconfigid", std::string{});
  }

} // namespace huelink::protocols
