#pragma once
/** @file  Lamp.hpp
 *  @brief Lamp records as listed by `GET api/<user>/lights`.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// 3rd-party headers
#include <nlohmann/json_fwd.hpp>

namespace huelink {
  namespace protocols {

    /// Current state of a lamp (`state` object of a lamp record).
    struct LampState {
      bool on{ false };
      std::uint8_t bri{ 0 };  ///< brightness 0..255
      std::uint16_t ct{ 0 };  ///< colour temperature in mired
      std::string alert;      ///< "none", "select", "lselect"
      std::string colorMode;  ///< "ct", "xy", "hs"
      std::string mode;
      bool reachable{ false };
    };

    /// Static attributes of a lamp bundled with its state.
    struct LampRecord {
      std::string uniqueId;
      std::string type;
      std::string name;
      std::string modelId;
      std::string manufacturerName;
      std::string productId;
      LampState state;
      std::string swVersion;
      std::string swConfigId;
    };

    // absent keys keep their defaults; a non-object, or a key of the wrong JSON type, throws nlohmann::json::type_error
    // bri/ct outside their unsigned range throw std::out_of_range
    void from_json(const nlohmann::json& j, LampState& s);
    void from_json(const nlohmann::json& j, LampRecord& r);

  } // namespace protocols
} // namespace huelink
