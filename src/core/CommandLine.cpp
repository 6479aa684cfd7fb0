/* @file CommandLine.cpp
 * @brief huelink command line argument classification
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>

// huelink headers
#include "core/CommandLine.hpp"

namespace huelink::core {

  Command parseCommand(const std::vector<std::string>& args) {
    if (args.empty())
      return Command::Invalid;

    const std::string& cmd = args[0];
    const auto n = args.size();
    if (cmd == "discover" && n == 1)
      return Command::Discover;
    if (cmd == "register" && n == 2)
      return Command::Register;
    if (cmd == "lights" && n == 3)
      return Command::Lights;
    if ((cmd == "on" || cmd == "off") && n == 4)
      return Command::Power;
    if (cmd == "bri" && n == 5)
      return Command::Brightness;
    return Command::Invalid;
  }

  std::optional<std::uint8_t> parseBrightness(const std::string& text) {
    if (text.empty() || text.size() > 3)
      return std::nullopt;
    int value = 0;
    for (char c : text) {
      if (!std::isdigit(static_cast<unsigned char>(c)))
        return std::nullopt;
      value = value * 10 + (c - '0');
    }
    if (value > 255)
      return std::nullopt;
    return static_cast<std::uint8_t>(value);
  }

} // namespace huelink::core
