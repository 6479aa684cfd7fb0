#pragma once
/** @file  CommandLine.hpp
 *  @brief Argument shapes accepted by the huelink command line tool.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace huelink::core {

  enum class Command { Discover, Register, Lights, Power, Brightness, Invalid };

  /// Classifies `args` (without program name and `--config`); a wrong argument count is Invalid.
  Command parseCommand(const std::vector<std::string>& args);

  /// "0".."255" → level, anything else std::nullopt
  std::optional<std::uint8_t> parseBrightness(const std::string& text);

} // namespace huelink::core
