/* @file Errors.cpp
 * @brief ProtocolError message formatting.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Errors.hpp"

using namespace huelink::core;

ProtocolError::ProtocolError(std::vector<protocols::ApiError> errors)
    : BridgeError(summarize(errors)), errors_(std::move(errors)) {}

std::string ProtocolError::summarize(const std::vector<protocols::ApiError>& errors) {
  if (errors.empty())
    return "[ResponseProtocol] bridge reported no success and no errors";

  std::string msg = "[ResponseProtocol] bridge reported " + std::to_string(errors.size()) +
                    (errors.size() == 1 ? " error: " : " errors: ");
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i > 0)
      msg += "; ";
    msg += errors[i].description + " (type " + std::to_string(errors[i].type);
    if (!errors[i].address.empty())
      msg += ", " + errors[i].address;
    msg += ")";
  }
  return msg;
}
