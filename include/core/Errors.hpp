#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the core and protocol layers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <vector>

// huelink headers
#include "protocols/ResponseProtocol.hpp" // ProtocolError carries ApiError by value

namespace huelink::core {

  /// Root of everything a bridge call can throw.
  class BridgeError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Socket or HTTP failure. Fatal to the current call, never retried.
  class TransportError : public BridgeError {
  public:
    using BridgeError::BridgeError;
  };

  /// Body could not be decoded (malformed JSON/XML or unexpected shape).
  class DecodeError : public BridgeError {
  public:
    using BridgeError::BridgeError;
  };

  /// Device description document missing, malformed or incomplete.
  class DescriptorError : public DecodeError {
  public:
    using DecodeError::DecodeError;
  };

  /**
 * @class ProtocolError
 * @brief Well-formed response in which the bridge reported failure.
 *
 *  * Holds the device's own error entries in response order.
 *  * The list may be empty (empty response, or successes without the expected key).
 */
  class ProtocolError : public BridgeError {
  public:
    explicit ProtocolError(std::vector<protocols::ApiError> errors);

    const std::vector<protocols::ApiError>& errors() const noexcept { return errors_; }

  private:
    static std::string summarize(const std::vector<protocols::ApiError>& errors);

    std::vector<protocols::ApiError> errors_;
  };

} // namespace huelink::core
