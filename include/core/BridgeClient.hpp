#pragma once
/** @file  BridgeClient.hpp
 *  @brief Blocking client for one bridge's JSON control API.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// huelink headers
#include "core/ConfigLoader.hpp"           // ClientConfig defaults
#include "core/ErrorMonitor.hpp"           // BridgeClient will be a client to the error monitor
#include "io/HttpTransport.hpp"
#include "protocols/DeviceDescription.hpp" // BridgeDescriptor is held by value
#include "protocols/Lamp.hpp"

namespace huelink {
  namespace core {

    /**
 * @class BridgeClient
 * @brief Registration, lamp listing and lamp state changes against one bridge.
 *
 *  * Immutable after construction; copies share the transport.
 *  * The authenticated user is passed per call, never stored: one bridge may
 *    serve several registered identities.
 *  * Failures throw: `TransportError`, `DecodeError`, `ProtocolError`
 *    (see core/Errors.hpp). Transport failures are reported to the
 *    ErrorMonitor first, when one is attached.
 */
    class BridgeClient {
    public:
      BridgeClient(protocols::BridgeDescriptor descriptor, std::shared_ptr<io::HttpTransport> transport,
                   std::shared_ptr<ErrorMonitor> errMonitor = nullptr);

      /// Fetch and decode the description document found at \p location.
      /// @throws TransportError, DescriptorError
      static BridgeClient resolve(const std::string& location,
                                  std::shared_ptr<io::HttpTransport> transport,
                                  std::shared_ptr<ErrorMonitor> errMonitor = nullptr);

      //---public APIs------------------------------------------------------

      /// Register a new user; the bridge's link button must have been pressed.
      /// Not retried here, a ProtocolError usually means "button not pressed yet".
      std::string registerUser(const std::string& deviceType = ClientConfig{}.deviceType) const;

      /// All lamps keyed by their bridge-local id ("1", "2", …).
      std::map<std::string, protocols::LampRecord> listLamps(const std::string& user) const;

      /// PUT `{key: value}` to the lamp's state; value must be a JSON scalar.
      void setLampAttribute(const std::string& user, const std::string& lampId, const std::string& key,
                            const nlohmann::json& value) const;

      void setPower(const std::string& user, const std::string& lampId, bool on) const;
      void setBrightness(const std::string& user, const std::string& lampId, std::uint8_t bri) const;
      void setColorTemperature(const std::string& user, const std::string& lampId,
                               std::uint16_t mired) const;

      //---accessors--------------------------------------------------------
      const protocols::BridgeDescriptor& descriptor() const { return descriptor_; }
      const std::string& urlBase() const { return descriptor_.urlBase; }
      const std::string& friendlyName() const { return descriptor_.device.friendlyName; }

    private:
      std::string apiUrl(const std::string& suffix) const { return descriptor_.urlBase + "api" + suffix; }

      io::HttpResponse send(const char* what, const std::function<io::HttpResponse()>& request) const;

      protocols::BridgeDescriptor descriptor_;
      std::shared_ptr<io::HttpTransport> transport_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
    };

  } // namespace core
} // namespace huelink
