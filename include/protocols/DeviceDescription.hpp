#pragma once
/** @file  DeviceDescription.hpp
 *  @brief Bridge identity decoded from the UPnP XML device description.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <string_view>

namespace huelink {
  namespace protocols {

    /// Manufacturer-declared identity of a bridge (`root/device/*`).
    struct BridgeDevice {
      std::string udn;              ///< e.g. uuid:2f402f80-da50-11e1-9b23-001788255acc
      std::string deviceType;       ///< e.g. urn:schemas-upnp-org:device:Basic:1
      std::string manufacturer;
      std::string modelName;
      std::string modelDescription;
      std::string serialNumber;
      std::string friendlyName;     ///< e.g. Philips hue (192.168.1.20)

      bool operator==(const BridgeDevice&) const = default;
    };

    /**
 * @struct BridgeDescriptor
 * @brief Base URL plus device metadata, everything needed to address a bridge.
 *
 *  * `urlBase` always ends in '/', API paths are appended directly ("api/...").
 */
    struct BridgeDescriptor {
      std::string urlBase;
      BridgeDevice device;

      /**
       * @brief Decode a description document.
       *
       * @param xml       raw document as fetched from the discovery location
       * @param location  URL it was fetched from; its origin stands in for a missing `URLBase`
       * @throws core::DescriptorError on malformed XML or missing device fields
       */
      static BridgeDescriptor fromXml(std::string_view xml, std::string_view location = {});
    };

  } // namespace protocols
} // namespace huelink
