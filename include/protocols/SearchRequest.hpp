#pragma once
/** @file  SearchRequest.hpp
 *  @brief SSDP M-SEARCH request with toWire.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

namespace huelink {
  namespace protocols {

    inline constexpr const char* kSsdpGroup = "239.255.255.250";
    inline constexpr std::uint16_t kSsdpPort = 1900;

    struct SearchRequest {
      int mx{ 10 };                       ///< max seconds a responder may delay its answer
      std::string searchTarget{ "ssdp:all" };

      std::string toWire() const {
        return std::string("M-SEARCH * HTTP/1.1\r\n") + "HOST: " + kSsdpGroup + ":" +
               std::to_string(kSsdpPort) + "\r\n" + "MAN: \"ssdp:discover\"\r\n" +
               "MX: " + std::to_string(mx) + "\r\n" + "ST: " + searchTarget + "\r\n\r\n";
      }
    };

  } // namespace protocols
} // namespace huelink
