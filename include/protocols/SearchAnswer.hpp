#pragma once
/** @file  SearchAnswer.hpp
 *  @brief SSDP answer datagram with fromWire.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

namespace huelink {
  namespace protocols {

    /**
 * @struct SearchAnswer
 * @brief Unicast reply to an M-SEARCH, reduced to what discovery needs.
 *
 *  * Only `HTTP/1.1 200 OK` replies are accepted.
 *  * `location` is the device description URL from the LOCATION header.
 */
    struct SearchAnswer {
      std::string location;

      /// @returns std::nullopt for anything that is not a 200 reply with a LOCATION header.
      static std::optional<SearchAnswer> fromWire(const std::string& datagram);
    };

  } // namespace protocols
} // namespace huelink
