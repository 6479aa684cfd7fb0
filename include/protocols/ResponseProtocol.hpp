#pragma once
/** @file  ResponseProtocol.hpp
 *  @brief Bridge result lists: section variant, decoding and outcome classification.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <variant>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace huelink {
  namespace protocols {

    /**
 * @struct ApiError
 * @brief One `{"error": {...}}` entry of a bridge result list.
 *
 *  * `type`        device error kind (1 = unauthorized user, 101 = link button not pressed, …)
 *  * `address`     resource the error refers to, e.g. `/lights/1/state/on`
 *  * `description` human readable text as sent by the bridge
 */
    struct ApiError {
      int type{ 0 };
      std::string address;
      std::string description;

      bool operator==(const ApiError&) const = default;
    };

    /// One `{"success": {...}}` entry; payload is the JSON object as received.
    struct SuccessSection {
      nlohmann::json payload = nlohmann::json::object();
    };

    using ResponseSection = std::variant<ApiError, SuccessSection>;

    /// Decode a single list entry; throws `core::DecodeError` on any other shape.
    ResponseSection sectionFromJson(const nlohmann::json& entry);

    /// Decode a complete response body (JSON array); throws `core::DecodeError`.
    std::vector<ResponseSection> parseSections(const std::string& body);

    /// Same, for a body that has already been parsed as JSON.
    std::vector<ResponseSection> sectionsFromJson(const nlohmann::json& body);

    /**
     * @brief Outcome of a registration call.
     *
     * The first success carrying a `"username"` key wins and any errors are
     * dropped. Throws `core::ProtocolError` with all collected errors otherwise
     * (empty list for an empty response).
     */
    std::string interpretRegistration(const std::vector<ResponseSection>& sections);

    /**
     * @brief Outcome of a state mutation call.
     *
     * Any success section makes the call successful. Throws
     * `core::ProtocolError` with every error, in response order, when there is none.
     */
    void interpretMutation(const std::vector<ResponseSection>& sections);

  } // namespace protocols
} // namespace huelink
