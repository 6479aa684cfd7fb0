/* @file ResponseProtocol.cpp
 * @brief decoding of bridge result lists and the "any success wins" classification
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// huelink headers
#include "protocols/ResponseProtocol.hpp"
#include "core/Errors.hpp"

using huelink::core::DecodeError;
using huelink::core::ProtocolError;

namespace huelink::protocols {

  namespace {
    ApiError errorFromJson(const nlohmann::json& body) {
      if (!body.is_object())
        throw DecodeError("[ResponseProtocol] error section is not an object");
      ApiError err;
      err.type = body.value("type", 0);
      err.address = body.value("address", std::string{});
      err.description = body.value("description", std::string{});
      return err;
    }
  } // namespace

  ResponseSection sectionFromJson(const nlohmann::json& entry) {
    // externally tagged: exactly one key naming the variant
    if (!entry.is_object() || entry.size() != 1)
      throw DecodeError("[ResponseProtocol] section must be a single-key object: " + entry.dump());

    try {
      if (auto it = entry.find("error"); it != entry.end())
        return errorFromJson(*it);

      if (auto it = entry.find("success"); it != entry.end()) {
        if (!it->is_object())
          throw DecodeError("[ResponseProtocol] success section is not an object");
        return SuccessSection{ *it };
      }
    } catch (const nlohmann::json::exception& e) {
      throw DecodeError(std::string("[ResponseProtocol] malformed section: ") + e.what());
    }

    throw DecodeError("[ResponseProtocol] unknown section kind: " + entry.begin().key());
  }

  std::vector<ResponseSection> sectionsFromJson(const nlohmann::json& body) {
    if (!body.is_array())
      throw DecodeError("[ResponseProtocol] response is not a list");

    std::vector<ResponseSection> sections;
    sections.reserve(body.size());
    for (const auto& entry : body)
      sections.push_back(sectionFromJson(entry));
    return sections;
  }

  std::vector<ResponseSection> parseSections(const std::string& body) {
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded())
      throw DecodeError("[ResponseProtocol] response is not valid JSON");
    return sectionsFromJson(doc);
  }

  std::string interpretRegistration(const std::vector<ResponseSection>& sections) {
    std::vector<ApiError> errors;

    for (const auto& section : sections) {
      if (const auto* err = std::get_if<ApiError>(&section)) {
        errors.push_back(*err);
        continue;
      }
      const auto& payload = std::get<SuccessSection>(section).payload;
      if (auto it = payload.find("username"); it != payload.end())
        return it->is_string() ? it->get<std::string>() : it->dump();
    }

    throw ProtocolError(std::move(errors));
  }

  void interpretMutation(const std::vector<ResponseSection>& sections) {
    std::vector<ApiError> errors;
    bool success = false;

    for (const auto& section : sections) {
      if (const auto* err = std::get_if<ApiError>(&section))
        errors.push_back(*err);
      else
        success = true;
    }

    if (!success)
      throw ProtocolError(std::move(errors));
  }

} // namespace huelink::protocols
