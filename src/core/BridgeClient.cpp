/* @file BridgeClient.cpp
 * @brief request construction for the bridge API, results interpreted by ResponseProtocol
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <variant>

// huelink headers
#include "core/BridgeClient.hpp"
#include "core/Errors.hpp"
#include "protocols/ResponseProtocol.hpp"

using namespace huelink::core;
using huelink::io::HttpResponse;
using huelink::io::HttpTransport;
using nlohmann::json;

namespace proto = huelink::protocols;

BridgeClient::BridgeClient(proto::BridgeDescriptor descriptor, std::shared_ptr<HttpTransport> transport,
                           std::shared_ptr<ErrorMonitor> errMonitor)
    : descriptor_(std::move(descriptor)), transport_(std::move(transport)),
      errorMonitor_(std::move(errMonitor)) {
  if (!transport_)
    throw std::invalid_argument("[BridgeClient] http transport is nullptr");
  if (descriptor_.urlBase.empty())
    throw std::invalid_argument("[BridgeClient] bridge has no base URL");
  if (!descriptor_.urlBase.ends_with('/'))
    descriptor_.urlBase += '/';
}

BridgeClient BridgeClient::resolve(const std::string& location, std::shared_ptr<HttpTransport> transport,
                                   std::shared_ptr<ErrorMonitor> errMonitor) {
  if (!transport)
    throw std::invalid_argument("[BridgeClient] http transport is nullptr");

  HttpResponse res;
  try {
    res = transport->get(location);
  } catch (const TransportError& e) {
    if (errMonitor)
      errMonitor->notifyFailure(e.what());
    throw;
  }

  if (res.status != 200) {
    throw DescriptorError("[BridgeClient] description " + location + " returned HTTP " +
                          std::to_string(res.status));
  }

  return BridgeClient(proto::BridgeDescriptor::fromXml(res.body, location), std::move(transport),
                      std::move(errMonitor));
}

HttpResponse BridgeClient::send(const char* what, const std::function<HttpResponse()>& request) const {
  try {
    return request();
  } catch (const TransportError& e) {
    if (errorMonitor_) {
      errorMonitor_->notifyFailure(std::string("[BridgeClient] ") + friendlyName() + ": " + what +
                                   " failed: " + e.what());
    }
    throw;
  }
}

std::string BridgeClient::registerUser(const std::string& deviceType) const {
  const std::string body = json{ { "devicetype", deviceType } }.dump();
  auto res = send("register", [&] { return transport_->post(apiUrl(""), body); });
  return proto::interpretRegistration(proto::parseSections(res.body));
}

std::map<std::string, proto::LampRecord> BridgeClient::listLamps(const std::string& user) const {
  auto res = send("list lamps", [&] { return transport_->get(apiUrl("/" + user + "/lights")); });

  json doc = json::parse(res.body, nullptr, false);
  if (doc.is_discarded())
    throw DecodeError("[BridgeClient] lamp list is not valid JSON");

  // an invalid user gets a result list instead of the lamp object
  if (doc.is_array()) {
    std::vector<proto::ApiError> errors;
    for (const auto& section : proto::sectionsFromJson(doc)) {
      if (const auto* err = std::get_if<proto::ApiError>(&section))
        errors.push_back(*err);
    }
    throw ProtocolError(std::move(errors));
  }

  if (!doc.is_object())
    throw DecodeError("[BridgeClient] lamp list is not an object");

  try {
    return doc.get<std::map<std::string, proto::LampRecord>>();
  } catch (const json::exception& e) {
    throw DecodeError(std::string("[BridgeClient] malformed lamp record: ") + e.what());
  } catch (const std::out_of_range& e) {
    throw DecodeError(std::string("[BridgeClient] malformed lamp record: ") + e.what());
  }
}

void BridgeClient::setLampAttribute(const std::string& user, const std::string& lampId,
                                    const std::string& key, const json& value) const {
  json body = json::object();
  body[key] = value;
  const std::string payload = body.dump();

  auto res = send("set lamp state", [&] {
    return transport_->put(apiUrl("/" + user + "/lights/" + lampId + "/state"), payload);
  });
  proto::interpretMutation(proto::parseSections(res.body));
}

void BridgeClient::setPower(const std::string& user, const std::string& lampId, bool on) const {
  setLampAttribute(user, lampId, "on", on);
}

void BridgeClient::setBrightness(const std::string& user, const std::string& lampId,
                                 std::uint8_t bri) const {
  setLampAttribute(user, lampId, "bri", bri);
}

void BridgeClient::setColorTemperature(const std::string& user, const std::string& lampId,
                                       std::uint16_t mired) const {
  setLampAttribute(user, lampId, "ct", mired);
}
