/* @file DeviceDescription.cpp
 * @brief expat based decoder for the bridge's UPnP description document
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <climits>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

// 3rd-party headers
#include <expat.h>

// huelink headers
#include "core/Errors.hpp"
#include "protocols/DeviceDescription.hpp"

using huelink::core::DescriptorError;
using namespace huelink::protocols;

namespace {

  struct ParseState {
    std::vector<std::string> path; ///< open elements, outermost first
    std::string text;              ///< character data of the innermost element
    BridgeDescriptor result;
    bool sawRoot = false;
  };

  std::string trimmed(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
      ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
      --e;
    return s.substr(b, e - b);
  }

  std::string* deviceField(BridgeDevice& dev, const std::string& name) {
    if (name == "UDN")
      return &dev.udn;
    if (name == "deviceType")
      return &dev.deviceType;
    if (name == "manufacturer")
      return &dev.manufacturer;
    if (name == "modelName")
      return &dev.modelName;
    if (name == "modelDescription")
      return &dev.modelDescription;
    if (name == "serialNumber")
      return &dev.serialNumber;
    if (name == "friendlyName")
      return &dev.friendlyName;
    return nullptr;
  }

  void XMLCALL onStart(void* userData, const XML_Char* name, const XML_Char**) {
    auto* st = static_cast<ParseState*>(userData);
    if (st->path.empty() && std::string_view(name) == "root")
      st->sawRoot = true;
    st->path.emplace_back(name);
    st->text.clear();
  }

  void XMLCALL onEnd(void* userData, const XML_Char*) {
    auto* st = static_cast<ParseState*>(userData);
    const auto& p = st->path;

    if (p.size() == 2 && p[0] == "root" && p[1] == "URLBase") {
      st->result.urlBase = trimmed(st->text);
    } else if (p.size() == 3 && p[0] == "root" && p[1] == "device") {
      // only direct children of the top level device, embedded devices sit deeper
      if (auto* field = deviceField(st->result.device, p[2]))
        *field = trimmed(st->text);
    }

    st->path.pop_back();
    st->text.clear();
  }

  void XMLCALL onText(void* userData, const XML_Char* s, int len) {
    static_cast<ParseState*>(userData)->text.append(s, static_cast<std::size_t>(len));
  }

  // scheme://authority/ of a URL, empty if it has none
  std::string originOf(std::string_view url) {
    auto scheme = url.find("://");
    if (scheme == std::string_view::npos)
      return {};
    auto slash = url.find('/', scheme + 3);
    return std::string(url.substr(0, slash)) + "/";
  }

} // namespace

BridgeDescriptor BridgeDescriptor::fromXml(std::string_view xml, std::string_view location) {
  if (xml.size() > static_cast<std::size_t>(INT_MAX))
    throw DescriptorError("[DeviceDescription] document too large");

  std::unique_ptr<std::remove_pointer_t<XML_Parser>, decltype(&XML_ParserFree)> parser(
      XML_ParserCreate(nullptr), &XML_ParserFree);
  if (!parser)
    throw DescriptorError("[DeviceDescription] could not create XML parser");

  ParseState state;
  XML_SetUserData(parser.get(), &state);
  XML_SetElementHandler(parser.get(), onStart, onEnd);
  XML_SetCharacterDataHandler(parser.get(), onText);

  if (XML_Parse(parser.get(), xml.data(), static_cast<int>(xml.size()), 1) == XML_STATUS_ERROR) {
    throw DescriptorError(std::string("[DeviceDescription] malformed XML at line ") +
                          std::to_string(XML_GetCurrentLineNumber(parser.get())) + ": " +
                          XML_ErrorString(XML_GetErrorCode(parser.get())));
  }

  if (!state.sawRoot)
    throw DescriptorError("[DeviceDescription] document has no <root> element");

  BridgeDescriptor desc = std::move(state.result);

  if (desc.urlBase.empty())
    desc.urlBase = originOf(location);
  if (desc.urlBase.empty())
    throw DescriptorError("[DeviceDescription] missing URLBase");
  if (!desc.urlBase.ends_with('/'))
    desc.urlBase += '/';

  const std::pair<const char*, const std::string*> required[] = {
    { "UDN", &desc.device.udn },
    { "deviceType", &desc.device.deviceType },
    { "manufacturer", &desc.device.manufacturer },
    { "modelName", &desc.device.modelName },
    { "modelDescription", &desc.device.modelDescription },
    { "serialNumber", &desc.device.serialNumber },
    { "friendlyName", &desc.device.friendlyName },
  };
  for (const auto& [name, value] : required) {
    if (value->empty())
      throw DescriptorError(std::string("[DeviceDescription] missing device field ") + name);
  }

  return desc;
}
