/* @file SearchAnswer.cpp
 * @brief line parser for SSDP answer datagrams
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <string_view>

// huelink headers
#include "protocols/SearchAnswer.hpp"

using namespace huelink::protocols;

namespace {
  constexpr std::string_view kStatusLine = "HTTP/1.1 200 OK";
  constexpr std::string_view kLocationHeader = "location";

  std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
      s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
      s.remove_suffix(1);
    return s;
  }

  bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
             return std::tolower(static_cast<unsigned char>(x)) ==
                    std::tolower(static_cast<unsigned char>(y));
           });
  }

  // splits on '\n', drops a trailing '\r'
  std::string_view nextLine(std::string_view& rest) {
    auto pos = rest.find('\n');
    std::string_view line = rest.substr(0, pos);
    rest = pos == std::string_view::npos ? std::string_view{} : rest.substr(pos + 1);
    if (line.ends_with('\r'))
      line.remove_suffix(1);
    return line;
  }
} // namespace

std::optional<SearchAnswer> SearchAnswer::fromWire(const std::string& datagram) {
  std::string_view rest = datagram;
  if (rest.empty())
    return std::nullopt;

  if (!nextLine(rest).starts_with(kStatusLine))
    return std::nullopt;

  while (!rest.empty()) {
    std::string_view line = nextLine(rest);
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
      continue;
    if (!iequals(trim(line.substr(0, colon)), kLocationHeader))
      continue;

    std::string_view url = trim(line.substr(colon + 1));
    if (url.empty())
      return std::nullopt;
    return SearchAnswer{ std::string(url) };
  }
  return std::nullopt; // no LOCATION header
}
