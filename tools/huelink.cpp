/* @file huelink.cpp
 * @brief command line front end: discover bridges, register, list and switch lamps
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// huelink headers
#include "core/BridgeClient.hpp"
#include "core/CommandLine.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DiscoveryIterator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"

using namespace huelink::core;

namespace {

  void usage() {
    std::cerr << "usage: huelink [--config <file>] <command>\n"
                 "  discover\n"
                 "  register <location>\n"
                 "  lights   <location> <user>\n"
                 "  on|off   <location> <user> <lamp>\n"
                 "  bri      <location> <user> <lamp> <0-255>\n";
  }

  int discover(const ClientConfig& cfg, std::shared_ptr<huelink::io::HttpTransport> transport,
               std::shared_ptr<ErrorMonitor> monitor) {
    DiscoveryIterator session(cfg.discoveryTimeout, std::move(transport), std::move(monitor));
    int found = 0;
    while (auto item = session.next()) {
      if (!item->ok()) {
        try {
          item->get();
        } catch (const BridgeError& e) {
          std::cerr << "skipped " << item->location << ": " << e.what() << "\n";
        }
        continue;
      }
      const auto& bridge = *item->bridge;
      std::cout << bridge.friendlyName() << "\t" << item->location << "\t" << bridge.urlBase() << "\n";
      ++found;
    }
    return found > 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  int run(const std::vector<std::string>& args, const ClientConfig& cfg) {
    const Command cmd = parseCommand(args);
    if (cmd == Command::Invalid) {
      usage();
      return EXIT_FAILURE;
    }

    std::optional<std::uint8_t> bri;
    if (cmd == Command::Brightness && !(bri = parseBrightness(args[4]))) {
      std::cerr << "brightness must be 0-255\n";
      return EXIT_FAILURE;
    }

    auto transport = std::make_shared<huelink::io::HttpTransport>(cfg.httpTimeout);
    auto monitor = std::make_shared<ErrorMonitor>();
    if (cmd == Command::Discover)
      return discover(cfg, transport, monitor);

    const auto bridge = BridgeClient::resolve(args[1], transport, monitor);
    switch (cmd) {
    case Command::Register:
      std::cout << bridge.registerUser(cfg.deviceType) << "\n";
      break;
    case Command::Lights:
      for (const auto& [id, lamp] : bridge.listLamps(args[2])) {
        std::cout << id << "\t" << lamp.name << "\t" << (lamp.state.on ? "on" : "off") << "\tbri "
                  << static_cast<int>(lamp.state.bri) << (lamp.state.reachable ? "" : "\tunreachable")
                  << "\n";
      }
      break;
    case Command::Power:
      bridge.setPower(args[2], args[3], args[0] == "on");
      break;
    case Command::Brightness:
      bridge.setBrightness(args[2], args[3], *bri);
      break;
    default:
      break;
    }
    return EXIT_SUCCESS;
  }

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  try {
    ClientConfig cfg;
    if (args.size() >= 2 && args[0] == "--config") {
      cfg = ConfigLoader(args[1]).loadClientConfig();
      args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
      usage();
      return EXIT_FAILURE;
    }
    return run(args, cfg);
  } catch (const ProtocolError& e) {
    std::cerr << "bridge refused the request:\n";
    for (const auto& err : e.errors())
      std::cerr << "  [" << err.type << "] " << err.address << ": " << err.description << "\n";
    if (e.errors().empty())
      std::cerr << "  (no error details)\n";
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return EXIT_FAILURE;
  }
}
