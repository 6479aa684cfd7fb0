/* @file DiscoveryIterator.cpp
 * @brief SSDP broadcast/receive loop with de-duplication and a wall-clock deadline
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <iostream>
#include <stdexcept>

// huelink headers
#include "core/DiscoveryIterator.hpp"
#include "core/Errors.hpp"
#include "protocols/SearchAnswer.hpp"
#include "protocols/SearchRequest.hpp"

using namespace huelink::core;
using namespace std::chrono_literals;

DiscoveryIterator::DiscoveryIterator(std::chrono::milliseconds timeout,
                                     std::shared_ptr<io::HttpTransport> transport,
                                     std::shared_ptr<ErrorMonitor> errMonitor)
    : DiscoveryIterator(std::make_unique<io::DatagramSocket>(), timeout, std::move(transport),
                        std::move(errMonitor)) {}

DiscoveryIterator::DiscoveryIterator(std::unique_ptr<io::DatagramSocket> socket,
                                     std::chrono::milliseconds timeout,
                                     std::shared_ptr<io::HttpTransport> transport,
                                     std::shared_ptr<ErrorMonitor> errMonitor)
    : socket_(std::move(socket)), transport_(std::move(transport)),
      errorMonitor_(std::move(errMonitor)), timeout_(timeout) {
  if (!socket_)
    throw std::invalid_argument("[DiscoveryIterator] socket is nullptr");
  if (!transport_)
    throw std::invalid_argument("[DiscoveryIterator] http transport is nullptr");
  if (timeout_ > kMaxTimeout)
    throw std::invalid_argument("[DiscoveryIterator] timeout exceeds " + std::to_string(kMaxTimeout.count()) +
                                " ms");
  start();
}

void DiscoveryIterator::start() {
  deadline_ = std::chrono::steady_clock::now() + timeout_;

  if (!socket_->open()) {
    std::string errMsg = "[DiscoveryIterator] could not bind discovery socket";
    if (errorMonitor_)
      errorMonitor_->notifyFailure(errMsg);
    throw TransportError(errMsg);
  }

  const std::string search = protocols::SearchRequest{}.toWire();
  if (!socket_->sendTo(protocols::kSsdpGroup, protocols::kSsdpPort, search)) {
    std::string errMsg = "[DiscoveryIterator] M-SEARCH broadcast failed";
    if (errorMonitor_)
      errorMonitor_->notifyFailure(errMsg);
    throw TransportError(errMsg);
  }

  state_ = State::Active;
}

std::chrono::milliseconds DiscoveryIterator::remaining() const {
  if (state_ == State::Exhausted)
    return 0ms;
  if (state_ == State::Idle)
    return timeout_;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ -
                                                                    std::chrono::steady_clock::now());
  return left > 0ms ? left : 0ms;
}

// -------------------------------------------------------------------
// DiscoveryIterator::next
// Blocks for at most remaining(). Malformed and duplicate answers
// are skipped inside the loop.
// -------------------------------------------------------------------
std::optional<DiscoveredBridge> DiscoveryIterator::next() {
  while (state_ == State::Active) {
    const auto left = remaining();
    if (left <= 0ms) {
      state_ = State::Exhausted;
      break;
    }

    auto datagram = socket_->receive(left);
    if (!datagram) {
      if (int err = socket_->lastError(); err != 0) {
        std::string errMsg = std::string("[DiscoveryIterator] receive failed: ") + strerror(err);
        std::cerr << errMsg << '\n';
        if (errorMonitor_)
          errorMonitor_->notifyFailure(errMsg);
        return DiscoveredBridge{ {}, std::nullopt, std::make_exception_ptr(TransportError(errMsg)) };
      }
      continue; // timeout → the deadline check ends the session
    }

    auto answer = protocols::SearchAnswer::fromWire(datagram->payload);
    if (!answer)
      continue; // not a 200 answer with a LOCATION

    if (!seen_.insert(answer->location).second)
      continue; // same description already yielded, possibly from another address

    state_ = State::Resolving;
    DiscoveredBridge item{ answer->location, std::nullopt, nullptr };
    try {
      item.bridge = BridgeClient::resolve(answer->location, transport_, errorMonitor_);
    } catch (const BridgeError&) {
      item.error = std::current_exception();
    }
    state_ = State::Active;
    return item;
  }
  return std::nullopt;
}
