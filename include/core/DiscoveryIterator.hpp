#pragma once
/** @file  DiscoveryIterator.hpp
 *  @brief Time-bounded SSDP discovery session yielding resolved bridges.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

// huelink headers
#include "core/BridgeClient.hpp"
#include "core/ErrorMonitor.hpp"
#include "io/DatagramSocket.hpp" // DiscoveryIterator owns its socket
#include "io/HttpTransport.hpp"

namespace huelink {
  namespace core {

    /**
 * @struct DiscoveredBridge
 * @brief One item of a discovery session: a resolved bridge or the reason it could not be resolved.
 */
    struct DiscoveredBridge {
      std::string location;               ///< description URL ("" for socket failures)
      std::optional<BridgeClient> bridge; ///< set on success
      std::exception_ptr error;           ///< set on failure

      bool ok() const { return bridge.has_value(); }

      /// The bridge, or rethrows the captured error.
      const BridgeClient& get() const {
        if (!bridge)
          std::rethrow_exception(error);
        return *bridge;
      }
    };

    /**
 * @class DiscoveryIterator
 * @brief Sends one M-SEARCH and yields every distinct responder until the deadline.
 *
 *  * Idle → Active → {Resolving → Active}* → Exhausted; Exhausted is terminal.
 *  * Every call to `next()` blocks for at most the remaining time.
 *  * Malformed answers and already seen locations are skipped silently.
 *  * Resolution failures are yielded as items and do not end the session.
 *  * Not restartable, a new session needs a new instance (and socket).
 */
    class DiscoveryIterator {
    public:
      enum class State { Idle, Active, Resolving, Exhausted };

      /// Binds a fresh socket and broadcasts; throws TransportError if either fails.
      /// A timeout above kMaxTimeout throws std::invalid_argument.
      DiscoveryIterator(std::chrono::milliseconds timeout, std::shared_ptr<io::HttpTransport> transport,
                        std::shared_ptr<ErrorMonitor> errMonitor = nullptr);

      /// Same, over an injected socket (not yet opened).
      DiscoveryIterator(std::unique_ptr<io::DatagramSocket> socket, std::chrono::milliseconds timeout,
                        std::shared_ptr<io::HttpTransport> transport,
                        std::shared_ptr<ErrorMonitor> errMonitor = nullptr);

      //---non-copyable, move-enabled-------------------------------------
      DiscoveryIterator(const DiscoveryIterator&) = delete;
      DiscoveryIterator& operator=(const DiscoveryIterator&) = delete;
      DiscoveryIterator(DiscoveryIterator&&) = default;
      DiscoveryIterator& operator=(DiscoveryIterator&&) = default;

      /// Next distinct bridge, or std::nullopt once the deadline has passed.
      std::optional<DiscoveredBridge> next();

      State state() const { return state_; }
      bool exhausted() const { return state_ == State::Exhausted; }

      /// Time left until the deadline, zero once exhausted.
      std::chrono::milliseconds remaining() const;

    private:
      void start();

      std::unique_ptr<io::DatagramSocket> socket_;
      std::shared_ptr<io::HttpTransport> transport_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::chrono::milliseconds timeout_;
      std::chrono::steady_clock::time_point deadline_{};
      std::unordered_set<std::string> seen_; ///< locations already yielded
      State state_{ State::Idle };
    };

  } // namespace core
} // namespace huelink
