#pragma once
/** @file  DatagramSocket.hpp
 *  @brief UDP datagram I/O wrapper with poll() based receive timeout.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace huelink {
  namespace io {

    /// One received datagram and who sent it.
    struct Datagram {
      std::string payload;
      std::string sender; ///< "a.b.c.d:port"
    };

    /**
 * @class DatagramSocket
 * @brief RAII wrapper around a single IPv4 UDP socket descriptor.
 *
 *  * Binds to an ephemeral port on all interfaces.
 *  * `receive()` returns std::nullopt on timeout; a hard error additionally sets `lastError()`.
 *  * A single `receive()` waits at most INT_MAX ms, the `poll` limit.
 *  * *Non-copyable*, but move-constructible.
 */

    class DatagramSocket {

    public:
      //---ctr / dtr--------------------------------------------
      DatagramSocket() = default;
      virtual ~DatagramSocket(); // close the fd at destruction

      //---public API-------------------------------------------
      virtual bool open(std::uint16_t port = 0); // 0 = ephemeral
      virtual bool sendTo(const std::string& host, std::uint16_t port, const std::string& payload);
      virtual std::optional<Datagram> receive(std::chrono::milliseconds timeout);
      void close();

      /// errno of the last failed receive(), 0 after a datagram or a plain timeout
      virtual int lastError() const { return last_errno_; }

      /// reads and clears SO_ERROR; EBADF if closed
      int takePendingError();

      /// bound port in host order, 0 if closed
      std::uint16_t localPort() const;

      //---non-copyable-----------------------------------------
      DatagramSocket(const DatagramSocket&) = delete;
      DatagramSocket& operator=(const DatagramSocket&) = delete;

      //---mv and mv assign-------------------------------------
      DatagramSocket(DatagramSocket&& other) noexcept;
      DatagramSocket& operator=(DatagramSocket&& other) noexcept;

    private:
      static constexpr std::size_t kMaxDatagram = 8192;

      int fd_{ -1 };         ///< POSIX socket fd (-1==closed)
      int last_errno_{ 0 };
    };
  } // namespace io
} // namespace huelink
