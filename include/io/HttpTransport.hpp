#pragma once
/** @file  HttpTransport.hpp
 *  @brief Blocking HTTP request/response over libcurl.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

namespace huelink {
  namespace io {

    struct HttpResponse {
      long status{ 0 };
      std::string body;
    };

    /**
 * @class HttpTransport
 * @brief Stateless blocking HTTP client.
 *
 *  * Each request uses its own curl easy handle: no pooling, safe to share across threads.
 *  * Transport failures (DNS, connect, timeout) throw `core::TransportError`;
 *    any HTTP status is returned to the caller.
 */
    class HttpTransport {

    public:
      explicit HttpTransport(std::chrono::milliseconds timeout = std::chrono::milliseconds{ 5000 });
      virtual ~HttpTransport() = default;

      //---public API-------------------------------------------
      virtual HttpResponse get(const std::string& url);
      virtual HttpResponse post(const std::string& url, const std::string& jsonBody);
      virtual HttpResponse put(const std::string& url, const std::string& jsonBody);

      std::chrono::milliseconds timeout() const { return timeout_; }

      //---non-copyable-----------------------------------------
      HttpTransport(const HttpTransport&) = delete;
      HttpTransport& operator=(const HttpTransport&) = delete;

    private:
      enum class Method { Get, Post, Put };

      HttpResponse perform(Method method, const std::string& url, const std::string* body);

      std::chrono::milliseconds timeout_;
    };
  } // namespace io
} // namespace huelink
