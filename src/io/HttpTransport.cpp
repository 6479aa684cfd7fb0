/* @file HttpTransport.cpp
 * @brief libcurl easy interface, one handle per request
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <memory>
#include <mutex>

// 3rd-party headers
#include <curl/curl.h>

// huelink headers
#include "core/Errors.hpp"
#include "io/HttpTransport.hpp"

using huelink::core::TransportError;
using namespace huelink::io;

namespace {
  std::once_flag g_curlInit;

  size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(data, size * nmemb);
    return size * nmemb;
  }
} // namespace

HttpTransport::HttpTransport(std::chrono::milliseconds timeout) : timeout_(timeout) {
  std::call_once(g_curlInit, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
      std::cerr << "[HttpTransport] curl_global_init failed\n";
  });
}

HttpResponse HttpTransport::get(const std::string& url) { return perform(Method::Get, url, nullptr); }

HttpResponse HttpTransport::post(const std::string& url, const std::string& jsonBody) {
  return perform(Method::Post, url, &jsonBody);
}

HttpResponse HttpTransport::put(const std::string& url, const std::string& jsonBody) {
  return perform(Method::Put, url, &jsonBody);
}

HttpResponse HttpTransport::perform(Method method, const std::string& url, const std::string* body) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl)
    throw TransportError("[HttpTransport] curl_easy_init failed");

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);

  HttpResponse response;
  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L); // required for timeouts in multi-threaded callers
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

  const char* verb = "GET";
  switch (method) {
  case Method::Get:
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    break;
  case Method::Post:
    verb = "POST";
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    break;
  case Method::Put:
    verb = "PUT";
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
    break;
  }

  if (body) {
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  }

  CURLcode res = curl_easy_perform(h);
  if (res != CURLE_OK) {
    std::string errMsg = std::string("[HttpTransport] ") + verb + " " +
                         url + " failed: " + curl_easy_strerror(res);
    std::cerr << errMsg << "\n";
    throw TransportError(errMsg);
  }

  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}
