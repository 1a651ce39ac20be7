#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace codeloop::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;  // 0 when no HTTP response was received
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;
  bool timed_out = false;
  bool cancelled = false;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
};

// Handle of one in-flight request, 0 when none was started
using RequestId = uint64_t;

// Async HTTP/1.1 client on asio; the caller runs the io_context
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  ~HttpClient();

  // Async request with callback
  RequestId request(const std::string &url, const HttpOptions &options, std::function<void(HttpResponse)> callback);

  // Async request returning future; id receives the handle for cancel()
  std::future<HttpResponse> request(const std::string &url, const HttpOptions &options, RequestId *id = nullptr);

  // Abort one request; its callback fires with cancelled set.
  // Other requests on this client are left alone.
  void cancel(RequestId id);

 private:
  class Impl;

  std::shared_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string &url);
};

// Decode a Transfer-Encoding: chunked body; nullopt when malformed or incomplete
std::optional<std::string> decode_chunked(const std::string &body);

}  // namespace codeloop::net
