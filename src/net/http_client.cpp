#include "http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <regex>
#include <set>
#include <sstream>
#include <type_traits>
#include <vector>

namespace codeloop::net {

namespace {

using TcpSocket = asio::ip::tcp::socket;
using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.host << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty()) {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

bool is_chunked(const HttpResponse& response) {
  auto it = response.headers.find("transfer-encoding");
  return it != response.headers.end() && to_lower(it->second).find("chunked") != std::string::npos;
}

// True once Content-Length bytes or the terminating chunk have arrived
bool body_complete(const HttpResponse& response) {
  if (is_chunked(response)) {
    return decode_chunked(response.body).has_value();
  }
  auto it = response.headers.find("content-length");
  if (it == response.headers.end()) return false;
  try {
    return response.body.size() >= std::stoull(it->second);
  } catch (const std::exception&) {
    return false;  // Read until EOF
  }
}

}  // namespace

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::optional<std::string> decode_chunked(const std::string& body) {
  std::string out;
  size_t pos = 0;
  while (true) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) return std::nullopt;

    std::string size_str = body.substr(pos, line_end - pos);
    auto ext = size_str.find(';');
    if (ext != std::string::npos) size_str.resize(ext);

    size_t size = 0;
    try {
      size = std::stoul(size_str, nullptr, 16);
    } catch (const std::exception&) {
      return std::nullopt;
    }

    pos = line_end + 2;
    if (size == 0) return out;
    if (pos + size + 2 > body.size()) return std::nullopt;
    out.append(body, pos, size);
    pos += size + 2;
  }
}

// All socket work runs on the io_context thread
class HttpClient::Impl : public std::enable_shared_from_this<HttpClient::Impl> {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  RequestId request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      HttpResponse response;
      response.error = "Invalid URL: " + url;
      callback(std::move(response));
      return 0;
    }

    RequestId id = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      id = next_id_++;
      pending_.insert(id);
    }

    asio::post(io_ctx_, [self = shared_from_this(), id, url = *parsed, options, callback = std::move(callback)]() mutable {
      if (url.is_https()) {
        auto socket = std::make_shared<TlsStream>(self->io_ctx_, self->ssl_ctx_);
        // SNI hostname
        SSL_set_tlsext_host_name(socket->native_handle(), url.host.c_str());
        self->start(id, socket, url, options, std::move(callback));
      } else {
        self->start(id, std::make_shared<TcpSocket>(self->io_ctx_), url, options, std::move(callback));
      }
    });
    return id;
  }

  void cancel(RequestId id) {
    std::function<void()> closer;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = active_.find(id);
      if (it != active_.end()) {
        closer = it->second;
      } else if (pending_.count(id)) {
        // Not started yet; start() finishes it as cancelled
        cancelled_early_.insert(id);
      }
    }
    if (closer) {
      asio::post(io_ctx_, closer);
    }
  }

 private:
  template <typename Socket>
  struct Exchange {
    Exchange(std::shared_ptr<Socket> s, asio::io_context& io) : socket(std::move(s)), resolver(io), timer(io) {}

    std::shared_ptr<Socket> socket;
    asio::ip::tcp::resolver resolver;
    asio::steady_timer timer;
    asio::streambuf buffer;
    std::string request;
    HttpResponse response;
    std::function<void(HttpResponse)> callback;
    RequestId id = 0;
    bool timed_out = false;
    bool cancelled = false;
    bool done = false;

    void close() {
      asio::error_code ignored;
      resolver.cancel();
      socket->lowest_layer().close(ignored);
    }
  };

  template <typename Socket>
  void start(RequestId id, std::shared_ptr<Socket> socket, const ParsedUrl& url, const HttpOptions& options,
             std::function<void(HttpResponse)> callback) {
    auto ex = std::make_shared<Exchange<Socket>>(std::move(socket), io_ctx_);
    ex->id = id;
    ex->request = build_request(url, options);
    ex->callback = std::move(callback);

    bool cancelled_early = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.erase(id);
      cancelled_early = cancelled_early_.erase(id) > 0;
      if (!cancelled_early) {
        active_[id] = [ex]() {
          if (!ex->done) {
            ex->cancelled = true;
            ex->close();
          }
        };
      }
    }
    if (cancelled_early) {
      ex->cancelled = true;
      return finish(ex);
    }

    // Timer closes the socket; pending handlers then fail and finish() reports the timeout
    ex->timer.expires_after(options.timeout);
    ex->timer.async_wait([ex](const asio::error_code& ec) {
      if (!ec && !ex->done) {
        ex->timed_out = true;
        ex->close();
      }
    });

    auto self = shared_from_this();
    ex->resolver.async_resolve(url.host, url.port_or_default(), [self, ex](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
      if (ec) {
        return self->fail(ex, "DNS resolution failed: " + ec.message());
      }

      asio::async_connect(ex->socket->lowest_layer(), results, [self, ex](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
        if (ec) {
          return self->fail(ex, "Connection failed: " + ec.message());
        }

        if constexpr (std::is_same_v<Socket, TlsStream>) {
          ex->socket->async_handshake(asio::ssl::stream_base::client, [self, ex](const asio::error_code& ec) {
            if (ec) {
              return self->fail(ex, "SSL handshake failed: " + ec.message());
            }
            self->send(ex);
          });
        } else {
          self->send(ex);
        }
      });
    });
  }

  template <typename Socket>
  void send(std::shared_ptr<Exchange<Socket>> ex) {
    auto self = shared_from_this();
    asio::async_write(*ex->socket, asio::buffer(ex->request), [self, ex](const asio::error_code& ec, size_t) {
      if (ec) {
        return self->fail(ex, "Write failed: " + ec.message());
      }
      self->read_headers(ex);
    });
  }

  template <typename Socket>
  void read_headers(std::shared_ptr<Exchange<Socket>> ex) {
    auto self = shared_from_this();
    asio::async_read_until(*ex->socket, ex->buffer, "\r\n\r\n", [self, ex](const asio::error_code& ec, size_t) {
      if (ec && ec != asio::error::eof) {
        return self->fail(ex, "Read headers failed: " + ec.message());
      }

      std::istream stream(&ex->buffer);
      std::string status_line;
      std::getline(stream, status_line);

      std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
      std::smatch match;
      if (!std::regex_search(status_line, match, status_regex)) {
        return self->fail(ex, "Invalid HTTP response: " + status_line);
      }
      ex->response.status_code = std::stoi(match[1].str());

      // Header names are stored lowercase
      std::string header_line;
      while (std::getline(stream, header_line) && header_line != "\r") {
        auto colon = header_line.find(':');
        if (colon != std::string::npos) {
          std::string key = to_lower(header_line.substr(0, colon));
          std::string value = header_line.substr(colon + 1);
          value.erase(0, value.find_first_not_of(" \t"));
          value.erase(value.find_last_not_of(" \t\r\n") + 1);
          ex->response.headers[key] = value;
        }
      }

      self->read_body(ex);
    });
  }

  template <typename Socket>
  static void drain(Exchange<Socket>& ex) {
    if (ex.buffer.size() > 0) {
      std::istream stream(&ex.buffer);
      std::ostringstream more;
      more << stream.rdbuf();
      ex.response.body += more.str();
    }
  }

  template <typename Socket>
  void read_body(std::shared_ptr<Exchange<Socket>> ex) {
    drain(*ex);
    if (body_complete(ex->response)) {
      return finish(ex);
    }

    auto self = shared_from_this();
    asio::async_read(*ex->socket, ex->buffer, asio::transfer_at_least(1), [self, ex](const asio::error_code& ec, size_t) {
      // TLS peers often close without close_notify
      bool is_eof = (ec == asio::error::eof) || (ec.category() == asio::error::get_ssl_category()) || ec == asio::ssl::error::stream_truncated;

      if (ec && !is_eof) {
        return self->fail(ex, "Read body failed: " + ec.message());
      }

      if (is_eof) {
        drain(*ex);
        return self->finish(ex);
      }
      self->read_body(ex);
    });
  }

  template <typename Socket>
  void fail(std::shared_ptr<Exchange<Socket>> ex, const std::string& error) {
    ex->response.status_code = 0;
    ex->response.error = error;
    finish(ex);
  }

  template <typename Socket>
  void finish(std::shared_ptr<Exchange<Socket>> ex) {
    if (ex->done) return;
    ex->done = true;
    ex->timer.cancel();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_.erase(ex->id);
    }

    asio::error_code ignored;
    ex->socket->lowest_layer().close(ignored);

    auto& response = ex->response;
    if (ex->timed_out) {
      response.status_code = 0;
      response.timed_out = true;
      response.error = "Request timed out";
    } else if (ex->cancelled) {
      response.status_code = 0;
      response.cancelled = true;
      response.error = "Request cancelled";
    } else if (response.error.empty() && is_chunked(response)) {
      auto decoded = decode_chunked(response.body);
      if (decoded) {
        response.body = std::move(*decoded);
      } else {
        response.status_code = 0;
        response.error = "Malformed chunked body";
      }
    }

    auto callback = std::move(ex->callback);
    callback(std::move(response));
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;

  std::mutex mutex_;
  RequestId next_id_ = 1;
  std::set<RequestId> pending_;
  std::set<RequestId> cancelled_early_;
  std::map<RequestId, std::function<void()>> active_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_shared<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

RequestId HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  return impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options, RequestId* id) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();

  auto started = impl_->request(url, options, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });
  if (id) {
    *id = started;
  }

  return future;
}

void HttpClient::cancel(RequestId id) {
  if (id == 0) return;
  spdlog::debug("[HttpClient] Cancelling request {}", id);
  impl_->cancel(id);
}

}  // namespace codeloop::net
