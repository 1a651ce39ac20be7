#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

#include "llm/openai.hpp"
#include "net/http_client.hpp"

using namespace codeloop;
using namespace std::chrono_literals;

// Loopback server that takes connections into its backlog and never answers
class HttpClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(server_ctx_, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    url_ = "http://127.0.0.1:" + std::to_string(acceptor_->local_endpoint().port());
  }

  void start_io() {
    io_thread_ = std::thread([this]() { io_ctx_.run(); });
  }

  void TearDown() override {
    work_guard_.reset();
    io_ctx_.stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
  }

  net::HttpOptions options(std::chrono::seconds timeout) const {
    net::HttpOptions opts;
    opts.method = "POST";
    opts.body = "{}";
    opts.timeout = timeout;
    return opts;
  }

  asio::io_context server_ctx_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::string url_;

  asio::io_context io_ctx_;
  asio::executor_work_guard<asio::io_context::executor_type> work_guard_ = asio::make_work_guard(io_ctx_);
  std::thread io_thread_;
};

TEST_F(HttpClientTest, CancelTargetsOneRequest) {
  start_io();
  net::HttpClient client(io_ctx_);

  net::RequestId first_id = 0;
  net::RequestId second_id = 0;
  auto first = client.request(url_ + "/a", options(2s), &first_id);
  auto second = client.request(url_ + "/b", options(2s), &second_id);
  ASSERT_NE(first_id, 0u);
  ASSERT_NE(first_id, second_id);

  std::this_thread::sleep_for(200ms);
  client.cancel(first_id);

  ASSERT_EQ(first.wait_for(1s), std::future_status::ready);
  auto cancelled = first.get();
  EXPECT_TRUE(cancelled.cancelled);
  EXPECT_EQ(cancelled.status_code, 0);

  // The other exchange keeps waiting until its own timeout
  EXPECT_EQ(second.wait_for(300ms), std::future_status::timeout);
  ASSERT_EQ(second.wait_for(5s), std::future_status::ready);
  auto timed_out = second.get();
  EXPECT_TRUE(timed_out.timed_out);
  EXPECT_FALSE(timed_out.cancelled);
}

TEST_F(HttpClientTest, CancelBeforeStart) {
  net::HttpClient client(io_ctx_);

  net::RequestId id = 0;
  auto future = client.request(url_ + "/a", options(2s), &id);
  client.cancel(id);

  start_io();
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(future.get().cancelled);
}

TEST_F(HttpClientTest, InvalidUrlFailsWithoutId) {
  net::HttpClient client(io_ctx_);

  net::RequestId id = 42;
  auto future = client.request("ftp://example.com", options(1s), &id);
  EXPECT_EQ(id, 0u);
  ASSERT_EQ(future.wait_for(0s), std::future_status::ready);
  EXPECT_EQ(future.get().error, "Invalid URL: ftp://example.com");

  // No-op for unknown handles
  client.cancel(0);
  client.cancel(12345);
}

// Sessions and subagents share one provider; aborting one send must not touch another
TEST_F(HttpClientTest, ProviderAbortLeavesSiblingRequests) {
  start_io();

  ProviderConfig config;
  config.name = "openai";
  config.api_key = "sk-test";
  config.base_url = url_ + "/v1";

  llm::RetryPolicy retry;
  retry.max_retries = 0;
  retry.timeout = 1s;
  llm::OpenAIProvider provider(config, io_ctx_, retry);

  llm::LlmRequest request;
  request.model = "gpt-4o";
  request.messages.push_back(Message::user("hello"));

  auto aborted_flag = std::make_shared<std::atomic<bool>>(false);
  auto sibling_flag = std::make_shared<std::atomic<bool>>(false);

  auto aborted = std::async(std::launch::async, [&]() { return provider.send(request, aborted_flag); });
  auto sibling = std::async(std::launch::async, [&]() { return provider.send(request, sibling_flag); });

  std::this_thread::sleep_for(200ms);
  aborted_flag->store(true);

  ASSERT_EQ(aborted.wait_for(2s), std::future_status::ready);
  EXPECT_THROW(aborted.get(), CancelledError);

  // The sibling runs into its transport timeout instead of a cancellation
  ASSERT_EQ(sibling.wait_for(5s), std::future_status::ready);
  try {
    sibling.get();
    FAIL() << "expected a network error";
  } catch (const ProviderError &e) {
    EXPECT_EQ(e.kind(), ProviderErrorKind::Network);
    EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
  }
}

TEST(ParsedUrlTest, SplitsComponents) {
  auto url = net::ParsedUrl::parse("https://api.example.com:8443/v1/messages?beta=1");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "api.example.com");
  EXPECT_EQ(url->port_or_default(), "8443");
  EXPECT_EQ(url->path, "/v1/messages");
  EXPECT_EQ(url->query, "?beta=1");

  auto plain = net::ParsedUrl::parse("http://localhost");
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->port_or_default(), "80");
  EXPECT_EQ(plain->path, "/");
}

TEST(ChunkedBodyTest, DecodesAndDetectsTruncation) {
  EXPECT_EQ(net::decode_chunked("4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n"), "Wikipedia");
  EXPECT_FALSE(net::decode_chunked("4\r\nWiki\r\n5\r\nped").has_value());
}
