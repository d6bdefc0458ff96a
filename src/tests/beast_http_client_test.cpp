#include <gtest/gtest.h>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include "fetch/beast_http_client.hpp"
#include "test_utils.hpp"

using namespace mvault::fetch;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

// Loopback listener. Connections complete in the kernel backlog and are
// never answered unless serve() is called. Served connections stay open
// until the server is destroyed.
class LocalServer {
public:
  LocalServer() : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

  ~LocalServer() {
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  std::string url(const std::string& target) const {
    return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + target;
  }

  // Answers the next responses.size() connections in order, one response each
  void serve(std::vector<std::string> responses) {
    worker_ = std::thread([this, responses = std::move(responses)] {
      for (const auto& response : responses) {
        tcp::socket socket(io_);
        acceptor_.accept(socket);
        std::string request;
        asio::read_until(socket, asio::dynamic_buffer(request), "\r\n\r\n");
        requests_.push_back(request.substr(0, request.find("\r\n")));
        asio::write(socket, asio::buffer(response));
        held_.push_back(std::move(socket));
      }
    });
  }

  // Request lines seen by serve(). Valid once the client is done.
  const std::vector<std::string>& requests() {
    if (worker_.joinable()) {
      worker_.join();
    }
    return requests_;
  }

private:
  asio::io_context io_;
  tcp::acceptor acceptor_;
  std::thread worker_;
  std::vector<std::string> requests_;
  std::vector<tcp::socket> held_;
};

BeastHttpClient::Options short_timeout() {
  BeastHttpClient::Options options;
  options.timeout = std::chrono::seconds(1);
  return options;
}

} // namespace

class BeastHttpClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging(boost::log::trivial::fatal);
  }
};

TEST_F(BeastHttpClientTest, SilentServerTimesOut) {
  LocalServer server;
  BeastHttpClient client(short_timeout());

  auto start = std::chrono::steady_clock::now();
  try {
    client.get(server.url("/model.bin"));
    FAIL() << "Expected FetchFailedError";
  } catch (const FetchFailedError& e) {
    EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos) << e.what();
    EXPECT_EQ(e.status(), 0);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(BeastHttpClientTest, StalledBodyTimesOut) {
  LocalServer server;
  // Promises more body than it sends, then holds the connection open
  server.serve({"HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\npartial"});
  BeastHttpClient client(short_timeout());

  auto response = client.get(server.url("/model.bin"));
  ASSERT_EQ(response->status(), 200);

  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(response->read_all(), FetchFailedError);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(BeastHttpClientTest, ReadsStatusAndBody) {
  LocalServer server;
  server.serve({"HTTP/1.1 200 OK\r\nContent-Length: 11\r\nConnection: close\r\n\r\nhello model"});
  BeastHttpClient client(short_timeout());

  auto response = client.get(server.url("/llm/model.bin?rev=2"));
  EXPECT_EQ(response->status(), 200);
  EXPECT_EQ(response->content_length(), std::optional<std::uint64_t>(11));

  const Bytes body = response->read_all();
  EXPECT_EQ(std::string(body.begin(), body.end()), "hello model");

  ASSERT_EQ(server.requests().size(), 1u);
  EXPECT_EQ(server.requests()[0], "GET /llm/model.bin?rev=2 HTTP/1.1");
}

TEST_F(BeastHttpClientTest, FollowsRelativeRedirect) {
  LocalServer server;
  server.serve({
    "HTTP/1.1 302 Found\r\nLocation: /mirror/model.bin\r\nContent-Length: 0\r\n\r\n",
    "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok",
  });
  BeastHttpClient client(short_timeout());

  auto response = client.get(server.url("/model.bin"));
  EXPECT_EQ(response->status(), 200);
  const Bytes body = response->read_all();
  EXPECT_EQ(std::string(body.begin(), body.end()), "ok");

  ASSERT_EQ(server.requests().size(), 2u);
  EXPECT_EQ(server.requests()[1], "GET /mirror/model.bin HTTP/1.1");
}
