#include <catch2/catch.hpp>

#include "engine/engine_client.h"
#include "net/http_client.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <thread>
#include <vector>

using namespace enginectl;

namespace {

std::string Decode(ChunkedDecoder &decoder, const std::string &input,
                   bool *ok = nullptr) {
  std::string out;
  bool result = decoder.Feed(input.data(), input.size(), &out);
  if (ok) {
    *ok = result;
  }
  return out;
}

// Loopback listener that answers one connection with a canned response.
class OneShotServer {
public:
  explicit OneShotServer(std::string response) : response_(std::move(response)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(fd_, 1) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) == 0);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { Serve(); });
  }
  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(fd_);
  }

  int Port() const { return port_; }

private:
  void Serve() {
    int client = ::accept(fd_, nullptr, nullptr);
    if (client < 0) {
      return;
    }
    char buffer[4096];
    while (request_.find("\r\n\r\n") == std::string::npos) {
      ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        break;
      }
      request_.append(buffer, static_cast<std::size_t>(n));
    }
    ::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
    ::close(client);
  }

  std::string response_;
  std::string request_;
  int fd_{-1};
  int port_{0};
  std::thread thread_;
};

int UnusedPort() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
  int port = ntohs(addr.sin_port);
  ::close(fd);
  return port;
}

} // namespace

TEST_CASE("ParseResponseHead reads status and lower-cased headers",
          "[http_client]") {
  auto head = ParseResponseHead(
      "HTTP/1.1 503 Service Unavailable\r\nContent-Type: application/json\r\n"
      "Content-Length:  42 \r\nTransfer-Encoding: Chunked\r\n");
  REQUIRE(head.status == 503);
  REQUIRE(head.Header("content-type") == "application/json");
  REQUIRE(head.ContentLength() == 42);
  REQUIRE(head.Chunked());
  REQUIRE(head.Header("x-missing").empty());

  auto bare = ParseResponseHead("HTTP/1.1 200 OK");
  REQUIRE(bare.status == 200);
  REQUIRE(bare.ContentLength() == -1);
  REQUIRE_FALSE(bare.Chunked());
}

TEST_CASE("ChunkedDecoder decodes across arbitrary splits", "[http_client]") {
  const std::string wire = "5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\n\r\n";
  for (std::size_t split = 1; split < wire.size(); split += 3) {
    ChunkedDecoder decoder;
    std::string out = Decode(decoder, wire.substr(0, split));
    out += Decode(decoder, wire.substr(split));
    REQUIRE(out == "hello, world");
    REQUIRE(decoder.Done());
  }
}

TEST_CASE("ChunkedDecoder rejects malformed sizes", "[http_client]") {
  ChunkedDecoder decoder;
  bool ok = true;
  Decode(decoder, "zz\r\nabc\r\n", &ok);
  REQUIRE_FALSE(ok);

  ChunkedDecoder missing_crlf;
  Decode(missing_crlf, "3\r\nabcX", &ok);
  REQUIRE_FALSE(ok);
}

TEST_CASE("ParseEngineModels reads the router listing", "[http_client]") {
  auto models = ParseEngineModels(
      R"({"data":[{"id":"qwen3","status":{"value":"loaded","args":["--ctx-size",8192]}},)"
      R"({"id":"gpt-oss"},"junk"]})");
  REQUIRE(models.size() == 2);
  REQUIRE(models[0].id == "qwen3");
  REQUIRE(models[0].status == "loaded");
  REQUIRE(models[0].args == std::vector<std::string>{"--ctx-size", "8192"});
  REQUIRE(models[1].status.empty());

  REQUIRE(ParseEngineModels("not json").empty());
  REQUIRE(ParseEngineModels(R"({"data":{}})").empty());
}

TEST_CASE("EngineHealth treats a busy engine as ready", "[http_client]") {
  REQUIRE(EngineHealth{true, 200, "ok"}.Ready());
  REQUIRE(EngineHealth{true, 200, "no slot available"}.Ready());
  REQUIRE_FALSE(EngineHealth{true, 503, "loading model"}.Ready());
  REQUIRE_FALSE(EngineHealth{false, 0, ""}.Ready());
}

TEST_CASE("HttpClient reads a chunked response", "[http_client]") {
  OneShotServer server("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n"
                       "Transfer-Encoding: chunked\r\n\r\n"
                       "3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n");
  HttpClient client(5);
  auto response = client.Post(
      "http://127.0.0.1:" + std::to_string(server.Port()) + "/v1/completions",
      R"({"prompt":"x"})");
  REQUIRE(response.status == 200);
  REQUIRE(response.body == "abcde");
  REQUIRE(response.headers["content-type"] == "text/plain");
}

TEST_CASE("HttpClient reads a Content-Length body", "[http_client]") {
  OneShotServer server("HTTP/1.1 404 Not Found\r\nContent-Length: 2\r\n\r\n{}");
  HttpClient client(5);
  auto response = client.Get("http://127.0.0.1:" +
                             std::to_string(server.Port()) + "/models");
  REQUIRE(response.status == 404);
  REQUIRE(response.body == "{}");
}

TEST_CASE("HttpClient raises ConnectionError when nothing listens",
          "[http_client]") {
  HttpClient client(2);
  std::string url = "http://127.0.0.1:" + std::to_string(UnusedPort()) + "/health";
  REQUIRE_THROWS_AS(client.Get(url), ConnectionError);
}
