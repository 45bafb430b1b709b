#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>
#include <sys/types.h>

namespace enginectl {

// Raised when the peer cannot be reached or drops the connection before a
// response head arrives. HTTP error statuses are returned, never thrown.
class ConnectionError : public std::runtime_error {
public:
  explicit ConnectionError(const std::string &message)
      : std::runtime_error(message) {}
};

struct HttpResponseHead {
  int status{0};
  std::map<std::string, std::string> headers; // lower-cased names

  std::string Header(const std::string &lower_name) const;
  bool Chunked() const;
  // -1 when the response carries no Content-Length.
  long long ContentLength() const;
};

// Parses "HTTP/1.1 200 OK\r\nName: value\r\n..." (without the blank line).
HttpResponseHead ParseResponseHead(const std::string &head);

struct HttpResponse {
  int status{0};
  std::string body;
  std::map<std::string, std::string> headers;
};

// Incremental decoder for Transfer-Encoding: chunked bodies.
class ChunkedDecoder {
public:
  // Appends decoded payload bytes to *out. Returns false on malformed input.
  bool Feed(const char *data, std::size_t length, std::string *out);
  bool Done() const { return state_ == State::kDone; }

private:
  enum class State { kSize, kData, kDataCrlf, kTrailer, kDone };
  State state_{State::kSize};
  std::string line_;
  std::size_t remaining_{0};
};

class HttpStream;

class HttpClient {
public:
  struct RawConnection {
    int sock{-1};
    SSL *ssl{nullptr};
  };

  // io_timeout_sec bounds every blocking send/recv on a connection.
  explicit HttpClient(int io_timeout_sec = 300);
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse
  Get(const std::string &url,
      const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Put(const std::string &url, const std::string &body,
      const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Delete(const std::string &url, const std::string &body,
         const std::map<std::string, std::string> &headers = {}) const;

  // Sends the request and reads the response head; the body is consumed
  // incrementally through the returned stream.
  std::unique_ptr<HttpStream>
  OpenStream(const std::string &method, const std::string &url,
             const std::string &body,
             const std::map<std::string, std::string> &headers = {}) const;

  // Low-level access for callers that parse the response themselves.
  RawConnection
  SendRaw(const std::string &method, const std::string &url,
          const std::string &body,
          const std::map<std::string, std::string> &headers) const;
  ssize_t RecvRaw(RawConnection &conn, char *buffer, std::size_t length) const;
  void CloseRaw(RawConnection &conn) const;

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const;

  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
  int io_timeout_sec_{300};
};

// Response body reader that owns its connection.
class HttpStream {
public:
  HttpStream(const HttpClient *client, HttpClient::RawConnection conn,
             HttpResponseHead head, std::string body_prefix);
  ~HttpStream();
  HttpStream(const HttpStream &) = delete;
  HttpStream &operator=(const HttpStream &) = delete;

  int Status() const { return head_.status; }
  const HttpResponseHead &Head() const { return head_; }

  // Replaces *chunk with the next decoded body bytes. Returns false once the
  // body is complete or the connection fails.
  bool Next(std::string *chunk);
  // Drains the remaining body.
  std::string ReadAll();
  void Close();

private:
  bool Decode(const char *data, std::size_t length, std::string *out);

  const HttpClient *client_;
  HttpClient::RawConnection conn_;
  HttpResponseHead head_;
  std::string prefix_;
  ChunkedDecoder decoder_;
  bool chunked_{false};
  long long remaining_{-1}; // bytes left when Content-Length is known
  bool finished_{false};
};

} // namespace enginectl
