#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace enginectl {
namespace {
struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception &) {
      throw std::runtime_error("invalid URL port");
    }
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

int CreateSocket(const ParsedUrl &parsed, int io_timeout_sec) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                  &hints, &result) != 0) {
    throw ConnectionError("failed to resolve host " + parsed.host);
  }
  int sock = -1;
  int last_errno = 0;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    last_errno = errno;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1) {
    throw ConnectionError("failed to connect to " + parsed.host + ":" +
                          std::to_string(parsed.port) +
                          (last_errno == ECONNREFUSED ? " (refused)" : ""));
  }
  struct timeval tv;
  tv.tv_sec = io_timeout_sec;
  tv.tv_usec = 0;
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return sock;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << ":" << parsed.port << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  if (headers.find("Content-Type") == headers.end()) {
    request << "Content-Type: application/json\r\n";
  }
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}
} // namespace

std::string HttpResponseHead::Header(const std::string &lower_name) const {
  auto it = headers.find(lower_name);
  return it == headers.end() ? std::string() : it->second;
}

bool HttpResponseHead::Chunked() const {
  return ToLower(Header("transfer-encoding")).find("chunked") !=
         std::string::npos;
}

long long HttpResponseHead::ContentLength() const {
  auto value = Header("content-length");
  if (value.empty()) {
    return -1;
  }
  try {
    return std::stoll(value);
  } catch (const std::exception &) {
    return -1;
  }
}

HttpResponseHead ParseResponseHead(const std::string &head) {
  HttpResponseHead parsed;
  std::istringstream stream(head);
  std::string line;
  if (std::getline(stream, line)) {
    auto status_pos = line.find(' ');
    if (status_pos != std::string::npos) {
      try {
        parsed.status = std::stoi(line.substr(status_pos + 1));
      } catch (const std::exception &) {
        parsed.status = 0;
      }
    }
  }
  while (std::getline(stream, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    parsed.headers[ToLower(Trim(line.substr(0, colon)))] =
        Trim(line.substr(colon + 1));
  }
  return parsed;
}

bool ChunkedDecoder::Feed(const char *data, std::size_t length,
                          std::string *out) {
  std::size_t i = 0;
  while (i < length) {
    switch (state_) {
    case State::kSize: {
      char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        break;
      }
      auto semi = line_.find(';');
      std::string size_text = Trim(line_.substr(0, semi));
      line_.clear();
      if (size_text.empty()) {
        return false;
      }
      std::size_t size = 0;
      try {
        size = std::stoul(size_text, nullptr, 16);
      } catch (const std::exception &) {
        return false;
      }
      if (size == 0) {
        state_ = State::kTrailer;
      } else {
        remaining_ = size;
        state_ = State::kData;
      }
      break;
    }
    case State::kData: {
      std::size_t take = std::min(remaining_, length - i);
      out->append(data + i, take);
      i += take;
      remaining_ -= take;
      if (remaining_ == 0) {
        state_ = State::kDataCrlf;
      }
      break;
    }
    case State::kDataCrlf: {
      char c = data[i++];
      if (c == '\n') {
        state_ = State::kSize;
      } else if (c != '\r') {
        return false;
      }
      break;
    }
    case State::kTrailer: {
      char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        break;
      }
      if (Trim(line_).empty()) {
        state_ = State::kDone;
      }
      line_.clear();
      break;
    }
    case State::kDone:
      return true;
    }
  }
  return true;
}

HttpClient::HttpClient(int io_timeout_sec)
    : io_timeout_sec_(io_timeout_sec > 0 ? io_timeout_sec : 300) {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Get(const std::string &url,
                const std::map<std::string, std::string> &headers) const {
  return Send("GET", url, "", headers);
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  return Send("POST", url, body, headers);
}

HttpResponse
HttpClient::Put(const std::string &url, const std::string &body,
                const std::map<std::string, std::string> &headers) const {
  return Send("PUT", url, body, headers);
}

HttpResponse
HttpClient::Delete(const std::string &url, const std::string &body,
                   const std::map<std::string, std::string> &headers) const {
  return Send("DELETE", url, body, headers);
}

HttpClient::RawConnection
HttpClient::SendRaw(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const {
  auto parsed = ParseUrl(url);
  RawConnection conn;
  conn.sock = CreateSocket(parsed, io_timeout_sec_);
  auto payload = BuildRequest(parsed, method, body, headers);
  const char *send_ptr = payload.c_str();
  std::size_t send_remaining = payload.size();

  auto close_connection = [&](const char *message) {
    CloseRaw(conn);
    throw ConnectionError(message);
  };

  if (parsed.use_tls) {
    if (!tls_ready_) {
      close_connection("TLS not available in HttpClient");
    }
    conn.ssl = SSL_new(ssl_ctx_);
    if (!conn.ssl) {
      close_connection("failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(conn.ssl, parsed.host.c_str());
#if defined(SSL_set1_host)
    SSL_set1_host(conn.ssl, parsed.host.c_str());
#endif
    SSL_set_fd(conn.ssl, conn.sock);
    if (SSL_connect(conn.ssl) != 1) {
      close_connection("TLS handshake failed");
    }
    if (SSL_get_verify_result(conn.ssl) != X509_V_OK) {
      close_connection("TLS certificate verification failed");
    }
    while (send_remaining > 0) {
      int sent =
          SSL_write(conn.ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        close_connection("failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  } else {
    while (send_remaining > 0) {
      ssize_t sent = ::send(conn.sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (sent < 0 && errno == EINTR) {
        continue;
      }
      if (sent <= 0) {
        close_connection("failed to send request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  }

  return conn;
}

ssize_t HttpClient::RecvRaw(RawConnection &conn, char *buffer,
                            std::size_t length) const {
  if (conn.ssl) {
    while (true) {
      int received = SSL_read(conn.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(conn.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      if (err == SSL_ERROR_ZERO_RETURN) {
        return 0;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(conn.sock, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpClient::CloseRaw(RawConnection &conn) const {
  if (conn.ssl) {
    SSL_shutdown(conn.ssl);
    SSL_free(conn.ssl);
    conn.ssl = nullptr;
  }
  if (conn.sock >= 0) {
    ::close(conn.sock);
    conn.sock = -1;
  }
}

std::unique_ptr<HttpStream>
HttpClient::OpenStream(const std::string &method, const std::string &url,
                       const std::string &body,
                       const std::map<std::string, std::string> &headers) const {
  RawConnection conn = SendRaw(method, url, body, headers);
  std::string buffered;
  std::size_t header_end = std::string::npos;
  char buffer[4096];
  while (header_end == std::string::npos) {
    ssize_t received = RecvRaw(conn, buffer, sizeof(buffer));
    if (received <= 0) {
      CloseRaw(conn);
      throw ConnectionError("connection closed before response head");
    }
    buffered.append(buffer, static_cast<std::size_t>(received));
    header_end = buffered.find("\r\n\r\n");
  }
  auto head = ParseResponseHead(buffered.substr(0, header_end));
  return std::make_unique<HttpStream>(this, conn, std::move(head),
                                      buffered.substr(header_end + 4));
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  auto stream = OpenStream(method, url, body, headers);
  HttpResponse response;
  response.status = stream->Status();
  response.headers = stream->Head().headers;
  response.body = stream->ReadAll();
  return response;
}

HttpStream::HttpStream(const HttpClient *client,
                       HttpClient::RawConnection conn, HttpResponseHead head,
                       std::string body_prefix)
    : client_(client), conn_(conn), head_(std::move(head)),
      prefix_(std::move(body_prefix)) {
  chunked_ = head_.Chunked();
  if (!chunked_) {
    remaining_ = head_.ContentLength();
  }
  if (head_.status == 204 || head_.status == 304 || remaining_ == 0) {
    finished_ = true;
  }
}

HttpStream::~HttpStream() { Close(); }

void HttpStream::Close() {
  if (client_) {
    client_->CloseRaw(conn_);
  }
}

bool HttpStream::Decode(const char *data, std::size_t length,
                        std::string *out) {
  if (chunked_) {
    if (!decoder_.Feed(data, length, out)) {
      finished_ = true;
      return false;
    }
    if (decoder_.Done()) {
      finished_ = true;
    }
    return true;
  }
  if (remaining_ >= 0) {
    auto take = std::min<long long>(remaining_, static_cast<long long>(length));
    out->append(data, static_cast<std::size_t>(take));
    remaining_ -= take;
    if (remaining_ == 0) {
      finished_ = true;
    }
    return true;
  }
  out->append(data, length);
  return true;
}

bool HttpStream::Next(std::string *chunk) {
  chunk->clear();
  if (finished_ && prefix_.empty()) {
    return false;
  }
  if (!prefix_.empty()) {
    std::string pending;
    pending.swap(prefix_);
    if (!finished_) {
      Decode(pending.data(), pending.size(), chunk);
    }
    if (!chunk->empty()) {
      return true;
    }
  }
  char buffer[8192];
  while (!finished_) {
    ssize_t received = client_->RecvRaw(conn_, buffer, sizeof(buffer));
    if (received <= 0) {
      finished_ = true;
      break;
    }
    if (!Decode(buffer, static_cast<std::size_t>(received), chunk)) {
      break;
    }
    if (!chunk->empty()) {
      return true;
    }
  }
  return !chunk->empty();
}

std::string HttpStream::ReadAll() {
  std::string body;
  std::string chunk;
  while (Next(&chunk)) {
    body += chunk;
  }
  return body;
}

} // namespace enginectl
