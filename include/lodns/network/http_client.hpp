// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "lodns/core/logger.hpp"

namespace lodns
{
namespace network
{

  /// \brief Transport-level failure of an HTTP exchange.
  class HttpError : public std::runtime_error
  {
  public:
    enum class Kind
    {
      InvalidUrl,
      Resolve,
      Connect,
      Tls,
      Timeout,
      Io,
      Protocol
    };

    HttpError(Kind kind, const std::string& message)
      : std::runtime_error(message), _kind(kind)
    {
    }

    Kind kind() const { return _kind; }

    static const char* kindName(Kind kind)
    {
      switch (kind)
      {
      case Kind::InvalidUrl:
        return "invalid-url";
      case Kind::Resolve:
        return "resolve";
      case Kind::Connect:
        return "connect";
      case Kind::Tls:
        return "tls";
      case Kind::Timeout:
        return "timeout";
      case Kind::Io:
        return "io";
      case Kind::Protocol:
        return "protocol";
      }
      return "unknown";
    }

  private:
    Kind _kind;
  };

  /// \brief Case-insensitive ordering for header names.
  struct CaseInsensitiveLess
  {
    bool operator()(const std::string& a, const std::string& b) const
    {
      return std::lexicographical_compare(
          a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y)
          { return std::tolower(x) < std::tolower(y); });
    }
  };

  using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

  /// \brief Minimal HTTP/1.1 client over POSIX sockets with OpenSSL for
  /// https. One connection per request; the connection is closed when the
  /// call returns.
  class HttpClient
  {
  public:
    /// \brief HTTP response structure
    struct Response
    {
      int statusCode = 0;
      std::string statusText;
      HttpHeaders headers;
      std::string body;
      bool success() const { return statusCode >= 200 && statusCode < 300; }
    };

    /// \brief Configuration for HTTP client
    struct Config
    {
      std::chrono::milliseconds connectTimeout;
      std::chrono::milliseconds requestTimeout; ///< Bounds the whole exchange
      std::string userAgent;
      std::string caFile;                       ///< Empty: system trust store
      bool verifyPeer;
      std::size_t maxResponseSize;

      Config()
        : connectTimeout(10000),
          requestTimeout(30000),
          userAgent("lodns/1.0"),
          verifyPeer(true),
          maxResponseSize(4 * 1024 * 1024)
      {
      }
    };

    struct ParsedUrl
    {
      std::string scheme;
      std::string host;
      std::uint16_t port = 0;
      std::string path;
      std::string query;

      bool isHttps() const { return scheme == "https"; }

      std::string getPathWithQuery() const
      {
        return query.empty() ? path : path + "?" + query;
      }
    };

    explicit HttpClient(Config config = Config()) : _config(std::move(config)) {}

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    ~HttpClient()
    {
      if (_sslCtx)
      {
        ::SSL_CTX_free(_sslCtx);
      }
    }

    const Config& config() const { return _config; }

    /// \brief POST a body and wait for the complete response.
    /// \throws HttpError on any transport failure; HTTP error statuses are
    /// returned, not thrown
    Response post(const std::string& url, const std::string& body,
                  const std::map<std::string, std::string>& headers = {}) const
    {
      return request("POST", url, body, headers);
    }

    Response get(const std::string& url,
                 const std::map<std::string, std::string>& headers = {}) const
    {
      return request("GET", url, "", headers);
    }

    Response request(const std::string& method, const std::string& url,
                     const std::string& body,
                     const std::map<std::string, std::string>& headers) const
    {
      auto parsedUrl = parseUrl(url);
      auto deadline = Clock::now() + _config.requestTimeout;
      LODNS_LOG_TRACE("HTTP " << method << " " << parsedUrl.host << ":" << parsedUrl.port
                              << parsedUrl.getPathWithQuery());

      Connection conn;
      conn.fd = connectTcp(parsedUrl, deadline);
      if (parsedUrl.isHttps())
      {
        startTls(conn, parsedUrl.host, deadline);
      }

      std::ostringstream request;
      request << method << " " << parsedUrl.getPathWithQuery() << " HTTP/1.1\r\n";
      request << "Host: " << parsedUrl.host;
      if (parsedUrl.port != (parsedUrl.isHttps() ? 443 : 80))
      {
        request << ":" << parsedUrl.port;
      }
      request << "\r\n";
      request << "User-Agent: " << _config.userAgent << "\r\n";
      request << "Connection: close\r\n";
      for (const auto& [name, value] : headers)
      {
        request << name << ": " << value << "\r\n";
      }
      if (!body.empty() || method == "POST" || method == "PUT")
      {
        request << "Content-Length: " << body.size() << "\r\n";
      }
      request << "\r\n";
      request << body;

      sendAll(conn, request.str(), deadline);

      std::string responseData;
      char buffer[8192];
      bool closed = false;
      while (!isCompleteHttpResponse(responseData, closed))
      {
        std::size_t n = receiveSome(conn, buffer, sizeof(buffer), deadline);
        if (n == 0)
        {
          closed = true;
          continue;
        }
        responseData.append(buffer, n);
        if (responseData.size() > _config.maxResponseSize)
        {
          throw HttpError(HttpError::Kind::Protocol, "HTTP response exceeds size limit");
        }
      }

      return parseHttpResponse(responseData);
    }

    /// \brief Parse URL into components
    /// \throws HttpError(InvalidUrl)
    static ParsedUrl parseUrl(const std::string& url)
    {
      ParsedUrl parsed;

      std::regex urlRegex(
          R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/?[^?\s]*)(?:\?([^#\s]*))?(?:#.*)?$)");
      std::smatch match;

      if (!std::regex_match(url, match, urlRegex))
      {
        throw HttpError(HttpError::Kind::InvalidUrl, "Invalid URL format: " + url);
      }

      parsed.scheme = match[1].str();
      parsed.host = match[2].str();

      if (match[3].matched)
      {
        std::string digits = match[3].str();
        unsigned long port = digits.size() > 5 ? 0 : std::stoul(digits);
        if (port == 0 || port > 65535)
        {
          throw HttpError(HttpError::Kind::InvalidUrl, "Invalid port in URL: " + url);
        }
        parsed.port = static_cast<std::uint16_t>(port);
      }
      else
      {
        parsed.port = parsed.isHttps() ? 443 : 80;
      }

      parsed.path = match[4].str();
      if (parsed.path.empty())
        parsed.path = "/";

      parsed.query = match[5].str();

      return parsed;
    }

    /// \brief Parse a complete HTTP response from raw data
    /// \throws HttpError(Protocol)
    static Response parseHttpResponse(const std::string& data)
    {
      auto headerEnd = data.find("\r\n\r\n");
      if (headerEnd == std::string::npos)
      {
        throw HttpError(HttpError::Kind::Protocol,
                        "Invalid HTTP response: no header separator found");
      }

      Response response = parseHead(data.substr(0, headerEnd));
      std::string bodySection = data.substr(headerEnd + 4);

      if (isChunked(response.headers))
      {
        if (!decodeChunkedBody(bodySection, response.body))
        {
          throw HttpError(HttpError::Kind::Protocol, "Truncated chunked HTTP body");
        }
      }
      else if (auto length = contentLength(response.headers))
      {
        if (bodySection.size() < *length)
        {
          throw HttpError(HttpError::Kind::Protocol, "Truncated HTTP body");
        }
        response.body = bodySection.substr(0, *length);
      }
      else
      {
        response.body = bodySection;
      }

      return response;
    }

    /// \brief Decode chunked transfer encoding
    /// \return false if the terminating zero-size chunk has not arrived
    static bool decodeChunkedBody(const std::string& chunkedData, std::string& result)
    {
      result.clear();
      std::size_t pos = 0;
      while (true)
      {
        auto lineEnd = chunkedData.find("\r\n", pos);
        if (lineEnd == std::string::npos)
        {
          return false;
        }

        std::string sizeLine = chunkedData.substr(pos, lineEnd - pos);
        auto ext = sizeLine.find(';');
        if (ext != std::string::npos)
        {
          sizeLine.erase(ext);
        }

        std::size_t chunkSize = 0;
        try
        {
          chunkSize = std::stoul(trim(sizeLine), nullptr, 16);
        }
        catch (const std::logic_error&)
        {
          throw HttpError(HttpError::Kind::Protocol, "Invalid chunk size: " + sizeLine);
        }

        pos = lineEnd + 2;
        if (chunkSize == 0)
        {
          return true;
        }
        if (chunkedData.size() < pos + 2 || chunkSize > chunkedData.size() - pos - 2)
        {
          return false;
        }
        result.append(chunkedData, pos, chunkSize);
        pos += chunkSize + 2;
      }
    }

  private:
    using Clock = std::chrono::steady_clock;

    /// \brief Socket plus optional TLS session, released together.
    struct Connection
    {
      int fd = -1;
      SSL* ssl = nullptr;

      Connection() = default;
      Connection(const Connection&) = delete;
      Connection& operator=(const Connection&) = delete;

      ~Connection()
      {
        if (ssl)
        {
          ::SSL_shutdown(ssl);
          ::SSL_free(ssl);
        }
        if (fd >= 0)
        {
          ::close(fd);
        }
      }
    };

    static std::string trim(const std::string& s)
    {
      auto begin = s.find_first_not_of(" \t");
      if (begin == std::string::npos)
      {
        return "";
      }
      auto end = s.find_last_not_of(" \t");
      return s.substr(begin, end - begin + 1);
    }

    /// \brief Parse the status line and header fields
    static Response parseHead(const std::string& headerSection)
    {
      Response response;
      std::istringstream headerStream(headerSection);
      std::string statusLine;
      std::getline(headerStream, statusLine);
      if (!statusLine.empty() && statusLine.back() == '\r')
      {
        statusLine.pop_back();
      }

      std::regex statusRegex(R"(HTTP/\d\.\d\s+(\d{3})\s*(.*))");
      std::smatch statusMatch;
      if (!std::regex_match(statusLine, statusMatch, statusRegex))
      {
        throw HttpError(HttpError::Kind::Protocol, "Invalid HTTP status line: " + statusLine);
      }
      response.statusCode = std::stoi(statusMatch[1].str());
      response.statusText = statusMatch[2].str();

      std::string headerLine;
      while (std::getline(headerStream, headerLine))
      {
        if (!headerLine.empty() && headerLine.back() == '\r')
        {
          headerLine.pop_back();
        }

        auto colonPos = headerLine.find(':');
        if (colonPos != std::string::npos)
        {
          response.headers[trim(headerLine.substr(0, colonPos))] =
              trim(headerLine.substr(colonPos + 1));
        }
      }
      return response;
    }

    static bool isChunked(const HttpHeaders& headers)
    {
      auto it = headers.find("Transfer-Encoding");
      if (it == headers.end())
      {
        return false;
      }
      std::string value = it->second;
      std::transform(value.begin(), value.end(), value.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      return value.find("chunked") != std::string::npos;
    }

    static std::optional<std::size_t> contentLength(const HttpHeaders& headers)
    {
      auto it = headers.find("Content-Length");
      if (it == headers.end())
      {
        return std::nullopt;
      }
      try
      {
        return static_cast<std::size_t>(std::stoull(it->second));
      }
      catch (const std::logic_error&)
      {
        throw HttpError(HttpError::Kind::Protocol, "Invalid Content-Length: " + it->second);
      }
    }

    /// \brief Check if we have a complete HTTP response
    static bool isCompleteHttpResponse(const std::string& data, bool closed)
    {
      auto headerEnd = data.find("\r\n\r\n");
      if (headerEnd == std::string::npos)
      {
        if (closed)
        {
          throw HttpError(HttpError::Kind::Io,
                          "Connection closed before receiving complete HTTP response");
        }
        return false;
      }

      Response head = parseHead(data.substr(0, headerEnd));
      std::string body = data.substr(headerEnd + 4);

      if (head.statusCode == 204 || head.statusCode == 304 ||
          (head.statusCode >= 100 && head.statusCode < 200))
      {
        return true;
      }

      bool complete = closed;
      if (isChunked(head.headers))
      {
        std::string decoded;
        complete = decodeChunkedBody(body, decoded);
      }
      else if (auto length = contentLength(head.headers))
      {
        complete = body.size() >= *length;
      }

      if (!complete && closed)
      {
        throw HttpError(HttpError::Kind::Io,
                        "Connection closed before receiving complete HTTP response");
      }
      return complete;
    }

    static int remainingMs(Clock::time_point deadline)
    {
      auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
      return left > 0 ? static_cast<int>(left) : 0;
    }

    /// \brief Wait for readiness on fd until the deadline.
    static void waitFor(int fd, short events, Clock::time_point deadline, const char* what)
    {
      while (true)
      {
        int left = remainingMs(deadline);
        if (left == 0)
        {
          throw HttpError(HttpError::Kind::Timeout, std::string("HTTP ") + what + " timeout");
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, left);
        if (rc > 0)
        {
          return;
        }
        if (rc < 0 && errno != EINTR)
        {
          throw HttpError(HttpError::Kind::Io, std::string("poll: ") + std::strerror(errno));
        }
      }
    }

    int connectTcp(const ParsedUrl& url, Clock::time_point requestDeadline) const
    {
      addrinfo hints{};
      hints.ai_family = AF_UNSPEC;
      hints.ai_socktype = SOCK_STREAM;
      addrinfo* res = nullptr;
      std::string port = std::to_string(url.port);
      int rc = ::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &res);
      if (rc != 0 || !res)
      {
        throw HttpError(HttpError::Kind::Resolve,
                        "getaddrinfo " + url.host + ": " + ::gai_strerror(rc));
      }
      std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

      auto deadline = std::min(requestDeadline, Clock::now() + _config.connectTimeout);
      std::string lastError = "no usable address";
      for (const addrinfo* ai = res; ai; ai = ai->ai_next)
      {
        int fd = ::socket(ai->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0)
        {
          lastError = std::string("socket: ") + std::strerror(errno);
          continue;
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
        {
          return fd;
        }
        if (errno != EINPROGRESS)
        {
          lastError = std::string("connect: ") + std::strerror(errno);
          ::close(fd);
          continue;
        }

        try
        {
          waitFor(fd, POLLOUT, deadline, "connect");
        }
        catch (const HttpError&)
        {
          ::close(fd);
          throw;
        }

        int soErr = 0;
        socklen_t len = sizeof(soErr);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len);
        if (soErr == 0)
        {
          return fd;
        }
        lastError = std::string("connect: ") + std::strerror(soErr);
        ::close(fd);
      }
      throw HttpError(HttpError::Kind::Connect,
                      "Failed to connect to " + url.host + ":" + port + ": " + lastError);
    }

    static std::string sslErrorString()
    {
      unsigned long e = ::ERR_get_error();
      if (e == 0)
      {
        return "unknown TLS error";
      }
      char msg[256];
      ::ERR_error_string_n(e, msg, sizeof(msg));
      return msg;
    }

    static void initSslGlobal()
    {
      ::OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                         nullptr);
    }

    SSL_CTX* clientContext() const
    {
      static std::once_flag sslGlobalInitFlag;
      std::call_once(sslGlobalInitFlag, initSslGlobal);

      std::lock_guard<std::mutex> lock(_sslMutex);
      if (_sslCtx)
      {
        return _sslCtx;
      }

      SSL_CTX* ctx = ::SSL_CTX_new(TLS_client_method());
      if (!ctx)
      {
        throw HttpError(HttpError::Kind::Tls, "SSL_CTX_new(client) failed: " + sslErrorString());
      }
      ::SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
      if (_config.verifyPeer)
      {
        ::SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        if (!_config.caFile.empty())
        {
          if (::SSL_CTX_load_verify_locations(ctx, _config.caFile.c_str(), nullptr) != 1)
          {
            std::string err = sslErrorString();
            ::SSL_CTX_free(ctx);
            throw HttpError(HttpError::Kind::Tls, "Failed to load CA file " + _config.caFile +
                                                      ": " + err);
          }
        }
        else
        {
          ::SSL_CTX_set_default_verify_paths(ctx);
        }
      }
      _sslCtx = ctx;
      return _sslCtx;
    }

    void startTls(Connection& conn, const std::string& host, Clock::time_point deadline) const
    {
      SSL_CTX* ctx = clientContext();
      conn.ssl = ::SSL_new(ctx);
      if (!conn.ssl)
      {
        throw HttpError(HttpError::Kind::Tls, "SSL_new(client) failed: " + sslErrorString());
      }
      ::SSL_set_fd(conn.ssl, conn.fd);
      ::SSL_set_tlsext_host_name(conn.ssl, host.c_str());
      if (_config.verifyPeer)
      {
        ::SSL_set1_host(conn.ssl, host.c_str());
      }
      ::SSL_set_connect_state(conn.ssl);

      while (true)
      {
        int rc = ::SSL_connect(conn.ssl);
        if (rc == 1)
        {
          return;
        }
        int errc = ::SSL_get_error(conn.ssl, rc);
        if (errc == SSL_ERROR_WANT_READ)
        {
          waitFor(conn.fd, POLLIN, deadline, "TLS handshake");
          continue;
        }
        if (errc == SSL_ERROR_WANT_WRITE)
        {
          waitFor(conn.fd, POLLOUT, deadline, "TLS handshake");
          continue;
        }
        std::string reason = sslErrorString();
        long verify = ::SSL_get_verify_result(conn.ssl);
        if (verify != X509_V_OK)
        {
          reason += std::string(" (") + ::X509_verify_cert_error_string(verify) + ")";
        }
        throw HttpError(HttpError::Kind::Tls, "TLS handshake with " + host + " failed: " + reason);
      }
    }

    static void sendAll(Connection& conn, const std::string& data, Clock::time_point deadline)
    {
      std::size_t sent = 0;
      while (sent < data.size())
      {
        if (conn.ssl)
        {
          int n = ::SSL_write(conn.ssl, data.data() + sent, static_cast<int>(data.size() - sent));
          if (n > 0)
          {
            sent += static_cast<std::size_t>(n);
            continue;
          }
          int ge = ::SSL_get_error(conn.ssl, n);
          if (ge == SSL_ERROR_WANT_WRITE || ge == SSL_ERROR_WANT_READ)
          {
            waitFor(conn.fd, ge == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN, deadline, "send");
            continue;
          }
          throw HttpError(HttpError::Kind::Tls, "SSL_write: " + sslErrorString());
        }

        ssize_t n = ::send(conn.fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n >= 0)
        {
          sent += static_cast<std::size_t>(n);
          continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        {
          waitFor(conn.fd, POLLOUT, deadline, "send");
          continue;
        }
        throw HttpError(HttpError::Kind::Io, std::string("send: ") + std::strerror(errno));
      }
    }

    /// \return bytes read, 0 when the peer closed the connection
    static std::size_t receiveSome(Connection& conn, char* buf, std::size_t len,
                                   Clock::time_point deadline)
    {
      while (true)
      {
        if (conn.ssl)
        {
          int n = ::SSL_read(conn.ssl, buf, static_cast<int>(len));
          if (n > 0)
          {
            return static_cast<std::size_t>(n);
          }
          int ge = ::SSL_get_error(conn.ssl, n);
          if (ge == SSL_ERROR_WANT_READ || ge == SSL_ERROR_WANT_WRITE)
          {
            waitFor(conn.fd, ge == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline, "response");
            continue;
          }
          // Peers often close without close_notify
          if (ge == SSL_ERROR_ZERO_RETURN || (ge == SSL_ERROR_SYSCALL && ::ERR_peek_error() == 0))
          {
            return 0;
          }
          throw HttpError(HttpError::Kind::Tls, "SSL_read: " + sslErrorString());
        }

        waitFor(conn.fd, POLLIN, deadline, "response");
        ssize_t n = ::recv(conn.fd, buf, len, 0);
        if (n >= 0)
        {
          return static_cast<std::size_t>(n);
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        {
          continue;
        }
        throw HttpError(HttpError::Kind::Io, std::string("recv: ") + std::strerror(errno));
      }
    }

    Config _config;
    mutable std::mutex _sslMutex;
    mutable SSL_CTX* _sslCtx = nullptr;
  };

} // namespace network
} // namespace lodns
