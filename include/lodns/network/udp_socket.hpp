// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace lodns
{
namespace network
{

/// \brief An IPv4 or IPv6 socket address.
struct Endpoint
{
  sockaddr_storage addr{};
  socklen_t len{0};

  /// \brief Build from a numeric address literal.
  /// \throws std::invalid_argument if the address is not numeric IPv4/IPv6
  static Endpoint fromString(const std::string& host, std::uint16_t port)
  {
    Endpoint ep;
    in6_addr t6{};
    in_addr t4{};
    if (::inet_pton(AF_INET6, host.c_str(), &t6) == 1)
    {
      sockaddr_in6 sa6{};
      sa6.sin6_family = AF_INET6;
      sa6.sin6_port = htons(port);
      sa6.sin6_addr = t6;
      std::memcpy(&ep.addr, &sa6, sizeof(sa6));
      ep.len = sizeof(sa6);
    }
    else if (::inet_pton(AF_INET, host.c_str(), &t4) == 1)
    {
      sockaddr_in sa4{};
      sa4.sin_family = AF_INET;
      sa4.sin_port = htons(port);
      sa4.sin_addr = t4;
      std::memcpy(&ep.addr, &sa4, sizeof(sa4));
      ep.len = sizeof(sa4);
    }
    else
    {
      throw std::invalid_argument("Invalid listen address: " + host);
    }
    return ep;
  }

  int family() const { return addr.ss_family; }

  std::uint16_t port() const
  {
    if (addr.ss_family == AF_INET6)
      return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }

  std::string toString() const
  {
    char host[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET6)
    {
      ::inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_addr, host,
                  sizeof(host));
      return std::string("[") + host + "]:" + std::to_string(port());
    }
    ::inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(&addr)->sin_addr, host,
                sizeof(host));
    return std::string(host) + ":" + std::to_string(port());
  }
};

/// \brief Blocking UDP socket with a polled receive, closed on destruction.
class UdpSocket
{
public:
  enum class RecvStatus
  {
    Data,
    Timeout,
    Error
  };

  struct RecvResult
  {
    RecvStatus status{RecvStatus::Timeout};
    std::size_t size{0};
    std::string error;
  };

  UdpSocket() = default;
  ~UdpSocket() { close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  UdpSocket(UdpSocket&& other) noexcept : _fd(other._fd) { other._fd = -1; }
  UdpSocket& operator=(UdpSocket&& other) noexcept
  {
    if (this != &other)
    {
      close();
      _fd = other._fd;
      other._fd = -1;
    }
    return *this;
  }

  /// \brief Create the socket and bind it. Port 0 picks an ephemeral port.
  /// \throws std::runtime_error on socket or bind failure
  void bind(const std::string& address, std::uint16_t port)
  {
    close();
    Endpoint local = Endpoint::fromString(address, port);
    int sfd = ::socket(local.family(), SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (sfd < 0)
    {
      throw std::runtime_error("socket: " + lastErr());
    }
    if (local.family() == AF_INET6)
    {
      int v6only = 0;
      ::setsockopt(sfd, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
    }
    if (::bind(sfd, reinterpret_cast<const sockaddr*>(&local.addr), local.len) < 0)
    {
      std::string err = lastErr();
      ::close(sfd);
      throw std::runtime_error("bind " + address + ":" + std::to_string(port) + ": " + err);
    }
    _fd = sfd;
  }

  bool isOpen() const { return _fd >= 0; }

  /// \brief Locally bound endpoint (resolves an ephemeral port).
  Endpoint localEndpoint() const
  {
    Endpoint ep;
    ep.len = sizeof(ep.addr);
    if (_fd < 0 || ::getsockname(_fd, reinterpret_cast<sockaddr*>(&ep.addr), &ep.len) < 0)
    {
      throw std::runtime_error("getsockname: " + lastErr());
    }
    return ep;
  }

  /// \brief Wait up to `timeout` for one datagram; `buffer` is resized to
  /// its payload.
  RecvResult receiveFrom(std::vector<std::uint8_t>& buffer, std::size_t capacity, Endpoint& from,
                         std::chrono::milliseconds timeout)
  {
    RecvResult result;
    pollfd pfd{};
    pfd.fd = _fd;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc == 0 || (rc < 0 && errno == EINTR))
    {
      return result;
    }
    if (rc < 0)
    {
      result.status = RecvStatus::Error;
      result.error = "poll: " + lastErr();
      return result;
    }

    buffer.resize(capacity);
    from.len = sizeof(from.addr);
    ssize_t n = ::recvfrom(_fd, buffer.data(), buffer.size(), 0,
                           reinterpret_cast<sockaddr*>(&from.addr), &from.len);
    if (n < 0)
    {
      buffer.clear();
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
      {
        return result;
      }
      result.status = RecvStatus::Error;
      result.error = "recvfrom: " + lastErr();
      return result;
    }
    buffer.resize(static_cast<std::size_t>(n));
    result.status = RecvStatus::Data;
    result.size = static_cast<std::size_t>(n);
    return result;
  }

  /// \return false if the datagram was not sent; `error` holds the reason
  bool sendTo(const std::vector<std::uint8_t>& payload, const Endpoint& to, std::string& error)
  {
    ssize_t n = ::sendto(_fd, payload.data(), payload.size(), 0,
                         reinterpret_cast<const sockaddr*>(&to.addr), to.len);
    if (n < 0)
    {
      error = "sendto: " + lastErr();
      return false;
    }
    return true;
  }

  void close()
  {
    if (_fd >= 0)
    {
      ::close(_fd);
      _fd = -1;
    }
  }

private:
  static std::string lastErr()
  {
    int e = errno;
    char buf[128];
    const char* msg = ::strerror_r(e, buf, sizeof(buf));
    return std::string(msg);
  }

  int _fd{-1};
};

} // namespace network
} // namespace lodns
