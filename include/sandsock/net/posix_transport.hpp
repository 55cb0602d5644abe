// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <sandsock/core/logger.hpp>
#include <sandsock/net/raw_transport.hpp>
#include <sandsock/net/socket_error.hpp>
#include <sandsock/net/types.hpp>

namespace sandsock
{
namespace net
{

namespace detail
{

/// Owns a file descriptor.
class FdHandle
{
public:
  explicit FdHandle(int fd = -1) : _fd(fd) {}
  ~FdHandle() { reset(); }

  FdHandle(const FdHandle &) = delete;
  FdHandle &operator=(const FdHandle &) = delete;

  int get() const { return _fd; }

  int release()
  {
    int fd = _fd;
    _fd = -1;
    return fd;
  }

  void reset()
  {
    if (_fd >= 0)
    {
      ::close(_fd);
      _fd = -1;
    }
  }

private:
  int _fd;
};

inline std::string lastErr() { return std::string(std::strerror(errno)); }

inline bool isWouldBlock(int err) { return err == EAGAIN || err == EWOULDBLOCK; }

inline sockaddr_in toSockaddr(const Endpoint &endpoint)
{
  sockaddr_in sa{};
  sa.sin_family = AF_INET;
  sa.sin_port = htons(endpoint.port);
  if (::inet_pton(AF_INET, endpoint.address.c_str(), &sa.sin_addr) != 1)
  {
    throw SocketException(SocketError::InvalidArgument,
                          "'" + endpoint.address + "' is not an IPv4 address");
  }
  return sa;
}

inline Endpoint fromSockaddr(const sockaddr_in &sa)
{
  char buf[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &sa.sin_addr, buf, sizeof(buf));
  return Endpoint{std::string(buf), ntohs(sa.sin_port)};
}

/// Maps a failed bind() to the conflict codes the socket layer rotates on.
inline SocketException bindError(const Endpoint &local, int err)
{
  if (err == EADDRINUSE)
  {
    return SocketException(SocketError::AlreadyInUse, "bind " + local.toString(), err);
  }
  return SocketException(SocketError::Transport, "bind " + local.toString(), err);
}

inline int openBound(int type, const Endpoint &local, bool reuseAddress)
{
  sockaddr_in sa = toSockaddr(local);
  FdHandle fd(::socket(AF_INET, type | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
  if (fd.get() < 0)
  {
    throw SocketException(SocketError::Transport, "socket: " + lastErr(), errno);
  }
  if (reuseAddress)
  {
    int one = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  }
  if (::bind(fd.get(), reinterpret_cast<sockaddr *>(&sa), sizeof(sa)) < 0)
  {
    throw bindError(local, errno);
  }
  return fd.release();
}

} // namespace detail

/// \brief Non-blocking TCP connection.
class PosixConnection : public IRawConnection
{
public:
  explicit PosixConnection(int fd) : _fd(fd) {}

  std::size_t send(const std::uint8_t *data, std::size_t size) override
  {
    ssize_t n = ::send(_fd.get(), data, size, MSG_NOSIGNAL);
    if (n < 0)
    {
      int err = errno;
      if (detail::isWouldBlock(err))
      {
        throw SocketException(SocketError::WouldBlock, "send");
      }
      if (err == EPIPE || err == ECONNRESET)
      {
        throw SocketException(SocketError::ConnectionClosed, "send", err);
      }
      throw SocketException(SocketError::Transport, "send", err);
    }
    return static_cast<std::size_t>(n);
  }

  ByteBuffer receive(std::size_t maxBytes) override
  {
    ByteBuffer buf(maxBytes);
    ssize_t n = ::recv(_fd.get(), buf.data(), buf.size(), 0);
    if (n < 0)
    {
      int err = errno;
      if (detail::isWouldBlock(err))
      {
        throw SocketException(SocketError::WouldBlock, "recv");
      }
      throw SocketException(SocketError::Transport, "recv", err);
    }
    if (n == 0)
    {
      throw SocketException(SocketError::ConnectionClosed, "peer closed the connection");
    }
    buf.resize(static_cast<std::size_t>(n));
    return buf;
  }

  /// Shuts the socket down; the descriptor itself is released on
  /// destruction so a concurrent reader never sees a reused fd.
  void close() override
  {
    if (!_closed.exchange(true))
    {
      ::shutdown(_fd.get(), SHUT_RDWR);
    }
  }

private:
  detail::FdHandle _fd;
  std::atomic<bool> _closed{false};
};

class PosixConnectionListener : public IRawConnectionListener
{
public:
  explicit PosixConnectionListener(int fd) : _fd(fd) {}

  AcceptedConnection accept() override
  {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    int cfd = ::accept4(_fd.get(), reinterpret_cast<sockaddr *>(&peer), &len,
                        SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (cfd < 0)
    {
      int err = errno;
      if (detail::isWouldBlock(err))
      {
        throw SocketException(SocketError::WouldBlock, "accept4");
      }
      throw SocketException(SocketError::Transport, "accept4", err);
    }
    int one = 1;
    ::setsockopt(cfd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return AcceptedConnection{std::make_unique<PosixConnection>(cfd), detail::fromSockaddr(peer)};
  }

  void close() override { _fd.reset(); }

private:
  detail::FdHandle _fd;
};

class PosixMessageListener : public IRawMessageListener
{
public:
  static constexpr std::size_t MaxDatagram = 65536;

  explicit PosixMessageListener(int fd) : _fd(fd) {}

  Datagram receiveDatagram() override
  {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    ByteBuffer buf(MaxDatagram);
    ssize_t n = ::recvfrom(_fd.get(), buf.data(), buf.size(), 0, reinterpret_cast<sockaddr *>(&peer),
                           &len);
    if (n < 0)
    {
      int err = errno;
      if (detail::isWouldBlock(err))
      {
        throw SocketException(SocketError::WouldBlock, "recvfrom");
      }
      throw SocketException(SocketError::Transport, "recvfrom", err);
    }
    buf.resize(static_cast<std::size_t>(n));
    return Datagram{detail::fromSockaddr(peer), std::move(buf)};
  }

  void close() override { _fd.reset(); }

private:
  detail::FdHandle _fd;
};

/// \brief IRawTransport over non-blocking IPv4 BSD sockets.
///
/// Never reports CleanupInProgress; the kernel handles TIME_WAIT itself.
class PosixTransport : public IRawTransport
{
public:
  explicit PosixTransport(int listenBacklog = SOMAXCONN) : _backlog(listenBacklog) {}

  std::unique_ptr<IRawConnection> connect(const Endpoint &remote, const Endpoint &local,
                                          std::chrono::milliseconds timeout) override
  {
    sockaddr_in peer = detail::toSockaddr(remote);
    detail::FdHandle fd(detail::openBound(SOCK_STREAM, local, false));

    if (::connect(fd.get(), reinterpret_cast<sockaddr *>(&peer), sizeof(peer)) < 0)
    {
      int err = errno;
      if (err != EINPROGRESS)
      {
        throw connectError(remote, local, err);
      }
      waitConnected(fd.get(), remote, timeout);
    }

    int one = 1;
    ::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    SANDSOCK_LOG_TRACE("PosixTransport: connected " << local << " -> " << remote);
    return std::make_unique<PosixConnection>(fd.release());
  }

  std::unique_ptr<IRawConnectionListener> listen(const Endpoint &local) override
  {
    detail::FdHandle fd(detail::openBound(SOCK_STREAM, local, true));
    if (::listen(fd.get(), _backlog) < 0)
    {
      int err = errno;
      if (err == EADDRINUSE)
      {
        throw SocketException(SocketError::AlreadyInUse, "listen " + local.toString(), err);
      }
      throw SocketException(SocketError::Transport, "listen " + local.toString(), err);
    }
    return std::make_unique<PosixConnectionListener>(fd.release());
  }

  std::size_t sendDatagram(const Endpoint &remote, const Endpoint &local,
                           const ByteBuffer &payload) override
  {
    sockaddr_in peer = detail::toSockaddr(remote);
    detail::FdHandle fd(detail::openBound(SOCK_DGRAM, local, false));
    ssize_t n = ::sendto(fd.get(), payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr *>(&peer), sizeof(peer));
    if (n < 0)
    {
      int err = errno;
      if (detail::isWouldBlock(err))
      {
        throw SocketException(SocketError::WouldBlock, "sendto " + remote.toString());
      }
      throw SocketException(SocketError::Transport, "sendto " + remote.toString(), err);
    }
    return static_cast<std::size_t>(n);
  }

  std::unique_ptr<IRawMessageListener> listenForMessages(const Endpoint &local) override
  {
    return std::make_unique<PosixMessageListener>(detail::openBound(SOCK_DGRAM, local, true));
  }

private:
  static SocketException connectError(const Endpoint &remote, const Endpoint &local, int err)
  {
    std::string what = "connect " + local.toString() + " -> " + remote.toString();
    if (err == EADDRNOTAVAIL)
    {
      return SocketException(SocketError::DuplicateBinding, what, err);
    }
    if (err == EADDRINUSE)
    {
      return SocketException(SocketError::AlreadyInUse, what, err);
    }
    return SocketException(SocketError::Transport, what, err);
  }

  static void waitConnected(int fd, const Endpoint &remote, std::chrono::milliseconds timeout)
  {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;

    int rc;
    do
    {
      rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0)
    {
      throw SocketException(SocketError::Transport, "poll: " + detail::lastErr(), errno);
    }
    if (rc == 0)
    {
      throw SocketException(SocketError::Timeout, "connect to " + remote.toString() + " timed out");
    }

    int soErr = 0;
    socklen_t len = sizeof(soErr);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &len) < 0)
    {
      throw SocketException(SocketError::Transport, "getsockopt: " + detail::lastErr(), errno);
    }
    if (soErr != 0)
    {
      Endpoint local;
      sockaddr_in sa{};
      socklen_t salen = sizeof(sa);
      if (::getsockname(fd, reinterpret_cast<sockaddr *>(&sa), &salen) == 0)
      {
        local = detail::fromSockaddr(sa);
      }
      throw connectError(remote, local, soErr);
    }
  }

  int _backlog;
};

} // namespace net
} // namespace sandsock
