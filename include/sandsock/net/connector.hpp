// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sandsock/core/logger.hpp>
#include <sandsock/net/environment.hpp>
#include <sandsock/net/ipv4.hpp>
#include <sandsock/net/port_registry.hpp>
#include <sandsock/net/raw_transport.hpp>
#include <sandsock/net/socket.hpp>
#include <sandsock/net/socket_error.hpp>
#include <sandsock/net/types.hpp>

namespace sandsock
{
namespace net
{

/// Per-call options of ConnectionEstablisher::connect().
struct ConnectOptions
{
  /// Defaults to the environment's local address.
  std::optional<std::string> localAddress;
  /// Pins the local port; when unset the port is chosen from the registry.
  std::optional<std::uint16_t> localPort;
  /// Defaults to ConnectorSettings::defaultTimeout.
  std::optional<std::chrono::milliseconds> timeout;
};

/// Per-call options of MessageSender::send().
struct SendOptions
{
  std::optional<std::string> localAddress;
  std::optional<std::uint16_t> localPort;
};

struct ConnectorSettings
{
  std::chrono::milliseconds defaultTimeout{60000};
  /// Once cleanup-in-progress was seen, give up when less than this remains.
  std::chrono::milliseconds cleanupThreshold{20};
  /// Pause before retrying a tuple that is still being cleaned up.
  std::chrono::milliseconds cleanupBackoff{200};
  /// Applied to every Socket handed out.
  SocketOptions socketOptions;
};

namespace detail
{

/// \brief Remote and local endpoints of one outbound operation, with the
/// candidate local ports still untried in auto-port mode.
class OutboundRoute
{
public:
  OutboundRoute(Protocol protocol, const std::string &host, std::uint16_t port,
                const std::optional<std::string> &localAddress,
                const std::optional<std::uint16_t> &localPort, IEnvironment &env,
                const PortRegistry &registry)
      : _protocol(protocol), _autoPort(!localPort)
  {
    if (host.empty())
    {
      throw SocketException(SocketError::InvalidArgument, "remote host is empty");
    }
    if (port == 0)
    {
      throw SocketException(SocketError::InvalidArgument, "remote port must be in 1-65535");
    }
    if (localPort && *localPort == 0)
    {
      throw SocketException(SocketError::InvalidArgument, "local port must be in 1-65535");
    }
    if (localAddress && !IPv4::isValid(*localAddress))
    {
      throw SocketException(SocketError::InvalidArgument,
                            "'" + *localAddress + "' is not a dotted-quad IPv4 address");
    }

    _remote.address = IPv4::isValid(host) ? host : env.resolve(host);
    _remote.port = port;
    _local.address = localAddress ? *localAddress : env.localAddress();

    if (!_autoPort)
    {
      _local.port = *localPort;
      return;
    }

    _candidates = registry.availablePorts(protocol, _local.address);
    if (!advance())
    {
      throw SocketException(SocketError::ResourceExhausted,
                            std::string("no ") + toString(protocol) + " port at " + _local.address +
                              " avoids a loop to " + _remote.toString());
    }
  }

  /// Move to the next candidate, skipping one that equals the remote
  /// endpoint. Returns false once candidates are exhausted.
  bool advance()
  {
    while (_next < _candidates.size())
    {
      std::uint16_t port = _candidates[_next++];
      if (_local.address == _remote.address && port == _remote.port)
      {
        continue;
      }
      _local.port = port;
      return true;
    }
    return false;
  }

  SocketException exhausted(const SocketException &last) const
  {
    SANDSOCK_LOG_WARN(toString(_protocol) << " to " << _remote << ": every local port at "
                                          << _local.address << " conflicted");
    return SocketException(SocketError::ResourceExhausted,
                           std::string("local ") + toString(_protocol) + " ports at " +
                             _local.address + " exhausted, last error: " + last.what());
  }

  bool autoPort() const { return _autoPort; }
  const Endpoint &remote() const { return _remote; }
  const Endpoint &local() const { return _local; }

private:
  Protocol _protocol;
  bool _autoPort;
  Endpoint _remote;
  Endpoint _local;
  std::vector<std::uint16_t> _candidates;
  std::size_t _next{0};
};

} // namespace detail

/// \brief Opens outbound TCP connections, rotating through free local ports
/// on conflicts until a deadline.
class ConnectionEstablisher
{
public:
  ConnectionEstablisher(std::shared_ptr<IRawTransport> transport, std::shared_ptr<IEnvironment> env,
                        std::shared_ptr<PortRegistry> registry, ConnectorSettings settings = {})
      : _transport(std::move(transport)), _env(std::move(env)), _registry(std::move(registry)),
        _settings(settings)
  {
  }

  /// \brief Connect to \p host : \p port.
  ///
  /// \throws SocketException InvalidArgument, ResourceExhausted (no local
  /// port left), Timeout, CleanupInProgress, a hard conflict on a pinned
  /// port, or a transport error.
  std::shared_ptr<Socket> connect(const std::string &host, std::uint16_t port,
                                  const ConnectOptions &options = {})
  {
    auto timeout = options.timeout.value_or(_settings.defaultTimeout);
    if (timeout.count() <= 0)
    {
      throw SocketException(SocketError::InvalidArgument, "connect timeout must be positive");
    }

    detail::OutboundRoute route(Protocol::Tcp, host, port, options.localAddress, options.localPort,
                                *_env, *_registry);

    const MonoTime deadline = _env->now() + timeout;
    bool cleanupSeen = false;
    std::unique_ptr<IRawConnection> connection;

    while (!connection)
    {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - _env->now());
      if (remaining.count() <= 0)
      {
        break;
      }
      // A near-zero attempt would only hide the cleanup condition.
      if (cleanupSeen && remaining <= _settings.cleanupThreshold)
      {
        break;
      }

      try
      {
        connection = _transport->connect(route.remote(), route.local(), remaining);
      }
      catch (const SocketException &e)
      {
        if (!e.isPortConflict())
        {
          throw;
        }

        const bool cleanup = e.code() == SocketError::CleanupInProgress;
        cleanupSeen = cleanupSeen || cleanup;

        if (route.autoPort())
        {
          Endpoint previous = route.local();
          if (route.advance())
          {
            SANDSOCK_LOG_DEBUG("TCP to " << route.remote() << ": " << previous << " unusable ("
                                         << toString(e.code()) << "), trying " << route.local());
            continue;
          }
          if (!cleanup)
          {
            throw route.exhausted(e);
          }
        }
        else if (!cleanup)
        {
          throw;
        }

        SANDSOCK_LOG_DEBUG("TCP to " << route.remote() << ": " << route.local()
                                     << " still being cleaned up, retrying");
        _env->sleepFor(std::min(_settings.cleanupBackoff, remaining));
      }
    }

    if (!connection)
    {
      if (cleanupSeen)
      {
        throw SocketException(SocketError::CleanupInProgress,
                              "local tuple " + route.local().toString() +
                                " was still being cleaned up when connecting to " +
                                route.remote().toString());
      }
      throw SocketException(SocketError::Timeout, "connect to " + route.remote().toString() +
                                                    " timed out after " +
                                                    std::to_string(timeout.count()) + " ms");
    }

    SANDSOCK_LOG_DEBUG("TCP connected " << route.local() << " -> " << route.remote());
    return std::make_shared<Socket>(std::move(connection), route.local(), route.remote(), _env,
                                    _settings.socketOptions);
  }

  const ConnectorSettings &settings() const { return _settings; }

private:
  std::shared_ptr<IRawTransport> _transport;
  std::shared_ptr<IEnvironment> _env;
  std::shared_ptr<PortRegistry> _registry;
  ConnectorSettings _settings;
};

/// \brief Sends single UDP datagrams, one attempt per candidate local port.
class MessageSender
{
public:
  MessageSender(std::shared_ptr<IRawTransport> transport, std::shared_ptr<IEnvironment> env,
                std::shared_ptr<PortRegistry> registry)
      : _transport(std::move(transport)), _env(std::move(env)), _registry(std::move(registry))
  {
  }

  /// \brief Send \p payload to \p host : \p port.
  /// \return bytes the transport accepted for the datagram.
  std::size_t send(const std::string &host, std::uint16_t port, const ByteBuffer &payload,
                   const SendOptions &options = {})
  {
    detail::OutboundRoute route(Protocol::Udp, host, port, options.localAddress, options.localPort,
                                *_env, *_registry);
    while (true)
    {
      try
      {
        return _transport->sendDatagram(route.remote(), route.local(), payload);
      }
      catch (const SocketException &e)
      {
        if (e.code() != SocketError::AlreadyInUse && e.code() != SocketError::DuplicateBinding)
        {
          throw;
        }
        if (!route.autoPort())
        {
          throw;
        }

        Endpoint previous = route.local();
        if (!route.advance())
        {
          throw route.exhausted(e);
        }
        SANDSOCK_LOG_DEBUG("UDP to " << route.remote() << ": " << previous << " unusable ("
                                     << toString(e.code()) << "), trying " << route.local());
      }
    }
  }

private:
  std::shared_ptr<IRawTransport> _transport;
  std::shared_ptr<IEnvironment> _env;
  std::shared_ptr<PortRegistry> _registry;
};

} // namespace net
} // namespace sandsock
