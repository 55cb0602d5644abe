// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sandsock/core/config_loader.hpp>
#include <sandsock/core/logger.hpp>
#include <sandsock/core/run_loop.hpp>
#include <sandsock/core/task_executor.hpp>
#include <sandsock/core/thread_pool.hpp>
#include <sandsock/net/connector.hpp>
#include <sandsock/net/environment.hpp>
#include <sandsock/net/ipv4.hpp>
#include <sandsock/net/listener.hpp>
#include <sandsock/net/port_registry.hpp>
#include <sandsock/net/posix_transport.hpp>
#include <sandsock/net/raw_transport.hpp>
#include <sandsock/net/socket.hpp>
#include <sandsock/net/socket_error.hpp>
#include <sandsock/net/types.hpp>

namespace sandsock
{

/// \brief One socket layer: a port registry shared by the connection
/// establisher, the message sender and the listener manager, wired to the
/// injected transport, scheduler and environment.
class SocketLayer
{
public:
  /// \brief All options, mirroring the [sandsock] TOML tables. Unset fields
  /// take the defaults below.
  struct Config
  {
    struct PortsConfig
    {
      std::optional<int> tcpFirst; // 50000
      std::optional<int> tcpLast;  // 50099
      std::optional<int> udpFirst; // 50000
      std::optional<int> udpLast;  // 50099
    } ports;
    /// Defaults to the resolved host name.
    std::optional<std::string> localAddress;
    struct SocketConfig
    {
      std::optional<std::chrono::milliseconds> pollInterval; // 10 ms
      std::optional<std::size_t> minReceiveChunk;           // 4096
    } socket;
    struct ConnectConfig
    {
      std::optional<std::chrono::milliseconds> timeout;          // 60 s
      std::optional<std::chrono::milliseconds> cleanupThreshold; // 20 ms
      std::optional<std::chrono::milliseconds> cleanupBackoff;   // 200 ms
    } connect;
    struct ListenerConfig
    {
      std::optional<std::chrono::milliseconds> pollInterval; // 100 ms
    } listener;
    struct EventsConfig
    {
      std::optional<std::size_t> limit; // 64
    } events;
    struct LogConfig
    {
      std::optional<std::string> level;
      std::optional<std::string> file;
      std::optional<bool> async;
      std::optional<int> retentionDays;
      std::optional<std::string> format;
    } log;
    struct ThreadPoolConfig
    {
      std::optional<std::size_t> minThreads;
      std::optional<std::size_t> maxThreads;
      std::optional<std::size_t> queueSize;
      std::optional<std::chrono::seconds> idleTimeout;
    } threadPool;

    /// \brief Fill every field still unset from \p loader's "sandsock.*"
    /// keys.
    void mergeFrom(const core::ConfigLoader &loader)
    {
      mergeInt(loader, "sandsock.ports.tcp_first", ports.tcpFirst);
      mergeInt(loader, "sandsock.ports.tcp_last", ports.tcpLast);
      mergeInt(loader, "sandsock.ports.udp_first", ports.udpFirst);
      mergeInt(loader, "sandsock.ports.udp_last", ports.udpLast);
      merge(loader.getString("sandsock.local_address"), localAddress);
      mergeMillis(loader, "sandsock.socket.poll_interval_ms", socket.pollInterval);
      mergeSize(loader, "sandsock.socket.min_receive_chunk", socket.minReceiveChunk);
      mergeMillis(loader, "sandsock.connect.timeout_ms", connect.timeout);
      mergeMillis(loader, "sandsock.connect.cleanup_threshold_ms", connect.cleanupThreshold);
      mergeMillis(loader, "sandsock.connect.cleanup_backoff_ms", connect.cleanupBackoff);
      mergeMillis(loader, "sandsock.listener.poll_interval_ms", listener.pollInterval);
      mergeSize(loader, "sandsock.events.limit", events.limit);
      merge(loader.getString("sandsock.log.level"), log.level);
      merge(loader.getString("sandsock.log.file"), log.file);
      merge(loader.getBool("sandsock.log.async"), log.async);
      mergeInt(loader, "sandsock.log.retention_days", log.retentionDays);
      merge(loader.getString("sandsock.log.format"), log.format);
      mergeSize(loader, "sandsock.thread_pool.min_threads", threadPool.minThreads);
      mergeSize(loader, "sandsock.thread_pool.max_threads", threadPool.maxThreads);
      mergeSize(loader, "sandsock.thread_pool.queue_size", threadPool.queueSize);
      if (!threadPool.idleTimeout)
      {
        if (auto v = loader.getIntInRange("sandsock.thread_pool.idle_timeout_s", 0, 86400))
        {
          threadPool.idleTimeout = std::chrono::seconds(*v);
        }
      }
    }

    static Config fromLoader(const core::ConfigLoader &loader)
    {
      Config config;
      config.mergeFrom(loader);
      return config;
    }

  private:
    template <typename T> static void merge(const std::optional<T> &value, std::optional<T> &field)
    {
      if (!field && value)
      {
        field = value;
      }
    }

    static void mergeInt(const core::ConfigLoader &loader, const std::string &key,
                         std::optional<int> &field)
    {
      if (!field)
      {
        if (auto v = loader.getIntInRange(key, 0, INT32_MAX))
        {
          field = static_cast<int>(*v);
        }
      }
    }

    static void mergeSize(const core::ConfigLoader &loader, const std::string &key,
                          std::optional<std::size_t> &field)
    {
      if (!field)
      {
        if (auto v = loader.getIntInRange(key, 0, INT32_MAX))
        {
          field = static_cast<std::size_t>(*v);
        }
      }
    }

    static void mergeMillis(const core::ConfigLoader &loader, const std::string &key,
                            std::optional<std::chrono::milliseconds> &field)
    {
      if (!field)
      {
        if (auto v = loader.getIntInRange(key, 0, INT32_MAX))
        {
          field = std::chrono::milliseconds(*v);
        }
      }
    }
  };

  /// \throws net::SocketException InvalidArgument for a missing collaborator,
  /// or an invalid port range, duration or local address in \p config.
  SocketLayer(const Config &config, std::shared_ptr<net::IRawTransport> transport,
              std::shared_ptr<core::IScheduler> scheduler, std::shared_ptr<net::IEnvironment> env)
      : _env(checked(std::move(env), "an environment")),
        _registry(std::make_shared<net::PortRegistry>(
          net::PortRange{checkedPort(config.ports.tcpFirst, 50000, "ports.tcp_first"),
                         checkedPort(config.ports.tcpLast, 50099, "ports.tcp_last")},
          net::PortRange{checkedPort(config.ports.udpFirst, 50000, "ports.udp_first"),
                         checkedPort(config.ports.udpLast, 50099, "ports.udp_last")})),
        _connector(checked(transport, "a transport"), _env, _registry, connectorSettings(config)),
        _sender(transport, _env, _registry),
        _listeners(transport, checked(std::move(scheduler), "a scheduler"), _env, _registry,
                   positive(config.listener.pollInterval, std::chrono::milliseconds(100),
                            "listener.poll_interval_ms"),
                   socketOptions(config))
  {
  }

  ~SocketLayer()
  {
    if (_ownedLoop)
    {
      _ownedLoop->stop();
    }
  }

  SocketLayer(const SocketLayer &) = delete;
  SocketLayer &operator=(const SocketLayer &) = delete;

  /// \brief Wire the POSIX transport, a started RunLoop and the system
  /// environment. The loop stops when the layer is destroyed.
  static std::unique_ptr<SocketLayer> createDefault(const Config &config = {})
  {
    if (config.localAddress && !net::IPv4::isValid(*config.localAddress))
    {
      throw net::SocketException(net::SocketError::InvalidArgument,
                                 "local_address '" + *config.localAddress +
                                   "' is not a dotted-quad IPv4 address");
    }

    auto env = std::make_shared<net::SystemEnvironment>(config.events.limit.value_or(64),
                                                        config.localAddress);
    auto loop = std::make_shared<core::RunLoop>();
    loop->start();

    auto layer = std::make_unique<SocketLayer>(config, std::make_shared<net::PosixTransport>(), loop,
                                               std::move(env));
    layer->_ownedLoop = std::move(loop);
    return layer;
  }

  std::shared_ptr<net::Socket> openConnection(const std::string &host, std::uint16_t port,
                                              const net::ConnectOptions &options = {})
  {
    return _connector.connect(host, port, options);
  }

  std::size_t sendMessage(const std::string &host, std::uint16_t port, const net::ByteBuffer &payload,
                          const net::SendOptions &options = {})
  {
    return _sender.send(host, port, payload, options);
  }

  net::ListenerHandle listenForConnection(const std::string &address, std::uint16_t port,
                                          net::ConnectionCallback callback,
                                          net::ListenerOptions options = {})
  {
    return _listeners.listenForConnection(address, port, std::move(callback), std::move(options));
  }

  net::ListenerHandle listenForMessage(const std::string &address, std::uint16_t port,
                                       net::MessageCallback callback, net::ListenerOptions options = {})
  {
    return _listeners.listenForMessage(address, port, std::move(callback), std::move(options));
  }

  /// Defaults to the environment's local address.
  std::vector<std::uint16_t>
  availableConnectPorts(const std::optional<std::string> &localAddress = std::nullopt)
  {
    return _registry->availablePorts(net::Protocol::Tcp,
                                     localAddress ? *localAddress : _env->localAddress());
  }

  std::vector<std::uint16_t>
  availableMessagePorts(const std::optional<std::string> &localAddress = std::nullopt)
  {
    return _registry->availablePorts(net::Protocol::Udp,
                                     localAddress ? *localAddress : _env->localAddress());
  }

  net::PortRegistry &registry() { return *_registry; }

  net::IEnvironment &environment() { return *_env; }

private:
  template <typename T> static std::shared_ptr<T> checked(std::shared_ptr<T> ptr, const char *what)
  {
    if (!ptr)
    {
      throw net::SocketException(net::SocketError::InvalidArgument,
                                 std::string("SocketLayer needs ") + what);
    }
    return ptr;
  }

  static std::uint16_t checkedPort(const std::optional<int> &value, int fallback, const char *key)
  {
    int p = value.value_or(fallback);
    if (p < 1 || p > 65535)
    {
      throw net::SocketException(net::SocketError::InvalidArgument,
                                 std::string(key) + " = " + std::to_string(p) + " is not a port");
    }
    return static_cast<std::uint16_t>(p);
  }

  static std::chrono::milliseconds positive(const std::optional<std::chrono::milliseconds> &value,
                                            std::chrono::milliseconds fallback, const char *key)
  {
    auto v = value.value_or(fallback);
    if (v.count() <= 0)
    {
      throw net::SocketException(net::SocketError::InvalidArgument,
                                 std::string(key) + " must be positive");
    }
    return v;
  }

  static net::SocketOptions socketOptions(const Config &config)
  {
    net::SocketOptions options;
    options.pollInterval = positive(config.socket.pollInterval, std::chrono::milliseconds(10),
                                    "socket.poll_interval_ms");
    options.minReceiveChunk = config.socket.minReceiveChunk.value_or(4096);
    if (options.minReceiveChunk == 0)
    {
      throw net::SocketException(net::SocketError::InvalidArgument,
                                 "socket.min_receive_chunk must be positive");
    }
    return options;
  }

  static net::ConnectorSettings connectorSettings(const Config &config)
  {
    net::ConnectorSettings settings;
    settings.defaultTimeout =
      positive(config.connect.timeout, std::chrono::milliseconds(60000), "connect.timeout_ms");
    settings.cleanupThreshold =
      config.connect.cleanupThreshold.value_or(std::chrono::milliseconds(20));
    settings.cleanupBackoff = positive(config.connect.cleanupBackoff, std::chrono::milliseconds(200),
                                       "connect.cleanup_backoff_ms");
    settings.socketOptions = socketOptions(config);
    return settings;
  }

  std::shared_ptr<net::IEnvironment> _env;
  std::shared_ptr<net::PortRegistry> _registry;
  net::ConnectionEstablisher _connector;
  net::MessageSender _sender;
  net::ListenerManager _listeners;
  std::shared_ptr<core::RunLoop> _ownedLoop;
};

} // namespace sandsock
