// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <sandsock/core/logger.hpp>
#include <sandsock/core/task_executor.hpp>
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

using ConnectionCallback = std::function<void(std::shared_ptr<Socket> socket)>;
using MessageCallback = std::function<void(const Endpoint &remote, const ByteBuffer &payload)>;
/// Receives the listener's protocol, its bound tuple and a diagnostic.
using ErrorDelegate =
  std::function<void(Protocol protocol, const Endpoint &local, const std::string &diagnostic)>;

struct ListenerOptions
{
  /// Runs the callbacks. Without one each callback gets its own thread,
  /// limited by the environment's event budget.
  std::shared_ptr<core::ITaskExecutor> threadPool;
  /// Defaults to ListenerManager's configured poll interval.
  std::optional<std::chrono::milliseconds> pollInterval;
  /// Defaults to logging the failure.
  ErrorDelegate errorDelegate;
};

namespace detail
{

/// \brief State shared by a listener's poll task, its dispatched callbacks
/// and its stop handle.
class ListenerState : public std::enable_shared_from_this<ListenerState>
{
public:
  ListenerState(Protocol protocol, Endpoint local, std::shared_ptr<PortRegistry> registry,
                std::shared_ptr<core::IScheduler> scheduler, std::shared_ptr<IEnvironment> env,
                std::shared_ptr<core::ITaskExecutor> pool, ErrorDelegate delegate)
      : _protocol(protocol), _local(std::move(local)), _registry(std::move(registry)),
        _scheduler(std::move(scheduler)), _env(std::move(env)), _pool(std::move(pool)),
        _delegate(std::move(delegate))
  {
  }

  virtual ~ListenerState() = default;

  void start(std::chrono::milliseconds interval)
  {
    std::weak_ptr<ListenerState> weak = shared_from_this();
    std::lock_guard<std::mutex> lock(_mutex);
    _jobId = _scheduler->scheduleEvery(interval,
                                       [weak]()
                                       {
                                         if (auto self = weak.lock())
                                         {
                                           self->poll();
                                         }
                                       });
    SANDSOCK_LOG_INFO(toString(_protocol) << " listener started on " << _local << ", polling every "
                                          << interval.count() << " ms");
  }

  /// One scheduled invocation: drain what is pending without blocking.
  void poll()
  {
    while (_pool || _env->freeEvents() > 0)
    {
      std::function<void()> task;
      std::shared_ptr<Socket> socket;
      std::string failure;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopped)
        {
          return;
        }
        try
        {
          task = acceptOne(socket);
        }
        catch (const SocketException &e)
        {
          if (e.code() == SocketError::WouldBlock)
          {
            return;
          }
          failure = e.what();
        }
        catch (const std::exception &e)
        {
          failure = e.what();
        }
      }

      if (!failure.empty())
      {
        std::string diagnostic = describe() + " failed: " + failure;
        SANDSOCK_LOG_ERROR(diagnostic << "; shutting the listener down");
        if (stop(false))
        {
          report(diagnostic);
        }
        return;
      }

      if (!dispatch(std::move(task), socket))
      {
        return;
      }
    }
  }

  /// Returns false when the listener was already stopped.
  bool stop(bool destroyThreadPool)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_stopped)
      {
        return false;
      }
      _stopped = true;
      closeEndpoint();
    }

    _scheduler->cancelSchedule(_jobId);
    if (!_registry->remove(_protocol, _local))
    {
      SANDSOCK_LOG_DEBUG(describe() << " was not registered at stop");
    }
    SANDSOCK_LOG_INFO(describe() << " stopped");

    if (destroyThreadPool && _pool)
    {
      _pool->shutdown();
    }
    return true;
  }

  bool isStopped() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stopped;
  }

  Protocol protocol() const { return _protocol; }
  const Endpoint &local() const { return _local; }

protected:
  /// \brief Take one pending connection or datagram and build the task that
  /// delivers it. Called with _mutex held.
  /// \param socket set to the accepted socket for stream listeners.
  /// \throws SocketException WouldBlock when nothing is pending.
  virtual std::function<void()> acceptOne(std::shared_ptr<Socket> &socket) = 0;

  /// Called once, with _mutex held.
  virtual void closeEndpoint() = 0;

  std::string describe() const
  {
    return std::string(toString(_protocol)) + " listener on " + _local.toString();
  }

  /// Runs on the dispatch thread; nothing escapes it.
  void invokeContained(const std::function<void()> &callback, const std::shared_ptr<Socket> &socket)
  {
    try
    {
      callback();
    }
    catch (const std::exception &e)
    {
      contain(e.what(), socket);
    }
    catch (...)
    {
      contain("non-standard exception", socket);
    }
  }

  const std::shared_ptr<IEnvironment> &env() const { return _env; }

private:
  bool dispatch(std::function<void()> task, const std::shared_ptr<Socket> &socket)
  {
    try
    {
      if (_pool)
      {
        _pool->submit(std::move(task));
      }
      else
      {
        _env->spawnThread(std::move(task));
      }
      return true;
    }
    catch (const std::exception &e)
    {
      SANDSOCK_LOG_WARN(describe() << " could not dispatch a callback: " << e.what());
      closeQuietly(socket);
      return false;
    }
  }

  void contain(const std::string &what, const std::shared_ptr<Socket> &socket)
  {
    std::string diagnostic = describe() + ": callback raised: " + what;
    closeQuietly(socket);
    SANDSOCK_LOG_WARN(diagnostic);
    report(diagnostic);
  }

  void closeQuietly(const std::shared_ptr<Socket> &socket)
  {
    if (!socket)
    {
      return;
    }
    try
    {
      socket->close();
    }
    catch (const std::exception &e)
    {
      SANDSOCK_LOG_DEBUG(describe() << ": closing " << socket->getRemoteEndpoint()
                                    << " failed: " << e.what());
    }
  }

  void report(const std::string &diagnostic)
  {
    try
    {
      _delegate(_protocol, _local, diagnostic);
    }
    catch (const std::exception &e)
    {
      SANDSOCK_LOG_DEBUG(describe() << ": error delegate raised: " << e.what());
    }
    catch (...)
    {
      SANDSOCK_LOG_DEBUG(describe() << ": error delegate raised a non-standard exception");
    }
  }

  const Protocol _protocol;
  const Endpoint _local;
  std::shared_ptr<PortRegistry> _registry;
  std::shared_ptr<core::IScheduler> _scheduler;
  std::shared_ptr<IEnvironment> _env;
  std::shared_ptr<core::ITaskExecutor> _pool;
  ErrorDelegate _delegate;

  mutable std::mutex _mutex;
  bool _stopped{false};
  core::IScheduler::JobId _jobId{0};
};

class ConnectionListenerState final : public ListenerState
{
public:
  ConnectionListenerState(Endpoint local, std::unique_ptr<IRawConnectionListener> listener,
                          ConnectionCallback callback, SocketOptions socketOptions,
                          std::shared_ptr<PortRegistry> registry,
                          std::shared_ptr<core::IScheduler> scheduler,
                          std::shared_ptr<IEnvironment> env, std::shared_ptr<core::ITaskExecutor> pool,
                          ErrorDelegate delegate)
      : ListenerState(Protocol::Tcp, std::move(local), std::move(registry), std::move(scheduler),
                      std::move(env), std::move(pool), std::move(delegate)),
        _listener(std::move(listener)), _callback(std::move(callback)), _socketOptions(socketOptions)
  {
  }

protected:
  std::function<void()> acceptOne(std::shared_ptr<Socket> &socket) override
  {
    AcceptedConnection accepted = _listener->accept();
    socket = std::make_shared<Socket>(std::move(accepted.connection), local(), accepted.remote, env(),
                                      _socketOptions);
    SANDSOCK_LOG_DEBUG(describe() << " accepted " << accepted.remote);

    auto self = std::static_pointer_cast<ConnectionListenerState>(shared_from_this());
    return [self, socket]() { self->invokeContained([&]() { self->_callback(socket); }, socket); };
  }

  void closeEndpoint() override { _listener->close(); }

private:
  std::unique_ptr<IRawConnectionListener> _listener;
  ConnectionCallback _callback;
  SocketOptions _socketOptions;
};

class MessageListenerState final : public ListenerState
{
public:
  MessageListenerState(Endpoint local, std::unique_ptr<IRawMessageListener> listener,
                       MessageCallback callback, std::shared_ptr<PortRegistry> registry,
                       std::shared_ptr<core::IScheduler> scheduler, std::shared_ptr<IEnvironment> env,
                       std::shared_ptr<core::ITaskExecutor> pool, ErrorDelegate delegate)
      : ListenerState(Protocol::Udp, std::move(local), std::move(registry), std::move(scheduler),
                      std::move(env), std::move(pool), std::move(delegate)),
        _listener(std::move(listener)), _callback(std::move(callback))
  {
  }

protected:
  std::function<void()> acceptOne(std::shared_ptr<Socket> &) override
  {
    auto datagram = std::make_shared<Datagram>(_listener->receiveDatagram());
    auto self = std::static_pointer_cast<MessageListenerState>(shared_from_this());
    return [self, datagram]()
    {
      self->invokeContained([&]() { self->_callback(datagram->remote, datagram->payload); }, nullptr);
    };
  }

  void closeEndpoint() override { _listener->close(); }

private:
  std::unique_ptr<IRawMessageListener> _listener;
  MessageCallback _callback;
};

} // namespace detail

/// \brief Stops one listener. Copies share the listener; the first call
/// stops it and later calls do nothing.
class ListenerHandle
{
public:
  ListenerHandle() = default;

  /// \param destroyThreadPool also shut down the listener's thread pool.
  void stop(bool destroyThreadPool = true)
  {
    if (_state)
    {
      _state->stop(destroyThreadPool);
    }
  }

  void operator()(bool destroyThreadPool = true) { stop(destroyThreadPool); }

  bool isActive() const { return _state && !_state->isStopped(); }

  /// The bound tuple.
  Endpoint localEndpoint() const { return _state ? _state->local() : Endpoint{}; }

private:
  explicit ListenerHandle(std::shared_ptr<detail::ListenerState> state) : _state(std::move(state)) {}

  std::shared_ptr<detail::ListenerState> _state;

  friend class ListenerManager;
};

/// \brief Registers TCP and UDP listeners polled on the scheduler.
class ListenerManager
{
public:
  ListenerManager(std::shared_ptr<IRawTransport> transport, std::shared_ptr<core::IScheduler> scheduler,
                  std::shared_ptr<IEnvironment> env, std::shared_ptr<PortRegistry> registry,
                  std::chrono::milliseconds defaultPollInterval = std::chrono::milliseconds(100),
                  SocketOptions socketOptions = {})
      : _transport(std::move(transport)), _scheduler(std::move(scheduler)), _env(std::move(env)),
        _registry(std::move(registry)), _defaultPollInterval(defaultPollInterval),
        _socketOptions(socketOptions)
  {
  }

  /// \brief Accept TCP connections at \p address : \p port and hand each to
  /// \p callback as a Socket.
  /// \throws SocketException InvalidArgument, DuplicateBinding or
  /// AlreadyInUse, or the transport's listen error.
  ListenerHandle listenForConnection(const std::string &address, std::uint16_t port,
                                     ConnectionCallback callback, ListenerOptions options = {})
  {
    if (!callback)
    {
      throw SocketException(SocketError::InvalidArgument, "connection callback is empty");
    }
    Endpoint local = validate(address, port, options);
    _registry->add(Protocol::Tcp, local);

    std::unique_ptr<IRawConnectionListener> raw;
    try
    {
      raw = _transport->listen(local);
    }
    catch (const std::exception &e)
    {
      _registry->remove(Protocol::Tcp, local);
      SANDSOCK_LOG_WARN("TCP listen on " << local << " failed: " << e.what());
      throw;
    }

    auto state = std::make_shared<detail::ConnectionListenerState>(
      local, std::move(raw), std::move(callback), _socketOptions, _registry, _scheduler, _env,
      options.threadPool, delegateOrDefault(std::move(options.errorDelegate)));
    return activate(state, *options.pollInterval);
  }

  /// \brief Receive UDP datagrams at \p address : \p port.
  ListenerHandle listenForMessage(const std::string &address, std::uint16_t port,
                                  MessageCallback callback, ListenerOptions options = {})
  {
    if (!callback)
    {
      throw SocketException(SocketError::InvalidArgument, "message callback is empty");
    }
    Endpoint local = validate(address, port, options);
    _registry->add(Protocol::Udp, local);

    std::unique_ptr<IRawMessageListener> raw;
    try
    {
      raw = _transport->listenForMessages(local);
    }
    catch (const std::exception &e)
    {
      _registry->remove(Protocol::Udp, local);
      SANDSOCK_LOG_WARN("UDP listen on " << local << " failed: " << e.what());
      throw;
    }

    auto state = std::make_shared<detail::MessageListenerState>(
      local, std::move(raw), std::move(callback), _registry, _scheduler, _env, options.threadPool,
      delegateOrDefault(std::move(options.errorDelegate)));
    return activate(state, *options.pollInterval);
  }

  static void logError(Protocol protocol, const Endpoint &local, const std::string &diagnostic)
  {
    SANDSOCK_LOG_ERROR(toString(protocol) << " listener " << local << " error: " << diagnostic);
  }

private:
  Endpoint validate(const std::string &address, std::uint16_t port, ListenerOptions &options) const
  {
    if (!IPv4::isValid(address))
    {
      throw SocketException(SocketError::InvalidArgument,
                            "'" + address + "' is not a dotted-quad IPv4 address");
    }
    if (port == 0)
    {
      throw SocketException(SocketError::InvalidArgument, "listen port must be in 1-65535");
    }
    if (!options.pollInterval)
    {
      options.pollInterval = _defaultPollInterval;
    }
    if (options.pollInterval->count() <= 0)
    {
      throw SocketException(SocketError::InvalidArgument, "listener poll interval must be positive");
    }
    return Endpoint{address, port};
  }

  static ErrorDelegate delegateOrDefault(ErrorDelegate delegate)
  {
    return delegate ? std::move(delegate) : ErrorDelegate(&ListenerManager::logError);
  }

  ListenerHandle activate(const std::shared_ptr<detail::ListenerState> &state,
                          std::chrono::milliseconds interval)
  {
    try
    {
      state->start(interval);
    }
    catch (const std::exception &e)
    {
      SANDSOCK_LOG_ERROR(toString(state->protocol())
                         << " listener on " << state->local() << " could not be scheduled: " << e.what());
      state->stop(false);
      throw;
    }
    return ListenerHandle(state);
  }

  std::shared_ptr<IRawTransport> _transport;
  std::shared_ptr<core::IScheduler> _scheduler;
  std::shared_ptr<IEnvironment> _env;
  std::shared_ptr<PortRegistry> _registry;
  std::chrono::milliseconds _defaultPollInterval;
  SocketOptions _socketOptions;
};

} // namespace net
} // namespace sandsock
