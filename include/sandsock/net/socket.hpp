// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <sandsock/core/logger.hpp>
#include <sandsock/net/environment.hpp>
#include <sandsock/net/raw_transport.hpp>
#include <sandsock/net/socket_error.hpp>
#include <sandsock/net/types.hpp>

namespace sandsock
{
namespace net
{

/// Initial settings of a Socket.
struct SocketOptions
{
  /// Unset blocks indefinitely, zero never blocks, positive bounds each wait.
  std::optional<std::chrono::milliseconds> timeout;
  std::chrono::milliseconds pollInterval{10};
  /// Smallest raw read; surplus bytes are kept for later receive() calls.
  std::size_t minReceiveChunk{4096};
};

/// \brief Blocking-style stream socket over a non-blocking raw connection.
///
/// Waits are emulated by polling the raw connection every poll interval.
/// The receive path and the send path each hold their own lock, so calls in
/// one direction are serialized without blocking the other direction.
class Socket
{
public:
  /// Steps of one receive() call.
  enum class ReadState
  {
    Idle,
    DrainingBuffer,
    RawReadPending,
    Satisfied,
    TimedOut
  };

  Socket(std::unique_ptr<IRawConnection> connection, Endpoint local, Endpoint remote,
         std::shared_ptr<IEnvironment> env, const SocketOptions &options = {})
      : _connection(std::move(connection)), _local(std::move(local)), _remote(std::move(remote)),
        _env(std::move(env)), _minReceiveChunk(std::max<std::size_t>(options.minReceiveChunk, 1))
  {
    if (!_connection || !_env)
    {
      throw SocketException(SocketError::InvalidArgument, "Socket needs a connection and an environment");
    }
    setTimeout(options.timeout);
    setPollInterval(options.pollInterval);
  }

  ~Socket()
  {
    try
    {
      close();
    }
    catch (const std::exception &e)
    {
      SANDSOCK_LOG_WARN("Socket " << _local << " -> " << _remote << " failed to close: " << e.what());
    }
  }

  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;

  /// \brief Read at most \p maxBytes.
  ///
  /// Buffered bytes are returned first without touching the transport, even
  /// when fewer than \p maxBytes are buffered.
  /// \throws SocketException WouldBlock (timeout zero), Timeout, or whatever
  /// the transport raised.
  ByteBuffer receive(std::size_t maxBytes)
  {
    std::lock_guard<std::mutex> lock(_receiveMutex);
    if (maxBytes == 0)
    {
      return {};
    }
    ensureOpen();
    return readBuffered(maxBytes, currentTimeout());
  }

  /// \brief Write once; a partial write is returned as is.
  std::size_t send(const ByteBuffer &data)
  {
    std::lock_guard<std::mutex> lock(_sendMutex);
    if (data.empty())
    {
      return 0;
    }
    ensureOpen();
    return writeOnce(data.data(), data.size(), currentTimeout());
  }

  /// \brief Read until \p size bytes arrived or the transport failed.
  ///
  /// Ignores the configured timeout. A result shorter than \p size means the
  /// connection ended early; this never throws.
  ByteBuffer receiveAll(std::size_t size)
  {
    std::lock_guard<std::mutex> lock(_receiveMutex);
    ByteBuffer result;
    result.reserve(size);
    while (result.size() < size && !_closed.load())
    {
      try
      {
        ByteBuffer chunk = readBuffered(size - result.size(), std::nullopt);
        result.insert(result.end(), chunk.begin(), chunk.end());
      }
      catch (const SocketException &e)
      {
        SANDSOCK_LOG_DEBUG("receiveAll on " << _local << " stopped after " << result.size() << " of "
                                            << size << " bytes: " << e.what());
        break;
      }
    }
    return result;
  }

  /// \brief Write all of \p data; returns the count actually written.
  std::size_t sendAll(const ByteBuffer &data)
  {
    std::lock_guard<std::mutex> lock(_sendMutex);
    std::size_t sent = 0;
    while (sent < data.size() && !_closed.load())
    {
      try
      {
        sent += writeOnce(data.data() + sent, data.size() - sent, std::nullopt);
      }
      catch (const SocketException &e)
      {
        SANDSOCK_LOG_DEBUG("sendAll on " << _local << " stopped after " << sent << " of "
                                         << data.size() << " bytes: " << e.what());
        break;
      }
    }
    return sent;
  }

  /// Safe to call repeatedly and concurrently.
  void close()
  {
    if (_closed.exchange(true))
    {
      return;
    }
    _connection->close();
  }

  bool isClosed() const { return _closed.load(); }

  const Endpoint &getLocalEndpoint() const { return _local; }
  const Endpoint &getRemoteEndpoint() const { return _remote; }

  void setTimeout(std::optional<std::chrono::milliseconds> timeout)
  {
    if (timeout && timeout->count() < 0)
    {
      throw SocketException(SocketError::InvalidArgument, "timeout must not be negative");
    }
    std::lock_guard<std::mutex> lock(_settingsMutex);
    _timeout = timeout;
  }

  std::optional<std::chrono::milliseconds> getTimeout() const
  {
    std::lock_guard<std::mutex> lock(_settingsMutex);
    return _timeout;
  }

  void setPollInterval(std::chrono::milliseconds interval)
  {
    if (interval.count() <= 0)
    {
      throw SocketException(SocketError::InvalidArgument, "poll interval must be positive");
    }
    std::lock_guard<std::mutex> lock(_settingsMutex);
    _pollInterval = interval;
  }

  std::chrono::milliseconds getPollInterval() const
  {
    std::lock_guard<std::mutex> lock(_settingsMutex);
    return _pollInterval;
  }

  /// Bytes received from the transport but not yet delivered.
  std::size_t bufferedBytes() const
  {
    std::lock_guard<std::mutex> lock(_receiveMutex);
    return _buffer.size();
  }

private:
  std::optional<std::chrono::milliseconds> currentTimeout() const
  {
    std::lock_guard<std::mutex> lock(_settingsMutex);
    return _timeout;
  }

  void ensureOpen() const
  {
    if (_closed.load())
    {
      throw SocketException(SocketError::ConnectionClosed,
                            "socket " + _local.toString() + " -> " + _remote.toString() + " is closed");
    }
  }

  /// \brief Decide what happens after a would-block.
  ///
  /// Rethrows \p wouldBlock in non-blocking mode, returns false once the
  /// timeout elapsed, otherwise sleeps up to one poll interval.
  bool pauseBeforeRetry(MonoTime start, const std::optional<std::chrono::milliseconds> &timeout,
                        const SocketException &wouldBlock)
  {
    if (timeout && timeout->count() == 0)
    {
      throw wouldBlock;
    }

    auto pause = getPollInterval();
    if (timeout)
    {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(_env->now() - start);
      if (elapsed >= *timeout)
      {
        return false;
      }
      pause = std::min(pause, *timeout - elapsed);
    }
    _env->sleepFor(pause);
    return true;
  }

  ByteBuffer takeFromBuffer(std::size_t maxBytes)
  {
    std::size_t count = std::min(maxBytes, _buffer.size());
    auto end = _buffer.begin() + static_cast<std::ptrdiff_t>(count);
    ByteBuffer out(_buffer.begin(), end);
    _buffer.erase(_buffer.begin(), end);
    return out;
  }

  /// Caller holds _receiveMutex.
  ByteBuffer readBuffered(std::size_t maxBytes, const std::optional<std::chrono::milliseconds> &timeout)
  {
    const MonoTime start = _env->now();
    ReadState state = ReadState::Idle;
    ByteBuffer out;

    while (true)
    {
      switch (state)
      {
      case ReadState::Idle:
        state = _buffer.empty() ? ReadState::RawReadPending : ReadState::DrainingBuffer;
        break;

      case ReadState::DrainingBuffer:
        out = takeFromBuffer(maxBytes);
        state = ReadState::Satisfied;
        break;

      case ReadState::RawReadPending:
        try
        {
          ByteBuffer chunk = _connection->receive(std::max(maxBytes, _minReceiveChunk));
          if (chunk.empty())
          {
            throw SocketException(SocketError::ConnectionClosed,
                                  "empty read from " + _remote.toString());
          }
          _buffer.insert(_buffer.end(), chunk.begin(), chunk.end());
          state = ReadState::DrainingBuffer;
        }
        catch (const SocketException &e)
        {
          if (e.code() != SocketError::WouldBlock)
          {
            throw;
          }
          if (!pauseBeforeRetry(start, timeout, e))
          {
            state = ReadState::TimedOut;
          }
        }
        break;

      case ReadState::Satisfied:
        return out;

      case ReadState::TimedOut:
        throw SocketException(SocketError::Timeout, "receive from " + _remote.toString() +
                                                      " timed out after " +
                                                      std::to_string(timeout->count()) + " ms");
      }
    }
  }

  /// Caller holds _sendMutex.
  std::size_t writeOnce(const std::uint8_t *data, std::size_t size,
                        const std::optional<std::chrono::milliseconds> &timeout)
  {
    const MonoTime start = _env->now();
    while (true)
    {
      try
      {
        return _connection->send(data, size);
      }
      catch (const SocketException &e)
      {
        if (e.code() != SocketError::WouldBlock)
        {
          throw;
        }
        if (!pauseBeforeRetry(start, timeout, e))
        {
          throw SocketException(SocketError::Timeout, "send to " + _remote.toString() +
                                                        " timed out after " +
                                                        std::to_string(timeout->count()) + " ms");
        }
      }
    }
  }

  std::unique_ptr<IRawConnection> _connection;
  const Endpoint _local;
  const Endpoint _remote;
  std::shared_ptr<IEnvironment> _env;
  const std::size_t _minReceiveChunk;

  mutable std::mutex _settingsMutex;
  std::optional<std::chrono::milliseconds> _timeout;
  std::chrono::milliseconds _pollInterval{10};

  mutable std::mutex _receiveMutex;
  std::deque<std::uint8_t> _buffer;
  std::mutex _sendMutex;
  std::atomic<bool> _closed{false};
};

} // namespace net
} // namespace sandsock
