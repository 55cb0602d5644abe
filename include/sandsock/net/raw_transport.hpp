// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <sandsock/net/socket_error.hpp>
#include <sandsock/net/types.hpp>

namespace sandsock
{
namespace net
{

/// \brief One non-blocking stream connection owned by the transport.
///
/// Every operation reports failure by throwing SocketException:
/// WouldBlock when nothing can be transferred right now, ConnectionClosed on
/// an orderly shutdown by the peer, Transport for anything else.
class IRawConnection
{
public:
  virtual ~IRawConnection() = default;

  /// Write up to \p size bytes; returns how many were accepted (> 0).
  virtual std::size_t send(const std::uint8_t *data, std::size_t size) = 0;

  /// Read up to \p maxBytes; never returns an empty buffer.
  virtual ByteBuffer receive(std::size_t maxBytes) = 0;

  /// Idempotent.
  virtual void close() = 0;
};

struct AcceptedConnection
{
  std::unique_ptr<IRawConnection> connection;
  Endpoint remote;
};

struct Datagram
{
  Endpoint remote;
  ByteBuffer payload;
};

/// \brief A bound, listening stream endpoint.
class IRawConnectionListener
{
public:
  virtual ~IRawConnectionListener() = default;

  /// Non-blocking; throws WouldBlock when no connection is pending.
  virtual AcceptedConnection accept() = 0;
  virtual void close() = 0;
};

/// \brief A bound datagram endpoint.
class IRawMessageListener
{
public:
  virtual ~IRawMessageListener() = default;

  /// Non-blocking; throws WouldBlock when no datagram is pending.
  virtual Datagram receiveDatagram() = 0;
  virtual void close() = 0;
};

/// \brief The primitive socket operations of the sandbox.
///
/// connect(), listen() and sendDatagram() report port conflicts as
/// AlreadyInUse (the tuple is taken by someone else) or DuplicateBinding
/// (the exact binding already exists); connect() may also report
/// CleanupInProgress while a previous binding of the tuple is torn down.
class IRawTransport
{
public:
  virtual ~IRawTransport() = default;

  virtual std::unique_ptr<IRawConnection> connect(const Endpoint &remote, const Endpoint &local,
                                                  std::chrono::milliseconds timeout) = 0;

  virtual std::unique_ptr<IRawConnectionListener> listen(const Endpoint &local) = 0;

  /// Returns the number of payload bytes accepted for the datagram.
  virtual std::size_t sendDatagram(const Endpoint &remote, const Endpoint &local,
                                   const ByteBuffer &payload) = 0;

  virtual std::unique_ptr<IRawMessageListener> listenForMessages(const Endpoint &local) = 0;
};

} // namespace net
} // namespace sandsock
