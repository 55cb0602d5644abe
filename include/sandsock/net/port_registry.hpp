// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <sandsock/net/ipv4.hpp>
#include <sandsock/net/socket_error.hpp>
#include <sandsock/net/types.hpp>

namespace sandsock
{
namespace net
{

/// Inclusive local port range.
struct PortRange
{
  std::uint16_t first;
  std::uint16_t last;
};

/// \brief Local tuples bound by listeners of one socket layer, per protocol.
///
/// A tuple lives in at most one of the two sets. All access is serialized by
/// an internal mutex.
class PortRegistry
{
public:
  PortRegistry(PortRange tcpRange, PortRange udpRange) : _tcpRange(tcpRange), _udpRange(udpRange)
  {
    validateRange(tcpRange, Protocol::Tcp);
    validateRange(udpRange, Protocol::Udp);
  }

  PortRegistry(const PortRegistry &) = delete;
  PortRegistry &operator=(const PortRegistry &) = delete;

  /// \throws SocketException DuplicateBinding when \p tuple is already held for
  /// \p protocol, AlreadyInUse when the other protocol holds it.
  void add(Protocol protocol, const Endpoint &tuple)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (setFor(protocol).count(tuple) != 0)
    {
      throw SocketException(SocketError::DuplicateBinding,
                            std::string(toString(protocol)) + " " + tuple.toString() +
                              " is already registered");
    }
    if (setFor(other(protocol)).count(tuple) != 0)
    {
      throw SocketException(SocketError::AlreadyInUse, tuple.toString() + " is held by a " +
                                                         toString(other(protocol)) + " listener");
    }
    setFor(protocol).insert(tuple);
  }

  /// Returns false when \p tuple was not registered.
  bool remove(Protocol protocol, const Endpoint &tuple)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return setFor(protocol).erase(tuple) != 0;
  }

  bool contains(Protocol protocol, const Endpoint &tuple) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return setFor(protocol).count(tuple) != 0;
  }

  std::size_t size(Protocol protocol) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return setFor(protocol).size();
  }

  PortRange range(Protocol protocol) const { return protocol == Protocol::Tcp ? _tcpRange : _udpRange; }

  /// \brief Ports of the configured range not registered for \p protocol at
  /// \p address, ascending.
  /// \throws SocketException InvalidArgument for a malformed address,
  /// ResourceExhausted when nothing is left.
  std::vector<std::uint16_t> availablePorts(Protocol protocol, const std::string &address) const
  {
    if (!IPv4::isValid(address))
    {
      throw SocketException(SocketError::InvalidArgument,
                            "'" + address + "' is not a dotted-quad IPv4 address");
    }

    PortRange r = range(protocol);
    std::vector<std::uint16_t> ports;
    ports.reserve(static_cast<std::size_t>(r.last - r.first) + 1);
    {
      std::lock_guard<std::mutex> lock(_mutex);
      const auto &taken = setFor(protocol);
      for (std::uint32_t port = r.first; port <= r.last; ++port)
      {
        if (taken.count(Endpoint{address, static_cast<std::uint16_t>(port)}) == 0)
        {
          ports.push_back(static_cast<std::uint16_t>(port));
        }
      }
    }

    if (ports.empty())
    {
      throw SocketException(SocketError::ResourceExhausted,
                            std::string("no free ") + toString(protocol) + " ports at " + address);
    }
    return ports;
  }

private:
  static Protocol other(Protocol protocol)
  {
    return protocol == Protocol::Tcp ? Protocol::Udp : Protocol::Tcp;
  }

  static void validateRange(const PortRange &r, Protocol protocol)
  {
    if (r.first == 0 || r.first > r.last)
    {
      throw SocketException(SocketError::InvalidArgument,
                            std::string("invalid ") + toString(protocol) + " port range " +
                              std::to_string(r.first) + "-" + std::to_string(r.last));
    }
  }

  std::set<Endpoint> &setFor(Protocol protocol) { return protocol == Protocol::Tcp ? _tcp : _udp; }
  const std::set<Endpoint> &setFor(Protocol protocol) const
  {
    return protocol == Protocol::Tcp ? _tcp : _udp;
  }

  const PortRange _tcpRange;
  const PortRange _udpRange;
  mutable std::mutex _mutex;
  std::set<Endpoint> _tcp;
  std::set<Endpoint> _udp;
};

} // namespace net
} // namespace sandsock
