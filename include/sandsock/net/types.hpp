// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

namespace sandsock
{
namespace net
{

using ByteBuffer = std::vector<std::uint8_t>;
using MonoClock = std::chrono::steady_clock;
using MonoTime = MonoClock::time_point;

enum class Protocol
{
  Tcp,
  Udp
};

inline const char *toString(Protocol protocol) { return protocol == Protocol::Tcp ? "TCP" : "UDP"; }

/// \brief An (address, port) pair; the address is a dotted-quad IPv4 string.
struct Endpoint
{
  std::string address;
  std::uint16_t port{0};

  std::string toString() const { return address + ":" + std::to_string(port); }

  bool operator==(const Endpoint &other) const
  {
    return port == other.port && address == other.address;
  }
  bool operator!=(const Endpoint &other) const { return !(*this == other); }
  bool operator<(const Endpoint &other) const
  {
    return std::tie(address, port) < std::tie(other.address, other.port);
  }
};

inline std::ostream &operator<<(std::ostream &os, const Endpoint &endpoint)
{
  return os << endpoint.toString();
}

inline ByteBuffer toBytes(const std::string &text) { return ByteBuffer(text.begin(), text.end()); }

inline std::string toString(const ByteBuffer &bytes) { return std::string(bytes.begin(), bytes.end()); }

} // namespace net
} // namespace sandsock
