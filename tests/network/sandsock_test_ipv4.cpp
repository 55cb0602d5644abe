// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <cerrno>
#include <sstream>

using sandsock::net::Endpoint;
using sandsock::net::IPv4;

TEST_CASE("IPv4 parses dotted quads", "[ipv4][parse]")
{
  std::uint32_t value = 0;

  REQUIRE(IPv4::parse("127.0.0.1", value));
  CHECK(value == 0x7F000001u);

  REQUIRE(IPv4::parse("255.255.255.255", value));
  CHECK(value == 0xFFFFFFFFu);

  REQUIRE(IPv4::parse("0.0.0.0", value));
  CHECK(value == 0u);

  REQUIRE(IPv4::parse("10.20.30.40", value));
  CHECK(IPv4::toString(value) == "10.20.30.40");
}

TEST_CASE("IPv4 rejects malformed addresses", "[ipv4][parse]")
{
  std::uint32_t value = 42;
  for (const char *bad : {"", "1.2.3", "1.2.3.4.5", "256.0.0.1", "1.2.3.04", "01.2.3.4", "1..2.3",
                          "1.2.3.4 ", " 1.2.3.4", "a.b.c.d", "1.2.3.-4", "localhost", "::1"})
  {
    INFO("address: '" << bad << "'");
    CHECK_FALSE(IPv4::parse(bad, value));
    CHECK_FALSE(IPv4::isValid(bad));
  }
  CHECK(value == 42u);
}

TEST_CASE("Endpoints compare by address then port", "[ipv4][endpoint]")
{
  Endpoint a{"10.0.0.1", 80};
  Endpoint b{"10.0.0.1", 81};
  Endpoint c{"10.0.0.2", 1};

  CHECK(a == Endpoint{"10.0.0.1", 80});
  CHECK(a != b);
  CHECK(a < b);
  CHECK(b < c);
  CHECK_FALSE(c < a);
  CHECK(a.toString() == "10.0.0.1:80");

  std::ostringstream oss;
  oss << c;
  CHECK(oss.str() == "10.0.0.2:1");
}

TEST_CASE("SocketException carries its code and errno", "[ipv4][errors]")
{
  using sandsock::net::SocketError;
  using sandsock::net::SocketException;

  SocketException plain(SocketError::Timeout, "connect timed out");
  CHECK(plain.code() == SocketError::Timeout);
  CHECK(plain.getErrno() == 0);
  CHECK(std::string(plain.what()) == "Timeout: connect timed out");
  CHECK_FALSE(plain.isPortConflict());

  SocketException withErrno(SocketError::AlreadyInUse, "bind 10.0.0.1:5000", EADDRINUSE);
  CHECK(withErrno.getErrno() == EADDRINUSE);
  CHECK(std::string(withErrno.what()).find("AlreadyInUse: bind 10.0.0.1:5000 (") == 0);
  CHECK(withErrno.isPortConflict());

  CHECK(SocketException(SocketError::DuplicateBinding, "").isPortConflict());
  CHECK(SocketException(SocketError::CleanupInProgress, "").isPortConflict());
  CHECK_FALSE(SocketException(SocketError::Transport, "").isPortConflict());
}
