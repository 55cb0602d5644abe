// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <set>
#include <thread>

using namespace sandsock::test;
using sandsock::net::ConnectionEstablisher;
using sandsock::net::ConnectOptions;
using sandsock::net::ConnectorSettings;
using sandsock::net::PortRange;
using sandsock::net::PortRegistry;
using sandsock::net::Protocol;

namespace
{
struct ConnectorFixture
{
  explicit ConnectorFixture(PortRange tcp = PortRange{5000, 5002},
                            const ConnectorSettings &settings = {})
      : transport(std::make_shared<FakeTransport>()), env(std::make_shared<FakeEnvironment>()),
        registry(std::make_shared<PortRegistry>(tcp, PortRange{6000, 6002})),
        connector(transport, env, registry, settings)
  {
    initializeTestLogging();
  }

  std::shared_ptr<FakeTransport> transport;
  std::shared_ptr<FakeEnvironment> env;
  std::shared_ptr<PortRegistry> registry;
  ConnectionEstablisher connector;
};

ConnectOptions pinned(std::uint16_t port, std::chrono::milliseconds timeout = 60000ms)
{
  ConnectOptions options;
  options.localPort = port;
  options.timeout = timeout;
  return options;
}

SocketError codeOf(const std::function<void()> &fn)
{
  try
  {
    fn();
  }
  catch (const SocketException &e)
  {
    return e.code();
  }
  FAIL("expected SocketException");
  return SocketError::Transport;
}
} // namespace

TEST_CASE("connect rotates to the next free port on a conflict", "[connector][rotation]")
{
  ConnectorFixture f;
  f.transport->pushConnectError(SocketError::AlreadyInUse);

  auto socket = f.connector.connect("10.0.0.5", 80);

  REQUIRE(socket);
  CHECK(socket->getLocalEndpoint() == Endpoint{"10.0.0.1", 5001});
  CHECK(socket->getRemoteEndpoint() == Endpoint{"10.0.0.5", 80});

  auto attempts = f.transport->attempts();
  REQUIRE(attempts.size() == 2);
  CHECK(attempts[0].local == Endpoint{"10.0.0.1", 5000});
  CHECK(attempts[1].local == Endpoint{"10.0.0.1", 5001});
  CHECK(attempts[0].timeout == 60000ms);

  CHECK(f.registry->size(Protocol::Tcp) == 0);
  CHECK(f.registry->size(Protocol::Udp) == 0);
  CHECK(f.env->sleeps().empty());
}

TEST_CASE("Duplicate bindings and cleanup both rotate in auto-port mode", "[connector][rotation]")
{
  ConnectorFixture f;
  f.transport->pushConnectError(SocketError::DuplicateBinding);
  f.transport->pushConnectError(SocketError::CleanupInProgress);

  auto socket = f.connector.connect("10.0.0.5", 80);
  CHECK(socket->getLocalEndpoint().port == 5002);
  CHECK(f.transport->attempts().size() == 3);
  CHECK(f.env->sleeps().empty());
}

TEST_CASE("Auto-port candidates skip listener tuples and self-loops", "[connector][candidates]")
{
  ConnectorFixture f;

  SECTION("Registered listener ports are not used")
  {
    f.registry->add(Protocol::Tcp, Endpoint{"10.0.0.1", 5000});
    auto socket = f.connector.connect("10.0.0.5", 80);
    CHECK(socket->getLocalEndpoint().port == 5001);
  }

  SECTION("A local tuple equal to the remote endpoint is skipped")
  {
    auto socket = f.connector.connect("10.0.0.1", 5000);
    CHECK(socket->getLocalEndpoint().port == 5001);
    CHECK(f.transport->attempts().size() == 1);
  }

  SECTION("Only the self-loop candidate left")
  {
    f.registry->add(Protocol::Tcp, Endpoint{"10.0.0.1", 5001});
    f.registry->add(Protocol::Tcp, Endpoint{"10.0.0.1", 5002});
    CHECK(codeOf([&]() { f.connector.connect("10.0.0.1", 5000); }) ==
          SocketError::ResourceExhausted);
    CHECK(f.transport->attempts().empty());
  }
}

TEST_CASE("Every candidate conflicting exhausts the range", "[connector][exhaustion]")
{
  ConnectorFixture f;
  LogCapture logs;
  for (int i = 0; i < 3; ++i)
  {
    f.transport->pushConnectError(SocketError::AlreadyInUse);
  }

  try
  {
    f.connector.connect("10.0.0.5", 80);
    FAIL("expected ResourceExhausted");
  }
  catch (const SocketException &e)
  {
    CHECK(e.code() == SocketError::ResourceExhausted);
    CHECK(std::string(e.what()).find("AlreadyInUse") != std::string::npos);
  }
  CHECK(f.transport->attempts().size() == 3);
  CHECK(logs.contains("every local port at 10.0.0.1 conflicted"));
}

TEST_CASE("A pinned port surfaces hard conflicts", "[connector][pinned]")
{
  ConnectorFixture f;
  f.transport->pushConnectError(SocketError::AlreadyInUse);
  CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80, pinned(7000)); }) ==
        SocketError::AlreadyInUse);
  CHECK(f.transport->attempts().size() == 1);

  auto socket = f.connector.connect("10.0.0.5", 80, pinned(7000));
  CHECK(socket->getLocalEndpoint() == Endpoint{"10.0.0.1", 7000});
}

TEST_CASE("Cleanup in progress is retried until the deadline", "[connector][cleanup]")
{
  ConnectorFixture f;

  SECTION("Retries with backoff, then reports cleanup")
  {
    for (int i = 0; i < 10; ++i)
    {
      f.transport->pushConnectError(SocketError::CleanupInProgress);
    }
    auto before = f.env->now();
    CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80, pinned(7000, 1000ms)); }) ==
          SocketError::CleanupInProgress);
    CHECK(f.env->now() - before == 1000ms);
    CHECK(f.env->sleeps() == std::vector<std::chrono::milliseconds>{200ms, 200ms, 200ms, 200ms,
                                                                     200ms});

    auto attempts = f.transport->attempts();
    REQUIRE(attempts.size() == 5);
    CHECK(attempts[0].timeout == 1000ms);
    CHECK(attempts[4].timeout == 200ms);
  }

  SECTION("Gives up once less than the threshold remains")
  {
    for (int i = 0; i < 10; ++i)
    {
      f.transport->pushConnectError(SocketError::CleanupInProgress);
    }
    CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80, pinned(7000, 215ms)); }) ==
          SocketError::CleanupInProgress);
    CHECK(f.transport->attempts().size() == 1);
    CHECK(f.env->sleeps() == std::vector<std::chrono::milliseconds>{200ms});
  }

  SECTION("Succeeds once the tuple is released")
  {
    f.transport->pushConnectError(SocketError::CleanupInProgress);
    auto socket = f.connector.connect("10.0.0.5", 80, pinned(7000));
    CHECK(socket->getLocalEndpoint().port == 7000);
    CHECK(f.env->sleeps() == std::vector<std::chrono::milliseconds>{200ms});
    CHECK(f.transport->attempts()[1].timeout == 59800ms);
  }

  SECTION("Auto-port retries the last candidate while it is cleaned up")
  {
    for (int i = 0; i < 4; ++i)
    {
      f.transport->pushConnectError(SocketError::CleanupInProgress);
    }
    auto socket = f.connector.connect("10.0.0.5", 80);
    CHECK(socket->getLocalEndpoint().port == 5002);
    CHECK(f.env->sleeps().size() == 2);
    CHECK(f.transport->attempts().size() == 5);
  }
}

TEST_CASE("Backoff and threshold come from the settings", "[connector][cleanup]")
{
  ConnectorSettings settings;
  settings.cleanupBackoff = 50ms;
  settings.cleanupThreshold = 100ms;
  settings.defaultTimeout = 400ms;
  ConnectorFixture f(PortRange{5000, 5002}, settings);
  for (int i = 0; i < 20; ++i)
  {
    f.transport->pushConnectError(SocketError::CleanupInProgress);
  }

  ConnectOptions options;
  options.localPort = 7000;
  CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80, options); }) ==
        SocketError::CleanupInProgress);
  // 400, 350, 300, 250, 200, 150 remaining at each attempt; 100 is at the threshold.
  CHECK(f.transport->attempts().size() == 6);
  CHECK(f.env->totalSlept() == 300ms);
}

TEST_CASE("Non-conflict errors propagate immediately", "[connector][errors]")
{
  ConnectorFixture f;
  f.transport->pushConnectError(SocketError::Transport);
  CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80); }) == SocketError::Transport);

  f.transport->pushConnectError(SocketError::Timeout);
  CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80); }) == SocketError::Timeout);

  CHECK(f.transport->attempts().size() == 2);
}

TEST_CASE("connect validates its arguments", "[connector][validation]")
{
  ConnectorFixture f;

  CHECK(codeOf([&]() { f.connector.connect("", 80); }) == SocketError::InvalidArgument);
  CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 0); }) == SocketError::InvalidArgument);
  CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80, pinned(0)); }) ==
        SocketError::InvalidArgument);
  CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80, pinned(7000, 0ms)); }) ==
        SocketError::InvalidArgument);

  ConnectOptions badAddress;
  badAddress.localAddress = "10.0.0";
  CHECK(codeOf([&]() { f.connector.connect("10.0.0.5", 80, badAddress); }) ==
        SocketError::InvalidArgument);

  CHECK(codeOf([&]() { f.connector.connect("unknown.host", 80); }) == SocketError::Transport);
  CHECK(f.transport->attempts().empty());
}

TEST_CASE("connect resolves host names and honours the local address", "[connector][resolve]")
{
  ConnectorFixture f;
  f.env->addHost("server.test", "10.0.0.5");

  ConnectOptions options;
  options.localAddress = "192.168.0.7";
  auto socket = f.connector.connect("server.test", 443, options);

  CHECK(socket->getRemoteEndpoint() == Endpoint{"10.0.0.5", 443});
  CHECK(socket->getLocalEndpoint() == Endpoint{"192.168.0.7", 5000});
}

TEST_CASE("Sockets get the configured socket options", "[connector][options]")
{
  ConnectorSettings settings;
  settings.socketOptions.timeout = 0ms;
  settings.socketOptions.pollInterval = 7ms;
  ConnectorFixture f(PortRange{5000, 5002}, settings);

  auto socket = f.connector.connect("10.0.0.5", 80);
  CHECK(socket->getTimeout() == 0ms);
  CHECK(socket->getPollInterval() == 7ms);
  CHECK(codeOf([&]() { socket->receive(1); }) == SocketError::WouldBlock);
}

TEST_CASE("A closed connection frees its local port", "[connector][lifecycle]")
{
  ConnectorFixture f;
  auto first = f.connector.connect("10.0.0.5", 80);
  auto second = f.connector.connect("10.0.0.5", 80);
  CHECK(first->getLocalEndpoint().port == 5000);
  CHECK(second->getLocalEndpoint().port == 5001);

  first->close();
  auto third = f.connector.connect("10.0.0.5", 80);
  CHECK(third->getLocalEndpoint().port == 5000);
}

TEST_CASE("Concurrent auto-port connects get distinct local ports", "[connector][concurrency]")
{
  ConnectorFixture f(PortRange{5000, 5019});
  constexpr int kThreads = 8;
  std::vector<std::shared_ptr<sandsock::net::Socket>> sockets(kThreads);
  std::vector<std::thread> threads;

  for (int i = 0; i < kThreads; ++i)
  {
    threads.emplace_back([&, i]() { sockets[static_cast<std::size_t>(i)] =
                                      f.connector.connect("10.0.0.5", 80); });
  }
  for (auto &t : threads)
  {
    t.join();
  }

  std::set<std::uint16_t> ports;
  for (const auto &socket : sockets)
  {
    REQUIRE(socket);
    ports.insert(socket->getLocalEndpoint().port);
  }
  CHECK(ports.size() == static_cast<std::size_t>(kThreads));
}
