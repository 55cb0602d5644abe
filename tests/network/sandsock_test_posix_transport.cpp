// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <future>
#include <thread>

using namespace sandsock::test;
using sandsock::SocketLayer;
using sandsock::core::ThreadPool;
using sandsock::net::ListenerOptions;
using sandsock::net::PosixTransport;
using sandsock::net::Socket;
using sandsock::net::SystemEnvironment;
using sandsock::net::toBytes;
using sandsock::net::toString;

namespace
{
SocketLayer::Config loopbackConfig()
{
  SocketLayer::Config config;
  config.localAddress = "127.0.0.1";
  config.ports.tcpFirst = 47000;
  config.ports.tcpLast = 47019;
  config.ports.udpFirst = 47100;
  config.ports.udpLast = 47119;
  config.listener.pollInterval = 5ms;
  config.connect.timeout = 2000ms;
  return config;
}

ListenerOptions pooled(std::shared_ptr<ThreadPool> &pool)
{
  pool = std::make_shared<ThreadPool>(1, 2, std::chrono::seconds(1), 16);
  ListenerOptions options;
  options.threadPool = pool;
  return options;
}

/// Reads until \p size bytes arrived, each wait bounded by the socket timeout.
std::string readExactly(Socket &socket, std::size_t size)
{
  std::string out;
  while (out.size() < size)
  {
    out += toString(socket.receive(size - out.size()));
  }
  return out;
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

TEST_CASE("TCP echo over loopback", "[posix][tcp]")
{
  initializeTestLogging();
  auto layer = SocketLayer::createDefault(loopbackConfig());
  std::shared_ptr<ThreadPool> pool;

  auto handle = layer->listenForConnection(
    "127.0.0.1", 47010,
    [](std::shared_ptr<Socket> socket)
    {
      socket->setTimeout(std::chrono::seconds(2));
      std::string request = readExactly(*socket, 4);
      socket->sendAll(toBytes(request + "-pong"));
    },
    pooled(pool));

  auto client = layer->openConnection("127.0.0.1", 47010);
  // Earlier runs may leave low ports in TIME_WAIT, which rotation skips.
  CHECK(client->getLocalEndpoint().address == "127.0.0.1");
  CHECK(client->getLocalEndpoint().port >= 47000);
  CHECK(client->getLocalEndpoint().port < 47010);
  CHECK(client->getRemoteEndpoint() == Endpoint{"127.0.0.1", 47010});

  client->setTimeout(std::chrono::seconds(5));
  CHECK(client->sendAll(toBytes("ping")) == 4);
  CHECK(readExactly(*client, 9) == "ping-pong");

  client->close();
  handle.stop();
  CHECK(pool->isShutdown());
}

TEST_CASE("A peer close ends receiveAll early", "[posix][tcp]")
{
  auto layer = SocketLayer::createDefault(loopbackConfig());
  std::shared_ptr<ThreadPool> pool;
  auto handle = layer->listenForConnection(
    "127.0.0.1", 47011,
    [](std::shared_ptr<Socket> socket)
    {
      socket->sendAll(toBytes("bye"));
      socket->close();
    },
    pooled(pool));

  auto client = layer->openConnection("127.0.0.1", 47011);
  ByteBuffer got;
  REQUIRE_NOTHROW(got = client->receiveAll(100));
  CHECK(toString(got) == "bye");

  handle.stop();
}

TEST_CASE("Non-blocking receive on an idle connection", "[posix][tcp]")
{
  auto layer = SocketLayer::createDefault(loopbackConfig());
  std::shared_ptr<ThreadPool> pool;
  std::promise<void> done;
  auto doneFuture = done.get_future().share();

  auto handle = layer->listenForConnection(
    "127.0.0.1", 47012,
    [doneFuture](std::shared_ptr<Socket>) { doneFuture.wait_for(std::chrono::seconds(2)); },
    pooled(pool));

  auto client = layer->openConnection("127.0.0.1", 47012);
  client->setTimeout(0ms);
  CHECK(codeOf([&]() { client->receive(8); }) == SocketError::WouldBlock);

  client->setTimeout(50ms);
  auto start = std::chrono::steady_clock::now();
  CHECK(codeOf([&]() { client->receive(8); }) == SocketError::Timeout);
  CHECK(std::chrono::steady_clock::now() - start >= 50ms);

  done.set_value();
  handle.stop();
}

TEST_CASE("Binding conflicts map to the conflict codes", "[posix][conflict]")
{
  auto layer = SocketLayer::createDefault(loopbackConfig());
  auto handle = layer->listenForConnection("127.0.0.1", 47013, [](std::shared_ptr<Socket>) {});

  SECTION("Pinned local port held by a listener")
  {
    sandsock::net::ConnectOptions options;
    options.localPort = 47013;
    CHECK(codeOf([&]() { layer->openConnection("127.0.0.1", 47010, options); }) ==
          SocketError::AlreadyInUse);
  }

  SECTION("Second raw listener on the same tuple")
  {
    PosixTransport transport;
    CHECK(codeOf([&]() { transport.listen(Endpoint{"127.0.0.1", 47013}); }) ==
          SocketError::AlreadyInUse);
  }

  SECTION("Second registration through the layer")
  {
    CHECK(codeOf([&]() {
            layer->listenForConnection("127.0.0.1", 47013, [](std::shared_ptr<Socket>) {});
          }) == SocketError::DuplicateBinding);
  }

  handle.stop();
}

TEST_CASE("Refused connections are transport errors", "[posix][errors]")
{
  auto layer = SocketLayer::createDefault(loopbackConfig());
  CHECK(codeOf([&]() { layer->openConnection("127.0.0.1", 47019); }) == SocketError::Transport);
}

TEST_CASE("UDP datagram over loopback", "[posix][udp]")
{
  auto layer = SocketLayer::createDefault(loopbackConfig());
  std::shared_ptr<ThreadPool> pool;
  auto received = std::make_shared<std::promise<std::pair<Endpoint, std::string>>>();

  auto handle = layer->listenForMessage(
    "127.0.0.1", 47110,
    [received](const Endpoint &remote, const ByteBuffer &payload)
    { received->set_value({remote, toString(payload)}); },
    pooled(pool));

  CHECK(layer->sendMessage("127.0.0.1", 47110, toBytes("dgram")) == 5);

  auto future = received->get_future();
  REQUIRE(future.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  auto [remote, payload] = future.get();
  CHECK(payload == "dgram");
  CHECK(remote.address == "127.0.0.1");
  CHECK(remote.port >= 47100);
  CHECK(remote.port <= 47119);
  CHECK(remote.port != 47110);

  handle.stop();
}

TEST_CASE("SystemEnvironment services", "[posix][environment]")
{
  SECTION("Literal addresses resolve to themselves")
  {
    SystemEnvironment env;
    CHECK(env.resolve("192.0.2.7") == "192.0.2.7");
  }

  SECTION("The configured local address wins")
  {
    SystemEnvironment env(4, std::string("127.0.0.1"));
    CHECK(env.localAddress() == "127.0.0.1");
  }

  SECTION("Without one the local address is a dotted quad")
  {
    SystemEnvironment env;
    CHECK(sandsock::net::IPv4::isValid(env.localAddress()));
  }

  SECTION("Dispatch threads consume the event budget")
  {
    SystemEnvironment env(2);
    CHECK(env.freeEvents() == 2);

    auto release = std::make_shared<std::promise<void>>();
    auto running = std::make_shared<std::promise<void>>();
    auto releaseFuture = release->get_future().share();
    env.spawnThread(
      [running, releaseFuture]()
      {
        running->set_value();
        releaseFuture.wait();
      });
    running->get_future().wait();
    CHECK(env.freeEvents() == 1);

    release->set_value();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (env.freeEvents() != 2 && std::chrono::steady_clock::now() < deadline)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    CHECK(env.freeEvents() == 2);
  }

  SECTION("sleepFor waits on the real clock")
  {
    SystemEnvironment env;
    auto before = env.now();
    env.sleepFor(20ms);
    CHECK(env.now() - before >= 20ms);
  }
}

TEST_CASE("createDefault validates the local address", "[posix][config]")
{
  auto config = loopbackConfig();
  config.localAddress = "not-an-ip";
  CHECK(codeOf([&]() { SocketLayer::createDefault(config); }) == SocketError::InvalidArgument);
}
