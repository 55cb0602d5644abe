// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <sandsock/core/logger.hpp>
#include <sandsock/net/ipv4.hpp>
#include <sandsock/net/socket_error.hpp>
#include <sandsock/net/types.hpp>

namespace sandsock
{
namespace net
{

/// \brief Process services the socket layer consumes: clock, sleep, name
/// resolution and the event budget for ad-hoc dispatch threads.
class IEnvironment
{
public:
  virtual ~IEnvironment() = default;

  virtual MonoTime now() const = 0;
  virtual void sleepFor(std::chrono::milliseconds duration) = 0;

  /// Resolve \p host to a dotted-quad IPv4 address.
  /// \throws SocketException Transport when resolution fails.
  virtual std::string resolve(const std::string &host) = 0;

  /// Address used for local bindings when the caller supplies none.
  virtual std::string localAddress() = 0;

  /// Remaining concurrent event budget.
  virtual std::size_t freeEvents() const = 0;

  /// Run \p task on a fresh thread, consuming one event until it returns.
  virtual void spawnThread(std::function<void()> task) = 0;
};

/// \brief IEnvironment over the steady clock, getaddrinfo and detached
/// threads.
class SystemEnvironment : public IEnvironment
{
public:
  explicit SystemEnvironment(std::size_t eventLimit = 64,
                             std::optional<std::string> localAddress = std::nullopt)
      : _eventLimit(eventLimit), _outstanding(std::make_shared<std::atomic<std::size_t>>(0)),
        _localAddress(std::move(localAddress))
  {
  }

  MonoTime now() const override { return MonoClock::now(); }

  void sleepFor(std::chrono::milliseconds duration) override { std::this_thread::sleep_for(duration); }

  std::string resolve(const std::string &host) override
  {
    if (IPv4::isValid(host))
    {
      return host;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr)
    {
      throw SocketException(SocketError::Transport, "cannot resolve '" + host +
                                                      "': " + (rc != 0 ? ::gai_strerror(rc) : "no address"));
    }

    char buf[INET_ADDRSTRLEN] = {0};
    const auto *sin = reinterpret_cast<const sockaddr_in *>(res->ai_addr);
    const char *text = ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    ::freeaddrinfo(res);
    if (text == nullptr)
    {
      throw SocketException(SocketError::Transport, "inet_ntop failed for '" + host + "'", errno);
    }
    return std::string(text);
  }

  std::string localAddress() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_localAddress)
    {
      return *_localAddress;
    }

    char name[256] = {0};
    if (::gethostname(name, sizeof(name) - 1) == 0)
    {
      try
      {
        _localAddress = resolve(name);
        return *_localAddress;
      }
      catch (const SocketException &e)
      {
        SANDSOCK_LOG_WARN("Local host name does not resolve, using loopback: " << e.what());
      }
    }
    _localAddress = "127.0.0.1";
    return *_localAddress;
  }

  std::size_t freeEvents() const override
  {
    std::size_t used = _outstanding->load();
    return used >= _eventLimit ? 0 : _eventLimit - used;
  }

  void spawnThread(std::function<void()> task) override
  {
    auto outstanding = _outstanding;
    ++*outstanding;
    try
    {
      std::thread(
        [outstanding, task = std::move(task)]()
        {
          try
          {
            task();
          }
          catch (const std::exception &e)
          {
            SANDSOCK_LOG_ERROR("Dispatch thread terminated by exception: " << e.what());
          }
          catch (...)
          {
            SANDSOCK_LOG_ERROR("Dispatch thread terminated by a non-standard exception");
          }
          --*outstanding;
        })
        .detach();
    }
    catch (const std::system_error &e)
    {
      --*outstanding;
      throw SocketException(SocketError::ResourceExhausted,
                            std::string("cannot start dispatch thread: ") + e.what(), e.code().value());
    }
  }

private:
  const std::size_t _eventLimit;
  std::shared_ptr<std::atomic<std::size_t>> _outstanding;
  std::mutex _mutex;
  std::optional<std::string> _localAddress;
};

} // namespace net
} // namespace sandsock
