// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstring>
#include <exception>
#include <string>

namespace sandsock
{
namespace net
{

enum class SocketError
{
  InvalidArgument,
  ResourceExhausted,
  Timeout,
  CleanupInProgress,
  AlreadyInUse,
  DuplicateBinding,
  WouldBlock,
  ConnectionClosed,
  Transport
};

inline const char *toString(SocketError code)
{
  switch (code)
  {
  case SocketError::InvalidArgument:
    return "InvalidArgument";
  case SocketError::ResourceExhausted:
    return "ResourceExhausted";
  case SocketError::Timeout:
    return "Timeout";
  case SocketError::CleanupInProgress:
    return "CleanupInProgress";
  case SocketError::AlreadyInUse:
    return "AlreadyInUse";
  case SocketError::DuplicateBinding:
    return "DuplicateBinding";
  case SocketError::WouldBlock:
    return "WouldBlock";
  case SocketError::ConnectionClosed:
    return "ConnectionClosed";
  case SocketError::Transport:
    return "Transport";
  }
  return "Unknown";
}

/// \brief Every failure raised by the socket layer and its transports.
class SocketException : public std::exception
{
public:
  SocketException(SocketError code, const std::string &msg, int errnoVal = 0)
      : _code(code), _errno(errnoVal), _message(std::string(toString(code)) + ": " + msg)
  {
    if (errnoVal != 0)
    {
      _message += " (" + std::string(std::strerror(errnoVal)) + ")";
    }
  }

  SocketError code() const { return _code; }
  int getErrno() const { return _errno; }
  const char *what() const noexcept override { return _message.c_str(); }

  /// True for the three conditions that justify trying another local port.
  bool isPortConflict() const
  {
    return _code == SocketError::AlreadyInUse || _code == SocketError::DuplicateBinding ||
           _code == SocketError::CleanupInProgress;
  }

private:
  SocketError _code;
  int _errno;
  std::string _message;
};

} // namespace net
} // namespace sandsock
