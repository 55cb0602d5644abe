// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <string>

namespace sandsock
{
namespace net
{

/// \brief Dotted-quad IPv4 parsing.
class IPv4
{
public:
  /// \brief Parse "a.b.c.d" into a host-order integer.
  /// \note Rejects leading zeros ("01") so no octet can be read as octal.
  static bool parse(const std::string &ip, std::uint32_t &result)
  {
    std::uint32_t value = 0;
    std::size_t pos = 0;

    for (int octetIndex = 0; octetIndex < 4; ++octetIndex)
    {
      if (octetIndex > 0)
      {
        if (pos >= ip.size() || ip[pos] != '.')
        {
          return false;
        }
        ++pos;
      }

      std::size_t start = pos;
      std::uint32_t octet = 0;
      while (pos < ip.size() && std::isdigit(static_cast<unsigned char>(ip[pos])))
      {
        octet = octet * 10 + static_cast<std::uint32_t>(ip[pos] - '0');
        if (octet > 255)
        {
          return false;
        }
        ++pos;
      }

      std::size_t length = pos - start;
      if (length == 0 || (length > 1 && ip[start] == '0'))
      {
        return false;
      }
      value = (value << 8) | octet;
    }

    if (pos != ip.size())
    {
      return false;
    }
    result = value;
    return true;
  }

  static bool isValid(const std::string &ip)
  {
    std::uint32_t ignored = 0;
    return parse(ip, ignored);
  }

  static std::string toString(std::uint32_t ip)
  {
    return std::to_string((ip >> 24) & 0xFF) + "." + std::to_string((ip >> 16) & 0xFF) + "." +
           std::to_string((ip >> 8) & 0xFF) + "." + std::to_string(ip & 0xFF);
  }
};

} // namespace net
} // namespace sandsock
