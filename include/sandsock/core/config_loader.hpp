// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <sandsock/parsers/toml.hpp>

namespace sandsock
{
namespace core
{
/// \brief Loads a TOML configuration file and serves typed lookups by
/// dotted key.
class ConfigLoader
{
public:
  /// \brief Loads \p filename; throws std::runtime_error when it cannot be
  /// read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { reload(); }

  /// \brief Builds a loader over an already parsed table.
  explicit ConfigLoader(parsers::toml::table table) : _table(std::move(table)) {}

  static ConfigLoader fromString(const std::string &text)
  {
    return ConfigLoader(parsers::toml::parse(text));
  }

  /// \brief Re-reads the file. On failure the previous table is kept and the
  /// error is rethrown.
  void reload()
  {
    if (_filename.empty())
    {
      throw std::runtime_error("ConfigLoader: no file to reload");
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const std::exception &e)
    {
      throw std::runtime_error("Failed to load configuration file " + _filename + ": " + e.what());
    }
  }

  const parsers::toml::table &table() const { return _table; }

  const std::string &filename() const { return _filename; }

  /// \brief Gets a typed value; std::nullopt when absent or of another type.
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Like getInt(), but rejects values outside [\p min, \p max].
  std::optional<int64_t> getIntInRange(const std::string &key, int64_t min, int64_t max) const
  {
    auto value = getInt(key);
    if (value && (*value < min || *value > max))
    {
      throw std::runtime_error("ConfigLoader: '" + key + "' = " + std::to_string(*value) +
                               " is outside [" + std::to_string(min) + ", " +
                               std::to_string(max) + "]");
    }
    return value;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace sandsock
