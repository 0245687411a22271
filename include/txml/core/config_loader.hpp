// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <txml/parsers/minimal_toml.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace txml
{
namespace core
{
/// \brief Loads and parses TOML configuration files for the command line tool.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Reloads the configuration from disk. On failure the previous table is kept and the
  /// reason is available from lastError().
  bool reload()
  {
    try
    {
      _table = parsers::toml::parseFile(_filename);
      _loaded = true;
      _lastError.clear();
      return true;
    }
    catch (const std::runtime_error &e)
    {
      _lastError = e.what();
      return false;
    }
  }

  const parsers::toml::Table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + ": " +
                               _lastError);
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string &lastError() const { return _lastError; }

  const std::string &filename() const { return _filename; }

  /// \brief Gets the full configuration table.
  const parsers::toml::Table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T std::int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.atPath(dottedKey);
    if (node && node.isValue())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<std::int64_t> getInt(const std::string &key) const { return get<std::int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \return std::nullopt if the key is missing or not an array.
  /// \throws std::runtime_error if any element is not a string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.atPath(key);
    const parsers::toml::Array *arr = node.asArray();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::Table _table;
  bool _loaded{false};
  std::string _lastError;
};

} // namespace core
} // namespace txml
