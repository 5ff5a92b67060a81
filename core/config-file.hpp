/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2024-2025,  The fabric-bootstrapper authors.
 *
 * This file is part of fabric-bootstrapper (FBS).
 * See AUTHORS.md for complete list of FBS authors and contributors.
 *
 * FBS is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later version.
 *
 * FBS is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
 * without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
 * PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along with
 * FBS, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef FBS_CORE_CONFIG_FILE_HPP
#define FBS_CORE_CONFIG_FILE_HPP

#include "core/common.hpp"

#include <boost/property_tree/ptree.hpp>

#include <iosfwd>
#include <map>
#include <type_traits>

namespace fbs {

/// A top-level section of the configuration file.
using ConfigSection = boost::property_tree::ptree;

/// A single `key value` line inside a section.
using ConfigOption = ConfigSection::value_type;

/**
 * \brief Validates a section and, unless \p isDryRun, applies it.
 * \throw ConfigFile::Error the section is invalid
 */
using ConfigSectionHandler = std::function<void(const ConfigSection& section, bool isDryRun)>;

/**
 * \brief The bootstrapper configuration file, in Boost INFO format.
 *
 * Each top-level section is handed to the handler registered under its name; a section
 * nobody registered for is an error. Handlers report problems with the offending option
 * only: ConfigFile prefixes every handler error with the origin and the section name.
 */
class ConfigFile : noncopyable
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  void
  addSectionHandler(const std::string& sectionName, ConfigSectionHandler handler);

  /** \brief Read \p filename, run every handler as a dry run, then run them for real.
   *
   *  Nothing is applied unless the whole file passes the dry run.
   *  \throw Error the file cannot be read, is malformed, or a section is rejected
   */
  void
  load(const std::string& filename);

  /** \brief Run the handlers once over \p input.
   *  \param origin names the input in error messages
   *  \throw Error \p input is malformed or a section is rejected
   */
  void
  parse(const std::string& input, bool isDryRun, const std::string& origin);

public: // option parsers
  /** \retval true the value is "yes"
   *  \retval false the value is "no"
   *  \throw Error anything else
   */
  static bool
  parseYesNo(const ConfigOption& option);

  /** \brief Parse the value of \p option as a \p T.
   *  \throw Error not a \p T, or a negative value for an unsigned \p T
   */
  template<typename T>
  static T
  parseNumber(const ConfigOption& option)
  {
    static_assert(std::is_arithmetic_v<T>);

    const auto& text = option.second.data();
    auto value = option.second.get_value_optional<T>();
    // property_tree wraps negative input into unsigned types
    if (!value || (std::is_unsigned_v<T> && text.find('-') != std::string::npos)) {
      NDN_THROW(Error("Invalid value '" + text + "' for option '" + option.first + "'"));
    }
    return *value;
  }

  /** \brief Parse the value of \p option as a \p T within [\p min, \p max].
   *  \throw Error not a \p T, or out of range
   */
  template<typename T>
  static T
  parseNumber(const ConfigOption& option, T min, T max)
  {
    static_assert(std::is_integral_v<T>);

    auto value = parseNumber<T>(option);
    if (value < min || value > max) {
      NDN_THROW(Error("Value " + to_string(value) + " of option '" + option.first +
                      "' is outside [" + to_string(min) + ", " + to_string(max) + "]"));
    }
    return value;
  }

private:
  void
  dispatch(const ConfigSection& tree, bool isDryRun, const std::string& origin) const;

private:
  std::map<std::string, ConfigSectionHandler> m_handlers;
};

} // namespace fbs

#endif // FBS_CORE_CONFIG_FILE_HPP
