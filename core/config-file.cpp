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

#include "core/config-file.hpp"

#include <boost/property_tree/info_parser.hpp>

#include <fstream>
#include <sstream>

namespace fbs {

static ConfigSection
readTree(std::istream& input, const std::string& origin)
{
  ConfigSection tree;
  try {
    boost::property_tree::read_info(input, tree);
  }
  catch (const boost::property_tree::info_parser_error& e) {
    NDN_THROW(ConfigFile::Error(origin + ":" + to_string(e.line()) + ": " + e.message()));
  }
  return tree;
}

void
ConfigFile::addSectionHandler(const std::string& sectionName, ConfigSectionHandler handler)
{
  m_handlers[sectionName] = std::move(handler);
}

void
ConfigFile::load(const std::string& filename)
{
  std::ifstream file(filename);
  if (!file) {
    NDN_THROW(Error("Cannot open configuration file " + filename));
  }
  auto tree = readTree(file, filename);

  dispatch(tree, true, filename);
  dispatch(tree, false, filename);
}

void
ConfigFile::parse(const std::string& input, bool isDryRun, const std::string& origin)
{
  std::istringstream is(input);
  dispatch(readTree(is, origin), isDryRun, origin);
}

bool
ConfigFile::parseYesNo(const ConfigOption& option)
{
  const auto& value = option.second.data();
  if (value == "yes") {
    return true;
  }
  if (value == "no") {
    return false;
  }
  NDN_THROW(Error("Option '" + option.first + "' expects yes or no, not '" + value + "'"));
}

void
ConfigFile::dispatch(const ConfigSection& tree, bool isDryRun, const std::string& origin) const
{
  for (const auto& [name, section] : tree) {
    auto handler = m_handlers.find(name);
    if (handler == m_handlers.end()) {
      NDN_THROW(Error(origin + ": unknown section '" + name + "'"));
    }

    try {
      handler->second(section, isDryRun);
    }
    catch (const Error& e) {
      NDN_THROW_NESTED(Error(origin + ": section '" + name + "': " + e.what()));
    }
  }
}

} // namespace fbs
