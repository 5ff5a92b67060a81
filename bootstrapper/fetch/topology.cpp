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

#include "bootstrapper/fetch/topology.hpp"

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

namespace fbs::fetch {

Topology
Topology::parse(const std::string& json)
{
  boost::property_tree::ptree root;
  std::istringstream input(json);
  try {
    boost::property_tree::read_json(input, root);
  }
  catch (const boost::property_tree::json_parser_error& e) {
    NDN_THROW(Error("Malformed topology JSON at line " + to_string(e.line()) + ": " + e.message()));
  }

  // property_tree represents arrays as children with empty keys
  if (root.empty() || root.begin()->first.empty()) {
    NDN_THROW(Error("Topology document must be a JSON object"));
  }

  Topology topology;
  topology.m_isdAs = root.get<std::string>("isd_as", "");
  if (topology.m_isdAs.empty()) {
    NDN_THROW(Error("Topology document lacks 'isd_as'"));
  }

  auto borderRouters = root.get_child_optional("border_routers");
  if (borderRouters) {
    topology.m_nBorderRouters = borderRouters->size();
  }
  return topology;
}

} // namespace fbs::fetch
