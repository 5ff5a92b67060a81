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

#include "tests/test-common.hpp"

namespace fbs::fetch::tests {

BOOST_AUTO_TEST_SUITE(Fetch)
BOOST_AUTO_TEST_SUITE(TestTopology)

BOOST_AUTO_TEST_CASE(Valid)
{
  auto topology = Topology::parse(R"JSON(
    {
      "isd_as": "1-ff00:0:110",
      "mtu": 1472,
      "border_routers": {
        "br1-ff00_0_110-1": {"internal_addr": "127.0.0.1:31002"},
        "br1-ff00_0_110-2": {"internal_addr": "127.0.0.1:31004"}
      }
    }
  )JSON");
  BOOST_CHECK_EQUAL(topology.getIsdAs(), "1-ff00:0:110");
  BOOST_CHECK_EQUAL(topology.getBorderRouterCount(), 2);

  topology = Topology::parse(R"JSON({"isd_as": "1-ff00:0:111"})JSON");
  BOOST_CHECK_EQUAL(topology.getIsdAs(), "1-ff00:0:111");
  BOOST_CHECK_EQUAL(topology.getBorderRouterCount(), 0);
}

BOOST_AUTO_TEST_CASE(Invalid)
{
  BOOST_CHECK_THROW(Topology::parse(""), Topology::Error);
  BOOST_CHECK_THROW(Topology::parse("<html></html>"), Topology::Error);
  BOOST_CHECK_THROW(Topology::parse(R"JSON({"isd_as": "1-ff00:0:110")JSON"), Topology::Error);
  BOOST_CHECK_THROW(Topology::parse(R"JSON(["1-ff00:0:110"])JSON"), Topology::Error);
  BOOST_CHECK_THROW(Topology::parse("{}"), Topology::Error);
  BOOST_CHECK_THROW(Topology::parse(R"JSON({"mtu": 1472})JSON"), Topology::Error);
  BOOST_CHECK_THROW(Topology::parse(R"JSON({"isd_as": ""})JSON"), Topology::Error);
}

BOOST_AUTO_TEST_SUITE_END() // TestTopology
BOOST_AUTO_TEST_SUITE_END() // Fetch

} // namespace fbs::fetch::tests
