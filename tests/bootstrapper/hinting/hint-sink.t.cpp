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

#include "bootstrapper/hinting/hint-sink.hpp"

#include "tests/test-common.hpp"

#include <thread>

namespace fbs::hinting::tests {

class HintSinkFixture
{
protected:
  HintSinkFixture()
    : sink(make_shared<HintSink>(io, [this] (const DiscoveredAddress& addr) { delivered.push_back(addr); }))
  {
  }

protected:
  boost::asio::io_context io;
  shared_ptr<HintSink> sink;
  std::vector<DiscoveredAddress> delivered;
};

BOOST_AUTO_TEST_SUITE(Hinting)
BOOST_FIXTURE_TEST_SUITE(TestHintSink, HintSinkFixture)

BOOST_AUTO_TEST_CASE(DeliverOnReaderContext)
{
  bool isAccepted1 = false;
  bool isAccepted2 = false;
  std::thread writer([&] {
    isAccepted1 = sink->emit(DiscoveredAddress::parse("192.0.2.1"));
    isAccepted2 = sink->emit(DiscoveredAddress::parse("192.0.2.2:9000"));
  });
  writer.join();
  BOOST_CHECK(isAccepted1);
  BOOST_CHECK(isAccepted2);

  // nothing is delivered until the reader runs its io_context
  BOOST_CHECK(delivered.empty());

  io.poll();
  BOOST_REQUIRE_EQUAL(delivered.size(), 2);
  BOOST_CHECK_EQUAL(delivered[0].toString(), "192.0.2.1");
  BOOST_CHECK_EQUAL(delivered[1].toString(), "192.0.2.2:9000");
}

BOOST_AUTO_TEST_CASE(EmitAfterClose)
{
  BOOST_CHECK_EQUAL(sink->isClosed(), false);
  sink->close();
  BOOST_CHECK_EQUAL(sink->isClosed(), true);

  BOOST_CHECK_EQUAL(sink->emit(DiscoveredAddress::parse("192.0.2.1")), false);
  io.poll();
  BOOST_CHECK(delivered.empty());
}

BOOST_AUTO_TEST_CASE(PendingDroppedOnClose)
{
  BOOST_CHECK(sink->emit(DiscoveredAddress::parse("192.0.2.1")));
  sink->close();

  io.poll();
  BOOST_CHECK(delivered.empty());
}

BOOST_AUTO_TEST_SUITE_END() // TestHintSink
BOOST_AUTO_TEST_SUITE_END() // Hinting

} // namespace fbs::hinting::tests
