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

#include "bootstrapper/hinting/hint-orchestrator.hpp"
#include "bootstrapper/hinting/mock-hint-generator.hpp"

#include "tests/test-common.hpp"
#include "tests/global-io-fixture.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace fbs::hinting::tests {

using namespace fbs::tests;

/**
 * \brief HintGenerator running an arbitrary function.
 */
class DummyHintGenerator : public HintGenerator
{
public:
  DummyHintGenerator(const std::string& name, std::function<void(HintSink&)> body)
    : m_name(name)
    , m_body(std::move(body))
  {
  }

  const std::string&
  getName() const final
  {
    return m_name;
  }

private:
  void
  doGenerate(HintSink& sink) final
  {
    m_body(sink);
  }

private:
  std::string m_name;
  std::function<void(HintSink&)> m_body;
};

/// keeps running until the sink is closed, without ever finding anything
static void
waitForCancellation(HintSink& sink)
{
  while (!sink.isClosed()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

static unique_ptr<HintGenerator>
makeMock(const std::string& address)
{
  MockHintGenerator::Options options;
  options.isEnabled = true;
  options.address = address;
  return make_unique<MockHintGenerator>(options);
}

template<typename... Generators>
static std::vector<unique_ptr<HintGenerator>>
makeGenerators(Generators&&... generators)
{
  std::vector<unique_ptr<HintGenerator>> v;
  (v.push_back(std::forward<Generators>(generators)), ...);
  return v;
}

BOOST_AUTO_TEST_SUITE(Hinting)
BOOST_FIXTURE_TEST_SUITE(TestHintOrchestrator, GlobalIoFixture)

BOOST_AUTO_TEST_CASE(MockWithDefaultPort)
{
  HintOrchestrator orchestrator(makeGenerators(makeMock("10.0.0.5:0")), DEFAULT_DISCOVERY_PORT);
  BOOST_CHECK_EQUAL(orchestrator.getState(), HintOrchestrator::State::IDLE);

  auto result = orchestrator.race(5_s);
  BOOST_REQUIRE(result);
  BOOST_CHECK_EQUAL(result->toString(), "10.0.0.5:8041");
  BOOST_CHECK_EQUAL(orchestrator.getState(), HintOrchestrator::State::RESOLVED);
}

BOOST_AUTO_TEST_CASE(MockWithPort)
{
  HintOrchestrator orchestrator(makeGenerators(makeMock("[2001:db8::5]:9000")), 8041);

  auto result = orchestrator.race(5_s);
  BOOST_REQUIRE(result);
  BOOST_CHECK_EQUAL(result->toString(), "[2001:db8::5]:9000");
}

BOOST_AUTO_TEST_CASE(Timeout)
{
  HintOrchestrator orchestrator(makeGenerators(
    make_unique<DummyHintGenerator>("silent", &waitForCancellation),
    make_unique<DummyHintGenerator>("failing", [] (HintSink&) {
      NDN_THROW(std::runtime_error("generator failure"));
    })), DEFAULT_DISCOVERY_PORT);

  auto start = std::chrono::steady_clock::now();
  auto result = orchestrator.race(100_ms);
  auto elapsed = std::chrono::steady_clock::now() - start;

  BOOST_CHECK(!result);
  BOOST_CHECK_EQUAL(orchestrator.getState(), HintOrchestrator::State::TIMED_OUT);
  BOOST_CHECK(elapsed >= std::chrono::milliseconds(100));
  BOOST_CHECK(elapsed < std::chrono::seconds(5));
}

BOOST_AUTO_TEST_CASE(NoGenerators)
{
  HintOrchestrator orchestrator({}, DEFAULT_DISCOVERY_PORT);
  BOOST_CHECK(!orchestrator.race(50_ms));
  BOOST_CHECK_EQUAL(orchestrator.getState(), HintOrchestrator::State::TIMED_OUT);
}

BOOST_AUTO_TEST_CASE(FirstAddressWins)
{
  std::atomic<bool> wasLateEmitAccepted{true};
  {
    HintOrchestrator orchestrator(makeGenerators(
      make_unique<DummyHintGenerator>("late", [&] (HintSink& sink) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        wasLateEmitAccepted = sink.emit(DiscoveredAddress::parse("192.0.2.2"));
      }),
      make_unique<DummyHintGenerator>("early", [] (HintSink& sink) {
        sink.emit(DiscoveredAddress::parse("192.0.2.1"));
        sink.emit(DiscoveredAddress::parse("192.0.2.3"));
      })), DEFAULT_DISCOVERY_PORT);

    auto result = orchestrator.race(5_s);
    BOOST_REQUIRE(result);
    BOOST_CHECK_EQUAL(result->toString(), "192.0.2.1:8041");
  }
  // the orchestrator has joined all generator threads
  BOOST_CHECK_EQUAL(wasLateEmitAccepted.load(), false);
}

BOOST_AUTO_TEST_CASE(CancellationReachesGenerators)
{
  std::atomic<bool> hasNoticedCancellation{false};
  {
    HintOrchestrator orchestrator(makeGenerators(
      makeMock("192.0.2.1"),
      make_unique<DummyHintGenerator>("slow", [&] (HintSink& sink) {
        waitForCancellation(sink);
        hasNoticedCancellation = true;
      })), DEFAULT_DISCOVERY_PORT);

    BOOST_CHECK(orchestrator.race(5_s));
  }
  BOOST_CHECK_EQUAL(hasNoticedCancellation.load(), true);
}

BOOST_AUTO_TEST_CASE(RaceOnlyOnce)
{
  HintOrchestrator orchestrator(makeGenerators(makeMock("192.0.2.1")), DEFAULT_DISCOVERY_PORT);
  BOOST_CHECK(orchestrator.race(5_s));
  BOOST_CHECK_THROW(orchestrator.race(5_s), HintOrchestrator::Error);
  BOOST_CHECK_EQUAL(orchestrator.getState(), HintOrchestrator::State::RESOLVED);
}

BOOST_AUTO_TEST_SUITE_END() // TestHintOrchestrator
BOOST_AUTO_TEST_SUITE_END() // Hinting

} // namespace fbs::hinting::tests
