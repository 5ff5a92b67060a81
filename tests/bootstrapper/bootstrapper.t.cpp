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

#include "bootstrapper/bootstrapper.hpp"

#include "tests/test-common.hpp"
#include "tests/global-io-fixture.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace fbs::tests {

using hinting::DiscoveredAddress;
using hinting::HintGenerator;
using hinting::HintSink;

/**
 * \brief HintGenerator that never finds anything and returns once cancelled.
 */
class SilentHintGenerator : public HintGenerator
{
public:
  const std::string&
  getName() const final
  {
    static const std::string NAME("silent");
    return NAME;
  }

private:
  void
  doGenerate(HintSink& sink) final
  {
    while (!sink.isClosed()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
};

/**
 * \brief HintGenerator stuck in an operation that ignores cancellation.
 *
 * It returns once \p release is set, or after five seconds.
 */
class StuckHintGenerator : public HintGenerator
{
public:
  StuckHintGenerator(shared_ptr<std::atomic<bool>> release, shared_ptr<std::atomic<bool>> isDone)
    : m_release(std::move(release))
    , m_isDone(std::move(isDone))
  {
  }

  const std::string&
  getName() const final
  {
    static const std::string NAME("stuck");
    return NAME;
  }

private:
  void
  doGenerate(HintSink&) final
  {
    auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!*m_release && std::chrono::steady_clock::now() < giveUp) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    *m_isDone = true;
  }

private:
  shared_ptr<std::atomic<bool>> m_release;
  shared_ptr<std::atomic<bool>> m_isDone;
};

class BootstrapperUnderTest : public Bootstrapper
{
public:
  using Bootstrapper::Bootstrapper;

  std::vector<unique_ptr<HintGenerator>>
  makeGenerators() final
  {
    if (makeTestGenerators) {
      return makeTestGenerators();
    }
    return Bootstrapper::makeGenerators();
  }

  void
  fetchArtifacts(const DiscoveredAddress& address) final
  {
    fetchedFrom.push_back(address);
    if (beforeFetch) {
      beforeFetch();
    }
    if (shouldFailFetch) {
      NDN_THROW(fetch::ArtifactFetcher::Error("HTTP 404 Not Found"));
    }
  }

public:
  std::function<std::vector<unique_ptr<HintGenerator>>()> makeTestGenerators;
  std::function<void()> beforeFetch;
  std::vector<DiscoveredAddress> fetchedFrom;
  bool shouldFailFetch = false;
};

class BootstrapperFixture : public GlobalIoFixture
{
protected:
  BootstrapperFixture()
  {
    config.hintsTimeout = 100_ms;
    config.discoveryPort = 31045;
    config.dnssd.enableSd = false;
    config.dnssd.enableNaptr = false;
    config.dnssd.enableSrv = false;
    config.useSystemResolvers = false;
  }

  void
  enableMock(const std::string& address)
  {
    config.mock.isEnabled = true;
    config.mock.address = address;
  }

protected:
  BootstrapperConfig config;
};

BOOST_FIXTURE_TEST_SUITE(TestBootstrapper, BootstrapperFixture)

BOOST_AUTO_TEST_CASE(TimedOut)
{
  BootstrapperUnderTest bootstrapper(config);
  bootstrapper.makeTestGenerators = [] {
    std::vector<unique_ptr<HintGenerator>> generators;
    generators.push_back(make_unique<SilentHintGenerator>());
    return generators;
  };

  BOOST_CHECK_EXCEPTION(bootstrapper.run(), Bootstrapper::Error, [] (const auto& e) {
    return std::string(e.what()) == "bootstrapper timed out";
  });
  BOOST_CHECK(bootstrapper.fetchedFrom.empty());
}

BOOST_AUTO_TEST_CASE(NothingEnabled)
{
  BootstrapperUnderTest bootstrapper(config);
  BOOST_CHECK_THROW(bootstrapper.run(), Bootstrapper::Error);
  BOOST_CHECK(bootstrapper.fetchedFrom.empty());
}

BOOST_AUTO_TEST_CASE(Success)
{
  enableMock("192.0.2.7");
  BootstrapperUnderTest bootstrapper(config);
  BOOST_CHECK_NO_THROW(bootstrapper.run());

  BOOST_REQUIRE_EQUAL(bootstrapper.fetchedFrom.size(), 1);
  BOOST_CHECK_EQUAL(bootstrapper.fetchedFrom.front(), DiscoveredAddress::parse("192.0.2.7:31045"));
}

BOOST_AUTO_TEST_CASE(FetchWhileGeneratorsWindDown)
{
  enableMock("192.0.2.7");
  auto release = make_shared<std::atomic<bool>>(false);
  auto isStuckDone = make_shared<std::atomic<bool>>(false);

  BootstrapperUnderTest bootstrapper(config);
  bootstrapper.makeTestGenerators = [&] {
    std::vector<unique_ptr<HintGenerator>> generators;
    generators.push_back(make_unique<hinting::MockHintGenerator>(config.mock));
    generators.push_back(make_unique<StuckHintGenerator>(release, isStuckDone));
    return generators;
  };
  bool wasStuckRunning = false;
  bootstrapper.beforeFetch = [&] {
    wasStuckRunning = !*isStuckDone;
    *release = true;
  };

  auto start = std::chrono::steady_clock::now();
  BOOST_CHECK_NO_THROW(bootstrapper.run());
  BOOST_CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(4));

  BOOST_CHECK_EQUAL(bootstrapper.fetchedFrom.size(), 1);
  BOOST_CHECK_EQUAL(wasStuckRunning, true);
  // run() does not return before every generator thread is joined
  BOOST_CHECK_EQUAL(isStuckDone->load(), true);
}

BOOST_AUTO_TEST_CASE(ExplicitPortKept)
{
  enableMock("[2001:db8::7]:443");
  BootstrapperUnderTest bootstrapper(config);
  bootstrapper.run();

  BOOST_REQUIRE_EQUAL(bootstrapper.fetchedFrom.size(), 1);
  BOOST_CHECK_EQUAL(bootstrapper.fetchedFrom.front(), DiscoveredAddress::parse("[2001:db8::7]:443"));
}

BOOST_AUTO_TEST_CASE(FetchFailed)
{
  enableMock("192.0.2.7:8041");
  BootstrapperUnderTest bootstrapper(config);
  bootstrapper.shouldFailFetch = true;

  BOOST_CHECK_EXCEPTION(bootstrapper.run(), Bootstrapper::Error, [] (const auto& e) {
    return std::string(e.what()).find("HTTP 404") != std::string::npos;
  });
  BOOST_CHECK_EQUAL(bootstrapper.fetchedFrom.size(), 1);
}

BOOST_AUTO_TEST_CASE(Generators)
{
  BootstrapperUnderTest bootstrapper(config);
  BOOST_CHECK(bootstrapper.makeGenerators().empty());

  enableMock("192.0.2.7");
  config.dnssd.enableSrv = true;
  BootstrapperUnderTest withoutResolvers(config);
  auto generators = withoutResolvers.makeGenerators();
  BOOST_REQUIRE_EQUAL(generators.size(), 1);
  BOOST_CHECK_EQUAL(generators[0]->getName(), "mock");

  config.dnsServers.resolvers.push_back("192.0.2.53");
  config.dnsServers.searchDomains.push_back("example.org");
  BootstrapperUnderTest withResolvers(config);
  generators = withResolvers.makeGenerators();
  BOOST_REQUIRE_EQUAL(generators.size(), 2);
  BOOST_CHECK_EQUAL(generators[0]->getName(), "mock");
  BOOST_CHECK_EQUAL(generators[1]->getName(), "DNS-SD");
}

BOOST_AUTO_TEST_SUITE_END() // TestBootstrapper

} // namespace fbs::tests
