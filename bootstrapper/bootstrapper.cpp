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
#include "bootstrapper/fetch/artifact-fetcher.hpp"
#include "bootstrapper/hinting/dns-sd-hint-generator.hpp"
#include "bootstrapper/hinting/hint-orchestrator.hpp"
#include "bootstrapper/hinting/mock-hint-generator.hpp"
#include "core/logger.hpp"

namespace fbs {

FBS_LOG_INIT(Bootstrapper);

Bootstrapper::Bootstrapper(const BootstrapperConfig& config)
  : m_config(config)
{
}

void
Bootstrapper::run()
{
  hinting::HintOrchestrator orchestrator(makeGenerators(), m_config.discoveryPort);
  auto address = orchestrator.race(m_config.hintsTimeout);
  // cancelled generators wind down while the artifacts are fetched,
  // and are joined when the orchestrator goes out of scope

  if (!address) {
    NDN_THROW(Error("bootstrapper timed out"));
  }

  try {
    fetchArtifacts(*address);
  }
  catch (const fetch::ArtifactFetcher::Error& e) {
    NDN_THROW_NESTED(Error(e.what()));
  }
  FBS_LOG_INFO("Bootstrap from " << *address << " completed");
}

std::vector<unique_ptr<hinting::HintGenerator>>
Bootstrapper::makeGenerators()
{
  std::vector<unique_ptr<hinting::HintGenerator>> generators;

  if (m_config.mock.isEnabled) {
    generators.push_back(make_unique<hinting::MockHintGenerator>(m_config.mock));
  }

  auto dnssd = m_config.dnssd;
  if (dnssd.enableSd || dnssd.enableNaptr || dnssd.enableSrv) {
    dnssd.discoveryPort = m_config.discoveryPort;
    auto servers = m_config.getDnsServers();
    if (servers.empty()) {
      FBS_LOG_WARN("DNS-SD enabled but no resolver is available");
    }
    else {
      generators.push_back(make_unique<hinting::DnsSdHintGenerator>(
        dnssd, std::move(servers), make_unique<hinting::UdpDnsQuerier>(m_config.queryTimeout)));
    }
  }

  for (const auto& generator : generators) {
    FBS_LOG_DEBUG("Enabled hint generator " << generator->getName());
  }
  return generators;
}

void
Bootstrapper::fetchArtifacts(const hinting::DiscoveredAddress& address)
{
  fetch::TcpStreamHttpClient client;
  fetch::ArtifactFetcher fetcher(m_config.getFetcherOptions(), client);
  fetcher.fetch(address);
}

} // namespace fbs
