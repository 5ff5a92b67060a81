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

#ifndef FBS_BOOTSTRAPPER_BOOTSTRAPPER_CONFIG_HPP
#define FBS_BOOTSTRAPPER_BOOTSTRAPPER_CONFIG_HPP

#include "bootstrapper/fetch/artifact-fetcher.hpp"
#include "bootstrapper/hinting/dns-sd-hint-generator.hpp"
#include "bootstrapper/hinting/mock-hint-generator.hpp"
#include "core/config-file.hpp"

namespace fbs {

/**
 * \brief Settings of one bootstrap attempt.
 *
 * Populated from the `general`, `mock` and `dnssd` sections of the configuration file.
 */
class BootstrapperConfig
{
public:
  /** \brief Register handlers for the sections of this class on \p config.
   *
   *  Values are committed only when the file is processed with isDryRun = false.
   */
  void
  setConfigFile(ConfigFile& config);

  fetch::ArtifactFetcher::Options
  getFetcherOptions() const;

  /** \brief Resolvers and search domains for DNS-SD.
   *
   *  The configured resolvers come first, followed by the host resolver configuration if
   *  #useSystemResolvers is set and it can be loaded.
   */
  std::vector<hinting::DnsServerInfo>
  getDnsServers() const;

private:
  void
  processGeneralSection(const ConfigSection& section, bool isDryRun);

  void
  processMockSection(const ConfigSection& section, bool isDryRun);

  void
  processDnsSdSection(const ConfigSection& section, bool isDryRun);

public:
  std::string configDir = DEFAULT_CONFIG_DIR;
  uint16_t discoveryPort = hinting::DEFAULT_DISCOVERY_PORT;
  time::milliseconds hintsTimeout = 10_s;
  time::milliseconds requestTimeout = 2_s;

  hinting::MockHintGenerator::Options mock;

  hinting::DnsSdHintGenerator::Options dnssd;
  bool useSystemResolvers = true;
  hinting::DnsServerInfo dnsServers;
  time::milliseconds queryTimeout = 2_s;
};

} // namespace fbs

#endif // FBS_BOOTSTRAPPER_BOOTSTRAPPER_CONFIG_HPP
