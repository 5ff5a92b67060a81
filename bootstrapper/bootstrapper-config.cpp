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

#include "bootstrapper/bootstrapper-config.hpp"
#include "core/logger.hpp"

#include <boost/asio/ip/address.hpp>

namespace fbs {

FBS_LOG_INIT(BootstrapperConfig);

static time::milliseconds
parseMilliseconds(const ConfigOption& option)
{
  return time::milliseconds(ConfigFile::parseNumber<uint32_t>(option, 1, 3600000));
}

void
BootstrapperConfig::setConfigFile(ConfigFile& config)
{
  config.addSectionHandler("general", [this] (const ConfigSection& section, bool isDryRun) {
    processGeneralSection(section, isDryRun);
  });
  config.addSectionHandler("mock", [this] (const ConfigSection& section, bool isDryRun) {
    processMockSection(section, isDryRun);
  });
  config.addSectionHandler("dnssd", [this] (const ConfigSection& section, bool isDryRun) {
    processDnsSdSection(section, isDryRun);
  });
}

void
BootstrapperConfig::processGeneralSection(const ConfigSection& section, bool isDryRun)
{
  // general
  // {
  //   config_dir /etc/fabric
  //   discovery_port 8041
  //   hints_timeout 10000
  //   request_timeout 2000
  // }

  std::string dir = configDir;
  uint16_t port = discoveryPort;
  auto hints = hintsTimeout;
  auto request = requestTimeout;

  for (const auto& option : section) {
    const std::string& key = option.first;
    if (key == "config_dir") {
      dir = option.second.get_value<std::string>();
      if (dir.empty()) {
        NDN_THROW(ConfigFile::Error("Option 'config_dir' must not be empty"));
      }
    }
    else if (key == "discovery_port") {
      port = ConfigFile::parseNumber<uint16_t>(option, 1, 65535);
    }
    else if (key == "hints_timeout") {
      hints = parseMilliseconds(option);
    }
    else if (key == "request_timeout") {
      request = parseMilliseconds(option);
    }
    else {
      NDN_THROW(ConfigFile::Error("Unrecognized option '" + key + "'"));
    }
  }

  if (!isDryRun) {
    configDir = dir;
    discoveryPort = port;
    hintsTimeout = hints;
    requestTimeout = request;
  }
}

void
BootstrapperConfig::processMockSection(const ConfigSection& section, bool isDryRun)
{
  // mock
  // {
  //   enabled no
  //   address 192.0.2.1:8041
  // }

  hinting::MockHintGenerator::Options options;
  for (const auto& option : section) {
    const std::string& key = option.first;
    if (key == "enabled") {
      options.isEnabled = ConfigFile::parseYesNo(option);
    }
    else if (key == "address") {
      options.address = option.second.get_value<std::string>();
      try {
        hinting::DiscoveredAddress::parse(options.address);
      }
      catch (const hinting::DiscoveredAddress::Error& e) {
        NDN_THROW_NESTED(ConfigFile::Error("Invalid value for option 'address': "s + e.what()));
      }
    }
    else {
      NDN_THROW(ConfigFile::Error("Unrecognized option '" + key + "'"));
    }
  }

  if (options.isEnabled && options.address.empty()) {
    NDN_THROW(ConfigFile::Error("Option 'address' is required when the mock generator is enabled"));
  }

  if (!isDryRun) {
    mock = options;
  }
}

void
BootstrapperConfig::processDnsSdSection(const ConfigSection& section, bool isDryRun)
{
  // dnssd
  // {
  //   enable_sd yes
  //   enable_naptr yes
  //   enable_srv yes
  //   system_resolvers yes
  //   resolver 192.0.2.53
  //   search_domain example.org
  //   max_chase_depth 8
  //   query_timeout 2000
  // }

  hinting::DnsSdHintGenerator::Options options;
  bool wantSystemResolvers = true;
  hinting::DnsServerInfo servers;
  auto timeout = queryTimeout;

  for (const auto& option : section) {
    const std::string& key = option.first;
    if (key == "enable_sd") {
      options.enableSd = ConfigFile::parseYesNo(option);
    }
    else if (key == "enable_naptr") {
      options.enableNaptr = ConfigFile::parseYesNo(option);
    }
    else if (key == "enable_srv") {
      options.enableSrv = ConfigFile::parseYesNo(option);
    }
    else if (key == "system_resolvers") {
      wantSystemResolvers = ConfigFile::parseYesNo(option);
    }
    else if (key == "resolver") {
      auto resolver = option.second.get_value<std::string>();
      boost::system::error_code ec;
      boost::asio::ip::make_address(resolver, ec);
      if (ec) {
        NDN_THROW(ConfigFile::Error("Invalid value '" + resolver + "' for option 'resolver'"));
      }
      servers.resolvers.push_back(resolver);
    }
    else if (key == "search_domain") {
      auto domain = option.second.get_value<std::string>();
      if (domain.empty()) {
        NDN_THROW(ConfigFile::Error("Option 'search_domain' must not be empty"));
      }
      servers.searchDomains.push_back(domain);
    }
    else if (key == "max_chase_depth") {
      options.maxChaseDepth = ConfigFile::parseNumber<size_t>(option, 1, 64);
    }
    else if (key == "query_timeout") {
      timeout = parseMilliseconds(option);
    }
    else {
      NDN_THROW(ConfigFile::Error("Unrecognized option '" + key + "'"));
    }
  }

  if (!isDryRun) {
    dnssd = options;
    useSystemResolvers = wantSystemResolvers;
    dnsServers = servers;
    queryTimeout = timeout;
  }
}

fetch::ArtifactFetcher::Options
BootstrapperConfig::getFetcherOptions() const
{
  fetch::ArtifactFetcher::Options options;
  options.configDir = configDir;
  options.requestTimeout = requestTimeout;
  options.discoveryPort = discoveryPort;
  return options;
}

std::vector<hinting::DnsServerInfo>
BootstrapperConfig::getDnsServers() const
{
  std::vector<hinting::DnsServerInfo> servers;
  if (!dnsServers.resolvers.empty()) {
    servers.push_back(dnsServers);
  }
  if (useSystemResolvers) {
    auto system = hinting::loadSystemDnsServerInfo();
    if (system) {
      // search domains configured without resolvers apply to the system resolvers
      if (dnsServers.resolvers.empty()) {
        system->searchDomains.insert(system->searchDomains.end(),
                                     dnsServers.searchDomains.begin(),
                                     dnsServers.searchDomains.end());
      }
      servers.push_back(*system);
    }
    else {
      FBS_LOG_WARN("Cannot load the host resolver configuration");
    }
  }
  return servers;
}

} // namespace fbs
