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

#include "bootstrapper/hinting/dns-sd-hint-generator.hpp"
#include "core/logger.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

namespace fbs::hinting {

FBS_LOG_INIT(DnsSdHintGenerator);

static std::string
makeFqdn(const std::string& name)
{
  if (!name.empty() && name.back() == '.') {
    return name;
  }
  return name + ".";
}

static bool
isRootName(const std::string& name)
{
  return name.empty() || name == ".";
}

DnsSdHintGenerator::DnsSdHintGenerator(const Options& options, std::vector<DnsServerInfo> servers,
                                       unique_ptr<DnsQuerier> querier, uint32_t randomSeed)
  : m_options(options)
  , m_servers(std::move(servers))
  , m_querier(std::move(querier))
  , m_rng(randomSeed)
{
  BOOST_ASSERT(m_querier != nullptr);
}

void
DnsSdHintGenerator::doGenerate(HintSink& sink)
{
  optional<std::string> localDomain;
  if (m_options.useLocalDomain) {
    if (m_options.hostName.empty()) {
      localDomain = getLocalDomainName();
    }
    else {
      localDomain = extractDomainName(m_options.hostName);
      if (!localDomain) {
        FBS_LOG_WARN("Cannot derive local domain name from host name '" << m_options.hostName << "'");
      }
    }
  }

  for (auto server : m_servers) {
    if (localDomain &&
        std::find(server.searchDomains.begin(), server.searchDomains.end(), *localDomain) ==
          server.searchDomains.end()) {
      server.searchDomains.push_back(*localDomain);
    }
    FBS_LOG_DEBUG("Searching " << server);

    for (const auto& resolver : server.resolvers) {
      for (const auto& domain : server.searchDomains) {
        if (sink.isClosed()) {
          return;
        }

        auto serviceName = makeFqdn(DISCOVERY_SERVICE + "." + domain);
        if (m_options.enableSrv) {
          FBS_LOG_INFO("DNS-SD query " << serviceName << " SRV @" << resolver);
          resolve(resolver, serviceName, RecordType::SRV, sink, 0);
        }
        if (m_options.enableSd) {
          FBS_LOG_INFO("DNS-SD query " << serviceName << " PTR @" << resolver);
          resolve(resolver, serviceName, RecordType::PTR, sink, 0);
        }
        if (m_options.enableNaptr) {
          auto naptrName = makeFqdn(domain);
          FBS_LOG_INFO("DNS-S-NAPTR query " << naptrName << " NAPTR @" << resolver);
          resolve(resolver, naptrName, RecordType::NAPTR, sink, 0);
        }
      }
    }
  }
}

void
DnsSdHintGenerator::resolve(const std::string& resolver, const std::string& name, RecordType type,
                            HintSink& sink, size_t depth)
{
  if (sink.isClosed()) {
    return;
  }
  if (depth > m_options.maxChaseDepth) {
    FBS_LOG_WARN("Not following " << name << " " << type << ": chase depth limit of "
                 << m_options.maxChaseDepth << " reached");
    return;
  }

  std::vector<ResourceRecord> answers;
  try {
    answers = m_querier->query(resolver, name, type, [&sink] { return sink.isClosed(); });
  }
  catch (const DnsQuerier::Error& e) {
    if (sink.isClosed()) {
      FBS_LOG_DEBUG("DNS-SD abandoned: " << e.what());
    }
    else {
      FBS_LOG_ERROR("DNS-SD failed: " << e.what());
    }
    return;
  }

  std::vector<SrvRecord> serviceRecords;
  std::vector<NaptrRecord> naptrRecords;
  for (auto& answer : answers) {
    FBS_LOG_DEBUG("Answer to " << name << " " << type << ": " << answer);

    if (const auto* ptr = std::get_if<PtrRecord>(&answer)) {
      resolve(resolver, ptr->target, RecordType::SRV, sink, depth + 1);
    }
    else if (auto* srv = std::get_if<SrvRecord>(&answer)) {
      if (srv->port != m_options.discoveryPort) {
        FBS_LOG_WARN("DNS announced unexpected discovery port " << srv->port
                     << ", expected " << m_options.discoveryPort);
      }
      serviceRecords.push_back(std::move(*srv));
    }
    else if (auto* naptr = std::get_if<NaptrRecord>(&answer)) {
      if (naptr->service == DISCOVERY_NAPTR_SERVICE) {
        naptrRecords.push_back(std::move(*naptr));
      }
      else {
        FBS_LOG_TRACE("Discarding NAPTR with service '" << naptr->service << "'");
      }
    }
    else if (const auto* addr = std::get_if<AddressRecord>(&answer)) {
      FBS_LOG_INFO("DNS hint " << addr->address);
      if (!sink.emit(DiscoveredAddress(addr->address))) {
        return;
      }
    }
  }

  if (!serviceRecords.empty()) {
    chaseServiceRecords(resolver, serviceRecords, sink, depth);
  }
  if (!naptrRecords.empty()) {
    chaseNaptrRecords(resolver, naptrRecords, sink, depth);
  }
}

void
DnsSdHintGenerator::chaseServiceRecords(const std::string& resolver, std::vector<SrvRecord>& records,
                                        HintSink& sink, size_t depth)
{
  sortServiceRecords(records, m_rng);

  for (const auto& srv : records) {
    if (isRootName(srv.target)) {
      FBS_LOG_DEBUG("Service explicitly unavailable: " << srv);
      continue;
    }
    resolve(resolver, srv.target, RecordType::AAAA, sink, depth + 1);
    resolve(resolver, srv.target, RecordType::A, sink, depth + 1);
  }
}

void
DnsSdHintGenerator::chaseNaptrRecords(const std::string& resolver, std::vector<NaptrRecord>& records,
                                      HintSink& sink, size_t depth)
{
  sortNamingAuthorityRecords(records);

  for (const auto& naptr : records) {
    if (isRootName(naptr.replacement)) {
      FBS_LOG_DEBUG("Ignoring NAPTR without replacement: " << naptr);
      continue;
    }

    if (naptr.flags.empty()) {
      resolve(resolver, naptr.replacement, RecordType::NAPTR, sink, depth + 1);
    }
    else if (boost::iequals(naptr.flags, "A")) {
      resolve(resolver, naptr.replacement, RecordType::AAAA, sink, depth + 1);
      resolve(resolver, naptr.replacement, RecordType::A, sink, depth + 1);
    }
    else if (boost::iequals(naptr.flags, "S")) {
      resolve(resolver, naptr.replacement, RecordType::SRV, sink, depth + 1);
    }
    else {
      FBS_LOG_DEBUG("Ignoring NAPTR with unsupported flags: " << naptr);
    }
  }
}

} // namespace fbs::hinting
