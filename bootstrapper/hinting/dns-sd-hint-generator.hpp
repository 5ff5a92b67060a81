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

#ifndef FBS_BOOTSTRAPPER_HINTING_DNS_SD_HINT_GENERATOR_HPP
#define FBS_BOOTSTRAPPER_HINTING_DNS_SD_HINT_GENERATOR_HPP

#include "bootstrapper/hinting/hint-generator.hpp"
#include "bootstrapper/hinting/dns-querier.hpp"
#include "bootstrapper/hinting/dns-server-info.hpp"

namespace fbs::hinting {

/**
 * \brief Hint generator implementing DNS-based service discovery.
 *
 * For every resolver and search domain, the generator looks up the discovery service with
 * up to three independent queries:
 *  - SRV for `_fabricdiscovery._tcp.<domain>.`
 *  - PTR for `_fabricdiscovery._tcp.<domain>.` (classic DNS-SD, RFC 6763)
 *  - NAPTR for `<domain>.` (straightforward NAPTR, RFC 3958)
 *
 * Answers are chased recursively: PTR targets are queried for SRV; SRV targets, ordered per
 * RFC 2782, are queried for AAAA then A; NAPTR records with the discovery service tag,
 * ordered per RFC 3403, are followed according to their flags. Every A and AAAA answer is
 * reported as a hint without port.
 *
 * A chase stops after Options::maxChaseDepth referrals, so looping or very deep DNS data
 * cannot keep the generator busy forever. A failed query only ends its own branch.
 */
class DnsSdHintGenerator final : public HintGenerator
{
public:
  struct Options
  {
    bool enableSd = true;
    bool enableNaptr = true;
    bool enableSrv = true;
    /// SRV answers announcing another port are reported in the log
    uint16_t discoveryPort = DEFAULT_DISCOVERY_PORT;
    /// maximum number of referrals followed from a discovery query
    size_t maxChaseDepth = 8;
    /// whether to also search the domain of the local host name
    bool useLocalDomain = true;
    /// host name whose domain is searched; the name of this machine if empty
    std::string hostName;
  };

  /**
   * \param options feature switches
   * \param servers resolvers and search domains to use
   * \param querier sends the DNS queries
   * \param randomSeed seed of the engine used for SRV weighted selection
   */
  DnsSdHintGenerator(const Options& options, std::vector<DnsServerInfo> servers,
                     unique_ptr<DnsQuerier> querier,
                     uint32_t randomSeed = ndn::random::generateWord32());

  const std::string&
  getName() const final
  {
    static const std::string NAME("DNS-SD");
    return NAME;
  }

private:
  void
  doGenerate(HintSink& sink) final;

  void
  resolve(const std::string& resolver, const std::string& name, RecordType type,
          HintSink& sink, size_t depth);

  void
  chaseServiceRecords(const std::string& resolver, std::vector<SrvRecord>& records,
                      HintSink& sink, size_t depth);

  void
  chaseNaptrRecords(const std::string& resolver, std::vector<NaptrRecord>& records,
                    HintSink& sink, size_t depth);

public:
  /// service and protocol labels of the discovery service
  static inline const std::string DISCOVERY_SERVICE = "_fabricdiscovery._tcp";
  /// NAPTR service tag of the discovery service
  static inline const std::string DISCOVERY_NAPTR_SERVICE = "x-fabricdiscovery:tcp";

private:
  Options m_options;
  std::vector<DnsServerInfo> m_servers;
  unique_ptr<DnsQuerier> m_querier;
  ndn::random::RandomNumberEngine m_rng;
};

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_DNS_SD_HINT_GENERATOR_HPP
