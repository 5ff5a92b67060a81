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

#ifndef FBS_BOOTSTRAPPER_HINTING_DNS_SERVER_INFO_HPP
#define FBS_BOOTSTRAPPER_HINTING_DNS_SERVER_INFO_HPP

#include "core/common.hpp"

#include <iosfwd>

namespace fbs::hinting {

/**
 * \brief Where and under which names DNS-SD should look for the discovery service.
 *
 * Sources include the configuration file, the host resolver configuration, and
 * any mechanism (e.g., DHCP) that learns resolvers from the network.
 */
struct DnsServerInfo
{
  /// resolver IP addresses
  std::vector<std::string> resolvers;
  /// domains under which the discovery service is looked up
  std::vector<std::string> searchDomains;
};

std::ostream&
operator<<(std::ostream& os, const DnsServerInfo& info);

/** \brief Read IPv4 nameservers and the search list from the host resolver configuration.
 *  \return nullopt if the resolver configuration cannot be loaded
 */
optional<DnsServerInfo>
loadSystemDnsServerInfo();

/** \brief Extract the domain part of a host name.
 *
 *  The domain is everything after the first dot, e.g., "example.org" for
 *  "host.example.org".
 *  \return nullopt if \p hostname has no dot or nothing follows it
 */
optional<std::string>
extractDomainName(const std::string& hostname);

/** \brief Derive the local domain from the host name of this machine.
 *  \return nullopt if the host name cannot be retrieved or has no domain part
 */
optional<std::string>
getLocalDomainName();

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_DNS_SERVER_INFO_HPP
