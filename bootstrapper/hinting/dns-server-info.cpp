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

#include "bootstrapper/hinting/dns-server-info.hpp"
#include "core/logger.hpp"

#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/host_name.hpp>

#include <cstring>
#include <ostream>

namespace fbs::hinting {

FBS_LOG_INIT(DnsServerInfo);

template<typename T>
static void
printList(std::ostream& os, const std::vector<T>& list)
{
  os << '[';
  for (size_t i = 0; i < list.size(); ++i) {
    os << (i > 0 ? ", " : "") << list[i];
  }
  os << ']';
}

std::ostream&
operator<<(std::ostream& os, const DnsServerInfo& info)
{
  os << "resolvers=";
  printList(os, info.resolvers);
  os << " search=";
  printList(os, info.searchDomains);
  return os;
}

optional<DnsServerInfo>
loadSystemDnsServerInfo()
{
  struct __res_state state;
  std::memset(&state, 0, sizeof(state));
  if (res_ninit(&state) != 0) {
    FBS_LOG_WARN("Cannot load the host resolver configuration");
    return nullopt;
  }

  DnsServerInfo info;
  for (int i = 0; i < state.nscount && i < MAXNS; ++i) {
    const auto& sa = state.nsaddr_list[i];
    // IPv6 nameservers are kept in libc-private storage and show up as AF_UNSPEC here
    if (sa.sin_family != AF_INET) {
      continue;
    }
    info.resolvers.push_back(boost::asio::ip::address_v4(ntohl(sa.sin_addr.s_addr)).to_string());
  }
  for (int i = 0; i < MAXDNSRCH && state.dnsrch[i] != nullptr; ++i) {
    info.searchDomains.emplace_back(state.dnsrch[i]);
  }
  res_nclose(&state);

  FBS_LOG_DEBUG("Host resolver configuration: " << info);
  return info;
}

optional<std::string>
extractDomainName(const std::string& hostname)
{
  auto dot = hostname.find('.');
  if (dot == std::string::npos || dot + 1 == hostname.size()) {
    return nullopt;
  }
  return hostname.substr(dot + 1);
}

optional<std::string>
getLocalDomainName()
{
  boost::system::error_code ec;
  std::string hostname = boost::asio::ip::host_name(ec);
  if (ec) {
    FBS_LOG_ERROR("Cannot retrieve host name: " << ec.message());
    return nullopt;
  }

  auto domain = extractDomainName(hostname);
  if (!domain) {
    FBS_LOG_ERROR("Cannot derive local domain name from host name '" << hostname << "'");
    return nullopt;
  }
  FBS_LOG_INFO("Local domain is " << *domain);
  return domain;
}

} // namespace fbs::hinting
