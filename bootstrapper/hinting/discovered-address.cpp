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

#include "bootstrapper/hinting/discovered-address.hpp"

#include <charconv>
#include <ostream>

namespace fbs::hinting {

DiscoveredAddress::DiscoveredAddress(const boost::asio::ip::address& ip, optional<uint16_t> port)
  : m_ip(ip)
  , m_port(port == 0 ? nullopt : port)
{
}

static uint16_t
parsePort(std::string_view str, const std::string& input)
{
  uint16_t port = 0;
  auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), port);
  if (str.empty() || ec != std::errc() || end != str.data() + str.size()) {
    NDN_THROW(DiscoveredAddress::Error("Invalid port in address '" + input + "'"));
  }
  return port;
}

DiscoveredAddress
DiscoveredAddress::parse(const std::string& str)
{
  std::string host = str;
  optional<uint16_t> port;

  if (!str.empty() && str.front() == '[') {
    auto close = str.find(']');
    if (close == std::string::npos) {
      NDN_THROW(Error("Unterminated IPv6 literal in address '" + str + "'"));
    }
    host = str.substr(1, close - 1);
    if (close + 1 < str.size()) {
      if (str[close + 1] != ':') {
        NDN_THROW(Error("Unexpected characters after IPv6 literal in address '" + str + "'"));
      }
      port = parsePort(std::string_view(str).substr(close + 2), str);
    }
  }
  else if (auto colon = str.find(':'); colon != std::string::npos && str.find(':', colon + 1) == std::string::npos) {
    // exactly one colon: IPv4 address or hostname followed by port
    host = str.substr(0, colon);
    port = parsePort(std::string_view(str).substr(colon + 1), str);
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(host, ec);
  if (ec) {
    NDN_THROW(Error("Invalid IP address '" + host + "': " + ec.message()));
  }
  return DiscoveredAddress(ip, port);
}

DiscoveredAddress
DiscoveredAddress::withDefaultPort(uint16_t port) const
{
  if (m_port) {
    return *this;
  }
  return DiscoveredAddress(m_ip, port);
}

std::string
DiscoveredAddress::toString() const
{
  std::string ip = m_ip.to_string();
  if (!m_port) {
    return ip;
  }
  if (m_ip.is_v6()) {
    return "[" + ip + "]:" + to_string(*m_port);
  }
  return ip + ":" + to_string(*m_port);
}

std::ostream&
operator<<(std::ostream& os, const DiscoveredAddress& address)
{
  return os << address.toString();
}

} // namespace fbs::hinting
