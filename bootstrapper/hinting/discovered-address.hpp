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

#ifndef FBS_BOOTSTRAPPER_HINTING_DISCOVERED_ADDRESS_HPP
#define FBS_BOOTSTRAPPER_HINTING_DISCOVERED_ADDRESS_HPP

#include "core/common.hpp"

#include <boost/asio/ip/address.hpp>

#include <iosfwd>

namespace fbs::hinting {

/// well-known TCP port of the discovery service
inline constexpr uint16_t DEFAULT_DISCOVERY_PORT = 8041;

/**
 * \brief A candidate address of the discovery service, as produced by a HintGenerator.
 *
 * The port is optional. A port number of zero is treated as "no port".
 */
class DiscoveredAddress
{
public:
  class Error : public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  explicit
  DiscoveredAddress(const boost::asio::ip::address& ip, optional<uint16_t> port = nullopt);

  /** \brief Parse "ip", "ip:port", "ipv6" or "[ipv6]:port".
   *  \throw Error the string is not a valid address
   */
  static DiscoveredAddress
  parse(const std::string& str);

  const boost::asio::ip::address&
  getIp() const noexcept
  {
    return m_ip;
  }

  const optional<uint16_t>&
  getPort() const noexcept
  {
    return m_port;
  }

  /** \brief Returns a copy that carries \p port if this address has none.
   */
  DiscoveredAddress
  withDefaultPort(uint16_t port) const;

  /** \brief Returns "ip:port" with IPv6 addresses in brackets, or "ip" without port.
   */
  std::string
  toString() const;

private:
  friend bool
  operator==(const DiscoveredAddress& lhs, const DiscoveredAddress& rhs) noexcept
  {
    return lhs.m_ip == rhs.m_ip && lhs.m_port == rhs.m_port;
  }

  friend bool
  operator!=(const DiscoveredAddress& lhs, const DiscoveredAddress& rhs) noexcept
  {
    return !(lhs == rhs);
  }

private:
  boost::asio::ip::address m_ip;
  optional<uint16_t> m_port;
};

std::ostream&
operator<<(std::ostream& os, const DiscoveredAddress& address);

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_DISCOVERED_ADDRESS_HPP
