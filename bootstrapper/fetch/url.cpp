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

#include "bootstrapper/fetch/url.hpp"

#include <boost/regex.hpp>

namespace fbs::fetch {

Url::Url(const std::string& url)
{
  static const boost::regex protocolExp("(\\w+)://([^/]*)(\\/.*)?");
  boost::smatch protocolMatch;
  if (!boost::regex_match(url, protocolMatch, protocolExp)) {
    return;
  }
  m_scheme = protocolMatch[1];
  const std::string authority = protocolMatch[2];
  m_path = protocolMatch[3];

  // IPv6 address enclosed in [ ], with optional port number
  static const boost::regex v6Exp("^\\[([a-fA-F0-9:.]+)\\](?:\\:(\\d+))?$");
  // IPv4 address or hostname, with optional port number
  static const boost::regex v4HostExp("^([^:\\[\\]]+)(?:\\:(\\d+))?$");

  boost::smatch match;
  if (boost::regex_match(authority, match, v6Exp)) {
    m_isV6 = true;
  }
  else if (!boost::regex_match(authority, match, v4HostExp)) {
    return;
  }
  m_host = match[1];
  m_port = match[2];

  if (m_port.empty()) {
    m_port = "80";
  }
  if (m_path.empty()) {
    m_path = "/";
  }
  m_isValid = true;
}

std::string
Url::getAuthority() const
{
  if (m_isV6) {
    return "[" + m_host + "]:" + m_port;
  }
  return m_host + ":" + m_port;
}

} // namespace fbs::fetch
