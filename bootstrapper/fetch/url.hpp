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

#ifndef FBS_BOOTSTRAPPER_FETCH_URL_HPP
#define FBS_BOOTSTRAPPER_FETCH_URL_HPP

#include "core/common.hpp"

namespace fbs::fetch {

/**
 * \brief A partial URL parser covering what an HTTP GET needs.
 *
 * Understands `scheme://host[:port][/path]`, where host may be a bracketed IPv6 literal.
 * Query strings and fragments are not supported.
 */
class Url
{
public:
  explicit
  Url(const std::string& url);

  bool
  isValid() const
  {
    return m_isValid;
  }

  const std::string&
  getScheme() const
  {
    return m_scheme;
  }

  /// host without brackets
  const std::string&
  getHost() const
  {
    return m_host;
  }

  /// port, "80" if absent from the URL
  const std::string&
  getPort() const
  {
    return m_port;
  }

  /// path, "/" if absent from the URL
  const std::string&
  getPath() const
  {
    return m_path;
  }

  /// host and port in the form suitable for a Host header
  std::string
  getAuthority() const;

private:
  bool m_isValid = false;
  bool m_isV6 = false;
  std::string m_scheme;
  std::string m_host;
  std::string m_port;
  std::string m_path;
};

} // namespace fbs::fetch

#endif // FBS_BOOTSTRAPPER_FETCH_URL_HPP
