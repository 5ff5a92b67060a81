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

#ifndef FBS_BOOTSTRAPPER_FETCH_TOPOLOGY_HPP
#define FBS_BOOTSTRAPPER_FETCH_TOPOLOGY_HPP

#include "core/common.hpp"

namespace fbs::fetch {

/**
 * \brief Summary of a topology document served by the discovery service.
 *
 * Only the parts needed to tell a topology document apart from arbitrary JSON are
 * interpreted. The document itself is persisted verbatim.
 */
class Topology
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /** \brief Parse and validate a topology document.
   *  \throw Error \p json is not valid JSON, is not an object, or lacks a non-empty "isd_as"
   */
  static Topology
  parse(const std::string& json);

  const std::string&
  getIsdAs() const
  {
    return m_isdAs;
  }

  size_t
  getBorderRouterCount() const
  {
    return m_nBorderRouters;
  }

private:
  Topology() = default;

private:
  std::string m_isdAs;
  size_t m_nBorderRouters = 0;
};

} // namespace fbs::fetch

#endif // FBS_BOOTSTRAPPER_FETCH_TOPOLOGY_HPP
