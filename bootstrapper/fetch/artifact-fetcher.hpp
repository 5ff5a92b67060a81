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

#ifndef FBS_BOOTSTRAPPER_FETCH_ARTIFACT_FETCHER_HPP
#define FBS_BOOTSTRAPPER_FETCH_ARTIFACT_FETCHER_HPP

#include "bootstrapper/fetch/http-client.hpp"
#include "bootstrapper/hinting/discovered-address.hpp"

namespace fbs::fetch {

/**
 * \brief Downloads the bootstrap artifacts from a discovery service and persists them.
 *
 * Two artifacts are retrieved, in order:
 *  -# the topology document, written to `<configDir>/topology.json` after validation;
 *  -# the trust root archive, whose files are extracted into `<configDir>/certs/`.
 *
 * Nothing is written for an artifact that fails validation. There is no rollback across
 * the two steps.
 */
class ArtifactFetcher : noncopyable
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  struct Options
  {
    std::string configDir = ".";
    /// deadline of each HTTP request
    time::milliseconds requestTimeout = 2_s;
    /// largest topology document accepted
    size_t maxTopologySize = 4 * 1024 * 1024;
    /// port of the discovery service when the address carries none
    uint16_t discoveryPort = hinting::DEFAULT_DISCOVERY_PORT;
  };

  ArtifactFetcher(const Options& options, HttpClient& client);

  /** \brief Fetch the topology, then the trust roots.
   *  \throw Error either step failed
   */
  void
  fetch(const hinting::DiscoveredAddress& address);

  /** \throw Error transport failure, oversized or invalid document, or write failure
   */
  void
  fetchTopology(const hinting::DiscoveredAddress& address);

  /** \throw Error transport failure, malformed archive, non-regular entry, or write failure
   */
  void
  fetchTrustRoots(const hinting::DiscoveredAddress& address);

  /** \brief Build the URL of \p endpoint on the discovery service at \p address.
   *
   *  \p defaultPort is used when \p address has none.
   */
  static std::string
  buildUrl(const hinting::DiscoveredAddress& address, const std::string& endpoint,
           uint16_t defaultPort);

public:
  static inline const std::string BASE_PATH = "fabric/discovery/v1";
  static inline const std::string TOPOLOGY_ENDPOINT = "/topology.json";
  static inline const std::string TRUST_ROOTS_ENDPOINT = "/trcs.tar";
  static inline const std::string TOPOLOGY_FILE_NAME = "topology.json";
  static inline const std::string CERTS_DIR_NAME = "certs";

private:
  Options m_options;
  HttpClient& m_client;
};

} // namespace fbs::fetch

#endif // FBS_BOOTSTRAPPER_FETCH_ARTIFACT_FETCHER_HPP
