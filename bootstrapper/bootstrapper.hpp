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

#ifndef FBS_BOOTSTRAPPER_BOOTSTRAPPER_HPP
#define FBS_BOOTSTRAPPER_BOOTSTRAPPER_HPP

#include "bootstrapper/bootstrapper-config.hpp"
#include "bootstrapper/hinting/hint-generator.hpp"

namespace fbs {

/**
 * \brief Runs one bootstrap attempt.
 *
 * The attempt races all enabled hint generators for at most the configured hints timeout,
 * then downloads the bootstrap artifacts from the first address found. There is no retry
 * and no fallback to another candidate.
 */
class Bootstrapper : noncopyable
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  explicit
  Bootstrapper(const BootstrapperConfig& config);

  VIRTUAL_WITH_TESTS
  ~Bootstrapper() = default;

  /** \brief Discover the discovery service and fetch the artifacts.
   *  \throw Error no address found in time, or artifact retrieval failed
   */
  void
  run();

PROTECTED_WITH_TESTS_ELSE_PRIVATE:
  /** \brief Create the generators enabled by the configuration.
   */
  VIRTUAL_WITH_TESTS std::vector<unique_ptr<hinting::HintGenerator>>
  makeGenerators();

  /** \throw fetch::ArtifactFetcher::Error
   */
  VIRTUAL_WITH_TESTS void
  fetchArtifacts(const hinting::DiscoveredAddress& address);

protected:
  BootstrapperConfig m_config;
};

} // namespace fbs

#endif // FBS_BOOTSTRAPPER_BOOTSTRAPPER_HPP
