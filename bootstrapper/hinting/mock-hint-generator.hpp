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

#ifndef FBS_BOOTSTRAPPER_HINTING_MOCK_HINT_GENERATOR_HPP
#define FBS_BOOTSTRAPPER_HINTING_MOCK_HINT_GENERATOR_HPP

#include "bootstrapper/hinting/hint-generator.hpp"

namespace fbs::hinting {

/**
 * \brief Hint generator that reports a statically configured address.
 *
 * Intended for testing deployments where the discovery service address is known in
 * advance.
 */
class MockHintGenerator final : public HintGenerator
{
public:
  struct Options
  {
    bool isEnabled = false;
    /// address in any format accepted by DiscoveredAddress::parse
    std::string address;
  };

  explicit
  MockHintGenerator(const Options& options);

  const std::string&
  getName() const final
  {
    static const std::string NAME("mock");
    return NAME;
  }

private:
  void
  doGenerate(HintSink& sink) final;

private:
  Options m_options;
};

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_MOCK_HINT_GENERATOR_HPP
