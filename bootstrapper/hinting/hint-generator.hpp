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

#ifndef FBS_BOOTSTRAPPER_HINTING_HINT_GENERATOR_HPP
#define FBS_BOOTSTRAPPER_HINTING_HINT_GENERATOR_HPP

#include "bootstrapper/hinting/hint-sink.hpp"

namespace fbs::hinting {

/**
 * \brief A discovery mechanism that searches one channel for discovery service addresses.
 *
 * A generator runs on its own thread until it has nothing more to find. It reports every
 * candidate it finds to the HintSink. Failures never leave generate(): they are logged
 * and simply reduce the number of candidates.
 */
class HintGenerator : noncopyable
{
public:
  virtual
  ~HintGenerator() = default;

  /** \brief Get generator name.
   *  \return generator name as a short phrase, e.g. "DNS-SD"
   */
  virtual const std::string&
  getName() const = 0;

  /** \brief Run discovery to completion, reporting candidates to \p sink.
   *
   *  Does not throw.
   */
  void
  generate(HintSink& sink) noexcept;

private:
  virtual void
  doGenerate(HintSink& sink) = 0;
};

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_HINT_GENERATOR_HPP
