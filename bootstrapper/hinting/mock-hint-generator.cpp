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

#include "bootstrapper/hinting/mock-hint-generator.hpp"
#include "core/logger.hpp"

namespace fbs::hinting {

FBS_LOG_INIT(MockHintGenerator);

MockHintGenerator::MockHintGenerator(const Options& options)
  : m_options(options)
{
}

void
MockHintGenerator::doGenerate(HintSink& sink)
{
  if (m_options.address.empty()) {
    FBS_LOG_WARN("No address configured");
    return;
  }

  try {
    auto address = DiscoveredAddress::parse(m_options.address);
    FBS_LOG_INFO("Mock hint " << address);
    sink.emit(address);
  }
  catch (const DiscoveredAddress::Error& e) {
    FBS_LOG_ERROR("Invalid mock address: " << e.what());
  }
}

} // namespace fbs::hinting
