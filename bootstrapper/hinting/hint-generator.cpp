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

#include "bootstrapper/hinting/hint-generator.hpp"
#include "core/logger.hpp"

#include <boost/exception/diagnostic_information.hpp>

namespace fbs::hinting {

FBS_LOG_INIT(HintGenerator);

void
HintGenerator::generate(HintSink& sink) noexcept
{
  FBS_LOG_INFO("Starting " << getName() << " hinting");
  try {
    doGenerate(sink);
  }
  catch (const std::exception& e) {
    FBS_LOG_ERROR(getName() << " hinting failed: " << boost::diagnostic_information(e));
    return;
  }
  FBS_LOG_INFO(getName() << " hinting done" << (sink.isClosed() ? " (cancelled)" : ""));
}

} // namespace fbs::hinting
