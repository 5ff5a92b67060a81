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

#include "core/log-config-section.hpp"

#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/logging.hpp>

namespace fbs::log {

static ndn::util::LogLevel
parseLogLevel(const ConfigOption& option)
{
  try {
    return ndn::util::parseLogLevel(option.second.data());
  }
  catch (const std::invalid_argument&) {
    NDN_THROW_NESTED(ConfigFile::Error("Invalid log level '" + option.second.data() +
                                       "' for '" + option.first + "'"));
  }
}

static void
onConfig(const ConfigSection& section, bool isDryRun)
{
  // log
  // {
  //   ; default_level applies to all fabric-bootstrapper modules
  //   ; that are not explicitly named below
  //   default_level INFO
  //
  //   DnsSdHintGenerator DEBUG
  //   ArtifactFetcher TRACE
  // }

  auto defaultLevel = ndn::util::LogLevel::INFO;
  auto item = section.find("default_level");
  if (item != section.not_found()) {
    defaultLevel = parseLogLevel(*item);
  }
  if (!isDryRun) {
    ndn::util::Logging::setLevel("fbs.*", defaultLevel);
  }

  for (const auto& option : section) {
    const std::string& key = option.first;
    if (key == "default_level") {
      continue;
    }

    auto level = parseLogLevel(option);
    if (!isDryRun) {
      if (key.find('.') == std::string::npos)
        // unqualified names refer to our own loggers
        ndn::util::Logging::setLevel("fbs." + key, level);
      else
        ndn::util::Logging::setLevel(key, level);
    }
  }
}

void
setConfigFile(ConfigFile& config)
{
  config.addSectionHandler("log", &onConfig);
}

} // namespace fbs::log
