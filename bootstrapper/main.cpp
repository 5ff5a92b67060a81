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

#include "bootstrapper/bootstrapper.hpp"
#include "core/config-file.hpp"
#include "core/log-config-section.hpp"
#include "core/logger.hpp"

#include <boost/config.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/version.hpp>

#include <iostream>

#include <ndn-cxx/util/logging.hpp>
#include <ndn-cxx/util/ostream-joiner.hpp>
#include <ndn-cxx/version.hpp>

namespace po = boost::program_options;

FBS_LOG_INIT(Main);

namespace fbs {

static void
printUsage(std::ostream& os, const char* programName, const po::options_description& opts)
{
  os << "Usage: " << programName << " [options]\n"
     << "\n"
     << "Locate the fabric discovery service on the local network and\n"
     << "download the topology and trust roots needed to join the fabric\n"
     << "\n"
     << opts;
}

static void
printLogModules(std::ostream& os)
{
  const auto& modules = ndn::util::Logging::getLoggerNames();
  std::copy(modules.begin(), modules.end(), ndn::make_ostream_joiner(os, "\n"));
  os << std::endl;
}

/** \brief Load \p configFile into \p config.
 */
static void
loadConfigFile(const std::string& configFile, BootstrapperConfig& config)
{
  ConfigFile file;
  log::setConfigFile(file);
  config.setConfigFile(file);

  file.load(configFile);
}

} // namespace fbs

int
main(int argc, char** argv)
{
  using namespace fbs;

  std::string configFile = DEFAULT_CONFIG_FILE;

  po::options_description description("Options");
  description.add_options()
    ("help,h",    "print this message and exit")
    ("version,V", "show version information and exit")
    ("config,c",  po::value<std::string>(&configFile),
                  "path to configuration file (default: " DEFAULT_CONFIG_FILE ")")
    ("modules,m", "list available logging modules")
    ;

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  }
  catch (const std::exception& e) {
    // logging is not configured yet and the message is meant for the user
    std::cerr << "ERROR: " << e.what() << "\n\n";
    printUsage(std::cerr, argv[0], description);
    return 2;
  }

  if (vm.count("help") > 0) {
    printUsage(std::cout, argv[0], description);
    return 0;
  }

  if (vm.count("version") > 0) {
    std::cout << FBS_VERSION_STRING << std::endl;
    return 0;
  }

  if (vm.count("modules") > 0) {
    printLogModules(std::cout);
    return 0;
  }

  const std::string boostBuildInfo =
      "with Boost version " + to_string(BOOST_VERSION / 100000) +
      "." + to_string(BOOST_VERSION / 100 % 1000) +
      "." + to_string(BOOST_VERSION % 100);

  std::clog << "fabric-bootstrapper version " << FBS_VERSION_STRING << " starting\n"
            << "Built with " BOOST_COMPILER ", with " BOOST_STDLIB
               ", " << boostBuildInfo <<
               ", with ndn-cxx version " NDN_CXX_VERSION_BUILD_STRING
            << std::endl;

  BootstrapperConfig config;
  // without an explicit --config, a missing default file means built-in defaults
  if (vm.count("config") > 0 || boost::filesystem::exists(configFile)) {
    try {
      loadConfigFile(configFile, config);
    }
    catch (const std::exception& e) {
      FBS_LOG_FATAL(e.what());
      return 2;
    }
  }
  else {
    FBS_LOG_INFO("No configuration file at " << configFile << ", using defaults");
  }

  try {
    Bootstrapper bootstrapper(config);
    bootstrapper.run();
  }
  catch (const Bootstrapper::Error& e) {
    FBS_LOG_FATAL(e.what());
    return 1;
  }
  catch (const std::exception& e) {
    FBS_LOG_FATAL(boost::diagnostic_information(e));
    return 1;
  }

  return 0;
}
