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

#include "bootstrapper/fetch/artifact-fetcher.hpp"
#include "bootstrapper/fetch/tar-reader.hpp"
#include "bootstrapper/fetch/topology.hpp"
#include "core/logger.hpp"

#include <boost/filesystem.hpp>

#include <fstream>
#include <set>

namespace fbs::fetch {

namespace fs = boost::filesystem;

FBS_LOG_INIT(ArtifactFetcher);

namespace {

/**
 * \brief A scratch directory that is removed with everything left in it.
 */
class StagingDirectory : noncopyable
{
public:
  explicit
  StagingDirectory(const fs::path& parent)
    : m_path(parent / fs::unique_path(".staging-%%%%-%%%%-%%%%"))
  {
    fs::create_directories(m_path);
  }

  ~StagingDirectory()
  {
    boost::system::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
      FBS_LOG_WARN("Cannot remove " << m_path << ": " << ec.message());
    }
  }

  const fs::path&
  getPath() const
  {
    return m_path;
  }

private:
  fs::path m_path;
};

} // namespace

ArtifactFetcher::ArtifactFetcher(const Options& options, HttpClient& client)
  : m_options(options)
  , m_client(client)
{
}

std::string
ArtifactFetcher::buildUrl(const hinting::DiscoveredAddress& address, const std::string& endpoint,
                          uint16_t defaultPort)
{
  auto withPort = address.withDefaultPort(defaultPort);
  return "http://" + withPort.toString() + "/" + BASE_PATH + endpoint;
}

void
ArtifactFetcher::fetch(const hinting::DiscoveredAddress& address)
{
  fetchTopology(address);
  fetchTrustRoots(address);
}

void
ArtifactFetcher::fetchTopology(const hinting::DiscoveredAddress& address)
{
  auto url = buildUrl(address, TOPOLOGY_ENDPOINT, m_options.discoveryPort);
  FBS_LOG_INFO("Fetching topology from " << url);

  std::string document;
  try {
    auto body = m_client.get(url, m_options.requestTimeout);

    char buffer[4096];
    while (body->read(buffer, sizeof(buffer)) || body->gcount() > 0) {
      document.append(buffer, static_cast<size_t>(body->gcount()));
      if (document.size() > m_options.maxTopologySize) {
        NDN_THROW(Error("Topology from " + url + " exceeds " +
                        to_string(m_options.maxTopologySize) + " bytes"));
      }
    }
    if (body->bad()) {
      NDN_THROW(Error("Failed to read topology from " + url));
    }
  }
  catch (const HttpClient::Error& e) {
    NDN_THROW_NESTED(Error("Failed to fetch topology: "s + e.what()));
  }

  try {
    auto topology = Topology::parse(document);
    FBS_LOG_DEBUG("Topology of " << topology.getIsdAs() << " with "
                  << topology.getBorderRouterCount() << " border router(s)");
  }
  catch (const Topology::Error& e) {
    NDN_THROW_NESTED(Error("Invalid topology from " + url + ": " + e.what()));
  }

  try {
    fs::path configDir(m_options.configDir);
    fs::create_directories(configDir);
    fs::path target = configDir / TOPOLOGY_FILE_NAME;
    fs::path temp = configDir / ("." + TOPOLOGY_FILE_NAME + ".tmp");

    std::ofstream ofs(temp.string(), std::ios::binary | std::ios::trunc);
    ofs.write(document.data(), static_cast<std::streamsize>(document.size()));
    ofs.close();
    if (!ofs) {
      boost::system::error_code ec;
      fs::remove(temp, ec);
      NDN_THROW(Error("Cannot write " + temp.string()));
    }
    fs::rename(temp, target);
    FBS_LOG_INFO("Stored topology in " << target);
  }
  catch (const fs::filesystem_error& e) {
    NDN_THROW_NESTED(Error("Cannot store topology: "s + e.what()));
  }
}

void
ArtifactFetcher::fetchTrustRoots(const hinting::DiscoveredAddress& address)
{
  auto url = buildUrl(address, TRUST_ROOTS_ENDPOINT, m_options.discoveryPort);
  FBS_LOG_INFO("Fetching trust roots from " << url);

  try {
    auto body = m_client.get(url, m_options.requestTimeout);

    fs::path configDir(m_options.configDir);
    fs::create_directories(configDir);
    StagingDirectory staging(configDir);

    TarReader reader(*body);
    std::set<std::string> names;
    while (auto entry = reader.next()) {
      switch (entry->type) {
        case TarReader::EntryType::REGULAR:
          break;
        case TarReader::EntryType::DIRECTORY:
          NDN_THROW(Error("Trust root archive must contain files only, found directory '" +
                          entry->name + "'"));
        default:
          NDN_THROW(Error("Trust root archive must contain files only, found entry '" +
                          entry->name + "' of type '" + std::string(1, entry->typeflag) + "'"));
      }

      auto name = fs::path(entry->name).filename().string();
      if (name.empty() || name == "." || name == ".." || name == "/") {
        FBS_LOG_WARN("Skipping trust root with invalid name '" << entry->name << "'");
        continue;
      }

      auto stagedFile = staging.getPath() / name;
      FBS_LOG_DEBUG("Extracting " << entry->name << " (" << entry->size << " bytes)");
      std::ofstream ofs(stagedFile.string(), std::ios::binary | std::ios::trunc);
      if (!ofs) {
        NDN_THROW(Error("Cannot create " + stagedFile.string()));
      }
      reader.copyData(ofs);
      ofs.close();
      if (!ofs) {
        NDN_THROW(Error("Cannot write " + stagedFile.string()));
      }
      names.insert(name);
    }

    fs::path certsDir = configDir / CERTS_DIR_NAME;
    fs::create_directories(certsDir);
    for (const auto& name : names) {
      fs::rename(staging.getPath() / name, certsDir / name);
      FBS_LOG_INFO("Stored trust root " << certsDir / name);
    }
    if (names.empty()) {
      FBS_LOG_WARN("Trust root archive from " << url << " contains no usable file");
    }
  }
  catch (const HttpClient::Error& e) {
    NDN_THROW_NESTED(Error("Failed to fetch trust roots: "s + e.what()));
  }
  catch (const TarReader::Error& e) {
    NDN_THROW_NESTED(Error("Malformed trust root archive from " + url + ": " + e.what()));
  }
  catch (const fs::filesystem_error& e) {
    NDN_THROW_NESTED(Error("Cannot store trust roots: "s + e.what()));
  }
}

} // namespace fbs::fetch
