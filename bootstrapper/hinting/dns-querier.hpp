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

#ifndef FBS_BOOTSTRAPPER_HINTING_DNS_QUERIER_HPP
#define FBS_BOOTSTRAPPER_HINTING_DNS_QUERIER_HPP

#include "bootstrapper/hinting/dns-records.hpp"

#include <chrono>

namespace fbs::hinting {

/**
 * \brief Sends one DNS question to one resolver and returns the answer section.
 */
class DnsQuerier : noncopyable
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /// returns true once the caller no longer needs the answer
  using CancelPredicate = std::function<bool()>;

  virtual
  ~DnsQuerier() = default;

  /** \brief Ask \p resolver for records of \p type owned by \p name.
   *  \param isCancelled polled while waiting for the answer, may be empty
   *  \return records of the answer section with a supported type, in wire order;
   *          empty if the name does not exist
   *  \throw Error transport failure, timeout, cancellation, malformed response,
   *               or error response code
   */
  virtual std::vector<ResourceRecord>
  query(const std::string& resolver, const std::string& name, RecordType type,
        const CancelPredicate& isCancelled) = 0;
};

/**
 * \brief DnsQuerier that exchanges a single UDP datagram with the resolver on port 53.
 *
 * Messages are encoded and decoded with libresolv. Each query has its own deadline and is
 * safe to run concurrently with queries on other threads. A cancelled query is abandoned
 * within #POLL_INTERVAL.
 */
class UdpDnsQuerier final : public DnsQuerier
{
public:
  explicit
  UdpDnsQuerier(time::milliseconds timeout);

  std::vector<ResourceRecord>
  query(const std::string& resolver, const std::string& name, RecordType type,
        const CancelPredicate& isCancelled) final;

PUBLIC_WITH_TESTS_ELSE_PRIVATE:
  /** \brief Encode a recursive query for (\p name, IN, \p type).
   *  \throw Error \p name is not a valid domain name
   */
  static std::vector<uint8_t>
  makeQuery(uint16_t id, const std::string& name, RecordType type);

  /** \brief Decode the answer section of a response to query \p id.
   *  \throw Error the message is malformed, is not a response to \p id,
   *               or carries an error response code other than NXDOMAIN
   */
  static std::vector<ResourceRecord>
  parseResponse(const uint8_t* msg, size_t msgLen, uint16_t id);

public:
  static constexpr uint16_t DNS_PORT = 53;
  /// how often the cancel predicate is consulted while waiting
  static constexpr std::chrono::milliseconds POLL_INTERVAL{50};

private:
  time::milliseconds m_timeout;
};

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_DNS_QUERIER_HPP
