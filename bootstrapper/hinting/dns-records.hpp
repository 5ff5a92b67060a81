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

#ifndef FBS_BOOTSTRAPPER_HINTING_DNS_RECORDS_HPP
#define FBS_BOOTSTRAPPER_HINTING_DNS_RECORDS_HPP

#include "core/common.hpp"

#include <boost/asio/ip/address.hpp>
#include <ndn-cxx/util/random.hpp>

#include <iosfwd>
#include <variant>

namespace fbs::hinting {

/**
 * \brief DNS resource record types used during discovery.
 */
enum class RecordType : uint16_t {
  A     = 1,
  PTR   = 12,
  AAAA  = 28,
  SRV   = 33,
  NAPTR = 35,
};

std::ostream&
operator<<(std::ostream& os, RecordType type);

/// A or AAAA record.
struct AddressRecord
{
  boost::asio::ip::address address;
};

struct PtrRecord
{
  std::string target;
};

/// \sa RFC 2782
struct SrvRecord
{
  uint16_t priority = 0;
  uint16_t weight = 0;
  uint16_t port = 0;
  std::string target;
};

/// \sa RFC 3403
struct NaptrRecord
{
  uint16_t order = 0;
  uint16_t preference = 0;
  std::string flags;
  std::string service;
  std::string regexp;
  std::string replacement;
};

using ResourceRecord = std::variant<AddressRecord, PtrRecord, SrvRecord, NaptrRecord>;

std::ostream&
operator<<(std::ostream& os, const AddressRecord& rr);

std::ostream&
operator<<(std::ostream& os, const PtrRecord& rr);

std::ostream&
operator<<(std::ostream& os, const SrvRecord& rr);

std::ostream&
operator<<(std::ostream& os, const NaptrRecord& rr);

std::ostream&
operator<<(std::ostream& os, const ResourceRecord& rr);

/**
 * \brief Arrange SRV records in the order in which their targets should be contacted.
 *
 * Records are grouped by ascending priority. Within one priority, records are picked one
 * at a time with a probability proportional to their weight among the records not yet
 * picked; when all remaining weights are zero, the pick is uniform. No record is dropped.
 *
 * \param rng source of randomness for the weighted selection
 * \sa RFC 2782, "Usage rules"
 */
void
sortServiceRecords(std::vector<SrvRecord>& records, ndn::random::RandomNumberEngine& rng);

/**
 * \brief Arrange NAPTR records by ascending order, then ascending preference.
 *
 * The sort is stable, so records with equal (order, preference) keep their relative position.
 * \sa RFC 3403, section 4.1
 */
void
sortNamingAuthorityRecords(std::vector<NaptrRecord>& records);

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_DNS_RECORDS_HPP
