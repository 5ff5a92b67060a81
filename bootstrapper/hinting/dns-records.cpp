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

#include "bootstrapper/hinting/dns-records.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <ostream>
#include <random>
#include <tuple>

namespace fbs::hinting {

std::ostream&
operator<<(std::ostream& os, RecordType type)
{
  switch (type) {
    case RecordType::A:
      return os << "A";
    case RecordType::PTR:
      return os << "PTR";
    case RecordType::AAAA:
      return os << "AAAA";
    case RecordType::SRV:
      return os << "SRV";
    case RecordType::NAPTR:
      return os << "NAPTR";
  }
  return os << "TYPE" << static_cast<uint16_t>(type);
}

std::ostream&
operator<<(std::ostream& os, const AddressRecord& rr)
{
  return os << (rr.address.is_v6() ? "AAAA " : "A ") << rr.address;
}

std::ostream&
operator<<(std::ostream& os, const PtrRecord& rr)
{
  return os << "PTR " << rr.target;
}

std::ostream&
operator<<(std::ostream& os, const SrvRecord& rr)
{
  return os << "SRV " << rr.priority << ' ' << rr.weight << ' ' << rr.port << ' ' << rr.target;
}

std::ostream&
operator<<(std::ostream& os, const NaptrRecord& rr)
{
  return os << "NAPTR " << rr.order << ' ' << rr.preference
            << " \"" << rr.flags << "\" \"" << rr.service << "\" \"" << rr.regexp << "\" "
            << rr.replacement;
}

std::ostream&
operator<<(std::ostream& os, const ResourceRecord& rr)
{
  std::visit([&os] (const auto& r) { os << r; }, rr);
  return os;
}

void
sortServiceRecords(std::vector<SrvRecord>& records, ndn::random::RandomNumberEngine& rng)
{
  std::stable_sort(records.begin(), records.end(),
                   [] (const auto& a, const auto& b) { return a.priority < b.priority; });

  std::vector<SrvRecord> ordered;
  ordered.reserve(records.size());

  auto tierBegin = records.begin();
  while (tierBegin != records.end()) {
    auto tierEnd = std::find_if(tierBegin, records.end(),
                                [p = tierBegin->priority] (const auto& r) { return r.priority != p; });
    std::vector<SrvRecord> tier(std::make_move_iterator(tierBegin), std::make_move_iterator(tierEnd));

    while (!tier.empty()) {
      uint32_t sum = std::accumulate(tier.begin(), tier.end(), uint32_t(0),
                                     [] (uint32_t s, const auto& r) { return s + r.weight; });
      size_t chosen = 0;
      if (sum == 0) {
        std::uniform_int_distribution<size_t> dist(0, tier.size() - 1);
        chosen = dist(rng);
      }
      else {
        // select the first record whose running weight sum reaches the random number;
        // zero-weight records can never be selected this way while others remain
        std::uniform_int_distribution<uint32_t> dist(1, sum);
        uint32_t threshold = dist(rng);
        uint32_t running = 0;
        for (; chosen < tier.size(); ++chosen) {
          running += tier[chosen].weight;
          if (running >= threshold) {
            break;
          }
        }
        BOOST_ASSERT(chosen < tier.size());
      }

      ordered.push_back(std::move(tier[chosen]));
      tier.erase(tier.begin() + chosen);
    }

    tierBegin = tierEnd;
  }

  records = std::move(ordered);
}

void
sortNamingAuthorityRecords(std::vector<NaptrRecord>& records)
{
  std::stable_sort(records.begin(), records.end(), [] (const auto& a, const auto& b) {
    return std::tie(a.order, a.preference) < std::tie(b.order, b.preference);
  });
}

} // namespace fbs::hinting
