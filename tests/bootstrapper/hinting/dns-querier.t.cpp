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

#include "bootstrapper/hinting/dns-querier.hpp"

#include "tests/test-common.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <chrono>

namespace fbs::hinting::tests {

using boost::asio::ip::make_address;

/**
 * \brief Assembles DNS response messages for the decoder tests.
 *
 * Names are written uncompressed unless a pointer to the question name is requested.
 */
class ResponseBuilder
{
public:
  static constexpr uint16_t FLAGS_NOERROR = 0x8180;
  static constexpr uint16_t FLAGS_NXDOMAIN = 0x8183;
  static constexpr uint16_t FLAGS_SERVFAIL = 0x8182;
  static constexpr uint16_t FLAGS_QUERY = 0x0100;

  ResponseBuilder(uint16_t id, uint16_t flags, const std::string& qname = "example.org",
                  uint16_t qtype = 33)
  {
    put16(m_header, id);
    put16(m_header, flags);
    put16(m_header, 1); // QDCOUNT
    put16(m_header, 0); // ANCOUNT, patched by build()
    put16(m_header, 0); // NSCOUNT
    put16(m_header, 0); // ARCOUNT
    putName(m_header, qname);
    put16(m_header, qtype);
    put16(m_header, 1);
  }

  static void
  put16(std::vector<uint8_t>& buf, uint16_t value)
  {
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value & 0xFF));
  }

  static void
  putName(std::vector<uint8_t>& buf, const std::string& name)
  {
    std::vector<std::string> labels;
    boost::split(labels, name, boost::is_any_of("."));
    for (const auto& label : labels) {
      if (label.empty()) {
        continue;
      }
      buf.push_back(static_cast<uint8_t>(label.size()));
      buf.insert(buf.end(), label.begin(), label.end());
    }
    buf.push_back(0);
  }

  static void
  putString(std::vector<uint8_t>& buf, const std::string& str)
  {
    buf.push_back(static_cast<uint8_t>(str.size()));
    buf.insert(buf.end(), str.begin(), str.end());
  }

  /// pointer to the question name
  static void
  putQuestionNamePointer(std::vector<uint8_t>& buf)
  {
    buf.push_back(0xC0);
    buf.push_back(12);
  }

  ResponseBuilder&
  addAnswer(uint16_t type, const std::vector<uint8_t>& rdata, uint16_t cls = 1)
  {
    putQuestionNamePointer(m_answers);
    put16(m_answers, type);
    put16(m_answers, cls);
    put16(m_answers, 0);   // TTL
    put16(m_answers, 300);
    put16(m_answers, static_cast<uint16_t>(rdata.size()));
    m_answers.insert(m_answers.end(), rdata.begin(), rdata.end());
    ++m_nAnswers;
    return *this;
  }

  std::vector<uint8_t>
  build() const
  {
    auto msg = m_header;
    msg[6] = static_cast<uint8_t>(m_nAnswers >> 8);
    msg[7] = static_cast<uint8_t>(m_nAnswers & 0xFF);
    msg.insert(msg.end(), m_answers.begin(), m_answers.end());
    return msg;
  }

private:
  std::vector<uint8_t> m_header;
  std::vector<uint8_t> m_answers;
  uint16_t m_nAnswers = 0;
};

static std::vector<uint8_t>
makeSrvData(uint16_t priority, uint16_t weight, uint16_t port, const std::string& target)
{
  std::vector<uint8_t> rdata;
  ResponseBuilder::put16(rdata, priority);
  ResponseBuilder::put16(rdata, weight);
  ResponseBuilder::put16(rdata, port);
  ResponseBuilder::putName(rdata, target);
  return rdata;
}

static std::vector<ResourceRecord>
parse(const std::vector<uint8_t>& msg, uint16_t id)
{
  return UdpDnsQuerier::parseResponse(msg.data(), msg.size(), id);
}

BOOST_AUTO_TEST_SUITE(Hinting)
BOOST_AUTO_TEST_SUITE(TestUdpDnsQuerier)

BOOST_AUTO_TEST_CASE(MakeQuery)
{
  auto msg = UdpDnsQuerier::makeQuery(0x1234, "example.org.", RecordType::SRV);

  std::vector<uint8_t> expected{
    0x12, 0x34, // ID
    0x01, 0x00, // RD
    0x00, 0x01, // QDCOUNT
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    7, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 3, 'o', 'r', 'g', 0,
    0x00, 33,   // SRV
    0x00, 0x01, // IN
  };
  BOOST_CHECK_EQUAL_COLLECTIONS(msg.begin(), msg.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(MakeQueryInvalidName)
{
  std::string longLabel(64, 'a');
  BOOST_CHECK_THROW(UdpDnsQuerier::makeQuery(1, longLabel + ".example.org.", RecordType::A),
                    DnsQuerier::Error);
}

BOOST_AUTO_TEST_CASE(ParseAddresses)
{
  auto msg = ResponseBuilder(7, ResponseBuilder::FLAGS_NOERROR, "discovery.example.org", 1)
    .addAnswer(1, {192, 0, 2, 1})
    .addAnswer(28, {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x01})
    .build();

  auto records = parse(msg, 7);
  BOOST_REQUIRE_EQUAL(records.size(), 2);
  BOOST_REQUIRE(std::holds_alternative<AddressRecord>(records[0]));
  BOOST_CHECK_EQUAL(std::get<AddressRecord>(records[0]).address, make_address("192.0.2.1"));
  BOOST_REQUIRE(std::holds_alternative<AddressRecord>(records[1]));
  BOOST_CHECK_EQUAL(std::get<AddressRecord>(records[1]).address, make_address("2001:db8::1"));
}

BOOST_AUTO_TEST_CASE(ParseSrv)
{
  auto msg = ResponseBuilder(42, ResponseBuilder::FLAGS_NOERROR, "_fabricdiscovery._tcp.example.org")
    .addAnswer(33, makeSrvData(10, 60, 8041, "discovery.example.org"))
    .addAnswer(16, {4, 't', 'e', 'x', 't'}) // TXT, ignored
    .addAnswer(1, {192, 0, 2, 99}, 3)       // class CH, ignored
    .build();

  auto records = parse(msg, 42);
  BOOST_REQUIRE_EQUAL(records.size(), 1);
  const auto* srv = std::get_if<SrvRecord>(&records[0]);
  BOOST_REQUIRE(srv != nullptr);
  BOOST_CHECK_EQUAL(srv->priority, 10);
  BOOST_CHECK_EQUAL(srv->weight, 60);
  BOOST_CHECK_EQUAL(srv->port, 8041);
  BOOST_CHECK_EQUAL(srv->target, "discovery.example.org");
}

BOOST_AUTO_TEST_CASE(ParsePtrWithCompression)
{
  // "instance" followed by a pointer to the question name
  std::vector<uint8_t> rdata{8, 'i', 'n', 's', 't', 'a', 'n', 'c', 'e'};
  ResponseBuilder::putQuestionNamePointer(rdata);

  auto msg = ResponseBuilder(3, ResponseBuilder::FLAGS_NOERROR, "_fabricdiscovery._tcp.example.org", 12)
    .addAnswer(12, rdata)
    .build();

  auto records = parse(msg, 3);
  BOOST_REQUIRE_EQUAL(records.size(), 1);
  const auto* ptr = std::get_if<PtrRecord>(&records[0]);
  BOOST_REQUIRE(ptr != nullptr);
  BOOST_CHECK_EQUAL(ptr->target, "instance._fabricdiscovery._tcp.example.org");
}

BOOST_AUTO_TEST_CASE(ParseNaptr)
{
  std::vector<uint8_t> rdata;
  ResponseBuilder::put16(rdata, 100);
  ResponseBuilder::put16(rdata, 10);
  ResponseBuilder::putString(rdata, "S");
  ResponseBuilder::putString(rdata, "x-fabricdiscovery:tcp");
  ResponseBuilder::putString(rdata, "");
  ResponseBuilder::putName(rdata, "_fabricdiscovery._tcp.example.org");

  auto msg = ResponseBuilder(9, ResponseBuilder::FLAGS_NOERROR, "example.org", 35)
    .addAnswer(35, rdata)
    .build();

  auto records = parse(msg, 9);
  BOOST_REQUIRE_EQUAL(records.size(), 1);
  const auto* naptr = std::get_if<NaptrRecord>(&records[0]);
  BOOST_REQUIRE(naptr != nullptr);
  BOOST_CHECK_EQUAL(naptr->order, 100);
  BOOST_CHECK_EQUAL(naptr->preference, 10);
  BOOST_CHECK_EQUAL(naptr->flags, "S");
  BOOST_CHECK_EQUAL(naptr->service, "x-fabricdiscovery:tcp");
  BOOST_CHECK_EQUAL(naptr->regexp, "");
  BOOST_CHECK_EQUAL(naptr->replacement, "_fabricdiscovery._tcp.example.org");
}

BOOST_AUTO_TEST_CASE(NxDomain)
{
  auto msg = ResponseBuilder(5, ResponseBuilder::FLAGS_NXDOMAIN).build();
  BOOST_CHECK(parse(msg, 5).empty());
}

BOOST_AUTO_TEST_CASE(ErrorResponseCode)
{
  auto msg = ResponseBuilder(5, ResponseBuilder::FLAGS_SERVFAIL).build();
  BOOST_CHECK_THROW(parse(msg, 5), DnsQuerier::Error);
}

BOOST_AUTO_TEST_CASE(MismatchedResponse)
{
  auto msg = ResponseBuilder(5, ResponseBuilder::FLAGS_NOERROR)
    .addAnswer(1, {192, 0, 2, 1})
    .build();
  BOOST_CHECK_THROW(parse(msg, 6), DnsQuerier::Error);

  auto query = ResponseBuilder(5, ResponseBuilder::FLAGS_QUERY).build();
  BOOST_CHECK_THROW(parse(query, 5), DnsQuerier::Error);
}

BOOST_AUTO_TEST_CASE(MalformedRecordData)
{
  auto shortA = ResponseBuilder(1, ResponseBuilder::FLAGS_NOERROR)
    .addAnswer(1, {192, 0, 2})
    .build();
  BOOST_CHECK_THROW(parse(shortA, 1), DnsQuerier::Error);

  auto shortSrv = ResponseBuilder(1, ResponseBuilder::FLAGS_NOERROR)
    .addAnswer(33, {0, 1, 0})
    .build();
  BOOST_CHECK_THROW(parse(shortSrv, 1), DnsQuerier::Error);

  auto shortNaptr = ResponseBuilder(1, ResponseBuilder::FLAGS_NOERROR)
    .addAnswer(35, {0, 1, 0, 1, 5, 'A'})
    .build();
  BOOST_CHECK_THROW(parse(shortNaptr, 1), DnsQuerier::Error);
}

BOOST_AUTO_TEST_CASE(MalformedMessage)
{
  std::vector<uint8_t> garbage{0x00, 0x05, 0x81};
  BOOST_CHECK_THROW(parse(garbage, 5), DnsQuerier::Error);

  // answer count larger than the number of answers present
  auto msg = ResponseBuilder(5, ResponseBuilder::FLAGS_NOERROR).build();
  msg[7] = 2;
  BOOST_CHECK_THROW(parse(msg, 5), DnsQuerier::Error);
}

BOOST_AUTO_TEST_CASE(InvalidResolver)
{
  UdpDnsQuerier querier(100_ms);
  BOOST_CHECK_THROW(querier.query("not-an-address", "example.org.", RecordType::A, nullptr),
                    DnsQuerier::Error);
}

BOOST_AUTO_TEST_CASE(Cancelled)
{
  UdpDnsQuerier querier(30_s);
  auto start = std::chrono::steady_clock::now();
  int nPolls = 0;
  try {
    // 192.0.2.0/24 is reserved for documentation, nothing answers there
    querier.query("192.0.2.1", "example.org.", RecordType::SRV, [&nPolls] { return ++nPolls > 3; });
    BOOST_ERROR("query() should not return without an answer");
  }
  catch (const DnsQuerier::Error&) {
  }
  BOOST_CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

BOOST_AUTO_TEST_SUITE_END() // TestUdpDnsQuerier
BOOST_AUTO_TEST_SUITE_END() // Hinting

} // namespace fbs::hinting::tests
