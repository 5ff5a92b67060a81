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
#include "core/logger.hpp"

#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <limits>

namespace fbs::hinting {

FBS_LOG_INIT(DnsQuerier);

const size_t MAX_MESSAGE_SIZE = 65535;

UdpDnsQuerier::UdpDnsQuerier(time::milliseconds timeout)
  : m_timeout(timeout)
{
}

std::vector<uint8_t>
UdpDnsQuerier::makeQuery(uint16_t id, const std::string& name, RecordType type)
{
  std::vector<uint8_t> msg(NS_HFIXEDSZ + NS_MAXCDNAME + NS_QFIXEDSZ, 0);

  ns_put16(id, msg.data());
  ns_put16(0x0100, msg.data() + 2); // RD
  ns_put16(1, msg.data() + 4);      // QDCOUNT

  int nameLen = dn_comp(name.data(), msg.data() + NS_HFIXEDSZ, NS_MAXCDNAME, nullptr, nullptr);
  if (nameLen < 0) {
    NDN_THROW(Error("Cannot encode domain name '" + name + "'"));
  }

  uint8_t* question = msg.data() + NS_HFIXEDSZ + nameLen;
  ns_put16(static_cast<uint16_t>(type), question);
  ns_put16(ns_c_in, question + 2);

  msg.resize(NS_HFIXEDSZ + nameLen + NS_QFIXEDSZ);
  return msg;
}

static uint16_t
readUint16(const uint8_t*& pos, const uint8_t* end)
{
  if (end - pos < NS_INT16SZ) {
    NDN_THROW(DnsQuerier::Error("Truncated record data"));
  }
  uint16_t value = ns_get16(pos);
  pos += NS_INT16SZ;
  return value;
}

static std::string
readCharacterString(const uint8_t*& pos, const uint8_t* end)
{
  if (pos >= end) {
    NDN_THROW(DnsQuerier::Error("Truncated record data"));
  }
  size_t len = *pos++;
  if (static_cast<size_t>(end - pos) < len) {
    NDN_THROW(DnsQuerier::Error("Truncated character-string in record data"));
  }
  std::string str(reinterpret_cast<const char*>(pos), len);
  pos += len;
  return str;
}

static std::string
readDomainName(const ns_msg& handle, const uint8_t*& pos, const uint8_t* end)
{
  char name[NS_MAXDNAME];
  int nConsumed = dn_expand(ns_msg_base(handle), ns_msg_end(handle), pos, name, sizeof(name));
  if (nConsumed < 0 || nConsumed > end - pos) {
    NDN_THROW(DnsQuerier::Error("Malformed domain name in record data"));
  }
  pos += nConsumed;
  return name;
}

static optional<ResourceRecord>
decodeRecord(const ns_msg& handle, const ns_rr& rr)
{
  const uint8_t* pos = ns_rr_rdata(rr);
  const uint8_t* end = pos + ns_rr_rdlen(rr);

  switch (ns_rr_type(rr)) {
    case ns_t_a: {
      boost::asio::ip::address_v4::bytes_type bytes;
      if (ns_rr_rdlen(rr) != bytes.size()) {
        NDN_THROW(DnsQuerier::Error("Invalid A record length " + to_string(ns_rr_rdlen(rr))));
      }
      std::memcpy(bytes.data(), pos, bytes.size());
      return AddressRecord{boost::asio::ip::address_v4(bytes)};
    }
    case ns_t_aaaa: {
      boost::asio::ip::address_v6::bytes_type bytes;
      if (ns_rr_rdlen(rr) != bytes.size()) {
        NDN_THROW(DnsQuerier::Error("Invalid AAAA record length " + to_string(ns_rr_rdlen(rr))));
      }
      std::memcpy(bytes.data(), pos, bytes.size());
      return AddressRecord{boost::asio::ip::address_v6(bytes)};
    }
    case ns_t_ptr:
      return PtrRecord{readDomainName(handle, pos, end)};
    case ns_t_srv: {
      SrvRecord srv;
      srv.priority = readUint16(pos, end);
      srv.weight = readUint16(pos, end);
      srv.port = readUint16(pos, end);
      srv.target = readDomainName(handle, pos, end);
      return srv;
    }
    case ns_t_naptr: {
      NaptrRecord naptr;
      naptr.order = readUint16(pos, end);
      naptr.preference = readUint16(pos, end);
      naptr.flags = readCharacterString(pos, end);
      naptr.service = readCharacterString(pos, end);
      naptr.regexp = readCharacterString(pos, end);
      naptr.replacement = readDomainName(handle, pos, end);
      return naptr;
    }
    default:
      return nullopt;
  }
}

std::vector<ResourceRecord>
UdpDnsQuerier::parseResponse(const uint8_t* msg, size_t msgLen, uint16_t id)
{
  ns_msg handle;
  if (msgLen > static_cast<size_t>(std::numeric_limits<int>::max()) ||
      ns_initparse(msg, static_cast<int>(msgLen), &handle) < 0) {
    NDN_THROW(Error("Malformed DNS message"));
  }
  if (ns_msg_id(handle) != id) {
    NDN_THROW(Error("DNS message ID " + to_string(ns_msg_id(handle)) +
                    " does not match query ID " + to_string(id)));
  }
  if (ns_msg_getflag(handle, ns_f_qr) == 0) {
    NDN_THROW(Error("DNS message is not a response"));
  }

  int rcode = ns_msg_getflag(handle, ns_f_rcode);
  if (rcode == ns_r_nxdomain) {
    return {};
  }
  if (rcode != ns_r_noerror) {
    NDN_THROW(Error("DNS server responded with "s + p_rcode(rcode)));
  }
  if (ns_msg_getflag(handle, ns_f_tc) != 0) {
    FBS_LOG_DEBUG("Response " << id << " is truncated");
  }

  std::vector<ResourceRecord> records;
  for (int i = 0; i < ns_msg_count(handle, ns_s_an); ++i) {
    ns_rr rr;
    if (ns_parserr(&handle, ns_s_an, i, &rr) < 0) {
      NDN_THROW(Error("Malformed answer record #" + to_string(i)));
    }
    if (ns_rr_class(rr) != ns_c_in) {
      continue;
    }
    auto record = decodeRecord(handle, rr);
    if (record) {
      records.push_back(std::move(*record));
    }
    else {
      FBS_LOG_TRACE("Ignoring answer of type " << p_type(ns_rr_type(rr)));
    }
  }
  return records;
}

std::vector<ResourceRecord>
UdpDnsQuerier::query(const std::string& resolver, const std::string& name, RecordType type,
                     const CancelPredicate& isCancelled)
{
  namespace ip = boost::asio::ip;

  const std::string context = " (" + name + " " + boost::lexical_cast<std::string>(type) +
                              " @" + resolver + ")";

  boost::system::error_code ec;
  auto address = ip::make_address(resolver, ec);
  if (ec) {
    NDN_THROW(Error("Invalid resolver address" + context));
  }
  const ip::udp::endpoint server(address, DNS_PORT);

  auto id = static_cast<uint16_t>(ndn::random::generateWord32());
  auto request = makeQuery(id, name, type);
  FBS_LOG_DEBUG("Sending query " << id << context);

  boost::asio::io_context io;
  ip::udp::socket socket(io);
  socket.open(server.protocol(), ec);
  if (ec) {
    NDN_THROW(Error("Cannot open socket: " + ec.message() + context));
  }

  std::vector<uint8_t> response(MAX_MESSAGE_SIZE);
  ip::udp::endpoint sender;
  optional<std::vector<ResourceRecord>> records;
  std::string failure;

  std::function<void()> receive = [&] {
    socket.async_receive_from(boost::asio::buffer(response), sender,
      [&] (const boost::system::error_code& error, size_t nBytes) {
        if (error) {
          failure = "Receive error: " + error.message();
          io.stop();
          return;
        }
        if (sender != server || nBytes < NS_HFIXEDSZ || ns_get16(response.data()) != id) {
          FBS_LOG_TRACE("Dropping unrelated datagram from " << sender);
          receive();
          return;
        }
        try {
          records = parseResponse(response.data(), nBytes, id);
        }
        catch (const Error& e) {
          failure = e.what();
        }
        io.stop();
      });
  };

  socket.async_send_to(boost::asio::buffer(request), server,
    [&] (const boost::system::error_code& error, size_t) {
      if (error) {
        failure = "Send error: " + error.message();
        io.stop();
        return;
      }
      receive();
    });

  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + std::chrono::milliseconds(m_timeout.count());
  bool wasCancelled = false;
  while (!io.stopped()) {
    auto now = Clock::now();
    if (now >= deadline) {
      break;
    }
    if (isCancelled && isCancelled()) {
      wasCancelled = true;
      break;
    }
    io.run_for(std::min<Clock::duration>(deadline - now, POLL_INTERVAL));
  }

  if (records) {
    FBS_LOG_DEBUG("Response " << id << " has " << records->size() << " usable answer(s)");
    return std::move(*records);
  }
  if (!failure.empty()) {
    NDN_THROW(Error(failure + context));
  }
  if (wasCancelled) {
    NDN_THROW(Error("Query abandoned" + context));
  }
  NDN_THROW(Error("Timeout after " + to_string(m_timeout.count()) + " ms" + context));
}

} // namespace fbs::hinting
