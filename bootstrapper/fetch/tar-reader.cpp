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

#include "bootstrapper/fetch/tar-reader.hpp"
#include "core/logger.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <array>
#include <istream>
#include <ostream>

namespace fbs::fetch {

FBS_LOG_INIT(TarReader);

// ustar header layout
namespace field {
constexpr size_t NAME = 0, NAME_LEN = 100;
constexpr size_t SIZE = 124, SIZE_LEN = 12;
constexpr size_t CHKSUM = 148, CHKSUM_LEN = 8;
constexpr size_t TYPEFLAG = 156;
constexpr size_t MAGIC = 257;
constexpr size_t PREFIX = 345, PREFIX_LEN = 155;
} // namespace field

static std::string
getString(const char* block, size_t offset, size_t length)
{
  const char* begin = block + offset;
  return std::string(begin, std::find(begin, begin + length, '\0'));
}

static uint64_t
parseNumeric(const char* block, size_t offset, size_t length)
{
  const auto* p = reinterpret_cast<const uint8_t*>(block + offset);

  if (p[0] & 0x80) {
    // base-256, big endian
    if (p[0] != 0x80) {
      NDN_THROW(TarReader::Error("Unsupported base-256 numeric field"));
    }
    uint64_t value = 0;
    for (size_t i = 1; i < length; ++i) {
      if (value >> 56) {
        NDN_THROW(TarReader::Error("Numeric field out of range"));
      }
      value = (value << 8) | p[i];
    }
    return value;
  }

  size_t i = 0;
  while (i < length && p[i] == ' ') {
    ++i;
  }
  uint64_t value = 0;
  for (; i < length && p[i] != '\0' && p[i] != ' '; ++i) {
    if (p[i] < '0' || p[i] > '7') {
      NDN_THROW(TarReader::Error("Invalid octal digit in header"));
    }
    if (value >> 61) {
      NDN_THROW(TarReader::Error("Numeric field out of range"));
    }
    value = (value << 3) | static_cast<uint64_t>(p[i] - '0');
  }
  return value;
}

static bool
isZeroBlock(const char* block)
{
  return std::all_of(block, block + TarReader::BLOCK_SIZE, [] (char c) { return c == '\0'; });
}

static void
verifyChecksum(const char* block)
{
  uint64_t expected = parseNumeric(block, field::CHKSUM, field::CHKSUM_LEN);

  // the checksum field itself counts as spaces
  uint64_t unsignedSum = 0;
  int64_t signedSum = 0;
  for (size_t i = 0; i < TarReader::BLOCK_SIZE; ++i) {
    bool inChecksum = i >= field::CHKSUM && i < field::CHKSUM + field::CHKSUM_LEN;
    char c = inChecksum ? ' ' : block[i];
    unsignedSum += static_cast<uint8_t>(c);
    signedSum += static_cast<signed char>(c);
  }

  if (expected != unsignedSum && static_cast<int64_t>(expected) != signedSum) {
    NDN_THROW(TarReader::Error("Header checksum mismatch"));
  }
}

static uint64_t
getPadding(uint64_t size)
{
  return (TarReader::BLOCK_SIZE - size % TarReader::BLOCK_SIZE) % TarReader::BLOCK_SIZE;
}

TarReader::TarReader(std::istream& is)
  : m_is(is)
{
}

optional<TarReader::Entry>
TarReader::next()
{
  if (m_isEnd) {
    return nullopt;
  }

  skip(m_remaining + m_padding);
  m_remaining = m_padding = 0;

  optional<std::string> longName;
  optional<uint64_t> paxSize;
  std::array<char, BLOCK_SIZE> block;

  while (true) {
    if (!readBlock(block.data()) || isZeroBlock(block.data())) {
      if (longName || paxSize) {
        NDN_THROW(Error("Archive ends after an extended header"));
      }
      m_isEnd = true;
      return nullopt;
    }
    verifyChecksum(block.data());

    char typeflag = block[field::TYPEFLAG];
    uint64_t size = parseNumeric(block.data(), field::SIZE, field::SIZE_LEN);

    switch (typeflag) {
      case 'L': {
        auto data = readData(size);
        longName = data.substr(0, data.find('\0'));
        continue;
      }
      case 'x': {
        parsePaxRecords(readData(size), longName, paxSize);
        continue;
      }
      case 'g':
      case 'K':
        FBS_LOG_TRACE("Skipping header of type '" << typeflag << "'");
        readData(size);
        continue;
    }

    Entry entry;
    entry.typeflag = typeflag;
    entry.size = paxSize.value_or(size);
    if (longName) {
      entry.name = *longName;
    }
    else {
      entry.name = getString(block.data(), field::NAME, field::NAME_LEN);
      auto prefix = getString(block.data(), field::PREFIX, field::PREFIX_LEN);
      if (getString(block.data(), field::MAGIC, 6) == "ustar" && !prefix.empty()) {
        entry.name = prefix + "/" + entry.name;
      }
    }

    switch (typeflag) {
      case '0':
        entry.type = EntryType::REGULAR;
        break;
      case '\0':
        // pre-POSIX archives mark directories only with a trailing slash
        entry.type = !entry.name.empty() && entry.name.back() == '/' ?
                     EntryType::DIRECTORY : EntryType::REGULAR;
        break;
      case '5':
        entry.type = EntryType::DIRECTORY;
        break;
      default:
        entry.type = EntryType::OTHER;
        break;
    }

    // links, devices and directories carry no data regardless of the size field
    m_remaining = entry.type == EntryType::REGULAR || typeflag == '7' ? entry.size : 0;
    m_padding = getPadding(m_remaining);

    FBS_LOG_TRACE("Entry " << entry.name << " type=" << entry.type << " size=" << entry.size);
    return entry;
  }
}

void
TarReader::copyData(std::ostream& os)
{
  std::array<char, 4096> buffer;
  while (m_remaining > 0) {
    auto chunk = static_cast<std::streamsize>(std::min<uint64_t>(m_remaining, buffer.size()));
    m_is.read(buffer.data(), chunk);
    if (m_is.gcount() != chunk) {
      NDN_THROW(Error("Archive truncated inside entry data"));
    }
    os.write(buffer.data(), chunk);
    if (!os) {
      NDN_THROW(Error("Failed to write entry data"));
    }
    m_remaining -= static_cast<uint64_t>(chunk);
  }
}

bool
TarReader::readBlock(char* block)
{
  m_is.read(block, BLOCK_SIZE);
  auto n = m_is.gcount();
  if (n == 0 && m_is.eof()) {
    return false;
  }
  if (n != static_cast<std::streamsize>(BLOCK_SIZE)) {
    NDN_THROW(Error("Archive truncated inside a header"));
  }
  return true;
}

std::string
TarReader::readData(uint64_t size)
{
  // extended headers are small; refuse anything that is not
  static constexpr uint64_t MAX_EXTENDED_HEADER_SIZE = 1024 * 1024;
  if (size > MAX_EXTENDED_HEADER_SIZE) {
    NDN_THROW(Error("Extended header too large"));
  }

  std::string data(size, '\0');
  m_is.read(data.data(), static_cast<std::streamsize>(size));
  if (m_is.gcount() != static_cast<std::streamsize>(size)) {
    NDN_THROW(Error("Archive truncated inside an extended header"));
  }
  skip(getPadding(size));
  return data;
}

void
TarReader::skip(uint64_t size)
{
  std::array<char, 4096> buffer;
  while (size > 0) {
    auto chunk = static_cast<std::streamsize>(std::min<uint64_t>(size, buffer.size()));
    m_is.read(buffer.data(), chunk);
    if (m_is.gcount() != chunk) {
      NDN_THROW(Error("Archive truncated"));
    }
    size -= static_cast<uint64_t>(chunk);
  }
}

void
TarReader::parsePaxRecords(const std::string& data, optional<std::string>& path,
                           optional<uint64_t>& size)
{
  // each record is "<length> <key>=<value>\n", length counting the whole record
  size_t pos = 0;
  while (pos < data.size() && data[pos] != '\0') {
    auto space = data.find(' ', pos);
    if (space == std::string::npos) {
      NDN_THROW(Error("Malformed pax record"));
    }
    size_t length = 0;
    try {
      length = boost::lexical_cast<size_t>(data.substr(pos, space - pos));
    }
    catch (const boost::bad_lexical_cast&) {
      NDN_THROW(Error("Malformed pax record length"));
    }
    if (length <= space - pos + 1 || pos + length > data.size() || data[pos + length - 1] != '\n') {
      NDN_THROW(Error("Malformed pax record"));
    }

    std::string record = data.substr(space + 1, pos + length - space - 2);
    auto equals = record.find('=');
    if (equals == std::string::npos) {
      NDN_THROW(Error("Malformed pax record"));
    }
    auto key = record.substr(0, equals);
    auto value = record.substr(equals + 1);
    if (key == "path") {
      path = value;
    }
    else if (key == "size") {
      try {
        size = boost::lexical_cast<uint64_t>(value);
      }
      catch (const boost::bad_lexical_cast&) {
        NDN_THROW(Error("Malformed pax size record"));
      }
    }

    pos += length;
  }
}

std::ostream&
operator<<(std::ostream& os, TarReader::EntryType type)
{
  switch (type) {
    case TarReader::EntryType::REGULAR:
      return os << "regular";
    case TarReader::EntryType::DIRECTORY:
      return os << "directory";
    case TarReader::EntryType::OTHER:
      return os << "other";
  }
  return os << static_cast<int>(type);
}

} // namespace fbs::fetch
