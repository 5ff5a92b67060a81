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

#ifndef FBS_BOOTSTRAPPER_FETCH_TAR_READER_HPP
#define FBS_BOOTSTRAPPER_FETCH_TAR_READER_HPP

#include "core/common.hpp"

#include <iosfwd>

namespace fbs::fetch {

/**
 * \brief Sequential reader of POSIX tar archives.
 *
 * Supports ustar headers (including the name prefix field), GNU long names ('L'), and
 * pax extended headers ('x' path and size records; global 'g' headers are skipped).
 * Base-256 encoded sizes are accepted.
 *
 * Entries are visited in archive order. The data of the current entry can be copied out
 * with copyData(); whatever is left unread is skipped by the next call to next().
 */
class TarReader : noncopyable
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  enum class EntryType {
    REGULAR,
    DIRECTORY,
    OTHER,
  };

  struct Entry
  {
    std::string name;
    EntryType type = EntryType::OTHER;
    /// typeflag as found in the header
    char typeflag = '\0';
    uint64_t size = 0;
  };

  static constexpr size_t BLOCK_SIZE = 512;

  explicit
  TarReader(std::istream& is);

  /** \brief Advance to the next entry.
   *  \return the entry, or nullopt at the end of the archive
   *  \throw Error the archive is malformed or truncated
   */
  optional<Entry>
  next();

  /** \brief Copy the unread data of the current entry to \p os.
   *  \throw Error the archive is truncated or \p os failed
   */
  void
  copyData(std::ostream& os);

private:
  /// \retval false clean end of stream at a block boundary
  bool
  readBlock(char* block);

  std::string
  readData(uint64_t size);

  void
  skip(uint64_t size);

  void
  parsePaxRecords(const std::string& data, optional<std::string>& path, optional<uint64_t>& size);

private:
  std::istream& m_is;
  uint64_t m_remaining = 0;
  uint64_t m_padding = 0;
  bool m_isEnd = false;
};

std::ostream&
operator<<(std::ostream& os, TarReader::EntryType type);

} // namespace fbs::fetch

#endif // FBS_BOOTSTRAPPER_FETCH_TAR_READER_HPP
