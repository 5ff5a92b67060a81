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

#include "bootstrapper/hinting/hint-sink.hpp"

#include <boost/asio/post.hpp>

namespace fbs::hinting {

HintSink::HintSink(boost::asio::io_context& io, DeliveryCallback deliver)
  : m_io(io)
  , m_deliver(std::move(deliver))
{
}

bool
HintSink::emit(const DiscoveredAddress& address)
{
  if (m_isClosed) {
    return false;
  }

  boost::asio::post(m_io, [self = shared_from_this(), address] {
    // the reader may have committed to another address in the meantime
    if (!self->m_isClosed) {
      self->m_deliver(address);
    }
  });
  return true;
}

} // namespace fbs::hinting
