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

#ifndef FBS_BOOTSTRAPPER_HINTING_HINT_SINK_HPP
#define FBS_BOOTSTRAPPER_HINTING_HINT_SINK_HPP

#include "bootstrapper/hinting/discovered-address.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>

namespace fbs::hinting {

/**
 * \brief The fan-in point shared by all running HintGenerators.
 *
 * emit() may be called from any thread. Each address is posted to the io_context of the
 * reader, where the delivery callback runs, so writers never block on the reader.
 *
 * Closing the sink is the cancellation signal: once closed, emit() returns false, pending
 * deliveries are dropped, and generators are expected to stop as soon as they notice.
 */
class HintSink : noncopyable, public std::enable_shared_from_this<HintSink>
{
public:
  using DeliveryCallback = std::function<void(const DiscoveredAddress&)>;

  HintSink(boost::asio::io_context& io, DeliveryCallback deliver);

  /** \brief Hand over an address without blocking.
   *  \retval false the sink is closed and the address was discarded
   */
  bool
  emit(const DiscoveredAddress& address);

  /** \brief Stop accepting and delivering addresses.
   */
  void
  close() noexcept
  {
    m_isClosed = true;
  }

  bool
  isClosed() const noexcept
  {
    return m_isClosed;
  }

private:
  boost::asio::io_context& m_io;
  DeliveryCallback m_deliver;
  std::atomic<bool> m_isClosed{false};
};

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_HINT_SINK_HPP
