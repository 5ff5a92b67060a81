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

#ifndef FBS_BOOTSTRAPPER_HINTING_HINT_ORCHESTRATOR_HPP
#define FBS_BOOTSTRAPPER_HINTING_HINT_ORCHESTRATOR_HPP

#include "bootstrapper/hinting/hint-generator.hpp"

#include <ndn-cxx/util/scheduler.hpp>

#include <iosfwd>
#include <thread>

namespace fbs::hinting {

/**
 * \brief Races a set of HintGenerators and commits to the first address found.
 *
 * Each generator runs on its own thread and reports into one shared HintSink. The
 * orchestrator waits on the global io_context until either an address arrives or the
 * deadline expires, then closes the sink so that the remaining generators wind down.
 *
 * race() can be called only once.
 */
class HintOrchestrator : noncopyable
{
public:
  class Error : public std::logic_error
  {
  public:
    using std::logic_error::logic_error;
  };

  enum class State {
    IDLE,
    RACING,
    RESOLVED,
    TIMED_OUT,
  };

  /**
   * \param generators discovery mechanisms to race
   * \param discoveryPort port assigned to addresses that arrive without one
   */
  HintOrchestrator(std::vector<unique_ptr<HintGenerator>> generators, uint16_t discoveryPort);

  /** \brief Cancel the race, if still running, and wait for every generator thread.
   */
  ~HintOrchestrator();

  /** \brief Run all generators until the first address or until \p timeout expires.
   *  \return the first address, with the discovery port filled in; nullopt on timeout
   *  \throw Error race() has already been called
   */
  optional<DiscoveredAddress>
  race(time::nanoseconds timeout);

  State
  getState() const noexcept
  {
    return m_state;
  }

private:
  void
  onHint(const DiscoveredAddress& address);

  void
  onDeadline();

  void
  finish(State state);

private:
  std::vector<unique_ptr<HintGenerator>> m_generators;
  const uint16_t m_discoveryPort;
  boost::asio::io_context& m_io;
  ndn::Scheduler& m_scheduler;

  State m_state = State::IDLE;
  shared_ptr<HintSink> m_sink;
  std::vector<std::thread> m_threads;
  ndn::scheduler::ScopedEventId m_deadline;
  optional<DiscoveredAddress> m_result;
};

std::ostream&
operator<<(std::ostream& os, HintOrchestrator::State state);

} // namespace fbs::hinting

#endif // FBS_BOOTSTRAPPER_HINTING_HINT_ORCHESTRATOR_HPP
