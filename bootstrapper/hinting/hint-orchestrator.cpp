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

#include "bootstrapper/hinting/hint-orchestrator.hpp"
#include "core/global.hpp"
#include "core/logger.hpp"

namespace fbs::hinting {

FBS_LOG_INIT(HintOrchestrator);

HintOrchestrator::HintOrchestrator(std::vector<unique_ptr<HintGenerator>> generators,
                                   uint16_t discoveryPort)
  : m_generators(std::move(generators))
  , m_discoveryPort(discoveryPort)
  , m_io(getGlobalIoService())
  , m_scheduler(getScheduler())
{
}

HintOrchestrator::~HintOrchestrator()
{
  if (m_sink != nullptr) {
    m_sink->close();
  }
  for (auto& thread : m_threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

optional<DiscoveredAddress>
HintOrchestrator::race(time::nanoseconds timeout)
{
  if (m_state != State::IDLE) {
    NDN_THROW(Error("HintOrchestrator::race() called more than once"));
  }
  m_state = State::RACING;

  if (m_generators.empty()) {
    FBS_LOG_WARN("No hint generator enabled");
  }

  m_sink = make_shared<HintSink>(m_io, [this] (const DiscoveredAddress& addr) { onHint(addr); });
  m_deadline = m_scheduler.schedule(timeout, [this] { onDeadline(); });

  for (const auto& generator : m_generators) {
    m_threads.emplace_back([gen = generator.get(), sink = m_sink] { gen->generate(*sink); });
  }
  FBS_LOG_INFO("Waiting for hints from " << m_generators.size() << " generator(s)");

  m_io.restart();
  m_io.run();
  m_io.restart();

  return m_result;
}

void
HintOrchestrator::onHint(const DiscoveredAddress& address)
{
  if (m_state != State::RACING) {
    return;
  }

  m_result = address.withDefaultPort(m_discoveryPort);
  FBS_LOG_INFO("Selected discovery service address " << *m_result);
  finish(State::RESOLVED);
}

void
HintOrchestrator::onDeadline()
{
  if (m_state != State::RACING) {
    return;
  }

  FBS_LOG_WARN("No hint received before the deadline");
  finish(State::TIMED_OUT);
}

void
HintOrchestrator::finish(State state)
{
  m_state = state;
  m_sink->close();
  m_deadline.cancel();
  m_io.stop();
}

std::ostream&
operator<<(std::ostream& os, HintOrchestrator::State state)
{
  switch (state) {
    case HintOrchestrator::State::IDLE:
      return os << "IDLE";
    case HintOrchestrator::State::RACING:
      return os << "RACING";
    case HintOrchestrator::State::RESOLVED:
      return os << "RESOLVED";
    case HintOrchestrator::State::TIMED_OUT:
      return os << "TIMED_OUT";
  }
  return os << static_cast<int>(state);
}

} // namespace fbs::hinting
