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

#include "core/global.hpp"

namespace fbs {

static thread_local unique_ptr<boost::asio::io_context> g_ioCtx;
static thread_local unique_ptr<ndn::Scheduler> g_scheduler;

boost::asio::io_context&
getGlobalIoService()
{
  if (g_ioCtx == nullptr) {
    g_ioCtx = make_unique<boost::asio::io_context>();
  }
  return *g_ioCtx;
}

ndn::Scheduler&
getScheduler()
{
  if (g_scheduler == nullptr) {
    g_scheduler = make_unique<ndn::Scheduler>(getGlobalIoService());
  }
  return *g_scheduler;
}

#ifdef WITH_TESTS
void
resetGlobalIoService()
{
  g_scheduler.reset();
  g_ioCtx.reset();
}
#endif

} // namespace fbs
