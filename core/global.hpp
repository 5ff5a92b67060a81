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

#ifndef FBS_CORE_GLOBAL_HPP
#define FBS_CORE_GLOBAL_HPP

#include "core/common.hpp"

#include <boost/asio/io_context.hpp>
#include <ndn-cxx/util/scheduler.hpp>

namespace fbs {

/**
 * \brief Returns the global io_context instance for the calling thread.
 */
boost::asio::io_context&
getGlobalIoService();

/**
 * \brief Returns the global Scheduler instance for the calling thread.
 */
ndn::Scheduler&
getScheduler();

#ifdef WITH_TESTS
/**
 * \brief Destroy the global io_context instance.
 *
 * It will be recreated at the next invocation of getGlobalIoService().
 */
void
resetGlobalIoService();
#endif

} // namespace fbs

#endif // FBS_CORE_GLOBAL_HPP
