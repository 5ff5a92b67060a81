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

#ifndef FBS_CORE_LOGGER_HPP
#define FBS_CORE_LOGGER_HPP

#include <ndn-cxx/util/logger.hpp>

#define FBS_LOG_INIT(name)                         NDN_LOG_INIT(fbs.name)
#define FBS_LOG_MEMBER_DECL()                      NDN_LOG_MEMBER_DECL()
#define FBS_LOG_MEMBER_INIT(cls, name)             NDN_LOG_MEMBER_INIT(cls, fbs.name)

#define FBS_LOG_TRACE NDN_LOG_TRACE
#define FBS_LOG_DEBUG NDN_LOG_DEBUG
#define FBS_LOG_INFO  NDN_LOG_INFO
#define FBS_LOG_WARN  NDN_LOG_WARN
#define FBS_LOG_ERROR NDN_LOG_ERROR
#define FBS_LOG_FATAL NDN_LOG_FATAL

#endif // FBS_CORE_LOGGER_HPP
