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

#ifndef FBS_BOOTSTRAPPER_FETCH_HTTP_CLIENT_HPP
#define FBS_BOOTSTRAPPER_FETCH_HTTP_CLIENT_HPP

#include "core/common.hpp"

#include <iosfwd>
#include <map>

namespace fbs::fetch {

/**
 * \brief Status line and headers of an HTTP response.
 */
struct HttpResponseHead
{
  std::string version;
  unsigned int statusCode = 0;
  std::string reason;
  /// header fields, names in lower case
  std::map<std::string, std::string> headers;

  /// value of Content-Length, if present and well-formed
  optional<size_t>
  getContentLength() const;
};

/**
 * \brief Read the status line and header fields of an HTTP response.
 *
 * On return, \p is is positioned at the first byte of the body.
 * \throw HttpClient::Error the response head is malformed
 */
HttpResponseHead
readResponseHead(std::istream& is);

/**
 * \brief Performs HTTP GET requests.
 */
class HttpClient : noncopyable
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  virtual
  ~HttpClient() = default;

  /** \brief Retrieve \p url.
   *  \param timeout deadline of the whole request, including reading the body
   *  \return stream positioned at the start of the response body
   *  \throw Error connection failure, malformed response, or status other than 200
   */
  virtual unique_ptr<std::istream>
  get(const std::string& url, time::milliseconds timeout) = 0;
};

/**
 * \brief HTTP/1.0 client on top of boost::asio::ip::tcp::iostream.
 *
 * The body is read up to the end of the connection before get() returns. A body whose
 * length differs from the Content-Length header is treated as a failed transfer.
 */
class TcpStreamHttpClient final : public HttpClient
{
public:
  unique_ptr<std::istream>
  get(const std::string& url, time::milliseconds timeout) final;
};

} // namespace fbs::fetch

#endif // FBS_BOOTSTRAPPER_FETCH_HTTP_CLIENT_HPP
