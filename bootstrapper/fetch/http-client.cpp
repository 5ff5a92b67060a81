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

#include "bootstrapper/fetch/http-client.hpp"
#include "bootstrapper/fetch/url.hpp"
#include "core/logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/lexical_cast.hpp>

#include <iterator>
#include <sstream>

namespace fbs::fetch {

FBS_LOG_INIT(HttpClient);

optional<size_t>
HttpResponseHead::getContentLength() const
{
  auto it = headers.find("content-length");
  if (it == headers.end()) {
    return nullopt;
  }
  try {
    return boost::lexical_cast<size_t>(it->second);
  }
  catch (const boost::bad_lexical_cast&) {
    return nullopt;
  }
}

static bool
readLine(std::istream& is, std::string& line)
{
  if (!std::getline(is, line)) {
    return false;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

HttpResponseHead
readResponseHead(std::istream& is)
{
  HttpResponseHead head;

  std::string statusLine;
  if (!readLine(is, statusLine)) {
    NDN_THROW(HttpClient::Error("HTTP communication error: no status line"));
  }

  std::istringstream statusStream(statusLine);
  statusStream >> head.version >> head.statusCode;
  if (!statusStream || head.version.compare(0, 5, "HTTP/") != 0) {
    NDN_THROW(HttpClient::Error("HTTP communication error: malformed status line '" +
                                statusLine + "'"));
  }
  std::getline(statusStream, head.reason);
  boost::trim(head.reason);

  std::string line;
  while (true) {
    if (!readLine(is, line)) {
      NDN_THROW(HttpClient::Error("HTTP communication error: truncated header"));
    }
    if (line.empty()) {
      break;
    }
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      NDN_THROW(HttpClient::Error("HTTP communication error: malformed header field '" +
                                  line + "'"));
    }
    auto name = boost::to_lower_copy(boost::trim_copy(line.substr(0, colon)));
    head.headers[name] = boost::trim_copy(line.substr(colon + 1));
  }

  return head;
}

unique_ptr<std::istream>
TcpStreamHttpClient::get(const std::string& urlString, time::milliseconds timeout)
{
  Url url(urlString);
  if (!url.isValid()) {
    NDN_THROW(Error("Invalid URL: " + urlString));
  }
  if (!boost::iequals(url.getScheme(), "http")) {
    NDN_THROW(Error("Only http:// URLs are supported: " + urlString));
  }

  auto stream = make_unique<boost::asio::ip::tcp::iostream>();
  stream->expires_after(std::chrono::milliseconds(timeout.count()));

  FBS_LOG_DEBUG("GET " << urlString);
  stream->connect(url.getHost(), url.getPort());
  if (!*stream) {
    NDN_THROW(Error("HTTP connection error to " + urlString + ": " + stream->error().message()));
  }

  *stream << "GET " << url.getPath() << " HTTP/1.0\r\n";
  *stream << "Host: " << url.getAuthority() << "\r\n";
  *stream << "Accept: */*\r\n";
  *stream << "Cache-Control: no-cache\r\n";
  *stream << "Connection: close\r\n\r\n";
  stream->flush();
  if (!*stream) {
    NDN_THROW(Error("HTTP communication error with " + urlString + ": " +
                    stream->error().message()));
  }

  auto head = readResponseHead(*stream);
  FBS_LOG_DEBUG(urlString << " -> " << head.statusCode << " " << head.reason);
  if (head.statusCode != 200) {
    NDN_THROW(Error("HTTP request for " + urlString + " failed: " +
                    to_string(head.statusCode) + " " + head.reason));
  }

  std::string body{std::istreambuf_iterator<char>(*stream), std::istreambuf_iterator<char>()};
  auto ec = stream->error();
  if (ec && ec != boost::asio::error::eof) {
    NDN_THROW(Error("HTTP communication error with " + urlString + ": " + ec.message()));
  }

  auto contentLength = head.getContentLength();
  if (contentLength && *contentLength != body.size()) {
    NDN_THROW(Error("HTTP response from " + urlString + " has " + to_string(body.size()) +
                    " bytes, Content-Length announced " + to_string(*contentLength)));
  }
  FBS_LOG_TRACE(urlString << " body has " << body.size() << " bytes");

  return make_unique<std::istringstream>(std::move(body));
}

} // namespace fbs::fetch
