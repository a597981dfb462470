/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2017-2024, Regents of the University of California.
 *
 * This file is part of acmemsg, the ACME message model of a certificate management client.
 *
 * acmemsg is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * acmemsg is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * acmemsg, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of acmemsg authors and contributors.
 */

#include "detail/base64url.hpp"

#include <ndn-cxx/encoding/buffer-stream.hpp>
#include <ndn-cxx/security/transform/base64-decode.hpp>
#include <ndn-cxx/security/transform/base64-encode.hpp>
#include <ndn-cxx/security/transform/buffer-source.hpp>
#include <ndn-cxx/security/transform/stream-sink.hpp>
#include <ndn-cxx/util/span.hpp>

#include <cctype>
#include <sstream>

namespace acmemsg {

namespace t = ndn::security::transform;

std::string
base64UrlEncode(const std::vector<uint8_t>& bytes)
{
  if (bytes.empty()) {
    return "";
  }

  std::ostringstream os;
  t::bufferSource(ndn::span<const uint8_t>(bytes.data(), bytes.size()))
    >> t::base64Encode(false) >> t::streamSink(os);

  std::string encoded = os.str();
  boost::algorithm::trim_right_if(encoded, boost::algorithm::is_any_of("="));
  boost::algorithm::replace_all(encoded, "+", "-");
  boost::algorithm::replace_all(encoded, "/", "_");
  return encoded;
}

std::vector<uint8_t>
base64UrlDecode(const std::string& encoded)
{
  std::string standard = boost::algorithm::trim_right_copy_if(encoded, boost::algorithm::is_any_of("="));
  for (char c : standard) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
      NDN_THROW(DecodeError("Invalid base64url character in '" + encoded + "'"));
    }
  }
  if (standard.size() % 4 == 1) {
    NDN_THROW(DecodeError("Truncated base64url value '" + encoded + "'"));
  }
  if (standard.empty()) {
    return {};
  }

  boost::algorithm::replace_all(standard, "-", "+");
  boost::algorithm::replace_all(standard, "_", "/");
  standard.append((4 - standard.size() % 4) % 4, '=');

  ndn::OBufferStream os;
  t::bufferSource(standard) >> t::base64Decode(false) >> t::streamSink(os);
  auto buffer = os.buf();
  return std::vector<uint8_t>(buffer->begin(), buffer->end());
}

JsonValue
Base64UrlCodec::encode(const std::vector<uint8_t>& bytes, JsonMode)
{
  return JsonCodec<std::string>::encode(base64UrlEncode(bytes), JsonMode::FULL);
}

std::vector<uint8_t>
Base64UrlCodec::decode(const JsonValue& json)
{
  if (!json.is_string()) {
    NDN_THROW(DecodeError("Expected a base64url string, got " + json::describeKind(json)));
  }
  return base64UrlDecode(JsonCodec<std::string>::decode(json));
}

} // namespace acmemsg
