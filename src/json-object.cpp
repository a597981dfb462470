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

#include "json-object.hpp"

#include <boost/json/value_to.hpp>

namespace acmemsg {

NDN_LOG_INIT(acmemsg.json);

namespace detail {

void
logDecodeFailure(const std::string& typeName, const std::string& reason)
{
  NDN_LOG_TRACE("Cannot decode " << typeName << ": " << reason);
}

} // namespace detail

JsonValue
JsonCodec<std::string>::encode(const std::string& value, JsonMode)
{
  return boost::json::string(value.data(), value.size());
}

std::string
JsonCodec<std::string>::decode(const JsonValue& json)
{
  if (!json.is_string()) {
    NDN_THROW(DecodeError("Expected a string, got " + json::describeKind(json)));
  }
  return boost::json::value_to<std::string>(json);
}

JsonValue
JsonCodec<bool>::encode(bool value, JsonMode)
{
  return value;
}

bool
JsonCodec<bool>::decode(const JsonValue& json)
{
  if (!json.is_bool()) {
    NDN_THROW(DecodeError("Expected a boolean, got " + json::describeKind(json)));
  }
  return json.get_bool();
}

JsonValue
JsonCodec<size_t>::encode(size_t value, JsonMode)
{
  return static_cast<uint64_t>(value);
}

size_t
JsonCodec<size_t>::decode(const JsonValue& json)
{
  if (json.is_uint64()) {
    return static_cast<size_t>(json.get_uint64());
  }
  if (json.is_int64()) {
    if (json.get_int64() < 0) {
      NDN_THROW(DecodeError("Expected a non-negative integer, got " + std::to_string(json.get_int64())));
    }
    return static_cast<size_t>(json.get_int64());
  }
  NDN_THROW(DecodeError("Expected a non-negative integer, got " + json::describeKind(json)));
}

JsonValue
JsonCodec<time::system_clock::time_point>::encode(const time::system_clock::time_point& value, JsonMode)
{
  return JsonCodec<std::string>::encode(time::toIsoExtendedString(value) + "Z", JsonMode::FULL);
}

time::system_clock::time_point
JsonCodec<time::system_clock::time_point>::decode(const JsonValue& json)
{
  auto value = JsonCodec<std::string>::decode(json);
  if (!boost::algorithm::ends_with(value, "Z")) {
    NDN_THROW(DecodeError("Timestamp '" + value + "' is not in UTC"));
  }
  value.pop_back();
  try {
    return time::fromIsoExtendedString(value);
  }
  catch (const std::exception& e) {
    NDN_THROW(DecodeError("Invalid timestamp '" + value + "Z': " + e.what()));
  }
}

} // namespace acmemsg
