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

#include "der-blob.hpp"
#include "detail/base64url.hpp"

#include <boost/container_hash/hash.hpp>

namespace acmemsg {

DerBlob::DerBlob(std::vector<uint8_t> der)
  : m_der(std::move(der))
{
  if (m_der.empty()) {
    NDN_THROW(std::invalid_argument("DER encoding cannot be empty"));
  }
}

JsonValue
DerBlob::toPartialJson() const
{
  return Base64UrlCodec::encode(m_der, JsonMode::PARTIAL);
}

DerBlob
DerBlob::fromJson(const JsonValue& json)
{
  auto der = Base64UrlCodec::decode(json);
  if (der.empty()) {
    NDN_THROW(DecodeError("DER encoding cannot be empty"));
  }
  return DerBlob(std::move(der));
}

size_t
hash_value(const DerBlob& blob)
{
  return boost::hash_range(blob.m_der.begin(), blob.m_der.end());
}

std::ostream&
operator<<(std::ostream& os, const DerBlob& blob)
{
  return os << base64UrlEncode(blob.m_der);
}

} // namespace acmemsg
