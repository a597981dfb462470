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

#include "jwk.hpp"
#include "detail/base64url.hpp"

namespace acmemsg {

const std::string JwkRsa::KEY_TYPE = "RSA";

JwkRsa::JwkRsa(std::vector<uint8_t> modulus, std::vector<uint8_t> exponent)
  : m_modulus(std::move(modulus))
  , m_exponent(std::move(exponent))
{
  if (m_modulus.empty() || m_exponent.empty()) {
    NDN_THROW(std::invalid_argument("RSA modulus and exponent cannot be empty"));
  }
}

const std::vector<JsonField<JwkRsa>>&
JwkRsa::getJsonFields()
{
  static const std::vector<JsonField<JwkRsa>> fields{
    JsonField<JwkRsa>::required("n", &JwkRsa::m_modulus, Base64UrlCodec{}),
    JsonField<JwkRsa>::required("e", &JwkRsa::m_exponent, Base64UrlCodec{}),
  };
  return fields;
}

void
JwkRsa::encodeExtraFields(boost::json::object& json, JsonMode) const
{
  json["kty"] = JsonCodec<std::string>::encode(KEY_TYPE, JsonMode::FULL);
}

void
JwkRsa::decodeExtraFields(const boost::json::object& json)
{
  auto it = json.find("kty");
  if (it == json.end()) {
    NDN_THROW(DecodeError("JWK has no key type"));
  }
  auto keyType = JsonCodec<std::string>::decode(it->value());
  if (keyType != KEY_TYPE) {
    NDN_THROW(DecodeError("Unsupported JWK key type '" + keyType + "'"));
  }
  if (m_modulus.empty() || m_exponent.empty()) {
    NDN_THROW(DecodeError("RSA modulus and exponent cannot be empty"));
  }
}

} // namespace acmemsg
