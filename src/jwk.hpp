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

#ifndef ACMEMSG_JWK_HPP
#define ACMEMSG_JWK_HPP

#include "json-object.hpp"

namespace acmemsg {

/**
 * @brief RSA public key in JSON Web Key form (RFC 7517).
 *
 * Target JSON format:
 * {
 *   "kty": "RSA",
 *   "n": "<base64url modulus>",
 *   "e": "<base64url public exponent>"
 * }
 */
class JwkRsa : public JsonObject<JwkRsa>
{
public:
  JwkRsa() = default;

  JwkRsa(std::vector<uint8_t> modulus, std::vector<uint8_t> exponent);

  const std::vector<uint8_t>&
  getModulus() const
  {
    return m_modulus;
  }

  const std::vector<uint8_t>&
  getExponent() const
  {
    return m_exponent;
  }

public:
  static const std::string KEY_TYPE;

private:
  static const std::vector<JsonField<JwkRsa>>&
  getJsonFields();

  void
  encodeExtraFields(boost::json::object& json, JsonMode mode) const;

  void
  decodeExtraFields(const boost::json::object& json);

  friend JsonObject<JwkRsa>;

private:
  std::vector<uint8_t> m_modulus;
  std::vector<uint8_t> m_exponent;
};

} // namespace acmemsg

#endif // ACMEMSG_JWK_HPP
