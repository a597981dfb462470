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

#ifndef ACMEMSG_DETAIL_BASE64URL_HPP
#define ACMEMSG_DETAIL_BASE64URL_HPP

#include "json-object.hpp"

namespace acmemsg {

/**
 * @brief Encode @p bytes as unpadded base64url (RFC 4648 section 5).
 */
std::string
base64UrlEncode(const std::vector<uint8_t>& bytes);

/**
 * @brief Decode unpadded (or padded) base64url.
 * @throw DecodeError @p encoded contains characters outside the base64url alphabet
 */
std::vector<uint8_t>
base64UrlDecode(const std::string& encoded);

/**
 * @brief Binary field written as a base64url string.
 */
struct Base64UrlCodec
{
  static JsonValue
  encode(const std::vector<uint8_t>& bytes, JsonMode);

  static std::vector<uint8_t>
  decode(const JsonValue& json);
};

} // namespace acmemsg

#endif // ACMEMSG_DETAIL_BASE64URL_HPP
