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

#ifndef ACMEMSG_CHALLENGES_HPP
#define ACMEMSG_CHALLENGES_HPP

#include "json-object.hpp"

#include <variant>

namespace acmemsg {

/**
 * @brief Simple HTTP identifier validation.
 *
 * Target JSON format:
 * {
 *   "type": "simpleHttp",
 *   "token": "...",
 *   "tls": true
 * }
 */
class SimpleHttp : public JsonObject<SimpleHttp>
{
public:
  SimpleHttp() = default;

  explicit
  SimpleHttp(std::string token, bool tls = true);

  const std::string&
  getToken() const
  {
    return m_token;
  }

  bool
  isTls() const
  {
    return m_tls;
  }

public:
  static const std::string TYPE;

private:
  static const std::vector<JsonField<SimpleHttp>>&
  getJsonFields();

  void
  encodeExtraFields(boost::json::object& json, JsonMode mode) const;

  void
  decodeExtraFields(const boost::json::object& json);

  friend JsonObject<SimpleHttp>;

private:
  std::string m_token;
  bool m_tls = true;
};

/**
 * @brief DVSNI (TLS SNI) identifier validation.
 *
 * Target JSON format:
 * {
 *   "type": "dvsni",
 *   "r": "<base64url, 32 octets>",
 *   "nonce": "<hex, 16 octets>"
 * }
 */
class Dvsni : public JsonObject<Dvsni>
{
public:
  Dvsni() = default;

  /**
   * @throw std::invalid_argument @p r is not 32 octets or @p nonce is not 32 hex digits
   */
  Dvsni(std::vector<uint8_t> r, std::string nonce);

  const std::vector<uint8_t>&
  getR() const
  {
    return m_r;
  }

  const std::string&
  getNonce() const
  {
    return m_nonce;
  }

public:
  static const std::string TYPE;
  static constexpr size_t R_SIZE = 32;
  static constexpr size_t NONCE_SIZE = 16;

private:
  static const std::vector<JsonField<Dvsni>>&
  getJsonFields();

  static bool
  isValid(const std::vector<uint8_t>& r, const std::string& nonce);

  void
  encodeExtraFields(boost::json::object& json, JsonMode mode) const;

  void
  decodeExtraFields(const boost::json::object& json);

  friend JsonObject<Dvsni>;

private:
  std::vector<uint8_t> m_r;
  std::string m_nonce;
};

/**
 * @brief DNS identifier validation.
 *
 * Target JSON format:
 * {
 *   "type": "dns",
 *   "token": "..."
 * }
 */
class Dns : public JsonObject<Dns>
{
public:
  Dns() = default;

  explicit
  Dns(std::string token);

  const std::string&
  getToken() const
  {
    return m_token;
  }

public:
  static const std::string TYPE;

private:
  static const std::vector<JsonField<Dns>>&
  getJsonFields();

  void
  encodeExtraFields(boost::json::object& json, JsonMode mode) const;

  void
  decodeExtraFields(const boost::json::object& json);

  friend JsonObject<Dns>;

private:
  std::string m_token;
};

/**
 * @brief Account recovery through a contact.
 */
class RecoveryContact : public JsonObject<RecoveryContact>
{
public:
  explicit
  RecoveryContact(optional<std::string> activationUrl = nullopt,
                  optional<std::string> successUrl = nullopt,
                  optional<std::string> contact = nullopt);

  const optional<std::string>&
  getActivationUrl() const
  {
    return m_activationUrl;
  }

  const optional<std::string>&
  getSuccessUrl() const
  {
    return m_successUrl;
  }

  const optional<std::string>&
  getContact() const
  {
    return m_contact;
  }

public:
  static const std::string TYPE;

private:
  static const std::vector<JsonField<RecoveryContact>>&
  getJsonFields();

  void
  encodeExtraFields(boost::json::object& json, JsonMode mode) const;

  void
  decodeExtraFields(const boost::json::object& json);

  friend JsonObject<RecoveryContact>;

private:
  optional<std::string> m_activationUrl;
  optional<std::string> m_successUrl;
  optional<std::string> m_contact;
};

/**
 * @brief Account recovery through a previously issued recovery token.
 */
class RecoveryToken : public JsonObject<RecoveryToken>
{
public:
  RecoveryToken() = default;

public:
  static const std::string TYPE;

private:
  static const std::vector<JsonField<RecoveryToken>>&
  getJsonFields();

  void
  encodeExtraFields(boost::json::object& json, JsonMode mode) const;

  void
  decodeExtraFields(const boost::json::object& json);

  friend JsonObject<RecoveryToken>;
};

/**
 * @brief Any supported challenge.
 */
using Challenge = std::variant<SimpleHttp, Dvsni, Dns, RecoveryContact, RecoveryToken>;

/**
 * @brief Decode a challenge, selecting its type by the "type" member.
 * @throw DecodeError the type is missing or not supported, or the challenge is malformed
 */
Challenge
decodeChallenge(const JsonValue& json);

JsonValue
encodeChallenge(const Challenge& challenge, JsonMode mode);

/**
 * @return the "type" discriminant of @p challenge
 */
const std::string&
getChallengeType(const Challenge& challenge);

bool
isChallengeTypeSupported(const std::string& type);

} // namespace acmemsg

#endif // ACMEMSG_CHALLENGES_HPP
