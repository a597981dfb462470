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

#include "challenges.hpp"
#include "detail/base64url.hpp"
#include "detail/json-helper.hpp"

#include <map>

namespace acmemsg {

NDN_LOG_INIT(acmemsg.challenges);

const std::string SimpleHttp::TYPE = "simpleHttp";
const std::string Dvsni::TYPE = "dvsni";
const std::string Dns::TYPE = "dns";
const std::string RecoveryContact::TYPE = "recoveryContact";
const std::string RecoveryToken::TYPE = "recoveryToken";

const std::string JSON_CHALLENGE_TYPE = "type";

static void
putType(boost::json::object& json, const std::string& type)
{
  json[JSON_CHALLENGE_TYPE] = JsonCodec<std::string>::encode(type, JsonMode::FULL);
}

static optional<std::string>
findType(const boost::json::object& json)
{
  auto it = json.find(JSON_CHALLENGE_TYPE);
  if (it == json.end() || it->value().is_null()) {
    return nullopt;
  }
  if (!it->value().is_string()) {
    NDN_THROW(DecodeError("Challenge type must be a string, got " + json::describeKind(it->value())));
  }
  return JsonCodec<std::string>::decode(it->value());
}

// the discriminant may be left out when the concrete type is already known
static void
checkType(const boost::json::object& json, const std::string& expected)
{
  auto type = findType(json);
  if (type && *type != expected) {
    NDN_THROW(DecodeError("Expected challenge type '" + expected + "', got '" + *type + "'"));
  }
}

SimpleHttp::SimpleHttp(std::string token, bool tls)
  : m_token(std::move(token))
  , m_tls(tls)
{
}

const std::vector<JsonField<SimpleHttp>>&
SimpleHttp::getJsonFields()
{
  static const std::vector<JsonField<SimpleHttp>> fields{
    JsonField<SimpleHttp>::required("token", &SimpleHttp::m_token),
    JsonField<SimpleHttp>::omitEmpty("tls", &SimpleHttp::m_tls, true),
  };
  return fields;
}

void
SimpleHttp::encodeExtraFields(boost::json::object& json, JsonMode) const
{
  putType(json, TYPE);
}

void
SimpleHttp::decodeExtraFields(const boost::json::object& json)
{
  checkType(json, TYPE);
}

Dvsni::Dvsni(std::vector<uint8_t> r, std::string nonce)
  : m_r(std::move(r))
  , m_nonce(std::move(nonce))
{
  if (!isValid(m_r, m_nonce)) {
    NDN_THROW(std::invalid_argument("DVSNI challenge requires a 32-octet r and a 16-octet hex nonce"));
  }
}

const std::vector<JsonField<Dvsni>>&
Dvsni::getJsonFields()
{
  static const std::vector<JsonField<Dvsni>> fields{
    JsonField<Dvsni>::required("r", &Dvsni::m_r, Base64UrlCodec{}),
    JsonField<Dvsni>::required("nonce", &Dvsni::m_nonce),
  };
  return fields;
}

bool
Dvsni::isValid(const std::vector<uint8_t>& r, const std::string& nonce)
{
  return r.size() == R_SIZE && nonce.size() == 2 * NONCE_SIZE &&
         boost::algorithm::all(nonce, boost::algorithm::is_xdigit());
}

void
Dvsni::encodeExtraFields(boost::json::object& json, JsonMode) const
{
  putType(json, TYPE);
}

void
Dvsni::decodeExtraFields(const boost::json::object& json)
{
  checkType(json, TYPE);
  if (!isValid(m_r, m_nonce)) {
    NDN_THROW(DecodeError("DVSNI challenge requires a 32-octet r and a 16-octet hex nonce"));
  }
}

Dns::Dns(std::string token)
  : m_token(std::move(token))
{
}

const std::vector<JsonField<Dns>>&
Dns::getJsonFields()
{
  static const std::vector<JsonField<Dns>> fields{
    JsonField<Dns>::required("token", &Dns::m_token),
  };
  return fields;
}

void
Dns::encodeExtraFields(boost::json::object& json, JsonMode) const
{
  putType(json, TYPE);
}

void
Dns::decodeExtraFields(const boost::json::object& json)
{
  checkType(json, TYPE);
}

RecoveryContact::RecoveryContact(optional<std::string> activationUrl,
                                 optional<std::string> successUrl,
                                 optional<std::string> contact)
  : m_activationUrl(std::move(activationUrl))
  , m_successUrl(std::move(successUrl))
  , m_contact(std::move(contact))
{
}

const std::vector<JsonField<RecoveryContact>>&
RecoveryContact::getJsonFields()
{
  static const std::vector<JsonField<RecoveryContact>> fields{
    JsonField<RecoveryContact>::omitEmpty("activationURL", &RecoveryContact::m_activationUrl),
    JsonField<RecoveryContact>::omitEmpty("successURL", &RecoveryContact::m_successUrl),
    JsonField<RecoveryContact>::omitEmpty("contact", &RecoveryContact::m_contact),
  };
  return fields;
}

void
RecoveryContact::encodeExtraFields(boost::json::object& json, JsonMode) const
{
  putType(json, TYPE);
}

void
RecoveryContact::decodeExtraFields(const boost::json::object& json)
{
  checkType(json, TYPE);
}

const std::vector<JsonField<RecoveryToken>>&
RecoveryToken::getJsonFields()
{
  static const std::vector<JsonField<RecoveryToken>> fields;
  return fields;
}

void
RecoveryToken::encodeExtraFields(boost::json::object& json, JsonMode) const
{
  putType(json, TYPE);
}

void
RecoveryToken::decodeExtraFields(const boost::json::object& json)
{
  checkType(json, TYPE);
}

using ChallengeDecoder = std::function<Challenge(const JsonValue&)>;
using ChallengeDecoderTable = std::map<std::string, ChallengeDecoder>;

template<class ChallengeType>
static void
addDecoder(ChallengeDecoderTable& table)
{
  BOOST_ASSERT(table.count(ChallengeType::TYPE) == 0);
  table[ChallengeType::TYPE] = [] (const JsonValue& json) -> Challenge {
    return ChallengeType::fromJson(json);
  };
}

static const ChallengeDecoderTable&
getDecoderTable()
{
  static const ChallengeDecoderTable table = [] {
    ChallengeDecoderTable result;
    addDecoder<SimpleHttp>(result);
    addDecoder<Dvsni>(result);
    addDecoder<Dns>(result);
    addDecoder<RecoveryContact>(result);
    addDecoder<RecoveryToken>(result);
    return result;
  }();
  return table;
}

Challenge
decodeChallenge(const JsonValue& json)
{
  if (!json.is_object()) {
    NDN_THROW(DecodeError("Expected a JSON object for a challenge, got " + json::describeKind(json)));
  }
  auto type = findType(json.get_object());
  if (!type) {
    NDN_THROW(DecodeError("Challenge has no type"));
  }

  const auto& table = getDecoderTable();
  auto it = table.find(*type);
  if (it == table.end()) {
    NDN_LOG_DEBUG("Unsupported challenge type " << *type);
    NDN_THROW(DecodeError("Unsupported challenge type '" + *type + "'"));
  }
  return it->second(json);
}

JsonValue
encodeChallenge(const Challenge& challenge, JsonMode mode)
{
  return std::visit([mode] (const auto& c) {
    return mode == JsonMode::FULL ? c.toJson() : c.toPartialJson();
  }, challenge);
}

const std::string&
getChallengeType(const Challenge& challenge)
{
  return std::visit([] (const auto& c) -> const std::string& {
    return std::decay_t<decltype(c)>::TYPE;
  }, challenge);
}

bool
isChallengeTypeSupported(const std::string& type)
{
  return getDecoderTable().count(type) != 0;
}

} // namespace acmemsg
