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

#include "challenge-body.hpp"

#include <type_traits>

namespace acmemsg {

namespace {

template<class T, class = void>
struct HasToken : std::false_type
{
};

template<class T>
struct HasToken<T, std::void_t<decltype(std::declval<const T&>().getToken())>> : std::true_type
{
};

} // namespace

ChallengeBody::ChallengeBody(Challenge challenge, std::string uri, Status status,
                             optional<time::system_clock::time_point> validated)
  : m_challenge(std::move(challenge))
  , m_uri(std::move(uri))
  , m_status(std::move(status))
  , m_validated(std::move(validated))
{
}

const std::vector<JsonField<ChallengeBody>>&
ChallengeBody::getJsonFields()
{
  static const std::vector<JsonField<ChallengeBody>> fields{
    JsonField<ChallengeBody>::required("uri", &ChallengeBody::m_uri),
    JsonField<ChallengeBody>::omitEmpty("status", &ChallengeBody::m_status, STATUS_PENDING),
    JsonField<ChallengeBody>::omitEmpty("validated", &ChallengeBody::m_validated),
  };
  return fields;
}

ChallengeBody
ChallengeBody::withStatus(Status status) const
{
  return with(&ChallengeBody::m_status, std::move(status));
}

ChallengeBody
ChallengeBody::withValidated(optional<time::system_clock::time_point> validated) const
{
  return with(&ChallengeBody::m_validated, std::move(validated));
}

const std::string&
ChallengeBody::getChallengeType() const
{
  return acmemsg::getChallengeType(m_challenge);
}

const std::string&
ChallengeBody::getToken() const
{
  return std::visit([] (const auto& challenge) -> const std::string& {
    using ChallengeType = std::decay_t<decltype(challenge)>;
    if constexpr (HasToken<ChallengeType>::value) {
      return challenge.getToken();
    }
    else {
      NDN_THROW(FieldLookupError(ChallengeType::TYPE + " challenge has no token"));
    }
  }, m_challenge);
}

void
ChallengeBody::encodeExtraFields(boost::json::object& json, JsonMode mode) const
{
  // members of the body take precedence over those of the challenge
  auto challenge = encodeChallenge(m_challenge, mode);
  for (const auto& item : challenge.get_object()) {
    if (json.find(item.key()) == json.end()) {
      json.emplace(item.key(), item.value());
    }
  }
}

void
ChallengeBody::decodeExtraFields(const boost::json::object& json)
{
  m_challenge = decodeChallenge(JsonValue(json));
}

} // namespace acmemsg
