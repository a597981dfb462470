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

#ifndef ACMEMSG_CHALLENGE_BODY_HPP
#define ACMEMSG_CHALLENGE_BODY_HPP

#include "challenges.hpp"
#include "constants.hpp"

namespace acmemsg {

/**
 * @brief A challenge as published by the server inside an authorization.
 *
 * The body adds the challenge URI, its status and the validation time to the
 * challenge itself. On the wire the challenge members are merged into the body:
 * {
 *   "uri": "...",
 *   "status": "valid",
 *   "validated": "2015-03-27T00:00:00Z",
 *   "type": "dns",
 *   "token": "..."
 * }
 */
class ChallengeBody : public JsonObject<ChallengeBody>
{
public:
  ChallengeBody() = default;

  ChallengeBody(Challenge challenge, std::string uri, Status status = STATUS_PENDING,
                optional<time::system_clock::time_point> validated = nullopt);

  const Challenge&
  getChallenge() const
  {
    return m_challenge;
  }

  const std::string&
  getUri() const
  {
    return m_uri;
  }

  const Status&
  getStatus() const
  {
    return m_status;
  }

  const optional<time::system_clock::time_point>&
  getValidated() const
  {
    return m_validated;
  }

  ChallengeBody
  withStatus(Status status) const;

  ChallengeBody
  withValidated(optional<time::system_clock::time_point> validated) const;

public: // forwarded to the challenge
  const std::string&
  getChallengeType() const;

  /**
   * @throw FieldLookupError the challenge has no token
   */
  const std::string&
  getToken() const;

  /**
   * @throw FieldLookupError the challenge is not a @p ChallengeType
   */
  template<class ChallengeType>
  const ChallengeType&
  getChallengeAs() const
  {
    const auto* challenge = std::get_if<ChallengeType>(&m_challenge);
    if (challenge == nullptr) {
      NDN_THROW(FieldLookupError("Challenge is a " + getChallengeType() + ", not a " + ChallengeType::TYPE));
    }
    return *challenge;
  }

private:
  static const std::vector<JsonField<ChallengeBody>>&
  getJsonFields();

  void
  encodeExtraFields(boost::json::object& json, JsonMode mode) const;

  void
  decodeExtraFields(const boost::json::object& json);

  friend JsonObject<ChallengeBody>;

private:
  Challenge m_challenge{RecoveryToken()};
  std::string m_uri;
  Status m_status = STATUS_PENDING;
  optional<time::system_clock::time_point> m_validated;
};

} // namespace acmemsg

#endif // ACMEMSG_CHALLENGE_BODY_HPP
