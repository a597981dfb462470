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

#ifndef ACMEMSG_AUTHORIZATION_HPP
#define ACMEMSG_AUTHORIZATION_HPP

#include "challenge-body.hpp"

#include <functional>

namespace acmemsg {

/**
 * @brief Identifier the client asks to be authorized for.
 *
 * Target JSON format:
 * {
 *   "type": "dns",
 *   "value": "example.com"
 * }
 */
class Identifier : public JsonObject<Identifier>
{
public:
  Identifier() = default;

  Identifier(IdentifierType type, std::string value);

  const IdentifierType&
  getType() const
  {
    return m_type;
  }

  const std::string&
  getValue() const
  {
    return m_value;
  }

private:
  static const std::vector<JsonField<Identifier>>&
  getJsonFields();

  friend JsonObject<Identifier>;

private:
  IdentifierType m_type = IDENTIFIER_FQDN;
  std::string m_value;
};

/**
 * @brief One combination with every challenge index replaced by its ChallengeBody.
 */
using ResolvedCombination = std::vector<std::reference_wrapper<const ChallengeBody>>;

/**
 * @brief Authorization of the account key for an identifier.
 *
 * Target JSON format:
 * {
 *   "identifier": {...},
 *   "challenges": [{...}, {...}],
 *   "combinations": [[0, 2], [1, 2]],
 *   "status": "pending",
 *   "expires": "2015-03-27T00:00:00Z"
 * }
 *
 * Each combination lists the indices, into "challenges", of a set of challenges
 * that together are sufficient to obtain the authorization.
 */
class Authorization : public JsonObject<Authorization>
{
public:
  Authorization() = default;

  /**
   * @throw std::invalid_argument a combination refers past the end of @p challenges
   */
  explicit
  Authorization(Identifier identifier, std::vector<ChallengeBody> challenges = {},
                std::vector<std::vector<size_t>> combinations = {},
                optional<Status> status = nullopt,
                optional<time::system_clock::time_point> expires = nullopt);

  const Identifier&
  getIdentifier() const
  {
    return m_identifier;
  }

  const std::vector<ChallengeBody>&
  getChallenges() const
  {
    return m_challenges;
  }

  const std::vector<std::vector<size_t>>&
  getCombinations() const
  {
    return m_combinations;
  }

  const optional<Status>&
  getStatus() const
  {
    return m_status;
  }

  const optional<time::system_clock::time_point>&
  getExpires() const
  {
    return m_expires;
  }

  /**
   * @brief Combinations with indices replaced by the challenges they refer to.
   *
   * Order is preserved both across and within combinations. The result refers
   * to the challenges held by this Authorization and is valid as long as it is.
   */
  std::vector<ResolvedCombination>
  getResolvedCombinations() const;

  Authorization
  withStatus(optional<Status> status) const;

  Authorization
  withExpires(optional<time::system_clock::time_point> expires) const;

private:
  static const std::vector<JsonField<Authorization>>&
  getJsonFields();

  /**
   * @return description of the first out-of-range index, or nullopt when all are valid
   */
  optional<std::string>
  findInvalidCombination() const;

  void
  decodeExtraFields(const boost::json::object& json);

  friend JsonObject<Authorization>;

private:
  Identifier m_identifier;
  std::vector<ChallengeBody> m_challenges;
  std::vector<std::vector<size_t>> m_combinations;
  optional<Status> m_status;
  optional<time::system_clock::time_point> m_expires;
};

} // namespace acmemsg

#endif // ACMEMSG_AUTHORIZATION_HPP
