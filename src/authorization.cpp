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

#include "authorization.hpp"

namespace acmemsg {

NDN_LOG_INIT(acmemsg.authorization);

Identifier::Identifier(IdentifierType type, std::string value)
  : m_type(std::move(type))
  , m_value(std::move(value))
{
}

const std::vector<JsonField<Identifier>>&
Identifier::getJsonFields()
{
  static const std::vector<JsonField<Identifier>> fields{
    JsonField<Identifier>::required("type", &Identifier::m_type),
    JsonField<Identifier>::required("value", &Identifier::m_value),
  };
  return fields;
}

Authorization::Authorization(Identifier identifier, std::vector<ChallengeBody> challenges,
                             std::vector<std::vector<size_t>> combinations,
                             optional<Status> status,
                             optional<time::system_clock::time_point> expires)
  : m_identifier(std::move(identifier))
  , m_challenges(std::move(challenges))
  , m_combinations(std::move(combinations))
  , m_status(std::move(status))
  , m_expires(std::move(expires))
{
  auto error = findInvalidCombination();
  if (error) {
    NDN_THROW(std::invalid_argument(*error));
  }
}

const std::vector<JsonField<Authorization>>&
Authorization::getJsonFields()
{
  static const std::vector<JsonField<Authorization>> fields{
    JsonField<Authorization>::required("identifier", &Authorization::m_identifier),
    JsonField<Authorization>::omitEmpty("challenges", &Authorization::m_challenges),
    JsonField<Authorization>::omitEmpty("combinations", &Authorization::m_combinations),
    JsonField<Authorization>::omitEmpty("status", &Authorization::m_status),
    JsonField<Authorization>::omitEmpty("expires", &Authorization::m_expires),
  };
  return fields;
}

std::vector<ResolvedCombination>
Authorization::getResolvedCombinations() const
{
  std::vector<ResolvedCombination> resolved;
  resolved.reserve(m_combinations.size());
  for (const auto& combination : m_combinations) {
    ResolvedCombination challenges;
    challenges.reserve(combination.size());
    for (size_t index : combination) {
      challenges.push_back(std::cref(m_challenges.at(index)));
    }
    resolved.push_back(std::move(challenges));
  }
  return resolved;
}

Authorization
Authorization::withStatus(optional<Status> status) const
{
  return with(&Authorization::m_status, std::move(status));
}

Authorization
Authorization::withExpires(optional<time::system_clock::time_point> expires) const
{
  return with(&Authorization::m_expires, std::move(expires));
}

optional<std::string>
Authorization::findInvalidCombination() const
{
  for (size_t i = 0; i < m_combinations.size(); ++i) {
    for (size_t index : m_combinations[i]) {
      if (index >= m_challenges.size()) {
        return "Combination " + std::to_string(i) + " refers to challenge " + std::to_string(index) +
               ", but there are only " + std::to_string(m_challenges.size()) + " challenges";
      }
    }
  }
  return nullopt;
}

void
Authorization::decodeExtraFields(const boost::json::object&)
{
  auto error = findInvalidCombination();
  if (error) {
    NDN_LOG_DEBUG("Rejecting authorization for " << m_identifier.getValue() << ": " << *error);
    NDN_THROW(DecodeError(*error));
  }
}

} // namespace acmemsg
