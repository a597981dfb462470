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

#ifndef ACMEMSG_REGISTRATION_HPP
#define ACMEMSG_REGISTRATION_HPP

#include "jwk.hpp"

namespace acmemsg {

/**
 * @brief Account registration.
 *
 * Target JSON format:
 * {
 *   "key": {...},
 *   "contact": ["mailto:admin@example.com", "tel:+12025551212"],
 *   "recoveryToken": "...",
 *   "agreement": "https://example.com/terms"
 * }
 */
class Registration : public JsonObject<Registration>
{
public:
  Registration() = default;

  explicit
  Registration(JwkRsa key, std::vector<std::string> contact = {},
               optional<std::string> recoveryToken = nullopt,
               optional<std::string> agreement = nullopt);

  const JwkRsa&
  getKey() const
  {
    return m_key;
  }

  const std::vector<std::string>&
  getContact() const
  {
    return m_contact;
  }

  const optional<std::string>&
  getRecoveryToken() const
  {
    return m_recoveryToken;
  }

  const optional<std::string>&
  getAgreement() const
  {
    return m_agreement;
  }

  Registration
  withContact(std::vector<std::string> contact) const;

  Registration
  withRecoveryToken(optional<std::string> recoveryToken) const;

  Registration
  withAgreement(optional<std::string> agreement) const;

private:
  static const std::vector<JsonField<Registration>>&
  getJsonFields();

  friend JsonObject<Registration>;

private:
  JwkRsa m_key;
  std::vector<std::string> m_contact;
  optional<std::string> m_recoveryToken;
  optional<std::string> m_agreement;
};

} // namespace acmemsg

#endif // ACMEMSG_REGISTRATION_HPP
