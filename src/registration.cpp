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

#include "registration.hpp"

namespace acmemsg {

Registration::Registration(JwkRsa key, std::vector<std::string> contact,
                           optional<std::string> recoveryToken, optional<std::string> agreement)
  : m_key(std::move(key))
  , m_contact(std::move(contact))
  , m_recoveryToken(std::move(recoveryToken))
  , m_agreement(std::move(agreement))
{
}

const std::vector<JsonField<Registration>>&
Registration::getJsonFields()
{
  static const std::vector<JsonField<Registration>> fields{
    JsonField<Registration>::required("key", &Registration::m_key),
    JsonField<Registration>::omitEmpty("contact", &Registration::m_contact),
    JsonField<Registration>::omitEmpty("recoveryToken", &Registration::m_recoveryToken),
    JsonField<Registration>::omitEmpty("agreement", &Registration::m_agreement),
  };
  return fields;
}

Registration
Registration::withContact(std::vector<std::string> contact) const
{
  return with(&Registration::m_contact, std::move(contact));
}

Registration
Registration::withRecoveryToken(optional<std::string> recoveryToken) const
{
  return with(&Registration::m_recoveryToken, std::move(recoveryToken));
}

Registration
Registration::withAgreement(optional<std::string> agreement) const
{
  return with(&Registration::m_agreement, std::move(agreement));
}

} // namespace acmemsg
