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

#include "revocation.hpp"

#include <regex>

namespace acmemsg {

NDN_LOG_INIT(acmemsg.revocation);

Revocation::Revocation(DerBlob certificate)
  : m_certificate(std::move(certificate))
{
}

const std::vector<JsonField<Revocation>>&
Revocation::getJsonFields()
{
  static const std::vector<JsonField<Revocation>> fields{
    JsonField<Revocation>::required("certificate", &Revocation::m_certificate),
  };
  return fields;
}

std::string
Revocation::url(const std::string& directoryBase)
{
  // scheme "://" authority, where the authority ends at the first '/', '?' or '#'
  static const std::regex schemeAndAuthority(R"_RE_(^([a-zA-Z][a-zA-Z0-9+.\-]*://[^/?#]+))_RE_");

  std::smatch match;
  if (!std::regex_search(directoryBase, match, schemeAndAuthority)) {
    NDN_THROW(std::invalid_argument("Cannot parse '" + directoryBase + "' as an absolute URL"));
  }
  auto endpoint = match[1].str() + RESOURCE_REVOKE_CERT;
  NDN_LOG_TRACE("Revocation endpoint for " << directoryBase << " is " << endpoint);
  return endpoint;
}

} // namespace acmemsg
