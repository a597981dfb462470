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

#ifndef ACMEMSG_REVOCATION_HPP
#define ACMEMSG_REVOCATION_HPP

#include "der-blob.hpp"

namespace acmemsg {

/**
 * @brief Certificate revocation request.
 *
 * Target JSON format:
 * {
 *   "certificate": "<base64url DER>"
 * }
 */
class Revocation : public JsonObject<Revocation>
{
public:
  Revocation() = default;

  explicit
  Revocation(DerBlob certificate);

  const DerBlob&
  getCertificate() const
  {
    return m_certificate;
  }

  /**
   * @brief Revocation endpoint of the server at @p directoryBase.
   *
   * Any path of @p directoryBase is replaced with the revoke-cert resource, so
   * both "https://example.com" and "https://example.com/acme/new-reg" give
   * "https://example.com/acme/revoke-cert".
   *
   * @throw std::invalid_argument @p directoryBase is not an absolute URL
   */
  static std::string
  url(const std::string& directoryBase);

private:
  static const std::vector<JsonField<Revocation>>&
  getJsonFields();

  friend JsonObject<Revocation>;

private:
  DerBlob m_certificate;
};

} // namespace acmemsg

#endif // ACMEMSG_REVOCATION_HPP
