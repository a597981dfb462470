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

#ifndef ACMEMSG_RESOURCES_HPP
#define ACMEMSG_RESOURCES_HPP

#include "authorization.hpp"
#include "der-blob.hpp"
#include "registration.hpp"

namespace acmemsg {

/**
 * @brief Registration together with the location the server assigned to it.
 */
class RegistrationResource : public JsonObject<RegistrationResource>
{
public:
  RegistrationResource() = default;

  RegistrationResource(Registration body, std::string uri,
                       optional<std::string> newAuthzUri = nullopt,
                       optional<std::string> termsOfService = nullopt);

  const Registration&
  getBody() const
  {
    return m_body;
  }

  const std::string&
  getUri() const
  {
    return m_uri;
  }

  const optional<std::string>&
  getNewAuthzUri() const
  {
    return m_newAuthzUri;
  }

  const optional<std::string>&
  getTermsOfService() const
  {
    return m_termsOfService;
  }

private:
  static const std::vector<JsonField<RegistrationResource>>&
  getJsonFields();

  friend JsonObject<RegistrationResource>;

private:
  Registration m_body;
  std::string m_uri;
  optional<std::string> m_newAuthzUri;
  optional<std::string> m_termsOfService;
};

/**
 * @brief Challenge together with the authorization it belongs to.
 */
class ChallengeResource : public JsonObject<ChallengeResource>
{
public:
  ChallengeResource() = default;

  ChallengeResource(ChallengeBody body, std::string authzUri);

  const ChallengeBody&
  getBody() const
  {
    return m_body;
  }

  const std::string&
  getAuthzUri() const
  {
    return m_authzUri;
  }

  /**
   * @return URI of the challenge body, or the authorization URI when the body has none
   */
  const std::string&
  getUri() const;

private:
  static const std::vector<JsonField<ChallengeResource>>&
  getJsonFields();

  friend JsonObject<ChallengeResource>;

private:
  ChallengeBody m_body;
  std::string m_authzUri;
};

/**
 * @brief Authorization together with its location and the new-cert endpoint.
 */
class AuthorizationResource : public JsonObject<AuthorizationResource>
{
public:
  AuthorizationResource() = default;

  AuthorizationResource(Authorization body, std::string uri,
                        optional<std::string> newCertUri = nullopt);

  const Authorization&
  getBody() const
  {
    return m_body;
  }

  const std::string&
  getUri() const
  {
    return m_uri;
  }

  const optional<std::string>&
  getNewCertUri() const
  {
    return m_newCertUri;
  }

private:
  static const std::vector<JsonField<AuthorizationResource>>&
  getJsonFields();

  friend JsonObject<AuthorizationResource>;

private:
  Authorization m_body;
  std::string m_uri;
  optional<std::string> m_newCertUri;
};

/**
 * @brief Request for a certificate.
 *
 * Target JSON format:
 * {
 *   "csr": "<base64url DER>",
 *   "authorizations": ["https://example.com/acme/authz/1", ...]
 * }
 */
class CertificateRequest : public JsonObject<CertificateRequest>
{
public:
  CertificateRequest() = default;

  explicit
  CertificateRequest(DerBlob csr, std::vector<std::string> authorizations = {});

  const DerBlob&
  getCsr() const
  {
    return m_csr;
  }

  const std::vector<std::string>&
  getAuthorizations() const
  {
    return m_authorizations;
  }

private:
  static const std::vector<JsonField<CertificateRequest>>&
  getJsonFields();

  friend JsonObject<CertificateRequest>;

private:
  DerBlob m_csr;
  std::vector<std::string> m_authorizations;
};

} // namespace acmemsg

#endif // ACMEMSG_RESOURCES_HPP
