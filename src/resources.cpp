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

#include "resources.hpp"

namespace acmemsg {

RegistrationResource::RegistrationResource(Registration body, std::string uri,
                                           optional<std::string> newAuthzUri,
                                           optional<std::string> termsOfService)
  : m_body(std::move(body))
  , m_uri(std::move(uri))
  , m_newAuthzUri(std::move(newAuthzUri))
  , m_termsOfService(std::move(termsOfService))
{
}

const std::vector<JsonField<RegistrationResource>>&
RegistrationResource::getJsonFields()
{
  static const std::vector<JsonField<RegistrationResource>> fields{
    JsonField<RegistrationResource>::required("body", &RegistrationResource::m_body),
    JsonField<RegistrationResource>::required("uri", &RegistrationResource::m_uri),
    JsonField<RegistrationResource>::omitEmpty("new_authzr_uri", &RegistrationResource::m_newAuthzUri),
    JsonField<RegistrationResource>::omitEmpty("terms_of_service", &RegistrationResource::m_termsOfService),
  };
  return fields;
}

ChallengeResource::ChallengeResource(ChallengeBody body, std::string authzUri)
  : m_body(std::move(body))
  , m_authzUri(std::move(authzUri))
{
}

const std::vector<JsonField<ChallengeResource>>&
ChallengeResource::getJsonFields()
{
  static const std::vector<JsonField<ChallengeResource>> fields{
    JsonField<ChallengeResource>::required("body", &ChallengeResource::m_body),
    JsonField<ChallengeResource>::required("authzr_uri", &ChallengeResource::m_authzUri),
  };
  return fields;
}

const std::string&
ChallengeResource::getUri() const
{
  return m_body.getUri().empty() ? m_authzUri : m_body.getUri();
}

AuthorizationResource::AuthorizationResource(Authorization body, std::string uri,
                                             optional<std::string> newCertUri)
  : m_body(std::move(body))
  , m_uri(std::move(uri))
  , m_newCertUri(std::move(newCertUri))
{
}

const std::vector<JsonField<AuthorizationResource>>&
AuthorizationResource::getJsonFields()
{
  static const std::vector<JsonField<AuthorizationResource>> fields{
    JsonField<AuthorizationResource>::required("body", &AuthorizationResource::m_body),
    JsonField<AuthorizationResource>::required("uri", &AuthorizationResource::m_uri),
    JsonField<AuthorizationResource>::omitEmpty("new_cert_uri", &AuthorizationResource::m_newCertUri),
  };
  return fields;
}

CertificateRequest::CertificateRequest(DerBlob csr, std::vector<std::string> authorizations)
  : m_csr(std::move(csr))
  , m_authorizations(std::move(authorizations))
{
}

const std::vector<JsonField<CertificateRequest>>&
CertificateRequest::getJsonFields()
{
  static const std::vector<JsonField<CertificateRequest>> fields{
    JsonField<CertificateRequest>::required("csr", &CertificateRequest::m_csr),
    JsonField<CertificateRequest>::omitEmpty("authorizations", &CertificateRequest::m_authorizations),
  };
  return fields;
}

} // namespace acmemsg
