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

#include "tests/test-common.hpp"

namespace acmemsg::tests {

BOOST_AUTO_TEST_SUITE(TestResources)

BOOST_AUTO_TEST_CASE(ChallengeResourceUri)
{
  ChallengeResource resource(ChallengeBody(Dns("foo"), "http://challb"), "http://authz");
  BOOST_CHECK_EQUAL(resource.getUri(), "http://challb");
  BOOST_CHECK_EQUAL(resource.getAuthzUri(), "http://authz");

  ChallengeResource withoutUri(ChallengeBody(Dns("foo"), ""), "http://authz");
  BOOST_CHECK_EQUAL(withoutUri.getUri(), "http://authz");
}

BOOST_AUTO_TEST_CASE(ChallengeResourceJson)
{
  ChallengeResource resource(ChallengeBody(Dns("foo"), "http://challb", STATUS_VALID), "http://authz");
  BOOST_CHECK_EQUAL(canonical(resource.toPartialJson()),
                    canonical(R"({"body": {"uri": "http://challb", "status": "valid", "type": "dns", "token": "foo"},
                                  "authzr_uri": "http://authz"})"));
  BOOST_CHECK_EQUAL(ChallengeResource::fromJson(resource.toJson()), resource);
  BOOST_CHECK_THROW(ChallengeResource::fromJson(json::parse(R"({"authzr_uri": "http://authz"})")), DecodeError);
}

BOOST_AUTO_TEST_CASE(RegistrationResourceJson)
{
  RegistrationResource resource(Registration(makeTestKey(), {"mailto:a@example.com"}),
                                "https://example.com/acme/reg/1",
                                "https://example.com/acme/new-authz"s);
  auto json = resource.toPartialJson();
  BOOST_CHECK_EQUAL(getString(json, "uri"), "https://example.com/acme/reg/1");
  BOOST_CHECK_EQUAL(getString(json, "new_authzr_uri"), "https://example.com/acme/new-authz");
  BOOST_CHECK(!hasMember(json, "terms_of_service"));
  BOOST_CHECK_EQUAL(canonical(json.as_object().at("body").as_object().at("contact")), R"(["mailto:a@example.com"])");

  auto decoded = RegistrationResource::fromJson(json);
  BOOST_CHECK_EQUAL(decoded, resource);
  BOOST_CHECK(!decoded.getTermsOfService());
  BOOST_CHECK_EQUAL(decoded.getBody().getKey(), makeTestKey());
}

BOOST_AUTO_TEST_CASE(AuthorizationResourceJson)
{
  Authorization authz(Identifier(IDENTIFIER_FQDN, "example.com"),
                      {ChallengeBody(Dns("foo"), "http://challb")}, {{0}}, STATUS_PENDING);
  AuthorizationResource resource(authz, "https://example.com/acme/authz/1",
                                 "https://example.com/acme/new-cert"s);
  auto json = resource.toPartialJson();
  BOOST_CHECK_EQUAL(getString(json.as_object().at("body").as_object().at("identifier"), "value"), "example.com");
  BOOST_CHECK_EQUAL(getString(json, "new_cert_uri"), "https://example.com/acme/new-cert");
  BOOST_CHECK_EQUAL(canonical(json.as_object().at("body").as_object().at("combinations")), "[[0]]");

  auto decoded = AuthorizationResource::fromJson(json);
  BOOST_CHECK_EQUAL(decoded, resource);
  BOOST_CHECK_EQUAL(decoded.getBody().getResolvedCombinations().front().front().get().getToken(), "foo");
}

BOOST_AUTO_TEST_CASE(CertificateRequestJson)
{
  CertificateRequest request(makeTestCertificate(), {"https://example.com/acme/authz/1"});
  auto json = request.toPartialJson();
  BOOST_CHECK_EQUAL(getString(json, "csr"), "MIIBCgKCAQEA-_8-");
  BOOST_CHECK_EQUAL(canonical(json.as_object().at("authorizations")), R"(["https://example.com/acme/authz/1"])");
  BOOST_CHECK_EQUAL(CertificateRequest::fromJson(json), request);

  CertificateRequest bare(makeTestCertificate());
  BOOST_CHECK_EQUAL(canonical(bare.toPartialJson()), R"({"csr":"MIIBCgKCAQEA-_8-"})");
  BOOST_CHECK_THROW(CertificateRequest::fromJson(json::parse("{}")), DecodeError);
}

BOOST_AUTO_TEST_SUITE_END() // TestResources

} // namespace acmemsg::tests
