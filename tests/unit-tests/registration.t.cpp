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
#include "detail/base64url.hpp"

#include "tests/test-common.hpp"

namespace acmemsg::tests {

class RegistrationFixture
{
public:
  RegistrationFixture()
    : key(makeTestKey())
    , reg(key, {"mailto:letsencrypt-client@letsencrypt.org"}, "XYZ"s, "https://letsencrypt.org/terms"s)
  {
  }

public:
  JwkRsa key;
  Registration reg;
};

BOOST_AUTO_TEST_SUITE(TestRegistration)

BOOST_AUTO_TEST_CASE(JwkJson)
{
  auto key = makeTestKey();
  auto json = key.toPartialJson();
  BOOST_CHECK_EQUAL(getString(json, "kty"), "RSA");
  BOOST_CHECK_EQUAL(getString(json, "e"), "AQAB");
  BOOST_CHECK_EQUAL(getString(json, "n"), base64UrlEncode(key.getModulus()));
  BOOST_CHECK_EQUAL(JwkRsa::fromJson(json), key);

  BOOST_CHECK_THROW(JwkRsa({}, {0x01, 0x00, 0x01}), std::invalid_argument);
  BOOST_CHECK_THROW(JwkRsa::fromJson(json::parse(R"({"kty": "EC", "n": "AQAB", "e": "AQAB"})")), DecodeError);
  BOOST_CHECK_THROW(JwkRsa::fromJson(json::parse(R"({"n": "AQAB", "e": "AQAB"})")), DecodeError);
  BOOST_CHECK_THROW(JwkRsa::fromJson(json::parse(R"({"kty": null, "n": "AQAB", "e": "AQAB"})")), DecodeError);
  BOOST_CHECK_THROW(JwkRsa::fromJson(json::parse(R"({"kty": "RSA", "n": "", "e": "AQAB"})")), DecodeError);
  BOOST_CHECK_THROW(JwkRsa::fromJson(json::parse(R"({"kty": "RSA", "e": "AQAB"})")), DecodeError);
  BOOST_CHECK_THROW(JwkRsa::fromJson(json::parse(R"({"kty": "RSA", "n": "+/8", "e": "AQAB"})")), DecodeError);
}

BOOST_FIXTURE_TEST_CASE(ToPartialJson, RegistrationFixture)
{
  auto json = reg.toPartialJson();
  BOOST_CHECK_EQUAL(canonical(json.as_object().at("contact")), R"(["mailto:letsencrypt-client@letsencrypt.org"])");
  BOOST_CHECK_EQUAL(getString(json, "recoveryToken"), "XYZ");
  BOOST_CHECK_EQUAL(getString(json, "agreement"), "https://letsencrypt.org/terms");
  BOOST_CHECK_EQUAL(canonical(json.as_object().at("key")), canonical(key.toJson()));

  Registration bare(key);
  BOOST_CHECK_EQUAL(canonical(bare.toPartialJson()), canonical("{\"key\": " + json::toString(key.toJson()) + "}"));
}

BOOST_FIXTURE_TEST_CASE(FromJson, RegistrationFixture)
{
  BOOST_CHECK_EQUAL(Registration::fromJson(reg.toPartialJson()), reg);
  BOOST_CHECK_EQUAL(Registration::fromJson(reg.toJson()), reg);
  BOOST_CHECK_EQUAL(Registration::fromJson(reg.toJson()).hash(), reg.hash());

  auto decoded = Registration::fromJson(json::parse(json::toString(reg.toPartialJson())));
  BOOST_CHECK_EQUAL(decoded.getContact().size(), 1);
  BOOST_CHECK_EQUAL(decoded.getContact().front(), "mailto:letsencrypt-client@letsencrypt.org");
  BOOST_CHECK_EQUAL(*decoded.getRecoveryToken(), "XYZ");
  BOOST_CHECK_EQUAL(*decoded.getAgreement(), "https://letsencrypt.org/terms");
  BOOST_CHECK_EQUAL(decoded.getKey(), key);

  BOOST_CHECK_THROW(Registration::fromJson(json::parse(R"({"contact": ["mailto:a@example.com"]})")), DecodeError);
}

BOOST_FIXTURE_TEST_CASE(CopyWith, RegistrationFixture)
{
  auto updated = reg.withContact({"mailto:a@example.com", "tel:+12025551212"}).withRecoveryToken(nullopt);
  BOOST_CHECK_EQUAL(updated.getContact().size(), 2);
  BOOST_CHECK(!updated.getRecoveryToken());
  BOOST_CHECK_EQUAL(reg.getContact().size(), 1);
  BOOST_CHECK_EQUAL(*reg.getRecoveryToken(), "XYZ");

  auto json = updated.toPartialJson();
  BOOST_CHECK(!hasMember(json, "recoveryToken"));
  BOOST_CHECK(updated.toJson().as_object().at("recoveryToken").is_null());
  BOOST_CHECK_EQUAL(updated.withAgreement(nullopt).withContact({}), Registration(key));
}

BOOST_AUTO_TEST_SUITE_END() // TestRegistration

} // namespace acmemsg::tests
