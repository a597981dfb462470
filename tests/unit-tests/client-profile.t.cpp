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

#include "detail/client-profile.hpp"

#include "tests/global-configuration.hpp"
#include "tests/test-common.hpp"

namespace acmemsg::tests {

BOOST_AUTO_TEST_SUITE(TestClientProfile)

BOOST_AUTO_TEST_CASE(ReadProfileFile)
{
  ClientProfile profile;
  profile.load("tests/unit-tests/config-files/config-client-1");
  BOOST_CHECK_EQUAL(profile.directory, "https://acme-staging.example.com/directory");
  BOOST_REQUIRE_EQUAL(profile.contact.size(), 2);
  BOOST_CHECK_EQUAL(profile.contact.front(), "mailto:letsencrypt-client@letsencrypt.org");
  BOOST_CHECK_EQUAL(profile.contact.back(), "tel:+12025551212");
  BOOST_REQUIRE(profile.agreement);
  BOOST_CHECK_EQUAL(*profile.agreement, "https://letsencrypt.org/terms");
  BOOST_CHECK_EQUAL(profile.key, makeTestKey());

  profile.load("tests/unit-tests/config-files/config-client-2");
  BOOST_CHECK_EQUAL(profile.directory, "http://localhost:4000/directory");
  BOOST_CHECK(profile.contact.empty());
  BOOST_CHECK(!profile.agreement);
}

BOOST_AUTO_TEST_CASE(ReadProfileFileWithErrors)
{
  ClientProfile profile;
  // nonexistent file
  BOOST_CHECK_THROW(profile.load("tests/unit-tests/config-files/Nonexist"), std::runtime_error);
  // missing directory
  BOOST_CHECK_THROW(profile.load("tests/unit-tests/config-files/config-client-3"), std::runtime_error);
  // unsupported key type
  BOOST_CHECK_THROW(profile.load("tests/unit-tests/config-files/config-client-4"), std::runtime_error);
  // missing key
  BOOST_CHECK_THROW(profile.load("tests/unit-tests/config-files/config-client-5"), std::runtime_error);
  // truncated document
  BOOST_CHECK_THROW(profile.load("tests/unit-tests/config-files/config-client-6"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(MakeMessages)
{
  ClientProfile profile;
  profile.load("tests/unit-tests/config-files/config-client-1");

  auto reg = profile.makeRegistration();
  BOOST_CHECK_EQUAL(reg.getKey(), makeTestKey());
  BOOST_CHECK_EQUAL(reg.getContact().size(), 2);
  BOOST_CHECK_EQUAL(*reg.getAgreement(), "https://letsencrypt.org/terms");
  BOOST_CHECK(!reg.getRecoveryToken());

  BOOST_CHECK_EQUAL(profile.getRevocationUrl(), "https://acme-staging.example.com/acme/revoke-cert");
}

BOOST_AUTO_TEST_CASE(SaveAndReload)
{
  ClientProfile profile;
  profile.directory = "https://example.com/directory";
  profile.contact = {"mailto:a@example.com"};
  profile.key = makeTestKey();

  auto fileName = GlobalConfiguration::makeTestPath("profile.json");
  profile.save(fileName);

  ClientProfile reloaded;
  reloaded.load(fileName);
  BOOST_CHECK_EQUAL(reloaded.directory, profile.directory);
  BOOST_CHECK_EQUAL_COLLECTIONS(reloaded.contact.begin(), reloaded.contact.end(),
                                profile.contact.begin(), profile.contact.end());
  BOOST_CHECK(!reloaded.agreement);
  BOOST_CHECK_EQUAL(reloaded.key, profile.key);
  BOOST_CHECK_EQUAL(canonical(json::fromPropertyTree(reloaded.toJson())),
                    canonical(json::fromPropertyTree(profile.toJson())));
}

BOOST_AUTO_TEST_SUITE_END() // TestClientProfile

} // namespace acmemsg::tests
