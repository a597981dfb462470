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

#ifndef ACMEMSG_TESTS_TEST_COMMON_HPP
#define ACMEMSG_TESTS_TEST_COMMON_HPP

#include "detail/json-helper.hpp"
#include "tests/boost-test.hpp"
#include "der-blob.hpp"
#include "jwk.hpp"

#include <boost/json/value_to.hpp>

namespace acmemsg::tests {

/**
 * @brief Small RSA public key: 64-octet modulus, exponent 65537.
 */
inline JwkRsa
makeTestKey()
{
  std::vector<uint8_t> modulus(64);
  for (size_t i = 0; i < modulus.size(); ++i) {
    modulus[i] = static_cast<uint8_t>(0xc1 + 7 * i);
  }
  return JwkRsa(std::move(modulus), {0x01, 0x00, 0x01});
}

/**
 * @brief Opaque stand-in for a DER certificate; only its bytes matter here.
 */
inline DerBlob
makeTestCertificate()
{
  return DerBlob({0x30, 0x82, 0x01, 0x0a, 0x02, 0x82, 0x01, 0x01, 0x00, 0xfb, 0xff, 0x3e});
}

/**
 * @brief Canonical form of @p document, for order-independent comparison of JSON trees.
 */
inline std::string
canonical(const std::string& document)
{
  return json::toCanonicalString(json::parse(document));
}

inline std::string
canonical(const JsonValue& json)
{
  return json::toCanonicalString(json);
}

/**
 * @brief Member @p key of the object @p json, which must be a string.
 */
inline std::string
getString(const JsonValue& json, const std::string& key)
{
  return boost::json::value_to<std::string>(json.as_object().at(key));
}

inline bool
hasMember(const JsonValue& json, const std::string& key)
{
  return json.as_object().find(key) != json.as_object().end();
}

} // namespace acmemsg::tests

#endif // ACMEMSG_TESTS_TEST_COMMON_HPP
