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

#include "detail/base64url.hpp"

#include "tests/test-common.hpp"

namespace acmemsg::tests {

BOOST_AUTO_TEST_SUITE(TestBase64Url)

BOOST_AUTO_TEST_CASE(Encode)
{
  BOOST_CHECK_EQUAL(base64UrlEncode({}), "");
  BOOST_CHECK_EQUAL(base64UrlEncode({0x01, 0x00, 0x01}), "AQAB");
  BOOST_CHECK_EQUAL(base64UrlEncode({0xfb, 0xff}), "-_8");
  BOOST_CHECK_EQUAL(base64UrlEncode({'f', 'o', 'o', 'b'}), "Zm9vYg");
}

BOOST_AUTO_TEST_CASE(Decode)
{
  std::vector<uint8_t> expected{0xfb, 0xff};
  auto decoded = base64UrlDecode("-_8");
  BOOST_CHECK_EQUAL_COLLECTIONS(decoded.begin(), decoded.end(), expected.begin(), expected.end());

  // padding is tolerated
  decoded = base64UrlDecode("-_8=");
  BOOST_CHECK_EQUAL_COLLECTIONS(decoded.begin(), decoded.end(), expected.begin(), expected.end());

  expected = {'f', 'o', 'o', 'b'};
  decoded = base64UrlDecode("Zm9vYg");
  BOOST_CHECK_EQUAL_COLLECTIONS(decoded.begin(), decoded.end(), expected.begin(), expected.end());

  BOOST_CHECK(base64UrlDecode("").empty());
  BOOST_CHECK_THROW(base64UrlDecode("+/8"), DecodeError);
  BOOST_CHECK_THROW(base64UrlDecode("AQA B"), DecodeError);
  BOOST_CHECK_THROW(base64UrlDecode("AQABA"), DecodeError);
}

BOOST_AUTO_TEST_CASE(Codec)
{
  BOOST_CHECK(Base64UrlCodec::encode({0x01, 0x00, 0x01}, JsonMode::PARTIAL) == JsonValue("AQAB"));
  auto decoded = Base64UrlCodec::decode(JsonValue("AQAB"));
  BOOST_CHECK_EQUAL(decoded.size(), 3);
  BOOST_CHECK_THROW(Base64UrlCodec::decode(json::parse(R"({"n": "AQAB"})")), DecodeError);
  BOOST_CHECK_THROW(Base64UrlCodec::decode(JsonValue(nullptr)), DecodeError);
  BOOST_CHECK_THROW(Base64UrlCodec::decode(json::parse("65537")), DecodeError);
}

BOOST_AUTO_TEST_SUITE_END() // TestBase64Url

} // namespace acmemsg::tests
