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

#include "detail/json-helper.hpp"

#include "tests/test-common.hpp"

namespace acmemsg::tests {

BOOST_AUTO_TEST_SUITE(TestJsonHelper)

BOOST_AUTO_TEST_CASE(CanonicalString)
{
  auto a = json::parse(R"({"b": 2, "a": {"y": true, "x": ["3", 1, null]}})");
  auto b = json::parse(R"({"a": {"x": ["3", 1, null], "y": true}, "b": 2})");
  BOOST_CHECK(a == b);
  BOOST_CHECK_EQUAL(json::toCanonicalString(a), R"({"a":{"x":["3",1,null],"y":true},"b":2})");
  BOOST_CHECK_EQUAL(json::toCanonicalString(a), json::toCanonicalString(b));
  BOOST_CHECK_EQUAL(json::hashJson(a), json::hashJson(b));

  // array order is significant
  auto c = json::parse(R"({"a": {"x": [1, "3", null], "y": true}, "b": 2})");
  BOOST_CHECK_NE(json::toCanonicalString(a), json::toCanonicalString(c));

  // a number and its text are different values
  BOOST_CHECK_NE(json::toCanonicalString(json::parse("2")), json::toCanonicalString(json::parse("\"2\"")));

  BOOST_CHECK_EQUAL(json::toCanonicalString(JsonValue("say \"hi\"")), R"("say \"hi\"")");
}

BOOST_AUTO_TEST_CASE(DescribeKind)
{
  auto doc = json::parse(R"({"list": [], "text": "", "flag": false, "none": null, "count": 1, "ratio": 0.5})");
  const auto& object = doc.as_object();
  BOOST_CHECK_EQUAL(json::describeKind(doc), "an object");
  BOOST_CHECK_EQUAL(json::describeKind(object.at("list")), "an array");
  BOOST_CHECK_EQUAL(json::describeKind(object.at("text")), "a string");
  BOOST_CHECK_EQUAL(json::describeKind(object.at("flag")), "a boolean");
  BOOST_CHECK_EQUAL(json::describeKind(object.at("none")), "null");
  BOOST_CHECK_EQUAL(json::describeKind(object.at("count")), "a number");
  BOOST_CHECK_EQUAL(json::describeKind(object.at("ratio")), "a number");
}

BOOST_AUTO_TEST_CASE(ParseAndWrite)
{
  BOOST_CHECK_THROW(json::parse("{\"a\": "), DecodeError);
  BOOST_CHECK_THROW(json::parse("not json"), DecodeError);

  auto doc = json::parse(R"({"uri": "http://example.com/acme/authz/1", "combinations": [[0, 2]], "tls": false})");
  BOOST_CHECK_EQUAL(json::toString(doc, false),
                    R"({"uri":"http://example.com/acme/authz/1","combinations":[[0,2]],"tls":false})");
  BOOST_CHECK_EQUAL(json::toString(doc),
                    "{\n"
                    "  \"uri\": \"http://example.com/acme/authz/1\",\n"
                    "  \"combinations\": [\n"
                    "    [\n"
                    "      0,\n"
                    "      2\n"
                    "    ]\n"
                    "  ],\n"
                    "  \"tls\": false\n"
                    "}\n");
  BOOST_CHECK(json::parse(json::toString(doc)) == doc);
  BOOST_CHECK_EQUAL(json::toString(json::parse(R"({"a": [], "b": {}})")), "{\n  \"a\": [],\n  \"b\": {}\n}\n");
}

BOOST_AUTO_TEST_CASE(PropertyTreeConversion)
{
  JsonSection section;
  section.put("n", "AQAB");
  JsonSection list;
  JsonSection item;
  item.put_value("mailto:admin@example.com");
  list.push_back(std::make_pair("", item));
  section.add_child("contact", list);

  auto value = json::fromPropertyTree(section);
  BOOST_CHECK_EQUAL(canonical(value), R"({"contact":["mailto:admin@example.com"],"n":"AQAB"})");

  auto doc = json::parse(R"({"tls": false, "count": 3, "none": null, "list": ["a"]})");
  auto tree = json::toPropertyTree(doc);
  BOOST_CHECK_EQUAL(tree.get<std::string>("tls"), "false");
  BOOST_CHECK_EQUAL(tree.get<std::string>("count"), "3");
  BOOST_CHECK_EQUAL(tree.get<std::string>("none"), "");
  BOOST_CHECK_EQUAL(tree.get_child("list").begin()->second.data(), "a");
}

BOOST_AUTO_TEST_SUITE_END() // TestJsonHelper

} // namespace acmemsg::tests
