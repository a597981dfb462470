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

#include <boost/container_hash/hash.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value_to.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace acmemsg::json {

static void
writeCanonical(std::ostream& os, const JsonValue& json)
{
  switch (json.kind()) {
    case boost::json::kind::object: {
      const auto& object = json.get_object();
      std::vector<const boost::json::key_value_pair*> members;
      members.reserve(object.size());
      for (const auto& member : object) {
        members.push_back(&member);
      }
      std::sort(members.begin(), members.end(),
                [] (const auto* a, const auto* b) { return a->key() < b->key(); });
      os << '{';
      bool isFirst = true;
      for (const auto* member : members) {
        if (!isFirst) {
          os << ',';
        }
        isFirst = false;
        os << boost::json::serialize(boost::json::string(member->key())) << ':';
        writeCanonical(os, member->value());
      }
      os << '}';
      break;
    }
    case boost::json::kind::array: {
      os << '[';
      bool isFirst = true;
      for (const auto& item : json.get_array()) {
        if (!isFirst) {
          os << ',';
        }
        isFirst = false;
        writeCanonical(os, item);
      }
      os << ']';
      break;
    }
    default:
      os << boost::json::serialize(json);
      break;
  }
}

static void
writePretty(std::ostream& os, const JsonValue& json, std::string& indent)
{
  static constexpr size_t INDENT_STEP = 2;
  switch (json.kind()) {
    case boost::json::kind::object: {
      const auto& object = json.get_object();
      if (object.empty()) {
        os << "{}";
        break;
      }
      os << "{\n";
      indent.append(INDENT_STEP, ' ');
      for (auto it = object.begin(); it != object.end(); ++it) {
        os << indent << boost::json::serialize(boost::json::string(it->key())) << ": ";
        writePretty(os, it->value(), indent);
        os << (std::next(it) == object.end() ? "\n" : ",\n");
      }
      indent.resize(indent.size() - INDENT_STEP);
      os << indent << '}';
      break;
    }
    case boost::json::kind::array: {
      const auto& array = json.get_array();
      if (array.empty()) {
        os << "[]";
        break;
      }
      os << "[\n";
      indent.append(INDENT_STEP, ' ');
      for (auto it = array.begin(); it != array.end(); ++it) {
        os << indent;
        writePretty(os, *it, indent);
        os << (std::next(it) == array.end() ? "\n" : ",\n");
      }
      indent.resize(indent.size() - INDENT_STEP);
      os << indent << ']';
      break;
    }
    default:
      os << boost::json::serialize(json);
      break;
  }
}

std::string
toCanonicalString(const JsonValue& json)
{
  std::ostringstream os;
  writeCanonical(os, json);
  return os.str();
}

size_t
hashJson(const JsonValue& json)
{
  return boost::hash<std::string>()(toCanonicalString(json));
}

std::string
describeKind(const JsonValue& json)
{
  switch (json.kind()) {
    case boost::json::kind::object:
      return "an object";
    case boost::json::kind::array:
      return "an array";
    case boost::json::kind::string:
      return "a string";
    case boost::json::kind::bool_:
      return "a boolean";
    case boost::json::kind::null:
      return "null";
    default:
      return "a number";
  }
}

JsonValue
parse(const std::string& document)
{
  boost::system::error_code ec;
  auto json = boost::json::parse(document, ec);
  if (ec) {
    NDN_THROW(DecodeError("Cannot parse JSON document: " + ec.message()));
  }
  return json;
}

std::string
toString(const JsonValue& json, bool pretty)
{
  if (!pretty) {
    return boost::json::serialize(json);
  }
  std::ostringstream os;
  std::string indent;
  writePretty(os, json, indent);
  os << '\n';
  return os.str();
}

JsonValue
fromPropertyTree(const JsonSection& section)
{
  if (section.empty()) {
    return JsonValue(boost::json::string(section.data().data(), section.data().size()));
  }
  bool isArray = std::all_of(section.begin(), section.end(),
                             [] (const auto& item) { return item.first.empty(); });
  if (isArray) {
    boost::json::array array;
    for (const auto& item : section) {
      array.push_back(fromPropertyTree(item.second));
    }
    return array;
  }
  boost::json::object object;
  for (const auto& item : section) {
    object[item.first] = fromPropertyTree(item.second);
  }
  return object;
}

JsonSection
toPropertyTree(const JsonValue& json)
{
  JsonSection section;
  switch (json.kind()) {
    case boost::json::kind::object:
      for (const auto& member : json.get_object()) {
        section.push_back(std::make_pair(std::string(member.key().data(), member.key().size()),
                                         toPropertyTree(member.value())));
      }
      break;
    case boost::json::kind::array:
      for (const auto& item : json.get_array()) {
        section.push_back(std::make_pair("", toPropertyTree(item)));
      }
      break;
    case boost::json::kind::string:
      section.put_value(boost::json::value_to<std::string>(json));
      break;
    case boost::json::kind::null:
      break;
    default:
      section.put_value(boost::json::serialize(json));
      break;
  }
  return section;
}

} // namespace acmemsg::json
