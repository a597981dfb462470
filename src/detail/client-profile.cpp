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
#include "revocation.hpp"

#include <boost/property_tree/json_parser.hpp>

#include <fstream>

namespace acmemsg {

NDN_LOG_INIT(acmemsg.profile);

void
ClientProfile::load(const std::string& fileName)
{
  JsonSection configJson;
  try {
    boost::property_tree::read_json(fileName, configJson);
  }
  catch (const std::exception& error) {
    NDN_THROW(std::runtime_error("Failed to parse configuration file " + fileName + ", " + error.what()));
  }
  if (configJson.begin() == configJson.end()) {
    NDN_THROW(std::runtime_error("No JSON configuration found in file: " + fileName));
  }
  load(configJson);
}

void
ClientProfile::load(const JsonSection& json)
{
  directory = json.get(CONFIG_DIRECTORY, "");
  if (directory.empty()) {
    NDN_THROW(std::runtime_error("Cannot parse directory from the config file"));
  }

  contact.clear();
  auto contactJson = json.get_child_optional(CONFIG_CONTACT);
  if (contactJson) {
    for (const auto& item : *contactJson) {
      auto uri = item.second.get_value<std::string>();
      if (uri.empty()) {
        NDN_THROW(std::runtime_error("Contact URI cannot be empty."));
      }
      contact.push_back(uri);
    }
  }

  agreement = nullopt;
  auto agreementStr = json.get(CONFIG_AGREEMENT, "");
  if (!agreementStr.empty()) {
    agreement = agreementStr;
  }

  auto keyJson = json.get_child_optional(CONFIG_KEY);
  if (!keyJson) {
    NDN_THROW(std::runtime_error("No account key is loaded from JSON configuration."));
  }
  try {
    key = JwkRsa::fromJson(json::fromPropertyTree(*keyJson));
  }
  catch (const DecodeError& e) {
    NDN_THROW_NESTED(std::runtime_error("Cannot parse account key: "s + e.what()));
  }
  NDN_LOG_DEBUG("Loaded profile for " << directory << " with " << contact.size() << " contact(s)");
}

void
ClientProfile::save(const std::string& fileName) const
{
  std::ofstream configFile(fileName);
  if (!configFile) {
    NDN_THROW(std::runtime_error("Cannot open " + fileName + " for writing"));
  }
  boost::property_tree::write_json(configFile, toJson());
}

JsonSection
ClientProfile::toJson() const
{
  JsonSection json;
  json.put(CONFIG_DIRECTORY, directory);
  if (!contact.empty()) {
    JsonSection contactJson;
    for (const auto& uri : contact) {
      JsonSection node;
      node.put_value(uri);
      contactJson.push_back(std::make_pair("", node));
    }
    json.add_child(CONFIG_CONTACT, contactJson);
  }
  if (agreement) {
    json.put(CONFIG_AGREEMENT, *agreement);
  }
  json.add_child(CONFIG_KEY, json::toPropertyTree(key.toJson()));
  return json;
}

Registration
ClientProfile::makeRegistration() const
{
  return Registration(key, contact, nullopt, agreement);
}

std::string
ClientProfile::getRevocationUrl() const
{
  return Revocation::url(directory);
}

} // namespace acmemsg
