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

#ifndef ACMEMSG_DETAIL_CLIENT_PROFILE_HPP
#define ACMEMSG_DETAIL_CLIENT_PROFILE_HPP

#include "registration.hpp"

namespace acmemsg {

// used in parsing the client profile file
const std::string CONFIG_DIRECTORY = "directory";
const std::string CONFIG_CONTACT = "contact";
const std::string CONFIG_AGREEMENT = "agreement";
const std::string CONFIG_KEY = "key";

/**
 * @brief Settings of a client talking to one ACME server.
 *
 * Sample:
 * {
 *   "directory": "https://acme.example.com/directory",
 *   "contact": ["mailto:admin@example.com"],
 *   "agreement": "https://acme.example.com/terms",
 *   "key": {"kty": "RSA", "n": "...", "e": "AQAB"}
 * }
 */
class ClientProfile
{
public:
  /**
   * @throw std::runtime_error when config file cannot be correctly parsed.
   */
  void
  load(const std::string& fileName);

  /**
   * @throw std::runtime_error when config file cannot be correctly parsed.
   */
  void
  load(const JsonSection& json);

  void
  save(const std::string& fileName) const;

  JsonSection
  toJson() const;

  /**
   * @brief New-registration payload for this profile.
   */
  Registration
  makeRegistration() const;

  /**
   * @brief Revocation endpoint of the configured server.
   */
  std::string
  getRevocationUrl() const;

public:
  /**
   * @brief Directory URL of the ACME server.
   */
  std::string directory;
  /**
   * @brief Contact URIs sent on registration.
   */
  std::vector<std::string> contact;
  /**
   * @brief Subscriber agreement the client accepts, if any.
   */
  optional<std::string> agreement;
  /**
   * @brief Account key.
   */
  JwkRsa key;
};

} // namespace acmemsg

#endif // ACMEMSG_DETAIL_CLIENT_PROFILE_HPP
