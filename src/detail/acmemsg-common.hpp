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

#ifndef ACMEMSG_DETAIL_ACMEMSG_COMMON_HPP
#define ACMEMSG_DETAIL_ACMEMSG_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <ndn-cxx/util/exception.hpp>
#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/time.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/assert.hpp>
#include <boost/json/value.hpp>
#include <boost/property_tree/ptree.hpp>

namespace acmemsg {

using std::optional;
using std::nullopt;

namespace time = ndn::time;
using namespace std::string_literals;

// wire messages
using JsonValue = boost::json::value;

// configuration files
using JsonSection = boost::property_tree::ptree;

/**
 * @brief Malformed or semantically invalid JSON input.
 *
 * Thrown by every fromJson(); the message names the offending field.
 */
class DecodeError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A field value cannot be converted to JSON.
 */
class EncodeError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Requested field is defined neither by a ChallengeBody nor by its challenge.
 */
class FieldLookupError : public std::out_of_range
{
public:
  using std::out_of_range::out_of_range;
};

// ACME resource paths
const std::string RESOURCE_REVOKE_CERT = "/acme/revoke-cert";

// ACME error type namespace
const std::string ERROR_TYPE_NAMESPACE = "urn:acme:error:";

} // namespace acmemsg

#endif // ACMEMSG_DETAIL_ACMEMSG_COMMON_HPP
