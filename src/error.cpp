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

#include "error.hpp"

#include <map>

namespace acmemsg {

static const std::map<std::string, std::string>&
getErrorDescriptions()
{
  static const std::map<std::string, std::string> descriptions{
    {"badCSR", "The CSR is unacceptable (e.g., due to a short key)"},
    {"badNonce", "The client sent an unacceptable anti-replay nonce"},
    {"connection", "The server could not connect to the client for DV"},
    {"dnssec", "The server could not validate a DNSSEC signed domain"},
    {"malformed", "The request message was malformed"},
    {"serverInternal", "The server experienced an internal error"},
    {"tls", "The server experienced a TLS error during DV"},
    {"unauthorized", "The client lacks sufficient authorization"},
    {"unknownHost", "The server could not resolve a domain name"},
  };
  return descriptions;
}

const std::vector<std::string>&
detail::ErrorTypeTag::getTokens()
{
  static const std::vector<std::string> tokens = [] {
    std::vector<std::string> result;
    for (const auto& item : getErrorDescriptions()) {
      result.push_back(item.first);
    }
    return result;
  }();
  return tokens;
}

namespace {

// "type" carries the error namespace on the wire
struct NamespacedErrorTypeCodec
{
  static JsonValue
  encode(const optional<ErrorType>& type, JsonMode mode)
  {
    if (!type) {
      return nullptr;
    }
    return JsonCodec<std::string>::encode(ERROR_TYPE_NAMESPACE + type->getToken(), mode);
  }

  static optional<ErrorType>
  decode(const JsonValue& json)
  {
    if (json.is_null()) {
      return nullopt;
    }
    if (!json.is_string()) {
      NDN_THROW(DecodeError("Error type must be a string, got " + json::describeKind(json)));
    }

    auto value = JsonCodec<std::string>::decode(json);
    if (!boost::algorithm::starts_with(value, ERROR_TYPE_NAMESPACE)) {
      NDN_THROW(DecodeError("Error type '" + value + "' lacks the " + ERROR_TYPE_NAMESPACE + " namespace"));
    }
    auto token = value.substr(ERROR_TYPE_NAMESPACE.size());
    if (token.empty() || !boost::algorithm::all(token, boost::algorithm::is_alnum())) {
      NDN_THROW(DecodeError("Malformed error type '" + value + "'"));
    }
    if (!ErrorType::isRegistered(token)) {
      NDN_THROW(DecodeError("Error type '" + token + "' is not recognized"));
    }
    return ErrorType(token);
  }
};

} // namespace

Error::Error(optional<ErrorType> type, optional<std::string> detail, optional<std::string> title)
  : m_type(std::move(type))
  , m_detail(std::move(detail))
  , m_title(std::move(title))
{
}

const std::vector<JsonField<Error>>&
Error::getJsonFields()
{
  static const std::vector<JsonField<Error>> fields{
    JsonField<Error>::omitEmpty("type", &Error::m_type, nullopt, NamespacedErrorTypeCodec{}),
    JsonField<Error>::omitEmpty("detail", &Error::m_detail),
    JsonField<Error>::omitEmpty("title", &Error::m_title),
  };
  return fields;
}

const std::string&
Error::describe(const ErrorType& type)
{
  // every registered ErrorType comes from this table
  return getErrorDescriptions().at(type.getToken());
}

std::string
Error::getDescription() const
{
  return m_type ? describe(*m_type) : "";
}

std::string
Error::toString() const
{
  if (!m_type) {
    return m_detail.value_or("");
  }

  std::vector<std::string> parts{m_type->getToken()};
  auto description = getDescription();
  if (!description.empty()) {
    parts.push_back(std::move(description));
  }
  if (m_detail && !m_detail->empty()) {
    parts.push_back(*m_detail);
  }
  return boost::algorithm::join(parts, " :: ");
}

Error
Error::withType(optional<ErrorType> type) const
{
  return with(&Error::m_type, std::move(type));
}

Error
Error::withDetail(optional<std::string> detail) const
{
  return with(&Error::m_detail, std::move(detail));
}

Error
Error::withTitle(optional<std::string> title) const
{
  return with(&Error::m_title, std::move(title));
}

void
Error::print(std::ostream& os) const
{
  os << toString();
}

} // namespace acmemsg
