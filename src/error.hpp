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

#ifndef ACMEMSG_ERROR_HPP
#define ACMEMSG_ERROR_HPP

#include "constant.hpp"
#include "json-object.hpp"

namespace acmemsg {

namespace detail {

struct ErrorTypeTag
{
  static constexpr char NAME[] = "ErrorType";

  static const std::vector<std::string>&
  getTokens();
};

} // namespace detail

/**
 * @brief Recognized ACME error code, without the urn:acme:error: namespace.
 */
using ErrorType = Constant<detail::ErrorTypeTag>;

/**
 * @brief ACME error document.
 *
 * Target JSON format:
 * {
 *   "type": "urn:acme:error:<token>",
 *   "detail": "...",
 *   "title": "..."
 * }
 * All members are optional.
 */
class Error : public JsonObject<Error>
{
public:
  Error() = default;

  explicit
  Error(optional<ErrorType> type, optional<std::string> detail = nullopt,
        optional<std::string> title = nullopt);

  const optional<ErrorType>&
  getType() const
  {
    return m_type;
  }

  const optional<std::string>&
  getDetail() const
  {
    return m_detail;
  }

  const optional<std::string>&
  getTitle() const
  {
    return m_title;
  }

  /**
   * @return human-readable meaning of the error type, or an empty string when
   *         the type is not set
   */
  std::string
  getDescription() const;

  /**
   * @brief Render as "<type> :: <description> :: <detail>", or the detail alone
   *        when the type is not set.
   */
  std::string
  toString() const;

  Error
  withType(optional<ErrorType> type) const;

  Error
  withDetail(optional<std::string> detail) const;

  Error
  withTitle(optional<std::string> title) const;

  /**
   * @return description of @p type
   */
  static const std::string&
  describe(const ErrorType& type);

private:
  static const std::vector<JsonField<Error>>&
  getJsonFields();

  void
  print(std::ostream& os) const;

  friend JsonObject<Error>;

private:
  optional<ErrorType> m_type;
  optional<std::string> m_detail;
  optional<std::string> m_title;
};

} // namespace acmemsg

#endif // ACMEMSG_ERROR_HPP
