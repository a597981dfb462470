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

#ifndef ACMEMSG_CONSTANTS_HPP
#define ACMEMSG_CONSTANTS_HPP

#include "constant.hpp"

namespace acmemsg {

namespace detail {

struct StatusTag
{
  static constexpr char NAME[] = "Status";

  static const std::vector<std::string>&
  getTokens();
};

struct IdentifierTypeTag
{
  static constexpr char NAME[] = "IdentifierType";

  static const std::vector<std::string>&
  getTokens();
};

} // namespace detail

/**
 * @brief Status of a challenge or authorization.
 */
using Status = Constant<detail::StatusTag>;

/**
 * @brief Type of an identifier the client asks to be authorized for.
 */
using IdentifierType = Constant<detail::IdentifierTypeTag>;

inline const Status STATUS_UNKNOWN{"unknown"};
inline const Status STATUS_PENDING{"pending"};
inline const Status STATUS_PROCESSING{"processing"};
inline const Status STATUS_VALID{"valid"};
inline const Status STATUS_INVALID{"invalid"};
inline const Status STATUS_REVOKED{"revoked"};

inline const IdentifierType IDENTIFIER_FQDN{"dns"};

} // namespace acmemsg

#endif // ACMEMSG_CONSTANTS_HPP
