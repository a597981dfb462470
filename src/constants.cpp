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

#include "constants.hpp"

namespace acmemsg::detail {

const std::vector<std::string>&
StatusTag::getTokens()
{
  static const std::vector<std::string> tokens{
    "unknown", "pending", "processing", "valid", "invalid", "revoked"
  };
  return tokens;
}

const std::vector<std::string>&
IdentifierTypeTag::getTokens()
{
  static const std::vector<std::string> tokens{"dns"};
  return tokens;
}

} // namespace acmemsg::detail
