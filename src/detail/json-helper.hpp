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

#ifndef ACMEMSG_DETAIL_JSON_HELPER_HPP
#define ACMEMSG_DETAIL_JSON_HELPER_HPP

#include "detail/acmemsg-common.hpp"

namespace acmemsg::json {

/**
 * @brief Compact rendering with object members sorted by key.
 *
 * Two values that are equal as JSON have the same canonical string; array
 * order is significant.
 */
std::string
toCanonicalString(const JsonValue& json);

size_t
hashJson(const JsonValue& json);

/**
 * @return "an object", "a string" etc., for error messages
 */
std::string
describeKind(const JsonValue& json);

/**
 * @throw DecodeError @p document is not valid JSON
 */
JsonValue
parse(const std::string& document);

std::string
toString(const JsonValue& json, bool pretty = true);

/**
 * @brief Convert a configuration subtree to a message value.
 *
 * Leaves become strings; a node whose children all have empty keys becomes an array.
 */
JsonValue
fromPropertyTree(const JsonSection& section);

/**
 * @brief Convert a message value to a configuration subtree.
 *
 * Numbers and booleans are stored as their JSON text, null as an empty node.
 */
JsonSection
toPropertyTree(const JsonValue& json);

} // namespace acmemsg::json

#endif // ACMEMSG_DETAIL_JSON_HELPER_HPP
