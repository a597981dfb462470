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

#ifndef ACMEMSG_CONSTANT_HPP
#define ACMEMSG_CONSTANT_HPP

#include "detail/json-helper.hpp"

#include <ostream>
#include <set>

#include <boost/container_hash/hash.hpp>
#include <boost/json/string.hpp>

namespace acmemsg {

/**
 * @brief Value drawn from a closed, named set of tokens.
 *
 * @p Tag provides `static constexpr char NAME[]` and
 * `static const std::vector<std::string>& getTokens()`. The token set of each
 * registry is built once, on first use, and never changes afterwards. Every
 * Constant refers to the single interned copy of its token, so two constants
 * of the same registry are equal iff they refer to the same entry. Constants of
 * different registries are different types and never compare equal.
 */
template<class Tag>
class Constant
{
public:
  /**
   * @throw std::invalid_argument @p token is not in the registry
   */
  explicit
  Constant(const std::string& token)
    : m_token(lookup(token))
  {
    if (m_token == nullptr) {
      NDN_THROW(std::invalid_argument("Unknown "s + Tag::NAME + " value '" + token + "'"));
    }
  }

  /**
   * @throw DecodeError @p json is not a registered token
   */
  static Constant
  fromJson(const JsonValue& json)
  {
    if (!json.is_string()) {
      NDN_THROW(DecodeError("Expected a "s + Tag::NAME + " token, got " + json::describeKind(json)));
    }
    const auto& value = json.get_string();
    std::string token(value.data(), value.size());
    const std::string* interned = lookup(token);
    if (interned == nullptr) {
      NDN_THROW(DecodeError("Unknown "s + Tag::NAME + " value '" + token + "'"));
    }
    return Constant(interned);
  }

  static bool
  isRegistered(const std::string& token)
  {
    return lookup(token) != nullptr;
  }

  JsonValue
  toPartialJson() const
  {
    return boost::json::string(m_token->data(), m_token->size());
  }

  JsonValue
  toJson() const
  {
    return toPartialJson();
  }

  const std::string&
  getToken() const
  {
    return *m_token;
  }

  friend bool
  operator==(const Constant& lhs, const Constant& rhs)
  {
    return lhs.m_token == rhs.m_token;
  }

  friend bool
  operator!=(const Constant& lhs, const Constant& rhs)
  {
    return lhs.m_token != rhs.m_token;
  }

  friend size_t
  hash_value(const Constant& constant)
  {
    size_t seed = 0;
    boost::hash_combine(seed, std::string(Tag::NAME));
    boost::hash_combine(seed, *constant.m_token);
    return seed;
  }

  friend std::ostream&
  operator<<(std::ostream& os, const Constant& constant)
  {
    return os << Tag::NAME << "(" << *constant.m_token << ")";
  }

private:
  explicit
  Constant(const std::string* token)
    : m_token(token)
  {
  }

  static const std::set<std::string>&
  getRegistry()
  {
    static const std::set<std::string> registry(Tag::getTokens().begin(), Tag::getTokens().end());
    return registry;
  }

  static const std::string*
  lookup(const std::string& token)
  {
    const auto& registry = getRegistry();
    auto it = registry.find(token);
    return it == registry.end() ? nullptr : &*it;
  }

private:
  const std::string* m_token;
};

} // namespace acmemsg

#endif // ACMEMSG_CONSTANT_HPP
