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

#ifndef ACMEMSG_JSON_OBJECT_HPP
#define ACMEMSG_JSON_OBJECT_HPP

#include "detail/json-helper.hpp"

#include <functional>
#include <ostream>
#include <typeinfo>

#include <boost/core/demangle.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/string.hpp>

namespace acmemsg {

/**
 * @brief Serialization direction.
 *
 * PARTIAL is the outbound request form, where fields at their default value are
 * left out. FULL contains every declared field and is used for equality,
 * hashing and storage.
 */
enum class JsonMode {
  PARTIAL,
  FULL
};

/**
 * @brief Conversion between a field value and its JSON value.
 *
 * The primary template handles message types, which provide toJson(),
 * toPartialJson() and a static fromJson().
 */
template<class V>
struct JsonCodec
{
  static JsonValue
  encode(const V& value, JsonMode mode)
  {
    return mode == JsonMode::FULL ? value.toJson() : value.toPartialJson();
  }

  static V
  decode(const JsonValue& json)
  {
    return V::fromJson(json);
  }
};

template<>
struct JsonCodec<std::string>
{
  static JsonValue
  encode(const std::string& value, JsonMode);

  static std::string
  decode(const JsonValue& json);
};

template<>
struct JsonCodec<bool>
{
  static JsonValue
  encode(bool value, JsonMode);

  static bool
  decode(const JsonValue& json);
};

template<>
struct JsonCodec<size_t>
{
  static JsonValue
  encode(size_t value, JsonMode);

  static size_t
  decode(const JsonValue& json);
};

/**
 * @brief RFC 3339 timestamps in UTC.
 */
template<>
struct JsonCodec<time::system_clock::time_point>
{
  static JsonValue
  encode(const time::system_clock::time_point& value, JsonMode);

  static time::system_clock::time_point
  decode(const JsonValue& json);
};

/**
 * @brief Absent values are written as null, and null reads back as absent.
 */
template<class V>
struct JsonCodec<optional<V>>
{
  static JsonValue
  encode(const optional<V>& value, JsonMode mode)
  {
    return value ? JsonCodec<V>::encode(*value, mode) : JsonValue(nullptr);
  }

  static optional<V>
  decode(const JsonValue& json)
  {
    if (json.is_null()) {
      return nullopt;
    }
    return JsonCodec<V>::decode(json);
  }
};

/**
 * @brief JSON arrays; null reads back as an empty sequence.
 */
template<class V>
struct JsonCodec<std::vector<V>>
{
  static JsonValue
  encode(const std::vector<V>& value, JsonMode mode)
  {
    boost::json::array array;
    array.reserve(value.size());
    for (const auto& item : value) {
      array.push_back(JsonCodec<V>::encode(item, mode));
    }
    return array;
  }

  static std::vector<V>
  decode(const JsonValue& json)
  {
    if (json.is_null()) {
      return {};
    }
    if (!json.is_array()) {
      NDN_THROW(DecodeError("Expected a JSON array, got " + json::describeKind(json)));
    }
    const auto& array = json.get_array();
    std::vector<V> result;
    result.reserve(array.size());
    for (size_t index = 0; index < array.size(); ++index) {
      try {
        result.push_back(JsonCodec<V>::decode(array[index]));
      }
      catch (const std::exception& e) {
        NDN_THROW_NESTED(DecodeError("Cannot decode element " + std::to_string(index) + ": " + e.what()));
      }
    }
    return result;
  }
};

namespace detail {

template<class V>
struct NonDeduced
{
  using type = V;
};

void
logDecodeFailure(const std::string& typeName, const std::string& reason);

} // namespace detail

/**
 * @brief One named field of a JsonObject, bound to a data member of @p T.
 */
template<class T>
class JsonField
{
public:
  /**
   * @brief A field that must be present on decode and is always encoded.
   */
  template<class V, class Codec = JsonCodec<V>>
  static JsonField
  required(std::string name, V T::*member, Codec = {})
  {
    JsonField field(std::move(name), true);
    field.m_encode = [member] (const T& object, JsonMode mode) {
      return Codec::encode(object.*member, mode);
    };
    field.m_decode = [member] (T& object, const JsonValue& json) {
      object.*member = Codec::decode(json);
    };
    return field;
  }

  /**
   * @brief A field that may be absent on decode, and is left out of the partial
   *        serialization while equal to @p defaultValue.
   */
  template<class V, class Codec = JsonCodec<V>>
  static JsonField
  omitEmpty(std::string name, V T::*member,
            typename detail::NonDeduced<V>::type defaultValue = V{}, Codec = {})
  {
    JsonField field(std::move(name), false);
    field.m_encode = [member] (const T& object, JsonMode mode) {
      return Codec::encode(object.*member, mode);
    };
    field.m_decode = [member] (T& object, const JsonValue& json) {
      object.*member = Codec::decode(json);
    };
    field.m_isDefault = [member, defaultValue] (const T& object) {
      return object.*member == defaultValue;
    };
    return field;
  }

  const std::string&
  getName() const
  {
    return m_name;
  }

  bool
  isRequired() const
  {
    return m_isRequired;
  }

  bool
  isDefault(const T& object) const
  {
    return m_isDefault && m_isDefault(object);
  }

  JsonValue
  encode(const T& object, JsonMode mode) const
  {
    return m_encode(object, mode);
  }

  void
  decode(T& object, const JsonValue& json) const
  {
    m_decode(object, json);
  }

private:
  JsonField(std::string name, bool isRequired)
    : m_name(std::move(name))
    , m_isRequired(isRequired)
  {
  }

private:
  std::string m_name;
  bool m_isRequired;
  std::function<JsonValue(const T&, JsonMode)> m_encode;
  std::function<void(T&, const JsonValue&)> m_decode;
  std::function<bool(const T&)> m_isDefault;
};

/**
 * @brief Immutable object with a fixed table of JSON fields.
 *
 * @p Derived provides
 *  - a default constructor that sets every field to its default value,
 *  - `static const std::vector<JsonField<Derived>>& getJsonFields()`,
 * and befriends JsonObject<Derived>. It may also hide encodeExtraFields(),
 * decodeExtraFields() and print() to add members that are not in the table
 * (discriminants, embedded objects), to validate after decoding, or to render
 * itself differently.
 *
 * Equality and hashing are defined over the full serialization.
 */
template<class Derived>
class JsonObject
{
public:
  JsonValue
  toPartialJson() const
  {
    return encode(JsonMode::PARTIAL);
  }

  JsonValue
  toJson() const
  {
    return encode(JsonMode::FULL);
  }

  /**
   * @throw DecodeError @p json does not describe a valid object
   */
  static Derived
  fromJson(const JsonValue& json)
  {
    try {
      return decode(json);
    }
    catch (const DecodeError& e) {
      detail::logDecodeFailure(getTypeName(), e.what());
      throw;
    }
  }

  size_t
  hash() const
  {
    return json::hashJson(toJson());
  }

  friend bool
  operator==(const Derived& lhs, const Derived& rhs)
  {
    return lhs.toJson() == rhs.toJson();
  }

  friend bool
  operator!=(const Derived& lhs, const Derived& rhs)
  {
    return !(lhs == rhs);
  }

  friend size_t
  hash_value(const Derived& object)
  {
    return object.hash();
  }

  friend std::ostream&
  operator<<(std::ostream& os, const Derived& object)
  {
    printTo(os, object);
    return os;
  }

protected:
  void
  encodeExtraFields(boost::json::object&, JsonMode) const
  {
  }

  void
  decodeExtraFields(const boost::json::object&)
  {
  }

  void
  print(std::ostream& os) const
  {
    os << json::toCanonicalString(toJson());
  }

  /**
   * @brief Copy of this object with @p member replaced by @p value.
   */
  template<class V>
  Derived
  with(V Derived::*member, typename detail::NonDeduced<V>::type value) const
  {
    Derived copy(derived());
    copy.*member = std::move(value);
    return copy;
  }

private:
  const Derived&
  derived() const
  {
    return static_cast<const Derived&>(*this);
  }

  static void
  printTo(std::ostream& os, const Derived& object)
  {
    object.print(os);
  }

  static std::string
  getTypeName()
  {
    return boost::core::demangle(typeid(Derived).name());
  }

  JsonValue
  encode(JsonMode mode) const
  {
    boost::json::object json;
    for (const auto& field : Derived::getJsonFields()) {
      if (mode == JsonMode::PARTIAL && field.isDefault(derived())) {
        continue;
      }
      try {
        json[field.getName()] = field.encode(derived(), mode);
      }
      catch (const std::exception& e) {
        NDN_THROW_NESTED(EncodeError("Cannot encode field '" + field.getName() + "' of " +
                                     getTypeName() + ": " + e.what()));
      }
    }
    derived().encodeExtraFields(json, mode);
    return json;
  }

  static Derived
  decode(const JsonValue& json)
  {
    if (!json.is_object()) {
      NDN_THROW(DecodeError("Expected a JSON object for " + getTypeName() + ", got " +
                            json::describeKind(json)));
    }
    const auto& object = json.get_object();

    Derived result;
    for (const auto& field : Derived::getJsonFields()) {
      auto it = object.find(field.getName());
      if (it == object.end()) {
        if (field.isRequired()) {
          NDN_THROW(DecodeError("Missing required field '" + field.getName() + "' of " + getTypeName()));
        }
        continue;
      }
      try {
        field.decode(result, it->value());
      }
      catch (const std::exception& e) {
        NDN_THROW_NESTED(DecodeError("Cannot decode field '" + field.getName() + "' of " +
                                     getTypeName() + ": " + e.what()));
      }
    }
    result.decodeExtraFields(object);
    return result;
  }
};

} // namespace acmemsg

#endif // ACMEMSG_JSON_OBJECT_HPP
