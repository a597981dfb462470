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

#ifndef ACMEMSG_DER_BLOB_HPP
#define ACMEMSG_DER_BLOB_HPP

#include "json-object.hpp"

namespace acmemsg {

/**
 * @brief DER encoding of an X.509 object (certificate or certificate request).
 *
 * The contents are not parsed. On the wire the blob is a base64url string.
 */
class DerBlob
{
public:
  DerBlob() = default;

  /**
   * @throw std::invalid_argument @p der is empty
   */
  explicit
  DerBlob(std::vector<uint8_t> der);

  const std::vector<uint8_t>&
  getDer() const
  {
    return m_der;
  }

  JsonValue
  toPartialJson() const;

  JsonValue
  toJson() const
  {
    return toPartialJson();
  }

  /**
   * @throw DecodeError @p json is not a non-empty base64url string
   */
  static DerBlob
  fromJson(const JsonValue& json);

  friend bool
  operator==(const DerBlob& lhs, const DerBlob& rhs)
  {
    return lhs.m_der == rhs.m_der;
  }

  friend bool
  operator!=(const DerBlob& lhs, const DerBlob& rhs)
  {
    return lhs.m_der != rhs.m_der;
  }

  friend size_t
  hash_value(const DerBlob& blob);

  friend std::ostream&
  operator<<(std::ostream& os, const DerBlob& blob);

private:
  std::vector<uint8_t> m_der;
};

} // namespace acmemsg

#endif // ACMEMSG_DER_BLOB_HPP
