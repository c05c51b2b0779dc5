// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_ATTRIBUTE_LIST_H_
#define NETLINK_ROUTE_ATTRIBUTE_LIST_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <base/containers/span.h>
#include <base/functional/callback.h>

#include "netlink-route/attribute_catalog.h"
#include "netlink-route/byte_view.h"
#include "netlink-route/error.h"
#include "netlink-route/export.h"
#include "netlink-route/netlink_attribute.h"

namespace netlink_route {

// An ordered sequence of attributes, as found in the attribute region of a
// message or in the payload of a nested attribute. Order and duplicates are
// kept as they appear on the wire.
class NETLINK_ROUTE_EXPORT AttributeList {
 public:
  using AttributeMethod =
      base::RepeatingCallback<bool(int id, base::span<const uint8_t> value)>;

  AttributeList();
  AttributeList(const AttributeList& other);
  AttributeList& operator=(const AttributeList& other);
  AttributeList(AttributeList&& other);
  AttributeList& operator=(AttributeList&& other);
  ~AttributeList();

  // Decodes every record of |region| with |catalog|. Either every record
  // decodes and the complete list is returned, or the first error is
  // returned and nothing else. An empty region is an empty list.
  static Result<AttributeList> Decode(
      ByteView region,
      const AttributeCatalog& catalog,
      const DecodeContext& context = DecodeContext());

  // Calls |method| with the type code and payload of each record in
  // |payload|, starting at |offset|. Returns false if a record is malformed
  // or if |method| returns false, true once the records are exhausted.
  static bool IterateAttributes(base::span<const uint8_t> payload,
                                size_t offset,
                                const AttributeMethod& method);

  // Serializes the list: a 4-byte header per attribute carrying its length
  // and its type code with its flags, then the payload, then zero padding
  // to the next 4-byte boundary.
  Result<std::vector<uint8_t>> Encode() const;

  // Number of bytes Encode() produces, padding included.
  size_t EncodedLength() const;

  // Checks the limits Encode() enforces without writing anything: every
  // record, nested ones included, must fit the 16-bit length field.
  Result<void> Validate() const;

  // Writes the encoded list into |out|, which must hold EncodedLength()
  // bytes. Returns the number of bytes written. Stops early, and returns
  // less than EncodedLength(), if an attribute misreports its length.
  size_t Emit(base::span<uint8_t> out) const;

  void Append(std::unique_ptr<NetlinkAttribute> attribute);

  size_t size() const { return attributes_.size(); }
  bool empty() const { return attributes_.empty(); }
  const NetlinkAttribute& at(size_t index) const {
    return *attributes_.at(index);
  }
  const std::vector<std::unique_ptr<NetlinkAttribute>>& attributes() const {
    return attributes_;
  }

  // Returns the first attribute with |type_code|, or nullptr.
  const NetlinkAttribute* Find(uint16_t type_code) const;
  bool HasAttribute(uint16_t type_code) const;

  // Typed lookups. They return std::nullopt (or nullptr) when the attribute
  // is absent or was decoded as a different datatype.
  std::optional<uint8_t> GetU8(uint16_t type_code) const;
  std::optional<uint16_t> GetU16(uint16_t type_code) const;
  std::optional<uint32_t> GetU32(uint16_t type_code) const;
  std::optional<int32_t> GetS32(uint16_t type_code) const;
  std::optional<uint64_t> GetU64(uint16_t type_code) const;
  std::optional<std::string> GetString(uint16_t type_code) const;
  // Works for binary and unknown attributes.
  std::optional<std::vector<uint8_t>> GetBytes(uint16_t type_code) const;
  const AttributeList* GetNested(uint16_t type_code) const;

  // e.g. "{IFLA_MTU(4)=1500, IFLA_IFNAME(3)="lo"}".
  std::string ToString() const;
  void Print(int log_level, int indent) const;

  // Attribute-wise comparison; see NetlinkAttribute::Equals().
  bool operator==(const AttributeList& rhs) const;

 private:
  std::vector<std::unique_ptr<NetlinkAttribute>> attributes_;
};

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_ATTRIBUTE_LIST_H_
