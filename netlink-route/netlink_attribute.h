// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_NETLINK_ATTRIBUTE_H_
#define NETLINK_ROUTE_NETLINK_ATTRIBUTE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <base/containers/span.h>

#include "netlink-route/byte_utils.h"
#include "netlink-route/export.h"

namespace netlink_route {

class AttributeList;

// The value of one decoded netlink attribute. Every concrete attribute knows
// how long its payload is and how to write it; the 4-byte record header and
// the padding are produced by AttributeList.
//
// Values own their data. Nothing in a NetlinkAttribute points back into the
// buffer it was decoded from.
class NETLINK_ROUTE_EXPORT NetlinkAttribute {
 public:
  enum class Type {
    kU8,
    kU16,
    kU32,
    kS32,
    kU64,
    kFlag,
    kString,
    kBinary,
    kNested,
    kUnknown,
  };

  NetlinkAttribute(const NetlinkAttribute&) = delete;
  NetlinkAttribute& operator=(const NetlinkAttribute&) = delete;
  virtual ~NetlinkAttribute();

  // The 14-bit type code, without the flag bits.
  uint16_t type_code() const { return type_code_; }
  Type datatype() const { return datatype_; }
  // Symbolic name from the catalog that decoded this attribute, e.g.
  // "IFLA_MTU". Empty for attributes the catalog does not know. The string is
  // not copied, so it must outlive the attribute.
  std::string_view name() const { return name_; }

  // NLA_F_NESTED and NLA_F_NET_BYTEORDER, in their wire positions. Decoded
  // attributes keep the bits they arrived with so they are re-emitted as is.
  uint16_t flags() const { return flags_; }
  void set_flags(uint16_t flags);
  bool is_nested() const;
  bool is_network_byte_order() const;

  // Length of the payload in bytes, excluding the record header and padding.
  virtual size_t EncodedLength() const = 0;

  // Writes the payload into |out|, which holds at least EncodedLength()
  // bytes. Returns the number of bytes written, which must be
  // EncodedLength().
  virtual size_t Emit(base::span<uint8_t> out) const = 0;

  // Returns the children of a nested attribute, nullptr for any other type.
  virtual const AttributeList* nested_value() const { return nullptr; }

  virtual std::unique_ptr<NetlinkAttribute> Clone() const = 0;

  // Human-readable rendering of the value alone.
  virtual std::string ValueToString() const = 0;

  // e.g. "IFLA_MTU(4)=1500" or "attr(99)=<4 bytes: 01020304>".
  std::string ToString() const;

  // Returns the payload as Emit() would write it.
  std::vector<uint8_t> EncodePayload() const;

  // Two attributes are equal when they have the same type code, flags and
  // datatype and equal values. Integers compare by value and byte order;
  // every other datatype compares its encoded payload.
  bool Equals(const NetlinkAttribute& other) const;

  static std::string_view TypeToString(Type type);

 protected:
  NetlinkAttribute(Type datatype, uint16_t type_code, std::string_view name);

  // |other| has the same datatype as this attribute.
  virtual bool ValueEquals(const NetlinkAttribute& other) const;

 private:
  const Type datatype_;
  const uint16_t type_code_;
  const std::string_view name_;
  uint16_t flags_ = 0;
};

class NETLINK_ROUTE_EXPORT NetlinkU8Attribute : public NetlinkAttribute {
 public:
  NetlinkU8Attribute(uint16_t type_code,
                     uint8_t value,
                     std::string_view name = {});

  uint8_t value() const { return value_; }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 private:
  uint8_t value_;
};

class NETLINK_ROUTE_EXPORT NetlinkU16Attribute : public NetlinkAttribute {
 public:
  NetlinkU16Attribute(
      uint16_t type_code,
      uint16_t value,
      std::string_view name = {},
      byte_utils::ByteOrder order = byte_utils::ByteOrder::kLittleEndian);

  uint16_t value() const { return value_; }
  byte_utils::ByteOrder byte_order() const { return order_; }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 protected:
  bool ValueEquals(const NetlinkAttribute& other) const override;

 private:
  uint16_t value_;
  byte_utils::ByteOrder order_;
};

class NETLINK_ROUTE_EXPORT NetlinkU32Attribute : public NetlinkAttribute {
 public:
  NetlinkU32Attribute(
      uint16_t type_code,
      uint32_t value,
      std::string_view name = {},
      byte_utils::ByteOrder order = byte_utils::ByteOrder::kLittleEndian);

  uint32_t value() const { return value_; }
  byte_utils::ByteOrder byte_order() const { return order_; }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 protected:
  bool ValueEquals(const NetlinkAttribute& other) const override;

 private:
  uint32_t value_;
  byte_utils::ByteOrder order_;
};

class NETLINK_ROUTE_EXPORT NetlinkS32Attribute : public NetlinkAttribute {
 public:
  NetlinkS32Attribute(uint16_t type_code,
                      int32_t value,
                      std::string_view name = {});

  int32_t value() const { return value_; }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 private:
  int32_t value_;
};

class NETLINK_ROUTE_EXPORT NetlinkU64Attribute : public NetlinkAttribute {
 public:
  NetlinkU64Attribute(
      uint16_t type_code,
      uint64_t value,
      std::string_view name = {},
      byte_utils::ByteOrder order = byte_utils::ByteOrder::kLittleEndian);

  uint64_t value() const { return value_; }
  byte_utils::ByteOrder byte_order() const { return order_; }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 protected:
  bool ValueEquals(const NetlinkAttribute& other) const override;

 private:
  uint64_t value_;
  byte_utils::ByteOrder order_;
};

// An attribute whose presence is the information; its payload is empty.
class NETLINK_ROUTE_EXPORT NetlinkFlagAttribute : public NetlinkAttribute {
 public:
  explicit NetlinkFlagAttribute(uint16_t type_code, std::string_view name = {});

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;
};

// A C string. A new string is cut at its first null character and emitted
// with a trailing one. A decoded string keeps the bytes it arrived with after
// its text: any number of null characters, or none at all.
class NETLINK_ROUTE_EXPORT NetlinkStringAttribute : public NetlinkAttribute {
 public:
  NetlinkStringAttribute(uint16_t type_code,
                         std::string value,
                         std::string_view name = {});

  // Splits |payload| at its first null character. The text before it is the
  // value, the rest is kept as the terminator.
  static std::unique_ptr<NetlinkStringAttribute> FromPayload(
      uint16_t type_code,
      base::span<const uint8_t> payload,
      std::string_view name = {});

  const std::string& value() const { return value_; }
  const std::vector<uint8_t>& terminator() const { return terminator_; }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 private:
  NetlinkStringAttribute(uint16_t type_code,
                         std::string value,
                         std::vector<uint8_t> terminator,
                         std::string_view name);

  std::string value_;
  std::vector<uint8_t> terminator_;
};

// A recognized attribute whose payload is a byte blob: an address or a
// fixed-layout kernel structure such as cache info or statistics.
class NETLINK_ROUTE_EXPORT NetlinkBinaryAttribute : public NetlinkAttribute {
 public:
  // Only affects ValueToString().
  enum class Format {
    kHex,
    kIPAddress,
    kLinkAddress,
  };

  NetlinkBinaryAttribute(uint16_t type_code,
                         std::vector<uint8_t> value,
                         std::string_view name = {},
                         Format format = Format::kHex);

  const std::vector<uint8_t>& value() const { return value_; }
  Format format() const { return format_; }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 private:
  std::vector<uint8_t> value_;
  Format format_;
};

// An attribute whose payload is itself a list of attributes. New instances
// carry NLA_F_NESTED; decoded ones keep whatever flags they arrived with
// since the kernel does not set the flag on every nested attribute.
class NETLINK_ROUTE_EXPORT NetlinkNestedAttribute : public NetlinkAttribute {
 public:
  NetlinkNestedAttribute(uint16_t type_code,
                         AttributeList value,
                         std::string_view name = {});
  ~NetlinkNestedAttribute() override;

  const AttributeList& value() const { return *value_; }
  AttributeList* mutable_value() { return value_.get(); }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  const AttributeList* nested_value() const override { return value_.get(); }
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 private:
  std::unique_ptr<AttributeList> value_;
};

// The fallback for type codes the catalog does not recognize. The payload is
// kept verbatim so the attribute survives a decode/encode cycle unchanged.
class NETLINK_ROUTE_EXPORT NetlinkUnknownAttribute : public NetlinkAttribute {
 public:
  NetlinkUnknownAttribute(uint16_t type_code, std::vector<uint8_t> value);

  const std::vector<uint8_t>& value() const { return value_; }

  size_t EncodedLength() const override;
  size_t Emit(base::span<uint8_t> out) const override;
  std::unique_ptr<NetlinkAttribute> Clone() const override;
  std::string ValueToString() const override;

 private:
  std::vector<uint8_t> value_;
};

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_NETLINK_ATTRIBUTE_H_
