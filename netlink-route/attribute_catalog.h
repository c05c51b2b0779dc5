// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_ATTRIBUTE_CATALOG_H_
#define NETLINK_ROUTE_ATTRIBUTE_CATALOG_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string_view>
#include <vector>

#include "netlink-route/attribute_iterator.h"
#include "netlink-route/error.h"
#include "netlink-route/export.h"
#include "netlink-route/netlink_attribute.h"

namespace netlink_route {

// Tracks how deep a nested attribute set sits while it is being decoded, and
// the address family of the message it belongs to.
struct NETLINK_ROUTE_EXPORT DecodeContext {
  static constexpr int kDefaultMaxDepth = 32;

  // Returns the context for the children of a nested attribute.
  DecodeContext Nested() const { return {depth + 1, max_depth, family}; }

  int depth = 0;
  int max_depth = kDefaultMaxDepth;
  // The family byte of the message's fixed header (AF_UNSPEC when none).
  uint8_t family = 0;
};

// Turns attribute records of one family into attribute values. Decode() is
// total over type codes: a code the catalog does not recognize becomes a
// NetlinkUnknownAttribute and is never an error. Only a recognized code whose
// payload has the wrong shape fails, with kAttributeDecodeFailed.
class NETLINK_ROUTE_EXPORT AttributeCatalog {
 public:
  virtual ~AttributeCatalog() = default;

  // e.g. "link" or "link/IFLA_LINKINFO".
  virtual std::string_view name() const = 0;

  virtual Result<std::unique_ptr<NetlinkAttribute>> Decode(
      const AttributeRecord& record, const DecodeContext& context) const = 0;

  // Returns the symbolic name of |type_code|, or an empty string.
  virtual std::string_view AttributeName(uint16_t type_code) const;

  // The fallback used for unrecognized codes. Keeps the payload and both
  // flag bits.
  static std::unique_ptr<NetlinkAttribute> MakeUnknown(
      const AttributeRecord& record);
};

enum class AttributeKind {
  kU8,
  kU16,
  kU32,
  kS32,
  kU64,
  // Always big-endian, whatever the byte-order flag says.
  kBe16,
  kBe32,
  kFlag,
  kString,
  kBinary,
  // 4 or 16 bytes.
  kIPAddress,
  kLinkAddress,
  kNested,
};

using CatalogGetter = const AttributeCatalog& (*)();
// Returns the catalog of the children for the given address family, or
// nullptr when the payload has no known layout for it.
using FamilyCatalogGetter = const AttributeCatalog* (*)(uint8_t family);

struct AttributeSpec {
  uint16_t type_code;
  std::string_view name;
  AttributeKind kind;
  // kBinary only: the exact payload size, or 0 to accept any size.
  size_t fixed_size = 0;
  // kNested only: the catalog of the children. Children of a nested
  // attribute without one are all kept as unknown attributes.
  CatalogGetter children = nullptr;
  // kNested only: takes precedence over |children|. The payload of a nested
  // attribute for which it returns nullptr is kept as raw bytes.
  FamilyCatalogGetter family_children = nullptr;
};

// A catalog described by a table of AttributeSpec.
class NETLINK_ROUTE_EXPORT TableAttributeCatalog : public AttributeCatalog {
 public:
  TableAttributeCatalog(std::string_view name,
                        const std::vector<AttributeSpec>& specs);
  TableAttributeCatalog(const TableAttributeCatalog&) = delete;
  TableAttributeCatalog& operator=(const TableAttributeCatalog&) = delete;
  ~TableAttributeCatalog() override;

  std::string_view name() const override { return name_; }
  Result<std::unique_ptr<NetlinkAttribute>> Decode(
      const AttributeRecord& record,
      const DecodeContext& context) const override;
  std::string_view AttributeName(uint16_t type_code) const override;

  // Returns the spec registered for |type_code|, or nullptr.
  const AttributeSpec* FindSpec(uint16_t type_code) const;

 private:
  std::string_view name_;
  std::map<uint16_t, AttributeSpec> specs_;
};

// Recognizes nothing: every record decodes to a NetlinkUnknownAttribute.
class NETLINK_ROUTE_EXPORT OpaqueAttributeCatalog : public AttributeCatalog {
 public:
  static const OpaqueAttributeCatalog& GetInstance();

  OpaqueAttributeCatalog() = default;
  OpaqueAttributeCatalog(const OpaqueAttributeCatalog&) = delete;
  OpaqueAttributeCatalog& operator=(const OpaqueAttributeCatalog&) = delete;

  std::string_view name() const override { return "opaque"; }
  Result<std::unique_ptr<NetlinkAttribute>> Decode(
      const AttributeRecord& record,
      const DecodeContext& context) const override;
};

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_ATTRIBUTE_CATALOG_H_
