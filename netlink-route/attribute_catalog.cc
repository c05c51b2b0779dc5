// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/attribute_catalog.h"

#include <utility>

#include <base/logging.h>
#include <base/no_destructor.h>
#include <base/strings/stringprintf.h>
#include <base/types/expected_macros.h>

#include "netlink-route/attribute_list.h"
#include "netlink-route/byte_utils.h"

namespace netlink_route {

namespace {

using byte_utils::ByteOrder;

Result<void> CheckSize(const AttributeSpec& spec,
                       const ByteView& payload,
                       size_t expected) {
  if (payload.size() != expected) {
    return base::unexpected(Error::AttributeDecodeFailed(
        spec.type_code,
        base::StringPrintf("%s: expected %zu bytes, got %zu",
                           std::string(spec.name).c_str(), expected,
                           payload.size())));
  }
  return base::ok();
}

Result<std::unique_ptr<NetlinkAttribute>> DecodeWithSpec(
    const AttributeSpec& spec,
    const AttributeRecord& record,
    const DecodeContext& context) {
  const ByteView& payload = record.payload;
  const ByteOrder order = record.is_network_byte_order
                              ? ByteOrder::kBigEndian
                              : ByteOrder::kLittleEndian;
  const uint16_t code = spec.type_code;

  switch (spec.kind) {
    case AttributeKind::kU8: {
      RETURN_IF_ERROR(CheckSize(spec, payload, sizeof(uint8_t)));
      ASSIGN_OR_RETURN(uint8_t value, payload.ReadU8(0));
      return std::make_unique<NetlinkU8Attribute>(code, value, spec.name);
    }
    case AttributeKind::kU16:
    case AttributeKind::kBe16: {
      RETURN_IF_ERROR(CheckSize(spec, payload, sizeof(uint16_t)));
      const ByteOrder u16_order =
          spec.kind == AttributeKind::kBe16 ? ByteOrder::kBigEndian : order;
      ASSIGN_OR_RETURN(uint16_t value, u16_order == ByteOrder::kBigEndian
                                           ? payload.ReadU16BigEndian(0)
                                           : payload.ReadU16(0));
      return std::make_unique<NetlinkU16Attribute>(code, value, spec.name,
                                                   u16_order);
    }
    case AttributeKind::kU32:
    case AttributeKind::kBe32: {
      RETURN_IF_ERROR(CheckSize(spec, payload, sizeof(uint32_t)));
      const ByteOrder u32_order =
          spec.kind == AttributeKind::kBe32 ? ByteOrder::kBigEndian : order;
      ASSIGN_OR_RETURN(uint32_t value, u32_order == ByteOrder::kBigEndian
                                           ? payload.ReadU32BigEndian(0)
                                           : payload.ReadU32(0));
      return std::make_unique<NetlinkU32Attribute>(code, value, spec.name,
                                                   u32_order);
    }
    case AttributeKind::kS32: {
      RETURN_IF_ERROR(CheckSize(spec, payload, sizeof(int32_t)));
      ASSIGN_OR_RETURN(int32_t value, payload.ReadI32(0));
      return std::make_unique<NetlinkS32Attribute>(code, value, spec.name);
    }
    case AttributeKind::kU64: {
      RETURN_IF_ERROR(CheckSize(spec, payload, sizeof(uint64_t)));
      ASSIGN_OR_RETURN(uint64_t value, order == ByteOrder::kBigEndian
                                           ? payload.ReadU64BigEndian(0)
                                           : payload.ReadU64(0));
      return std::make_unique<NetlinkU64Attribute>(code, value, spec.name,
                                                   order);
    }
    case AttributeKind::kFlag: {
      RETURN_IF_ERROR(CheckSize(spec, payload, 0));
      return std::make_unique<NetlinkFlagAttribute>(code, spec.name);
    }
    case AttributeKind::kString:
      return NetlinkStringAttribute::FromPayload(code, payload.span(),
                                                 spec.name);
    case AttributeKind::kBinary:
      if (spec.fixed_size != 0) {
        RETURN_IF_ERROR(CheckSize(spec, payload, spec.fixed_size));
      }
      return std::make_unique<NetlinkBinaryAttribute>(code, payload.ToBytes(),
                                                      spec.name);
    case AttributeKind::kIPAddress:
      if (payload.size() != 4 && payload.size() != 16) {
        return base::unexpected(Error::AttributeDecodeFailed(
            code, base::StringPrintf("%s: %zu bytes is not an IP address",
                                     std::string(spec.name).c_str(),
                                     payload.size())));
      }
      return std::make_unique<NetlinkBinaryAttribute>(
          code, payload.ToBytes(), spec.name,
          NetlinkBinaryAttribute::Format::kIPAddress);
    case AttributeKind::kLinkAddress:
      return std::make_unique<NetlinkBinaryAttribute>(
          code, payload.ToBytes(), spec.name,
          NetlinkBinaryAttribute::Format::kLinkAddress);
    case AttributeKind::kNested: {
      const AttributeCatalog* children =
          spec.children ? &spec.children()
                        : &OpaqueAttributeCatalog::GetInstance();
      if (spec.family_children) {
        children = spec.family_children(context.family);
        if (!children) {
          VLOG(3) << spec.name << ": no layout for family "
                  << static_cast<int>(context.family);
          return std::make_unique<NetlinkBinaryAttribute>(
              code, payload.ToBytes(), spec.name);
        }
      }
      ASSIGN_OR_RETURN(AttributeList list,
                       AttributeList::Decode(payload, *children,
                                             context.Nested()));
      return std::make_unique<NetlinkNestedAttribute>(code, std::move(list),
                                                      spec.name);
    }
  }
  return AttributeCatalog::MakeUnknown(record);
}

}  // namespace

std::string_view AttributeCatalog::AttributeName(uint16_t type_code) const {
  return {};
}

// static
std::unique_ptr<NetlinkAttribute> AttributeCatalog::MakeUnknown(
    const AttributeRecord& record) {
  auto attr = std::make_unique<NetlinkUnknownAttribute>(
      record.type_code, record.payload.ToBytes());
  attr->set_flags(record.flags());
  return attr;
}

TableAttributeCatalog::TableAttributeCatalog(
    std::string_view name, const std::vector<AttributeSpec>& specs)
    : name_(name) {
  for (const auto& spec : specs) {
    if (!specs_.emplace(spec.type_code, spec).second) {
      LOG(ERROR) << name_ << ": duplicate spec for type " << spec.type_code;
    }
  }
}

TableAttributeCatalog::~TableAttributeCatalog() = default;

Result<std::unique_ptr<NetlinkAttribute>> TableAttributeCatalog::Decode(
    const AttributeRecord& record, const DecodeContext& context) const {
  const AttributeSpec* spec = FindSpec(record.type_code);
  if (!spec) {
    VLOG(3) << name_ << ": unknown attribute type " << record.type_code;
    return MakeUnknown(record);
  }
  ASSIGN_OR_RETURN(std::unique_ptr<NetlinkAttribute> attr,
                   DecodeWithSpec(*spec, record, context));
  attr->set_flags(record.flags());
  return attr;
}

std::string_view TableAttributeCatalog::AttributeName(
    uint16_t type_code) const {
  const AttributeSpec* spec = FindSpec(type_code);
  return spec ? spec->name : std::string_view();
}

const AttributeSpec* TableAttributeCatalog::FindSpec(
    uint16_t type_code) const {
  const auto it = specs_.find(type_code);
  return it == specs_.end() ? nullptr : &it->second;
}

// static
const OpaqueAttributeCatalog& OpaqueAttributeCatalog::GetInstance() {
  static const base::NoDestructor<OpaqueAttributeCatalog> instance;
  return *instance;
}

Result<std::unique_ptr<NetlinkAttribute>> OpaqueAttributeCatalog::Decode(
    const AttributeRecord& record, const DecodeContext& context) const {
  return MakeUnknown(record);
}

}  // namespace netlink_route
