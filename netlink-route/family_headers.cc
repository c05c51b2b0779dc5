// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/family_headers.h"

#include <type_traits>

#include <base/strings/stringprintf.h>
#include <base/types/expected_macros.h>

#include "netlink-route/byte_utils.h"

namespace netlink_route {

namespace {

Result<void> CheckLength(ByteView bytes, size_t length, const char* name) {
  if (bytes.size() < length) {
    return base::unexpected(
        Error(ErrorCode::kFamilyHeaderTooShort,
              base::StringPrintf("%s needs %zu bytes, %zu available", name,
                                 length, bytes.size())));
  }
  return base::ok();
}

void AppendPadding(std::vector<uint8_t>* bytes, size_t length) {
  bytes->insert(bytes->end(), length, 0);
}

}  // namespace

// static
Result<LinkHeader> LinkHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "ifinfomsg"));
  LinkHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  ASSIGN_OR_RETURN(header.link_type, bytes.ReadU16(2));
  ASSIGN_OR_RETURN(header.index, bytes.ReadI32(4));
  ASSIGN_OR_RETURN(header.flags, bytes.ReadU32(8));
  ASSIGN_OR_RETURN(header.change, bytes.ReadU32(12));
  return header;
}

void LinkHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  AppendPadding(bytes, 1);
  byte_utils::AppendU16(bytes, link_type);
  byte_utils::AppendU32(bytes, static_cast<uint32_t>(index));
  byte_utils::AppendU32(bytes, flags);
  byte_utils::AppendU32(bytes, change);
}

std::string LinkHeader::ToString() const {
  return base::StringPrintf(
      "ifinfomsg family=%u link_type=%u index=%d flags=%u change=%u",
      family, link_type, index, flags, change);
}

// static
Result<AddressHeader> AddressHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "ifaddrmsg"));
  AddressHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  ASSIGN_OR_RETURN(header.prefix_length, bytes.ReadU8(1));
  ASSIGN_OR_RETURN(header.flags, bytes.ReadU8(2));
  ASSIGN_OR_RETURN(header.scope, bytes.ReadU8(3));
  ASSIGN_OR_RETURN(header.index, bytes.ReadU32(4));
  return header;
}

void AddressHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  byte_utils::AppendU8(bytes, prefix_length);
  byte_utils::AppendU8(bytes, flags);
  byte_utils::AppendU8(bytes, scope);
  byte_utils::AppendU32(bytes, index);
}

std::string AddressHeader::ToString() const {
  return base::StringPrintf(
      "ifaddrmsg family=%u prefix_length=%u flags=%u scope=%u "
      "index=%u",
      family, prefix_length, flags, scope, index);
}

// static
Result<RouteHeader> RouteHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "rtmsg"));
  RouteHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  ASSIGN_OR_RETURN(header.dst_length, bytes.ReadU8(1));
  ASSIGN_OR_RETURN(header.src_length, bytes.ReadU8(2));
  ASSIGN_OR_RETURN(header.tos, bytes.ReadU8(3));
  ASSIGN_OR_RETURN(header.table, bytes.ReadU8(4));
  ASSIGN_OR_RETURN(header.protocol, bytes.ReadU8(5));
  ASSIGN_OR_RETURN(header.scope, bytes.ReadU8(6));
  ASSIGN_OR_RETURN(header.type, bytes.ReadU8(7));
  ASSIGN_OR_RETURN(header.flags, bytes.ReadU32(8));
  return header;
}

void RouteHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  byte_utils::AppendU8(bytes, dst_length);
  byte_utils::AppendU8(bytes, src_length);
  byte_utils::AppendU8(bytes, tos);
  byte_utils::AppendU8(bytes, table);
  byte_utils::AppendU8(bytes, protocol);
  byte_utils::AppendU8(bytes, scope);
  byte_utils::AppendU8(bytes, type);
  byte_utils::AppendU32(bytes, flags);
}

std::string RouteHeader::ToString() const {
  return base::StringPrintf(
      "rtmsg family=%u dst_length=%u src_length=%u tos=%u table=%u "
      "protocol=%u scope=%u type=%u flags=%u",
      family, dst_length, src_length, tos, table, protocol, scope, type,
      flags);
}

// static
Result<RuleHeader> RuleHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "fib_rule_hdr"));
  RuleHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  ASSIGN_OR_RETURN(header.dst_length, bytes.ReadU8(1));
  ASSIGN_OR_RETURN(header.src_length, bytes.ReadU8(2));
  ASSIGN_OR_RETURN(header.tos, bytes.ReadU8(3));
  ASSIGN_OR_RETURN(header.table, bytes.ReadU8(4));
  ASSIGN_OR_RETURN(header.reserved1, bytes.ReadU8(5));
  ASSIGN_OR_RETURN(header.reserved2, bytes.ReadU8(6));
  ASSIGN_OR_RETURN(header.action, bytes.ReadU8(7));
  ASSIGN_OR_RETURN(header.flags, bytes.ReadU32(8));
  return header;
}

void RuleHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  byte_utils::AppendU8(bytes, dst_length);
  byte_utils::AppendU8(bytes, src_length);
  byte_utils::AppendU8(bytes, tos);
  byte_utils::AppendU8(bytes, table);
  byte_utils::AppendU8(bytes, reserved1);
  byte_utils::AppendU8(bytes, reserved2);
  byte_utils::AppendU8(bytes, action);
  byte_utils::AppendU32(bytes, flags);
}

std::string RuleHeader::ToString() const {
  return base::StringPrintf(
      "fib_rule_hdr family=%u dst_length=%u src_length=%u tos=%u "
      "table=%u reserved1=%u reserved2=%u action=%u flags=%u",
      family, dst_length, src_length, tos, table, reserved1, reserved2, action,
      flags);
}

// static
Result<TrafficControlHeader> TrafficControlHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "tcmsg"));
  TrafficControlHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  ASSIGN_OR_RETURN(header.index, bytes.ReadI32(4));
  ASSIGN_OR_RETURN(header.handle, bytes.ReadU32(8));
  ASSIGN_OR_RETURN(header.parent, bytes.ReadU32(12));
  ASSIGN_OR_RETURN(header.info, bytes.ReadU32(16));
  return header;
}

void TrafficControlHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  AppendPadding(bytes, 3);
  byte_utils::AppendU32(bytes, static_cast<uint32_t>(index));
  byte_utils::AppendU32(bytes, handle);
  byte_utils::AppendU32(bytes, parent);
  byte_utils::AppendU32(bytes, info);
}

std::string TrafficControlHeader::ToString() const {
  return base::StringPrintf(
      "tcmsg family=%u index=%d handle=%u parent=%u info=%u",
      family, index, handle, parent, info);
}

// static
Result<NeighborHeader> NeighborHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "ndmsg"));
  NeighborHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  ASSIGN_OR_RETURN(header.index, bytes.ReadI32(4));
  ASSIGN_OR_RETURN(header.state, bytes.ReadU16(8));
  ASSIGN_OR_RETURN(header.flags, bytes.ReadU8(10));
  ASSIGN_OR_RETURN(header.type, bytes.ReadU8(11));
  return header;
}

void NeighborHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  AppendPadding(bytes, 3);
  byte_utils::AppendU32(bytes, static_cast<uint32_t>(index));
  byte_utils::AppendU16(bytes, state);
  byte_utils::AppendU8(bytes, flags);
  byte_utils::AppendU8(bytes, type);
}

std::string NeighborHeader::ToString() const {
  return base::StringPrintf(
      "ndmsg family=%u index=%d state=%u flags=%u type=%u",
      family, index, state, flags, type);
}

// static
Result<NeighborTableHeader> NeighborTableHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "ndtmsg"));
  NeighborTableHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  return header;
}

void NeighborTableHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  AppendPadding(bytes, 3);
}

std::string NeighborTableHeader::ToString() const {
  return base::StringPrintf("ndtmsg family=%u", family);
}

// static
Result<NsidHeader> NsidHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "rtgenmsg"));
  NsidHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  return header;
}

void NsidHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  AppendPadding(bytes, 3);
}

std::string NsidHeader::ToString() const {
  return base::StringPrintf("rtgenmsg family=%u", family);
}

// static
Result<PrefixHeader> PrefixHeader::Parse(ByteView bytes) {
  RETURN_IF_ERROR(CheckLength(bytes, kLength, "prefixmsg"));
  PrefixHeader header;
  ASSIGN_OR_RETURN(header.family, bytes.ReadU8(0));
  ASSIGN_OR_RETURN(header.index, bytes.ReadI32(4));
  ASSIGN_OR_RETURN(header.type, bytes.ReadU8(8));
  ASSIGN_OR_RETURN(header.prefix_length, bytes.ReadU8(9));
  ASSIGN_OR_RETURN(header.flags, bytes.ReadU8(10));
  return header;
}

void PrefixHeader::AppendTo(std::vector<uint8_t>* bytes) const {
  byte_utils::AppendU8(bytes, family);
  AppendPadding(bytes, 3);
  byte_utils::AppendU32(bytes, static_cast<uint32_t>(index));
  byte_utils::AppendU8(bytes, type);
  byte_utils::AppendU8(bytes, prefix_length);
  byte_utils::AppendU8(bytes, flags);
  AppendPadding(bytes, 1);
}

std::string PrefixHeader::ToString() const {
  return base::StringPrintf(
      "prefixmsg family=%u index=%d type=%u prefix_length=%u "
      "flags=%u",
      family, index, type, prefix_length, flags);
}

size_t FamilyHeaderLength(const FamilyHeader& header) {
  return std::visit(
      [](const auto& h) -> size_t {
        if constexpr (std::is_same_v<std::decay_t<decltype(h)>,
                                     std::monostate>) {
          return 0;
        } else {
          return h.kLength;
        }
      },
      header);
}

void AppendFamilyHeader(const FamilyHeader& header,
                        std::vector<uint8_t>* bytes) {
  std::visit(
      [bytes](const auto& h) {
        if constexpr (!std::is_same_v<std::decay_t<decltype(h)>,
                                      std::monostate>) {
          h.AppendTo(bytes);
        }
      },
      header);
}

std::string FamilyHeaderToString(const FamilyHeader& header) {
  return std::visit(
      [](const auto& h) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(h)>,
                                     std::monostate>) {
          return "";
        } else {
          return h.ToString();
        }
      },
      header);
}

}  // namespace netlink_route
