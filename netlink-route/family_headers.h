// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_FAMILY_HEADERS_H_
#define NETLINK_ROUTE_FAMILY_HEADERS_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "netlink-route/byte_view.h"
#include "netlink-route/error.h"
#include "netlink-route/export.h"

namespace netlink_route {

// The fixed-size headers that follow the netlink envelope, one per message
// family. Multi-byte fields are little-endian. Padding is ignored on decode
// and written as zero.
//
// Every header has the same interface:
//   static constexpr size_t kLength;
//   // Fails with kFamilyHeaderTooShort if |bytes| holds fewer than kLength.
//   static Result<Header> Parse(ByteView bytes);
//   // Appends exactly kLength bytes.
//   void AppendTo(std::vector<uint8_t>* bytes) const;
//   std::string ToString() const;

// struct ifinfomsg
struct NETLINK_ROUTE_EXPORT LinkHeader {
  static constexpr size_t kLength = 16;

  uint8_t family = 0;
  uint16_t link_type = 0;
  int32_t index = 0;
  uint32_t flags = 0;
  uint32_t change = 0;

  static Result<LinkHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const LinkHeader& rhs) const = default;
};

// struct ifaddrmsg
struct NETLINK_ROUTE_EXPORT AddressHeader {
  static constexpr size_t kLength = 8;

  uint8_t family = 0;
  uint8_t prefix_length = 0;
  uint8_t flags = 0;
  uint8_t scope = 0;
  uint32_t index = 0;

  static Result<AddressHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const AddressHeader& rhs) const = default;
};

// struct rtmsg
struct NETLINK_ROUTE_EXPORT RouteHeader {
  static constexpr size_t kLength = 12;

  uint8_t family = 0;
  uint8_t dst_length = 0;
  uint8_t src_length = 0;
  uint8_t tos = 0;
  uint8_t table = 0;
  uint8_t protocol = 0;
  uint8_t scope = 0;
  uint8_t type = 0;
  uint32_t flags = 0;

  static Result<RouteHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const RouteHeader& rhs) const = default;
};

// struct fib_rule_hdr
struct NETLINK_ROUTE_EXPORT RuleHeader {
  static constexpr size_t kLength = 12;

  uint8_t family = 0;
  uint8_t dst_length = 0;
  uint8_t src_length = 0;
  uint8_t tos = 0;
  uint8_t table = 0;
  uint8_t reserved1 = 0;
  uint8_t reserved2 = 0;
  uint8_t action = 0;
  uint32_t flags = 0;

  static Result<RuleHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const RuleHeader& rhs) const = default;
};

// struct tcmsg
struct NETLINK_ROUTE_EXPORT TrafficControlHeader {
  static constexpr size_t kLength = 20;

  uint8_t family = 0;
  int32_t index = 0;
  uint32_t handle = 0;
  uint32_t parent = 0;
  uint32_t info = 0;

  static Result<TrafficControlHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const TrafficControlHeader& rhs) const = default;
};

// struct ndmsg
struct NETLINK_ROUTE_EXPORT NeighborHeader {
  static constexpr size_t kLength = 12;

  uint8_t family = 0;
  int32_t index = 0;
  uint16_t state = 0;
  uint8_t flags = 0;
  uint8_t type = 0;

  static Result<NeighborHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const NeighborHeader& rhs) const = default;
};

// struct ndtmsg
struct NETLINK_ROUTE_EXPORT NeighborTableHeader {
  static constexpr size_t kLength = 4;

  uint8_t family = 0;

  static Result<NeighborTableHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const NeighborTableHeader& rhs) const = default;
};

// struct rtgenmsg
struct NETLINK_ROUTE_EXPORT NsidHeader {
  static constexpr size_t kLength = 4;

  uint8_t family = 0;

  static Result<NsidHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const NsidHeader& rhs) const = default;
};

// struct prefixmsg
struct NETLINK_ROUTE_EXPORT PrefixHeader {
  static constexpr size_t kLength = 12;

  uint8_t family = 0;
  int32_t index = 0;
  uint8_t type = 0;
  uint8_t prefix_length = 0;
  uint8_t flags = 0;

  static Result<PrefixHeader> Parse(ByteView bytes);
  void AppendTo(std::vector<uint8_t>* bytes) const;
  std::string ToString() const;

  bool operator==(const PrefixHeader& rhs) const = default;
};

// Empty for control messages and for message types with no known family.
using FamilyHeader = std::variant<std::monostate,
                                  LinkHeader,
                                  AddressHeader,
                                  RouteHeader,
                                  RuleHeader,
                                  TrafficControlHeader,
                                  NeighborHeader,
                                  NeighborTableHeader,
                                  NsidHeader,
                                  PrefixHeader>;

// Length of the header held by |header|, 0 for std::monostate.
NETLINK_ROUTE_EXPORT size_t FamilyHeaderLength(const FamilyHeader& header);
NETLINK_ROUTE_EXPORT void AppendFamilyHeader(const FamilyHeader& header,
                                             std::vector<uint8_t>* bytes);
NETLINK_ROUTE_EXPORT std::string FamilyHeaderToString(
    const FamilyHeader& header);

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_FAMILY_HEADERS_H_
