// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_RTNL_MESSAGE_H_
#define NETLINK_ROUTE_RTNL_MESSAGE_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <base/containers/span.h>

#include "netlink-route/attribute_list.h"
#include "netlink-route/error.h"
#include "netlink-route/export.h"
#include "netlink-route/family_headers.h"
#include "netlink-route/netlink_header.h"

namespace netlink_route {

// One decoded route netlink message: the envelope fields, the fixed header
// of its family and its attributes. Control messages carry no family header
// and no attributes; they and messages of unrecognized types keep their
// payload bytes verbatim instead.
class NETLINK_ROUTE_EXPORT RTNLMessage {
 public:
  enum Type {
    kTypeUnknown,
    kTypeLink,
    kTypeAddress,
    kTypeRoute,
    kTypeRule,
    kTypeTrafficControl,
    kTypeNeighbor,
    kTypeNeighborTable,
    kTypeNsid,
    kTypePrefix,
    kTypeNoop,
    kTypeError,
    kTypeDone,
    kTypeOverrun,
  };

  enum Mode {
    kModeUnknown,
    kModeGet,
    kModeAdd,
    kModeDelete,
    kModeSet,
  };

  RTNLMessage();
  RTNLMessage(Type type,
              Mode mode,
              uint16_t message_type,
              uint16_t flags,
              uint32_t seq,
              uint32_t pid);
  RTNLMessage(const RTNLMessage&);
  RTNLMessage& operator=(const RTNLMessage&);
  RTNLMessage(RTNLMessage&&);
  RTNLMessage& operator=(RTNLMessage&&);
  ~RTNLMessage();

  // Serializes the message. The envelope length is always recomputed from
  // the family header and the attributes. Fails with kUnsupportedMessage if
  // the family header does not match the message type.
  Result<std::vector<uint8_t>> Encode() const;

  // Number of bytes Encode() produces.
  size_t EncodedLength() const;

  bool IsControl() const;
  // True for the message types that carry a family header and attributes.
  bool HasFamilyHeader() const;

  Type type() const { return type_; }
  Mode mode() const { return mode_; }
  uint16_t message_type() const { return message_type_; }
  uint16_t flags() const { return flags_; }
  uint32_t seq() const { return seq_; }
  uint32_t pid() const { return pid_; }
  void set_flags(uint16_t flags) { flags_ = flags; }
  void set_seq(uint32_t seq) { seq_ = seq; }
  void set_pid(uint32_t pid) { pid_ = pid; }

  const FamilyHeader& family_header() const { return family_header_; }
  void set_family_header(const FamilyHeader& header) {
    family_header_ = header;
  }

  // Typed views of the family header. nullptr when the message holds a
  // different header.
  const LinkHeader* link_header() const;
  const AddressHeader* address_header() const;
  const RouteHeader* route_header() const;
  const RuleHeader* rule_header() const;
  const TrafficControlHeader* traffic_control_header() const;
  const NeighborHeader* neighbor_header() const;
  const NeighborTableHeader* neighbor_table_header() const;
  const NsidHeader* nsid_header() const;
  const PrefixHeader* prefix_header() const;

  const AttributeList& attributes() const { return attributes_; }
  AttributeList* mutable_attributes() { return &attributes_; }
  void set_attributes(AttributeList attributes) {
    attributes_ = std::move(attributes);
  }

  // kTypeError only: the negated errno, 0 for an ACK.
  int32_t error() const { return error_; }
  void set_error(int32_t error) { error_ = error; }

  // Bytes that are not interpreted: the payload of noop, done, overrun and
  // unrecognized messages, and the echoed request of an error message.
  const std::vector<uint8_t>& payload() const { return payload_; }
  void set_payload(std::vector<uint8_t> payload) {
    payload_ = std::move(payload);
  }

  std::string ToString() const;
  void Print(int header_log_level, int detail_log_level) const;

  // Logs |bytes| as a netlink envelope followed by rows of hex.
  static void PrintBytes(int log_level, base::span<const uint8_t> bytes);

  static std::string ModeToString(Mode mode);
  static std::string TypeToString(Type type);

  bool operator==(const RTNLMessage& rhs) const = default;

 private:
  Type type_ = kTypeUnknown;
  Mode mode_ = kModeUnknown;
  uint16_t message_type_ = 0;
  uint16_t flags_ = 0;
  uint32_t seq_ = 0;
  uint32_t pid_ = 0;
  FamilyHeader family_header_;
  AttributeList attributes_;
  int32_t error_ = 0;
  std::vector<uint8_t> payload_;
};

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_RTNL_MESSAGE_H_
