// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/rtnl_message.h"

#include <string.h>

#include <algorithm>
#include <cinttypes>
#include <limits>
#include <variant>

#include <base/logging.h>
#include <base/strings/stringprintf.h>
#include <base/types/expected_macros.h>

#include "netlink-route/byte_utils.h"

namespace netlink_route {

namespace {

constexpr size_t kErrorCodeLength = sizeof(int32_t);

bool HeaderMatchesType(RTNLMessage::Type type, const FamilyHeader& header) {
  switch (type) {
    case RTNLMessage::kTypeLink:
      return std::holds_alternative<LinkHeader>(header);
    case RTNLMessage::kTypeAddress:
      return std::holds_alternative<AddressHeader>(header);
    case RTNLMessage::kTypeRoute:
      return std::holds_alternative<RouteHeader>(header);
    case RTNLMessage::kTypeRule:
      return std::holds_alternative<RuleHeader>(header);
    case RTNLMessage::kTypeTrafficControl:
      return std::holds_alternative<TrafficControlHeader>(header);
    case RTNLMessage::kTypeNeighbor:
      return std::holds_alternative<NeighborHeader>(header);
    case RTNLMessage::kTypeNeighborTable:
      return std::holds_alternative<NeighborTableHeader>(header);
    case RTNLMessage::kTypeNsid:
      return std::holds_alternative<NsidHeader>(header);
    case RTNLMessage::kTypePrefix:
      return std::holds_alternative<PrefixHeader>(header);
    default:
      return std::holds_alternative<std::monostate>(header);
  }
}

void PrintPayload(int log_level, base::span<const uint8_t> bytes) {
  while (!bytes.empty()) {
    std::string output;
    const size_t bytes_this_row = std::min(bytes.size(), size_t{32});
    for (uint8_t byte : bytes.first(bytes_this_row)) {
      base::StringAppendF(&output, " %02x", byte);
    }
    VLOG(log_level) << output;
    bytes = bytes.subspan(bytes_this_row);
  }
}

}  // namespace

RTNLMessage::RTNLMessage() = default;

RTNLMessage::RTNLMessage(Type type,
                         Mode mode,
                         uint16_t message_type,
                         uint16_t flags,
                         uint32_t seq,
                         uint32_t pid)
    : type_(type),
      mode_(mode),
      message_type_(message_type),
      flags_(flags),
      seq_(seq),
      pid_(pid) {}

RTNLMessage::RTNLMessage(const RTNLMessage&) = default;
RTNLMessage& RTNLMessage::operator=(const RTNLMessage&) = default;
RTNLMessage::RTNLMessage(RTNLMessage&&) = default;
RTNLMessage& RTNLMessage::operator=(RTNLMessage&&) = default;
RTNLMessage::~RTNLMessage() = default;

bool RTNLMessage::IsControl() const {
  return type_ == kTypeNoop || type_ == kTypeError || type_ == kTypeDone ||
         type_ == kTypeOverrun;
}

bool RTNLMessage::HasFamilyHeader() const {
  return type_ != kTypeUnknown && !IsControl();
}

size_t RTNLMessage::EncodedLength() const {
  size_t length = NetlinkHeader::kLength;
  if (HasFamilyHeader()) {
    length += FamilyHeaderLength(family_header_) + attributes_.EncodedLength();
  } else {
    if (type_ == kTypeError) {
      length += kErrorCodeLength;
    }
    length += payload_.size();
  }
  return length;
}

Result<std::vector<uint8_t>> RTNLMessage::Encode() const {
  if (!HeaderMatchesType(type_, family_header_)) {
    return base::unexpected(Error(
        ErrorCode::kUnsupportedMessage,
        base::StringPrintf("%s message holds a mismatched family header",
                           TypeToString(type_).c_str())));
  }
  if (!HasFamilyHeader() && !attributes_.empty()) {
    return base::unexpected(Error(
        ErrorCode::kUnsupportedMessage,
        base::StringPrintf("%s message cannot carry attributes",
                           TypeToString(type_).c_str())));
  }
  RETURN_IF_ERROR(attributes_.Validate());

  const size_t length = EncodedLength();
  if (length > std::numeric_limits<uint32_t>::max()) {
    return base::unexpected(
        Error(ErrorCode::kMessageTooLong,
              base::StringPrintf("%zu bytes do not fit a netlink message",
                                 length)));
  }

  NetlinkHeader header;
  header.length = static_cast<uint32_t>(length);
  header.message_type = message_type_;
  header.flags = flags_;
  header.sequence = seq_;
  header.port_id = pid_;

  std::vector<uint8_t> bytes(NetlinkHeader::kLength, 0);
  bytes.reserve(length);
  header.Emit(bytes);

  if (HasFamilyHeader()) {
    AppendFamilyHeader(family_header_, &bytes);
    ASSIGN_OR_RETURN(std::vector<uint8_t> attributes, attributes_.Encode());
    bytes.insert(bytes.end(), attributes.begin(), attributes.end());
  } else {
    if (type_ == kTypeError) {
      byte_utils::AppendU32(&bytes, static_cast<uint32_t>(error_));
    }
    bytes.insert(bytes.end(), payload_.begin(), payload_.end());
  }

  if (bytes.size() != length) {
    LOG(ERROR) << ToString() << ": encoded " << bytes.size()
               << " bytes, expected " << length;
    return base::unexpected(
        Error(ErrorCode::kEncodeLengthMismatch,
              base::StringPrintf("encoded %zu bytes, expected %zu",
                                 bytes.size(), length)));
  }
  return bytes;
}

const LinkHeader* RTNLMessage::link_header() const {
  return std::get_if<LinkHeader>(&family_header_);
}

const AddressHeader* RTNLMessage::address_header() const {
  return std::get_if<AddressHeader>(&family_header_);
}

const RouteHeader* RTNLMessage::route_header() const {
  return std::get_if<RouteHeader>(&family_header_);
}

const RuleHeader* RTNLMessage::rule_header() const {
  return std::get_if<RuleHeader>(&family_header_);
}

const TrafficControlHeader* RTNLMessage::traffic_control_header() const {
  return std::get_if<TrafficControlHeader>(&family_header_);
}

const NeighborHeader* RTNLMessage::neighbor_header() const {
  return std::get_if<NeighborHeader>(&family_header_);
}

const NeighborTableHeader* RTNLMessage::neighbor_table_header() const {
  return std::get_if<NeighborTableHeader>(&family_header_);
}

const NsidHeader* RTNLMessage::nsid_header() const {
  return std::get_if<NsidHeader>(&family_header_);
}

const PrefixHeader* RTNLMessage::prefix_header() const {
  return std::get_if<PrefixHeader>(&family_header_);
}

std::string RTNLMessage::ToString() const {
  std::string details;
  switch (type_) {
    case kTypeError:
      if (error_ == 0) {
        details = "ACK";
      } else {
        // Negated in 64 bits so that INT32_MIN stays in range.
        const int64_t errnum = -static_cast<int64_t>(error_);
        details = base::StringPrintf(
            "NETLINK_ERROR %" PRId64 ": %s", errnum,
            errnum <= std::numeric_limits<int>::max()
                ? strerror(static_cast<int>(errnum))
                : "Unknown error");
      }
      break;
    case kTypeNoop:
      details = "<NOOP>";
      break;
    case kTypeDone:
      details = "<DONE with multipart message>";
      break;
    case kTypeOverrun:
      details = "<OVERRUN - data lost>";
      break;
    case kTypeUnknown:
      details = base::StringPrintf("type %u, %zu bytes", message_type_,
                                   payload_.size());
      break;
    default:
      details = FamilyHeaderToString(family_header_) + " " +
                attributes_.ToString();
      break;
  }
  return base::StringPrintf("%s %s seq %u pid %u: %s",
                            ModeToString(mode_).c_str(),
                            TypeToString(type_).c_str(), seq_, pid_,
                            details.c_str());
}

void RTNLMessage::Print(int header_log_level, int detail_log_level) const {
  if (!HasFamilyHeader()) {
    VLOG(header_log_level) << ToString();
    PrintPayload(detail_log_level, payload_);
    return;
  }
  VLOG(header_log_level) << ModeToString(mode_) << " " << TypeToString(type_)
                         << " seq " << seq_ << " pid " << pid_ << ": "
                         << FamilyHeaderToString(family_header_);
  attributes_.Print(detail_log_level, 2);
}

// static
void RTNLMessage::PrintBytes(int log_level, base::span<const uint8_t> bytes) {
  VLOG(log_level) << "RTNL Message -- Examining Bytes";
  const Result<NetlinkHeader> header = NetlinkHeader::Parse(ByteView(bytes));
  if (!header.has_value()) {
    VLOG(log_level) << "No complete netlink header: " << header.error();
    PrintPayload(log_level, bytes);
    return;
  }

  const uint8_t* buf = bytes.data();
  VLOG(log_level) << base::StringPrintf(
      "len:          %02x %02x %02x %02x = %u bytes", buf[0], buf[1], buf[2],
      buf[3], header->length);
  VLOG(log_level) << base::StringPrintf(
      "type | flags: %02x %02x %02x %02x - %s", buf[4], buf[5], buf[6],
      buf[7], header->ToString().c_str());
  VLOG(log_level) << base::StringPrintf(
      "sequence:     %02x %02x %02x %02x = %u", buf[8], buf[9], buf[10],
      buf[11], header->sequence);
  VLOG(log_level) << base::StringPrintf(
      "pid:          %02x %02x %02x %02x = %u", buf[12], buf[13], buf[14],
      buf[15], header->port_id);
  PrintPayload(log_level, bytes.subspan(NetlinkHeader::kLength));
}

// static
std::string RTNLMessage::ModeToString(Mode mode) {
  switch (mode) {
    case kModeGet:
      return "Get";
    case kModeAdd:
      return "Add";
    case kModeDelete:
      return "Delete";
    case kModeSet:
      return "Set";
    default:
      return "UnknownMode";
  }
}

// static
std::string RTNLMessage::TypeToString(Type type) {
  switch (type) {
    case kTypeLink:
      return "Link";
    case kTypeAddress:
      return "Address";
    case kTypeRoute:
      return "Route";
    case kTypeRule:
      return "Rule";
    case kTypeTrafficControl:
      return "TrafficControl";
    case kTypeNeighbor:
      return "Neighbor";
    case kTypeNeighborTable:
      return "NeighborTable";
    case kTypeNsid:
      return "Nsid";
    case kTypePrefix:
      return "Prefix";
    case kTypeNoop:
      return "Noop";
    case kTypeError:
      return "Error";
    case kTypeDone:
      return "Done";
    case kTypeOverrun:
      return "Overrun";
    default:
      return "UnknownType";
  }
}

}  // namespace netlink_route
