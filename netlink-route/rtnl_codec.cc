// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/rtnl_codec.h"

#include <linux/netlink.h>
#include <linux/rtnetlink.h>

#include <utility>

#include <base/containers/contains.h>
#include <base/logging.h>
#include <base/strings/stringprintf.h>
#include <base/types/expected_macros.h>

#include "netlink-route/netlink_header.h"
#include "netlink-route/rtnl_catalogs.h"

namespace netlink_route {

namespace {

// Parses a |Header| at the front of |payload| into |out| and returns its
// length.
template <typename Header>
Result<size_t> ParseFamilyHeader(ByteView payload, FamilyHeader* out) {
  ASSIGN_OR_RETURN(Header header, Header::Parse(payload));
  *out = header;
  return Header::kLength;
}

template <typename Header>
FamilyHeader FamilyOnly(uint8_t family) {
  Header header;
  header.family = family;
  return header;
}

}  // namespace

RTNLCodec::RTNLCodec() : RTNLCodec(Options()) {}

RTNLCodec::RTNLCodec(const Options& options) : options_(options) {}

RTNLCodec::~RTNLCodec() = default;

void RTNLCodec::RegisterRouteFamilies() {
  using T = RTNLMessage;
  static constexpr struct {
    uint16_t message_type;
    RTNLMessage::Type type;
    RTNLMessage::Mode mode;
  } kMessageTypes[] = {
      {RTM_NEWLINK, T::kTypeLink, T::kModeAdd},
      {RTM_DELLINK, T::kTypeLink, T::kModeDelete},
      {RTM_GETLINK, T::kTypeLink, T::kModeGet},
      {RTM_SETLINK, T::kTypeLink, T::kModeSet},
      {RTM_NEWLINKPROP, T::kTypeLink, T::kModeAdd},
      {RTM_DELLINKPROP, T::kTypeLink, T::kModeDelete},
      {RTM_NEWADDR, T::kTypeAddress, T::kModeAdd},
      {RTM_DELADDR, T::kTypeAddress, T::kModeDelete},
      {RTM_GETADDR, T::kTypeAddress, T::kModeGet},
      {RTM_NEWROUTE, T::kTypeRoute, T::kModeAdd},
      {RTM_DELROUTE, T::kTypeRoute, T::kModeDelete},
      {RTM_GETROUTE, T::kTypeRoute, T::kModeGet},
      {RTM_NEWNEIGH, T::kTypeNeighbor, T::kModeAdd},
      {RTM_DELNEIGH, T::kTypeNeighbor, T::kModeDelete},
      {RTM_GETNEIGH, T::kTypeNeighbor, T::kModeGet},
      {RTM_NEWRULE, T::kTypeRule, T::kModeAdd},
      {RTM_DELRULE, T::kTypeRule, T::kModeDelete},
      {RTM_GETRULE, T::kTypeRule, T::kModeGet},
      {RTM_NEWQDISC, T::kTypeTrafficControl, T::kModeAdd},
      {RTM_DELQDISC, T::kTypeTrafficControl, T::kModeDelete},
      {RTM_GETQDISC, T::kTypeTrafficControl, T::kModeGet},
      {RTM_NEWTCLASS, T::kTypeTrafficControl, T::kModeAdd},
      {RTM_DELTCLASS, T::kTypeTrafficControl, T::kModeDelete},
      {RTM_GETTCLASS, T::kTypeTrafficControl, T::kModeGet},
      {RTM_NEWTFILTER, T::kTypeTrafficControl, T::kModeAdd},
      {RTM_DELTFILTER, T::kTypeTrafficControl, T::kModeDelete},
      {RTM_GETTFILTER, T::kTypeTrafficControl, T::kModeGet},
      {RTM_NEWCHAIN, T::kTypeTrafficControl, T::kModeAdd},
      {RTM_DELCHAIN, T::kTypeTrafficControl, T::kModeDelete},
      {RTM_GETCHAIN, T::kTypeTrafficControl, T::kModeGet},
      {RTM_NEWPREFIX, T::kTypePrefix, T::kModeAdd},
      {RTM_NEWNEIGHTBL, T::kTypeNeighborTable, T::kModeAdd},
      {RTM_GETNEIGHTBL, T::kTypeNeighborTable, T::kModeGet},
      {RTM_SETNEIGHTBL, T::kTypeNeighborTable, T::kModeSet},
      {RTM_NEWNSID, T::kTypeNsid, T::kModeAdd},
      {RTM_DELNSID, T::kTypeNsid, T::kModeDelete},
      {RTM_GETNSID, T::kTypeNsid, T::kModeGet},
  };
  for (const auto& entry : kMessageTypes) {
    RegisterMessageType(entry.message_type, entry.type, entry.mode);
  }

  RegisterAttributeCatalog(T::kTypeLink, &LinkAttributeCatalog());
  RegisterAttributeCatalog(T::kTypeAddress, &AddressAttributeCatalog());
  RegisterAttributeCatalog(T::kTypeRoute, &RouteAttributeCatalog());
  RegisterAttributeCatalog(T::kTypeRule, &RuleAttributeCatalog());
  RegisterAttributeCatalog(T::kTypeTrafficControl,
                           &TrafficControlAttributeCatalog());
  RegisterAttributeCatalog(T::kTypeNeighbor, &NeighborAttributeCatalog());
  RegisterAttributeCatalog(T::kTypeNeighborTable,
                           &NeighborTableAttributeCatalog());
  RegisterAttributeCatalog(T::kTypeNsid, &NsidAttributeCatalog());
  RegisterAttributeCatalog(T::kTypePrefix, &PrefixAttributeCatalog());
}

bool RTNLCodec::RegisterMessageType(uint16_t message_type,
                                    RTNLMessage::Type type,
                                    RTNLMessage::Mode mode) {
  if (message_type < NLMSG_MIN_TYPE) {
    LOG(ERROR) << "Message type " << message_type
               << " is reserved for netlink control messages.";
    return false;
  }
  if (type == RTNLMessage::kTypeUnknown || type >= RTNLMessage::kTypeNoop) {
    LOG(ERROR) << "Cannot register message type " << message_type << " as "
               << RTNLMessage::TypeToString(type);
    return false;
  }
  if (base::Contains(message_types_, message_type)) {
    LOG(WARNING) << "Message type " << message_type << " already exists.";
    return false;
  }
  message_types_[message_type] = MessageKind{type, mode};
  return true;
}

bool RTNLCodec::RegisterAttributeCatalog(RTNLMessage::Type type,
                                         const AttributeCatalog* catalog) {
  if (!catalog) {
    LOG(ERROR) << "Null catalog for " << RTNLMessage::TypeToString(type);
    return false;
  }
  catalogs_[type] = catalog;
  return true;
}

RTNLCodec::MessageKind RTNLCodec::LookupMessageType(
    uint16_t message_type) const {
  switch (message_type) {
    case NLMSG_NOOP:
      return {RTNLMessage::kTypeNoop, RTNLMessage::kModeUnknown};
    case NLMSG_ERROR:
      return {RTNLMessage::kTypeError, RTNLMessage::kModeUnknown};
    case NLMSG_DONE:
      return {RTNLMessage::kTypeDone, RTNLMessage::kModeUnknown};
    case NLMSG_OVERRUN:
      return {RTNLMessage::kTypeOverrun, RTNLMessage::kModeUnknown};
  }
  const auto it = message_types_.find(message_type);
  if (it == message_types_.end()) {
    return {RTNLMessage::kTypeUnknown, RTNLMessage::kModeUnknown};
  }
  return it->second;
}

const AttributeCatalog& RTNLCodec::CatalogFor(RTNLMessage::Type type) const {
  const auto it = catalogs_.find(type);
  if (it == catalogs_.end()) {
    return OpaqueAttributeCatalog::GetInstance();
  }
  return *it->second;
}

bool RTNLCodec::IsShortDumpRequest(uint16_t message_type,
                                   size_t payload_length) const {
  if (!options_.accept_short_dump_requests) {
    return false;
  }
  switch (message_type) {
    case RTM_GETLINK:
    case RTM_GETADDR:
      return payload_length == 4;
    case RTM_GETROUTE:
      return payload_length == 4 || payload_length == 1;
    default:
      return false;
  }
}

Result<RTNLMessage> RTNLCodec::Decode(base::span<const uint8_t> bytes) const {
  const ByteView view(bytes);
  ASSIGN_OR_RETURN(const NetlinkHeader header, NetlinkHeader::Parse(view));
  if (header.length > view.size() && !options_.tolerate_truncation) {
    return base::unexpected(Error(
        ErrorCode::kBufferTooShort,
        base::StringPrintf("message declares %u bytes, %zu available",
                           header.length, view.size())));
  }
  ASSIGN_OR_RETURN(
      const ByteView payload,
      view.Truncate(header.length).SliceFrom(NetlinkHeader::kLength));

  const MessageKind kind = LookupMessageType(header.message_type);
  RTNLMessage message(kind.type, kind.mode, header.message_type,
                      header.flags, header.sequence, header.port_id);
  if (message.IsControl()) {
    RETURN_IF_ERROR(DecodeControlMessage(payload, &message));
  } else if (message.HasFamilyHeader()) {
    RETURN_IF_ERROR(DecodeFamilyMessage(payload, &message));
  } else {
    VLOG(2) << "Unrecognized message type " << header.message_type << ", "
            << payload.size() << " payload bytes kept";
    message.set_payload(payload.ToBytes());
  }
  return message;
}

Result<void> RTNLCodec::DecodeControlMessage(ByteView payload,
                                             RTNLMessage* message) const {
  if (message->type() == RTNLMessage::kTypeError) {
    ASSIGN_OR_RETURN(const int32_t error, payload.ReadI32(0));
    ASSIGN_OR_RETURN(const ByteView request, payload.SliceFrom(sizeof(error)));
    message->set_error(error);
    message->set_payload(request.ToBytes());
    return base::ok();
  }
  message->set_payload(payload.ToBytes());
  return base::ok();
}

Result<void> RTNLCodec::DecodeFamilyMessage(ByteView payload,
                                            RTNLMessage* message) const {
  const RTNLMessage::Type type = message->type();
  if (IsShortDumpRequest(message->message_type(), payload.size())) {
    ASSIGN_OR_RETURN(const uint8_t family, payload.ReadU8(0));
    VLOG(3) << "Short " << RTNLMessage::TypeToString(type)
            << " dump request for family " << static_cast<int>(family);
    switch (type) {
      case RTNLMessage::kTypeLink:
        message->set_family_header(FamilyOnly<LinkHeader>(family));
        break;
      case RTNLMessage::kTypeAddress:
        message->set_family_header(FamilyOnly<AddressHeader>(family));
        break;
      default:
        message->set_family_header(FamilyOnly<RouteHeader>(family));
        break;
    }
    return base::ok();
  }

  FamilyHeader header;
  size_t header_length = 0;
  switch (type) {
    case RTNLMessage::kTypeLink:
      ASSIGN_OR_RETURN(header_length,
                       ParseFamilyHeader<LinkHeader>(payload, &header));
      break;
    case RTNLMessage::kTypeAddress:
      ASSIGN_OR_RETURN(header_length,
                       ParseFamilyHeader<AddressHeader>(payload, &header));
      break;
    case RTNLMessage::kTypeRoute:
      ASSIGN_OR_RETURN(header_length,
                       ParseFamilyHeader<RouteHeader>(payload, &header));
      break;
    case RTNLMessage::kTypeRule:
      ASSIGN_OR_RETURN(header_length,
                       ParseFamilyHeader<RuleHeader>(payload, &header));
      break;
    case RTNLMessage::kTypeTrafficControl:
      ASSIGN_OR_RETURN(
          header_length,
          ParseFamilyHeader<TrafficControlHeader>(payload, &header));
      break;
    case RTNLMessage::kTypeNeighbor:
      ASSIGN_OR_RETURN(header_length,
                       ParseFamilyHeader<NeighborHeader>(payload, &header));
      break;
    case RTNLMessage::kTypeNeighborTable:
      ASSIGN_OR_RETURN(
          header_length,
          ParseFamilyHeader<NeighborTableHeader>(payload, &header));
      break;
    case RTNLMessage::kTypeNsid:
      ASSIGN_OR_RETURN(header_length,
                       ParseFamilyHeader<NsidHeader>(payload, &header));
      break;
    case RTNLMessage::kTypePrefix:
      ASSIGN_OR_RETURN(header_length,
                       ParseFamilyHeader<PrefixHeader>(payload, &header));
      break;
    default:
      return base::unexpected(
          Error(ErrorCode::kUnsupportedMessage,
                RTNLMessage::TypeToString(type) + " has no family header"));
  }

  ASSIGN_OR_RETURN(const ByteView region, payload.SliceFrom(header_length));
  DecodeContext context;
  context.max_depth = options_.max_nesting_depth;
  // Every family header starts with its address family.
  ASSIGN_OR_RETURN(context.family, payload.ReadU8(0));
  ASSIGN_OR_RETURN(AttributeList attributes,
                   AttributeList::Decode(region, CatalogFor(type), context));
  message->set_family_header(header);
  message->set_attributes(std::move(attributes));
  return base::ok();
}

std::vector<Result<RTNLMessage>> RTNLCodec::DecodeAll(
    base::span<const uint8_t> bytes) const {
  std::vector<Result<RTNLMessage>> results;
  size_t offset = 0;
  while (offset < bytes.size()) {
    base::span<const uint8_t> remaining = bytes.subspan(offset);
    const Result<NetlinkHeader> header =
        NetlinkHeader::Parse(ByteView(remaining));
    if (!header.has_value()) {
      LOG(WARNING) << "Cannot split message at offset " << offset << ": "
                   << header.error();
      results.push_back(base::unexpected(header.error()));
      break;
    }

    Result<RTNLMessage> message = Decode(remaining);
    if (!message.has_value()) {
      LOG(WARNING) << "Failed to decode message at offset " << offset << ": "
                   << message.error();
    }
    results.push_back(std::move(message));

    if (header->length > remaining.size()) {
      break;
    }
    offset += NetlinkAlign(header->length);
  }
  return results;
}

Result<std::vector<uint8_t>> RTNLCodec::Encode(
    const RTNLMessage& message) const {
  const MessageKind kind = LookupMessageType(message.message_type());
  if (kind.type != message.type() || kind.mode != message.mode()) {
    return base::unexpected(Error(
        ErrorCode::kUnsupportedMessage,
        base::StringPrintf("message type %u is not a %s %s message",
                           message.message_type(),
                           RTNLMessage::ModeToString(message.mode()).c_str(),
                           RTNLMessage::TypeToString(message.type()).c_str())));
  }
  return message.Encode();
}

}  // namespace netlink_route
