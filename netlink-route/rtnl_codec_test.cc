// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/rtnl_codec.h"

#include <errno.h>
#include <linux/if_addr.h>
#include <linux/if_bridge.h>
#include <linux/if_link.h>
#include <linux/net_namespace.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <sys/socket.h>

#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "netlink-route/byte_utils.h"

namespace netlink_route {
namespace {

// RTM_NEWADDR for 127.0.0.1/8 on lo, as dumped by the kernel.
const std::vector<uint8_t> kNewAddressLoopback = {
    // Envelope: length 76, RTM_NEWADDR, NLM_F_MULTI, seq 1, pid 0.
    0x4c, 0x00, 0x00, 0x00, 0x14, 0x00, 0x02, 0x00,  //
    0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  //
    // ifaddrmsg.
    0x02, 0x08, 0x80, 0xfe, 0x01, 0x00, 0x00, 0x00,  //
    // IFA_ADDRESS 127.0.0.1
    0x08, 0x00, 0x01, 0x00, 0x7f, 0x00, 0x00, 0x01,  //
    // IFA_LOCAL 127.0.0.1
    0x08, 0x00, 0x02, 0x00, 0x7f, 0x00, 0x00, 0x01,  //
    // IFA_LABEL "lo"
    0x07, 0x00, 0x03, 0x00, 0x6c, 0x6f, 0x00, 0x00,  //
    // IFA_FLAGS IFA_F_PERMANENT
    0x08, 0x00, 0x08, 0x00, 0x80, 0x00, 0x00, 0x00,  //
    // IFA_CACHEINFO
    0x14, 0x00, 0x06, 0x00, 0xff, 0xff, 0xff, 0xff,  //
    0xff, 0xff, 0xff, 0xff, 0x9c, 0x00, 0x00, 0x00,  //
    0x9c, 0x00, 0x00, 0x00,
};

// RTM_NEWLINK for lo with nested IFLA_LINKINFO and IFLA_AF_SPEC.
const std::vector<uint8_t> kNewLinkNested = {
    // Envelope: length 80, RTM_NEWLINK, seq 2, pid 3.
    0x50, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00,  //
    0x02, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00,  //
    // ifinfomsg: ARPHRD_LOOPBACK, index 1, IFF_UP|IFF_LOOPBACK.
    0x00, 0x00, 0x04, 0x03, 0x01, 0x00, 0x00, 0x00,  //
    0x09, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,  //
    // IFLA_IFNAME "lo"
    0x07, 0x00, 0x03, 0x00, 0x6c, 0x6f, 0x00, 0x00,  //
    // IFLA_MTU 65536
    0x08, 0x00, 0x04, 0x00, 0x00, 0x00, 0x01, 0x00,  //
    // IFLA_LINKINFO { IFLA_INFO_KIND "veth" }
    0x10, 0x00, 0x12, 0x00, 0x09, 0x00, 0x01, 0x00,  //
    0x76, 0x65, 0x74, 0x68, 0x00, 0x00, 0x00, 0x00,  //
    // IFLA_AF_SPEC { AF_INET6 { IFLA_INET6_FLAGS 0x80000000 } }
    0x10, 0x00, 0x1a, 0x80, 0x0c, 0x00, 0x0a, 0x80,  //
    0x08, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x80,
};

// Prepends a netlink envelope to |payload|.
std::vector<uint8_t> MakeMessage(uint16_t message_type,
                                 uint16_t flags,
                                 const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> bytes;
  byte_utils::AppendU32(&bytes,
                        static_cast<uint32_t>(NetlinkHeader::kLength +
                                              payload.size()));
  byte_utils::AppendU16(&bytes, message_type);
  byte_utils::AppendU16(&bytes, flags);
  byte_utils::AppendU32(&bytes, 0);
  byte_utils::AppendU32(&bytes, 0);
  bytes.insert(bytes.end(), payload.begin(), payload.end());
  return bytes;
}

class RTNLCodecTest : public testing::Test {
 protected:
  RTNLCodecTest() { codec_.RegisterRouteFamilies(); }

  RTNLCodec codec_;
};

TEST_F(RTNLCodecTest, DecodeNewAddress) {
  const auto message = codec_.Decode(kNewAddressLoopback);
  ASSERT_TRUE(message.has_value()) << message.error();
  EXPECT_EQ(message->type(), RTNLMessage::kTypeAddress);
  EXPECT_EQ(message->mode(), RTNLMessage::kModeAdd);
  EXPECT_EQ(message->message_type(), RTM_NEWADDR);
  EXPECT_EQ(message->flags(), NLM_F_MULTI);
  EXPECT_EQ(message->seq(), 1u);
  EXPECT_EQ(message->pid(), 0u);

  const AddressHeader* header = message->address_header();
  ASSERT_NE(header, nullptr);
  EXPECT_EQ(header->family, AF_INET);
  EXPECT_EQ(header->prefix_length, 8);
  EXPECT_EQ(header->flags, IFA_F_PERMANENT);
  EXPECT_EQ(header->scope, RT_SCOPE_HOST);
  EXPECT_EQ(header->index, 1u);

  const AttributeList& attributes = message->attributes();
  ASSERT_EQ(attributes.size(), 5u);
  EXPECT_EQ(attributes.GetBytes(IFA_ADDRESS),
            (std::vector<uint8_t>{127, 0, 0, 1}));
  EXPECT_EQ(attributes.GetBytes(IFA_LOCAL),
            (std::vector<uint8_t>{127, 0, 0, 1}));
  EXPECT_EQ(attributes.GetString(IFA_LABEL), "lo");
  EXPECT_EQ(attributes.GetU32(IFA_FLAGS), uint32_t{IFA_F_PERMANENT});
  const auto cacheinfo = attributes.GetBytes(IFA_CACHEINFO);
  ASSERT_TRUE(cacheinfo.has_value());
  EXPECT_EQ(cacheinfo->size(), 16u);
  EXPECT_EQ(attributes.at(0).ToString(), "IFA_ADDRESS(1)=127.0.0.1");

  const auto encoded = codec_.Encode(*message);
  ASSERT_TRUE(encoded.has_value()) << encoded.error();
  EXPECT_EQ(*encoded, kNewAddressLoopback);
}

TEST_F(RTNLCodecTest, DecodeNestedLink) {
  const auto message = codec_.Decode(kNewLinkNested);
  ASSERT_TRUE(message.has_value()) << message.error();
  EXPECT_EQ(message->type(), RTNLMessage::kTypeLink);
  ASSERT_NE(message->link_header(), nullptr);
  EXPECT_EQ(message->link_header()->index, 1);

  const AttributeList& attributes = message->attributes();
  EXPECT_EQ(attributes.GetString(IFLA_IFNAME), "lo");
  EXPECT_EQ(attributes.GetU32(IFLA_MTU), 65536u);

  const AttributeList* info = attributes.GetNested(IFLA_LINKINFO);
  ASSERT_NE(info, nullptr);
  EXPECT_EQ(info->GetString(IFLA_INFO_KIND), "veth");

  const AttributeList* af_spec = attributes.GetNested(IFLA_AF_SPEC);
  ASSERT_NE(af_spec, nullptr);
  const AttributeList* inet6 = af_spec->GetNested(AF_INET6);
  ASSERT_NE(inet6, nullptr);
  EXPECT_EQ(inet6->GetU32(IFLA_INET6_FLAGS), 0x80000000u);
  EXPECT_EQ(inet6->at(0).name(), "IFLA_INET6_FLAGS");

  EXPECT_EQ(codec_.Encode(*message).value(), kNewLinkNested);
}

TEST_F(RTNLCodecTest, BridgeAfSpec) {
  // RTM_NEWLINK for a bridge port with VLAN 1 as its untagged PVID.
  const std::vector<uint8_t> bytes = MakeMessage(
      RTM_NEWLINK, NLM_F_REQUEST,
      {// ifinfomsg: AF_BRIDGE, index 5.
       AF_BRIDGE, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00,  //
       0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,       //
       // IFLA_AF_SPEC { IFLA_BRIDGE_VLAN_INFO {PVID|UNTAGGED, vid 1} }
       0x0c, 0x00, 0x1a, 0x00, 0x08, 0x00, 0x02, 0x00,  //
       0x06, 0x00, 0x01, 0x00});
  const auto message = codec_.Decode(bytes);
  ASSERT_TRUE(message.has_value()) << message.error();
  ASSERT_NE(message->link_header(), nullptr);
  EXPECT_EQ(message->link_header()->family, AF_BRIDGE);

  const AttributeList* af_spec = message->attributes().GetNested(IFLA_AF_SPEC);
  ASSERT_NE(af_spec, nullptr);
  ASSERT_EQ(af_spec->size(), 1u);
  EXPECT_EQ(af_spec->at(0).name(), "IFLA_BRIDGE_VLAN_INFO");
  EXPECT_EQ(af_spec->GetBytes(IFLA_BRIDGE_VLAN_INFO),
            (std::vector<uint8_t>{0x06, 0x00, 0x01, 0x00}));

  EXPECT_EQ(codec_.Encode(*message).value(), bytes);
}

TEST_F(RTNLCodecTest, BridgeAfSpecFlagsAndMode) {
  const std::vector<uint8_t> bytes = MakeMessage(
      RTM_SETLINK, NLM_F_REQUEST,
      {AF_BRIDGE, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00,  //
       0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,       //
       // IFLA_AF_SPEC { IFLA_BRIDGE_FLAGS BRIDGE_FLAGS_SELF,
       //                IFLA_BRIDGE_MODE BRIDGE_MODE_VEPA }
       0x14, 0x00, 0x1a, 0x00, 0x06, 0x00, 0x00, 0x00,  //
       0x02, 0x00, 0x00, 0x00, 0x06, 0x00, 0x01, 0x00,  //
       0x01, 0x00, 0x00, 0x00});
  const auto message = codec_.Decode(bytes);
  ASSERT_TRUE(message.has_value()) << message.error();
  const AttributeList* af_spec = message->attributes().GetNested(IFLA_AF_SPEC);
  ASSERT_NE(af_spec, nullptr);
  EXPECT_EQ(af_spec->GetU16(IFLA_BRIDGE_FLAGS), uint16_t{BRIDGE_FLAGS_SELF});
  EXPECT_EQ(af_spec->GetU16(IFLA_BRIDGE_MODE), uint16_t{BRIDGE_MODE_VEPA});
  EXPECT_EQ(codec_.Encode(*message).value(), bytes);
}

TEST_F(RTNLCodecTest, AfSpecOfOtherFamiliesStaysRaw) {
  // The same IFLA_AF_SPEC as a bridge message, under AF_INET6.
  const std::vector<uint8_t> bytes = MakeMessage(
      RTM_NEWLINK, 0,
      {AF_INET6, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00,  //
       0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,      //
       0x0c, 0x00, 0x1a, 0x00, 0x08, 0x00, 0x02, 0x00,      //
       0x06, 0x00, 0x01, 0x00});
  const auto message = codec_.Decode(bytes);
  ASSERT_TRUE(message.has_value()) << message.error();
  EXPECT_EQ(message->attributes().GetNested(IFLA_AF_SPEC), nullptr);
  EXPECT_EQ(message->attributes().GetBytes(IFLA_AF_SPEC),
            (std::vector<uint8_t>{0x08, 0x00, 0x02, 0x00, 0x06, 0x00, 0x01,
                                  0x00}));
  EXPECT_EQ(codec_.Encode(*message).value(), bytes);

  // Not a valid attribute list, which is fine for an unknown layout.
  const std::vector<uint8_t> garbage = MakeMessage(
      RTM_NEWLINK, 0,
      {AF_INET6, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00,  //
       0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,      //
       0x08, 0x00, 0x1a, 0x00, 0xff, 0xff, 0x00, 0x00});
  const auto raw = codec_.Decode(garbage);
  ASSERT_TRUE(raw.has_value()) << raw.error();
  EXPECT_EQ(codec_.Encode(*raw).value(), garbage);
}

TEST_F(RTNLCodecTest, NestingDepthOption) {
  RTNLCodec::Options options;
  options.max_nesting_depth = 1;
  RTNLCodec codec(options);
  codec.RegisterRouteFamilies();

  // IFLA_AF_SPEC holds attributes two levels down.
  const auto message = codec.Decode(kNewLinkNested);
  ASSERT_FALSE(message.has_value());
  EXPECT_EQ(message.error().code(), ErrorCode::kNestingTooDeep);
}

TEST_F(RTNLCodecTest, EncodeLinkMessage) {
  RTNLMessage message(RTNLMessage::kTypeLink, RTNLMessage::kModeAdd,
                      RTM_NEWLINK, 0, 0, 0);
  message.set_family_header(LinkHeader());
  message.mutable_attributes()->Append(
      std::make_unique<NetlinkU32Attribute>(2, 1));
  const auto bytes = codec_.Encode(message);
  ASSERT_TRUE(bytes.has_value());
  ASSERT_EQ(bytes->size(), 40u);
  EXPECT_EQ(std::vector<uint8_t>(bytes->begin() + 32, bytes->end()),
            (std::vector<uint8_t>{0x08, 0x00, 0x02, 0x00, 0x01, 0x00, 0x00,
                                  0x00}));
}

TEST_F(RTNLCodecTest, Nsid) {
  const std::vector<uint8_t> get_nsid = MakeMessage(
      RTM_GETNSID, NLM_F_REQUEST,
      {0x00, 0x00, 0x00, 0x00, 0x08, 0x00, 0x01, 0x00, 0x63, 0x00, 0x00, 0x00});
  auto message = codec_.Decode(get_nsid);
  ASSERT_TRUE(message.has_value()) << message.error();
  EXPECT_EQ(message->type(), RTNLMessage::kTypeNsid);
  EXPECT_EQ(message->mode(), RTNLMessage::kModeGet);
  ASSERT_NE(message->nsid_header(), nullptr);
  EXPECT_EQ(message->nsid_header()->family, AF_UNSPEC);
  EXPECT_EQ(message->attributes().GetS32(NETNSA_NSID), 99);
  EXPECT_EQ(codec_.Encode(*message).value(), get_nsid);

  const std::vector<uint8_t> by_fd = MakeMessage(
      RTM_GETNSID, NLM_F_REQUEST,
      {0x00, 0x00, 0x00, 0x00, 0x08, 0x00, 0x03, 0x00, 0x06, 0x00, 0x00, 0x00});
  message = codec_.Decode(by_fd);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->attributes().GetU32(NETNSA_FD), 6u);

  const std::vector<uint8_t> by_target = MakeMessage(
      RTM_GETNSID, NLM_F_REQUEST,
      {0x00, 0x00, 0x00, 0x00, 0x08, 0x00, 0x04, 0x00, 0x63, 0x00, 0x00, 0x00});
  message = codec_.Decode(by_target);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->attributes().GetS32(NETNSA_TARGET_NSID), 99);

  // Built from scratch, the same request encodes to the same bytes.
  RTNLMessage built(RTNLMessage::kTypeNsid, RTNLMessage::kModeGet,
                    RTM_GETNSID, NLM_F_REQUEST, 0, 0);
  built.set_family_header(NsidHeader());
  built.mutable_attributes()->Append(std::make_unique<NetlinkS32Attribute>(
      NETNSA_TARGET_NSID, 99, "NETNSA_TARGET_NSID"));
  EXPECT_EQ(codec_.Encode(built).value(), by_target);
  EXPECT_EQ(built, message.value());
}

TEST_F(RTNLCodecTest, TruncatedBuffer) {
  for (size_t length = 0; length < kNewAddressLoopback.size(); ++length) {
    const auto message = codec_.Decode(
        base::span<const uint8_t>(kNewAddressLoopback).first(length));
    ASSERT_FALSE(message.has_value()) << length;
    EXPECT_EQ(message.error().code(), length < NetlinkHeader::kLength
                                          ? ErrorCode::kHeaderTooShort
                                          : ErrorCode::kBufferTooShort)
        << length;
  }
}

TEST_F(RTNLCodecTest, TolerateTruncation) {
  RTNLCodec::Options options;
  options.tolerate_truncation = true;
  RTNLCodec codec(options);
  codec.RegisterRouteFamilies();

  // Cut right after IFA_ADDRESS.
  const auto message =
      codec.Decode(base::span<const uint8_t>(kNewAddressLoopback).first(32u));
  ASSERT_TRUE(message.has_value()) << message.error();
  EXPECT_EQ(message->attributes().size(), 1u);
  EXPECT_TRUE(message->attributes().HasAttribute(IFA_ADDRESS));

  // Cut in the middle of IFA_LOCAL.
  const auto broken =
      codec.Decode(base::span<const uint8_t>(kNewAddressLoopback).first(36u));
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error().code(), ErrorCode::kTlvMalformed);

  // Cut inside the family header.
  const auto short_header =
      codec.Decode(base::span<const uint8_t>(kNewAddressLoopback).first(20u));
  ASSERT_FALSE(short_header.has_value());
  EXPECT_EQ(short_header.error().code(), ErrorCode::kFamilyHeaderTooShort);
}

TEST_F(RTNLCodecTest, BytesPastDeclaredLengthAreIgnored) {
  std::vector<uint8_t> bytes = kNewAddressLoopback;
  bytes.insert(bytes.end(), {0xde, 0xad, 0xbe, 0xef});
  const auto message = codec_.Decode(bytes);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(codec_.Encode(*message).value(), kNewAddressLoopback);
}

TEST_F(RTNLCodecTest, DeclaredLengthBelowHeader) {
  std::vector<uint8_t> bytes = kNewAddressLoopback;
  bytes[0] = 8;
  const auto message = codec_.Decode(bytes);
  ASSERT_FALSE(message.has_value());
  EXPECT_EQ(message.error().code(), ErrorCode::kHeaderTooShort);
}

TEST_F(RTNLCodecTest, UnrecognizedMessageType) {
  // RTM_GETLINKPROP is not part of the registry.
  const std::vector<uint8_t> bytes = MakeMessage(110, 0, {1, 2, 3});
  const auto message = codec_.Decode(bytes);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type(), RTNLMessage::kTypeUnknown);
  EXPECT_EQ(message->mode(), RTNLMessage::kModeUnknown);
  EXPECT_EQ(message->message_type(), 110);
  EXPECT_EQ(message->payload(), (std::vector<uint8_t>{1, 2, 3}));
  EXPECT_TRUE(message->attributes().empty());
  EXPECT_EQ(codec_.Encode(*message).value(), bytes);
}

TEST_F(RTNLCodecTest, UnregisteredCodecKeepsEverythingRaw) {
  RTNLCodec codec;
  const auto message = codec.Decode(kNewAddressLoopback);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type(), RTNLMessage::kTypeUnknown);
  EXPECT_EQ(message->payload().size(), 60u);
  EXPECT_EQ(codec.Encode(*message).value(), kNewAddressLoopback);
}

TEST_F(RTNLCodecTest, FamilyWithoutCatalog) {
  RTNLCodec codec;
  ASSERT_TRUE(codec.RegisterMessageType(RTM_NEWADDR, RTNLMessage::kTypeAddress,
                                        RTNLMessage::kModeAdd));
  const auto message = codec.Decode(kNewAddressLoopback);
  ASSERT_TRUE(message.has_value());
  ASSERT_EQ(message->attributes().size(), 5u);
  for (const auto& attribute : message->attributes().attributes()) {
    EXPECT_EQ(attribute->datatype(), NetlinkAttribute::Type::kUnknown);
  }
  EXPECT_EQ(codec.Encode(*message).value(), kNewAddressLoopback);
}

TEST_F(RTNLCodecTest, ErrorMessages) {
  std::vector<uint8_t> payload;
  byte_utils::AppendU32(&payload, static_cast<uint32_t>(-ENODEV));
  // The echoed request header.
  const std::vector<uint8_t> request(kNewAddressLoopback.begin(),
                                     kNewAddressLoopback.begin() + 16);
  payload.insert(payload.end(), request.begin(), request.end());

  const std::vector<uint8_t> bytes = MakeMessage(NLMSG_ERROR, 0, payload);
  const auto message = codec_.Decode(bytes);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type(), RTNLMessage::kTypeError);
  EXPECT_TRUE(message->IsControl());
  EXPECT_EQ(message->error(), -ENODEV);
  EXPECT_EQ(message->payload(), request);
  EXPECT_EQ(codec_.Encode(*message).value(), bytes);

  const auto ack = codec_.Decode(MakeMessage(NLMSG_ERROR, 0, {0, 0, 0, 0}));
  ASSERT_TRUE(ack.has_value());
  EXPECT_EQ(ack->error(), 0);
  EXPECT_TRUE(ack->payload().empty());
  EXPECT_EQ(ack->ToString(), "UnknownMode Error seq 0 pid 0: ACK");

  const auto short_error = codec_.Decode(MakeMessage(NLMSG_ERROR, 0, {0, 0}));
  ASSERT_FALSE(short_error.has_value());
  EXPECT_EQ(short_error.error().code(), ErrorCode::kBufferTooShort);
}

TEST_F(RTNLCodecTest, OtherControlMessages) {
  const std::vector<uint8_t> done =
      MakeMessage(NLMSG_DONE, NLM_F_MULTI, {0, 0, 0, 0});
  auto message = codec_.Decode(done);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type(), RTNLMessage::kTypeDone);
  EXPECT_EQ(message->payload().size(), 4u);
  EXPECT_EQ(codec_.Encode(*message).value(), done);

  message = codec_.Decode(MakeMessage(NLMSG_NOOP, 0, {}));
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type(), RTNLMessage::kTypeNoop);

  message = codec_.Decode(MakeMessage(NLMSG_OVERRUN, 0, {}));
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type(), RTNLMessage::kTypeOverrun);
}

TEST_F(RTNLCodecTest, ShortDumpRequests) {
  // iproute2 sends a bare struct rtgenmsg for link and address dumps.
  const auto link = codec_.Decode(MakeMessage(
      RTM_GETLINK, NLM_F_REQUEST | NLM_F_DUMP, {AF_PACKET, 0, 0, 0}));
  ASSERT_TRUE(link.has_value()) << link.error();
  ASSERT_NE(link->link_header(), nullptr);
  EXPECT_EQ(link->link_header()->family, AF_PACKET);
  EXPECT_TRUE(link->attributes().empty());

  const auto address = codec_.Decode(
      MakeMessage(RTM_GETADDR, NLM_F_REQUEST | NLM_F_DUMP, {AF_INET, 0, 0, 0}));
  ASSERT_TRUE(address.has_value());
  ASSERT_NE(address->address_header(), nullptr);
  EXPECT_EQ(address->address_header()->family, AF_INET);

  const auto route = codec_.Decode(
      MakeMessage(RTM_GETROUTE, NLM_F_REQUEST | NLM_F_DUMP, {AF_INET6}));
  ASSERT_TRUE(route.has_value());
  ASSERT_NE(route->route_header(), nullptr);
  EXPECT_EQ(route->route_header()->family, AF_INET6);

  // Only the get requests get this treatment.
  const auto new_link =
      codec_.Decode(MakeMessage(RTM_NEWLINK, 0, {AF_PACKET, 0, 0, 0}));
  ASSERT_FALSE(new_link.has_value());
  EXPECT_EQ(new_link.error().code(), ErrorCode::kFamilyHeaderTooShort);

  RTNLCodec::Options options;
  options.accept_short_dump_requests = false;
  RTNLCodec strict(options);
  strict.RegisterRouteFamilies();
  const auto rejected = strict.Decode(MakeMessage(
      RTM_GETLINK, NLM_F_REQUEST | NLM_F_DUMP, {AF_PACKET, 0, 0, 0}));
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().code(), ErrorCode::kFamilyHeaderTooShort);
}

TEST_F(RTNLCodecTest, DecodeAll) {
  std::vector<uint8_t> buffer = kNewAddressLoopback;

  // An unrecognized message of 19 bytes, followed by one byte of alignment.
  const std::vector<uint8_t> odd = MakeMessage(200, 0, {7, 8, 9});
  buffer.insert(buffer.end(), odd.begin(), odd.end());
  buffer.push_back(0);

  // An address message whose only attribute declares a length of 2.
  const std::vector<uint8_t> broken =
      MakeMessage(RTM_NEWADDR, 0,
                  {0x02, 0x08, 0x80, 0xfe, 0x01, 0x00, 0x00, 0x00,  //
                   0x02, 0x00, 0x01, 0x00});
  buffer.insert(buffer.end(), broken.begin(), broken.end());

  const std::vector<uint8_t> done = MakeMessage(NLMSG_DONE, NLM_F_MULTI, {});
  buffer.insert(buffer.end(), done.begin(), done.end());

  const auto results = codec_.DecodeAll(buffer);
  ASSERT_EQ(results.size(), 4u);
  ASSERT_TRUE(results[0].has_value());
  EXPECT_EQ(results[0]->type(), RTNLMessage::kTypeAddress);
  ASSERT_TRUE(results[1].has_value());
  EXPECT_EQ(results[1]->message_type(), 200);
  EXPECT_EQ(results[1]->payload(), (std::vector<uint8_t>{7, 8, 9}));
  ASSERT_FALSE(results[2].has_value());
  EXPECT_EQ(results[2].error().code(), ErrorCode::kTlvMalformed);
  ASSERT_TRUE(results[3].has_value());
  EXPECT_EQ(results[3]->type(), RTNLMessage::kTypeDone);
}

TEST_F(RTNLCodecTest, DecodeAllStopsAtUnreadableEnvelope) {
  std::vector<uint8_t> buffer = kNewAddressLoopback;
  buffer.insert(buffer.end(), {0x10, 0x00, 0x00, 0x00, 0x03});

  const auto results = codec_.DecodeAll(buffer);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].has_value());
  ASSERT_FALSE(results[1].has_value());
  EXPECT_EQ(results[1].error().code(), ErrorCode::kHeaderTooShort);

  EXPECT_TRUE(codec_.DecodeAll({}).empty());
}

TEST_F(RTNLCodecTest, DecodeAllStopsAtTruncatedMessage) {
  std::vector<uint8_t> buffer = kNewAddressLoopback;
  buffer.insert(buffer.end(), kNewAddressLoopback.begin(),
                kNewAddressLoopback.begin() + 40);

  const auto results = codec_.DecodeAll(buffer);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].has_value());
  ASSERT_FALSE(results[1].has_value());
  EXPECT_EQ(results[1].error().code(), ErrorCode::kBufferTooShort);
}

TEST_F(RTNLCodecTest, EncodeRejectsMismatchedType) {
  RTNLMessage message(RTNLMessage::kTypeLink, RTNLMessage::kModeAdd,
                      RTM_NEWADDR, 0, 0, 0);
  message.set_family_header(LinkHeader());
  const auto bytes = codec_.Encode(message);
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error().code(), ErrorCode::kUnsupportedMessage);

  // The message itself has no registry to check against.
  EXPECT_TRUE(message.Encode().has_value());
}

TEST_F(RTNLCodecTest, EncodeRejectsMessagesTheRegistryDisagreesWith) {
  // An unknown message carrying a registered family message type.
  RTNLMessage unknown(RTNLMessage::kTypeUnknown, RTNLMessage::kModeUnknown,
                      RTM_NEWLINK, 0, 0, 0);
  unknown.set_payload({1, 2, 3, 4});
  auto bytes = codec_.Encode(unknown);
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error().code(), ErrorCode::kUnsupportedMessage);

  // A control message carrying the type of another control message.
  RTNLMessage noop(RTNLMessage::kTypeNoop, RTNLMessage::kModeUnknown,
                   NLMSG_DONE, 0, 0, 0);
  bytes = codec_.Encode(noop);
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error().code(), ErrorCode::kUnsupportedMessage);

  // The right family with the wrong mode.
  RTNLMessage get_link(RTNLMessage::kTypeLink, RTNLMessage::kModeGet,
                       RTM_NEWLINK, 0, 0, 0);
  get_link.set_family_header(LinkHeader());
  bytes = codec_.Encode(get_link);
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error().code(), ErrorCode::kUnsupportedMessage);

  // Consistent messages still encode.
  RTNLMessage done(RTNLMessage::kTypeDone, RTNLMessage::kModeUnknown,
                   NLMSG_DONE, 0, 0, 0);
  EXPECT_TRUE(codec_.Encode(done).has_value());
  RTNLMessage new_link(RTNLMessage::kTypeLink, RTNLMessage::kModeAdd,
                       RTM_NEWLINK, 0, 0, 0);
  new_link.set_family_header(LinkHeader());
  EXPECT_TRUE(codec_.Encode(new_link).has_value());
}

TEST_F(RTNLCodecTest, Registration) {
  RTNLCodec codec;
  EXPECT_FALSE(codec.RegisterMessageType(NLMSG_DONE, RTNLMessage::kTypeLink,
                                         RTNLMessage::kModeGet));
  EXPECT_FALSE(codec.RegisterMessageType(100, RTNLMessage::kTypeError,
                                         RTNLMessage::kModeGet));
  EXPECT_FALSE(codec.RegisterMessageType(100, RTNLMessage::kTypeUnknown,
                                         RTNLMessage::kModeGet));
  EXPECT_TRUE(codec.RegisterMessageType(100, RTNLMessage::kTypeLink,
                                        RTNLMessage::kModeGet));
  EXPECT_FALSE(codec.RegisterMessageType(100, RTNLMessage::kTypeRoute,
                                         RTNLMessage::kModeGet));
  EXPECT_FALSE(codec.RegisterAttributeCatalog(RTNLMessage::kTypeLink, nullptr));

  // Registering the route families twice keeps the first mapping.
  codec_.RegisterRouteFamilies();
  const auto message = codec_.Decode(kNewAddressLoopback);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type(), RTNLMessage::kTypeAddress);
}

}  // namespace
}  // namespace netlink_route
