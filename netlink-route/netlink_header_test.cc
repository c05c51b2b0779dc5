// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/netlink_header.h"

#include <linux/netlink.h>
#include <linux/rtnetlink.h>

#include <vector>

#include <gtest/gtest.h>

namespace netlink_route {
namespace {

// RTM_NEWLINK, NLM_F_REQUEST | NLM_F_ACK, seq 0x01020304, pid 0x0a0b0c0d.
const std::vector<uint8_t> kHeaderBytes = {
    0x20, 0x00, 0x00, 0x00, 0x10, 0x00, 0x05, 0x00,
    0x04, 0x03, 0x02, 0x01, 0x0d, 0x0c, 0x0b, 0x0a,
};

TEST(NetlinkHeaderTest, Parse) {
  const auto header = NetlinkHeader::Parse(ByteView(kHeaderBytes));
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->length, 0x20u);
  EXPECT_EQ(header->message_type, RTM_NEWLINK);
  EXPECT_EQ(header->flags, NLM_F_REQUEST | NLM_F_ACK);
  EXPECT_EQ(header->sequence, 0x01020304u);
  EXPECT_EQ(header->port_id, 0x0a0b0c0du);
}

TEST(NetlinkHeaderTest, Emit) {
  NetlinkHeader header;
  header.length = 0x20;
  header.message_type = RTM_NEWLINK;
  header.flags = NLM_F_REQUEST | NLM_F_ACK;
  header.sequence = 0x01020304;
  header.port_id = 0x0a0b0c0d;

  std::vector<uint8_t> bytes(NetlinkHeader::kLength, 0);
  header.Emit(bytes);
  EXPECT_EQ(bytes, kHeaderBytes);
}

TEST(NetlinkHeaderTest, TooShort) {
  for (size_t length = 0; length < NetlinkHeader::kLength; ++length) {
    const auto header =
        NetlinkHeader::Parse(ByteView(kHeaderBytes).Truncate(length));
    ASSERT_FALSE(header.has_value()) << length;
    EXPECT_EQ(header.error().code(), ErrorCode::kHeaderTooShort);
  }
}

TEST(NetlinkHeaderTest, DeclaredLengthBelowHeader) {
  std::vector<uint8_t> bytes = kHeaderBytes;
  bytes[0] = 0x0f;
  const auto header = NetlinkHeader::Parse(ByteView(bytes));
  ASSERT_FALSE(header.has_value());
  EXPECT_EQ(header.error().code(), ErrorCode::kHeaderTooShort);
}

TEST(NetlinkHeaderTest, DeclaredLengthBeyondBufferIsNotChecked) {
  std::vector<uint8_t> bytes = kHeaderBytes;
  bytes[1] = 0x10;
  const auto header = NetlinkHeader::Parse(ByteView(bytes));
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->length, 0x1020u);
}

TEST(NetlinkHeaderTest, Align) {
  EXPECT_EQ(NetlinkAlign(0), 0u);
  EXPECT_EQ(NetlinkAlign(1), 4u);
  EXPECT_EQ(NetlinkAlign(4), 4u);
  EXPECT_EQ(NetlinkAlign(7), 8u);
}

TEST(NetlinkHeaderTest, ToString) {
  const auto header = NetlinkHeader::Parse(ByteView(kHeaderBytes));
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->ToString(),
            "len 32 type 16 flags REQUEST ACK seq 16909060 pid 168496141");
}

}  // namespace
}  // namespace netlink_route
