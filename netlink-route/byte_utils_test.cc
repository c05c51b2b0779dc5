// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/byte_utils.h"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace netlink_route::byte_utils {
namespace {

TEST(Bytes, WriteLittleEndian) {
  std::vector<uint8_t> bytes(8, 0xff);
  WriteU16(bytes, 0x1122);
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x22, 0x11, 0xff, 0xff, 0xff, 0xff,
                                         0xff, 0xff}));
  WriteU32(bytes, 0x11223344);
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x44, 0x33, 0x22, 0x11, 0xff, 0xff,
                                         0xff, 0xff}));
  WriteU64(bytes, 0x0102030405060708);
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x08, 0x07, 0x06, 0x05, 0x04, 0x03,
                                         0x02, 0x01}));
}

TEST(Bytes, WriteBigEndian) {
  std::vector<uint8_t> bytes(4, 0);
  WriteU16(bytes, 0x1122, ByteOrder::kBigEndian);
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x11, 0x22, 0x00, 0x00}));
  WriteU32(bytes, 0x11223344, ByteOrder::kBigEndian);
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x11, 0x22, 0x33, 0x44}));
}

TEST(Bytes, Append) {
  std::vector<uint8_t> bytes;
  AppendU8(&bytes, 0x01);
  AppendU16(&bytes, 0x0302);
  AppendU32(&bytes, 0x07060504);
  EXPECT_EQ(bytes, (std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7}));
}

TEST(Bytes, StringFromCStringBytes) {
  EXPECT_EQ(StringFromCStringBytes(std::vector<uint8_t>{'a', 'b'}), "ab");
  EXPECT_EQ(StringFromCStringBytes(std::vector<uint8_t>{'a', 'b', '\0'}), "ab");
  EXPECT_EQ(StringFromCStringBytes(std::vector<uint8_t>{'a', 'b', '\0', 'c'}),
            "ab");
  EXPECT_EQ(StringFromCStringBytes(std::vector<uint8_t>{}), "");
}

TEST(Bytes, ByteStringToBytes) {
  EXPECT_EQ(ByteStringToBytes(std::string("abc", 3)),
            (std::vector<uint8_t>{'a', 'b', 'c'}));
  EXPECT_EQ(ByteStringToBytes(std::string("abc\0d", 5)),
            (std::vector<uint8_t>{'a', 'b', 'c', '\0', 'd'}));
}

}  // namespace
}  // namespace netlink_route::byte_utils
