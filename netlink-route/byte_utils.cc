// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/byte_utils.h"

#include <string.h>

#include <base/sys_byteorder.h>

namespace netlink_route::byte_utils {

namespace {

template <typename T>
void WriteRaw(base::span<uint8_t> out, T val) {
  base::span<uint8_t> dst = out.first(sizeof(T));
  memcpy(dst.data(), &val, sizeof(T));
}

}  // namespace

void WriteU16(base::span<uint8_t> out, uint16_t val, ByteOrder order) {
  WriteRaw(out, order == ByteOrder::kBigEndian ? base::HostToNet16(val)
                                               : base::ByteSwapToLE16(val));
}

void WriteU32(base::span<uint8_t> out, uint32_t val, ByteOrder order) {
  WriteRaw(out, order == ByteOrder::kBigEndian ? base::HostToNet32(val)
                                               : base::ByteSwapToLE32(val));
}

void WriteU64(base::span<uint8_t> out, uint64_t val, ByteOrder order) {
  WriteRaw(out, order == ByteOrder::kBigEndian ? base::HostToNet64(val)
                                               : base::ByteSwapToLE64(val));
}

void AppendU8(std::vector<uint8_t>* bytes, uint8_t val) {
  bytes->push_back(val);
}

void AppendU16(std::vector<uint8_t>* bytes, uint16_t val) {
  const size_t offset = bytes->size();
  bytes->resize(offset + sizeof(val));
  WriteU16(base::span<uint8_t>(*bytes).subspan(offset), val);
}

void AppendU32(std::vector<uint8_t>* bytes, uint32_t val) {
  const size_t offset = bytes->size();
  bytes->resize(offset + sizeof(val));
  WriteU32(base::span<uint8_t>(*bytes).subspan(offset), val);
}

std::string StringFromCStringBytes(base::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }
  const size_t len =
      strnlen(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  return {reinterpret_cast<const char*>(bytes.data()), len};
}

std::vector<uint8_t> ByteStringToBytes(std::string_view bytes) {
  return {reinterpret_cast<const uint8_t*>(bytes.data()),
          reinterpret_cast<const uint8_t*>(bytes.data() + bytes.size())};
}

}  // namespace netlink_route::byte_utils
