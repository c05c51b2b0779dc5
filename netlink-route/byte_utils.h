// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_BYTE_UTILS_H_
#define NETLINK_ROUTE_BYTE_UTILS_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <base/containers/span.h>

#include "netlink-route/export.h"

namespace netlink_route::byte_utils {

enum class ByteOrder {
  kLittleEndian,
  kBigEndian,
};

// Writes |val| into the first bytes of |out| in the requested byte order.
// |out| must be at least sizeof(val) bytes long.
NETLINK_ROUTE_EXPORT void WriteU16(base::span<uint8_t> out,
                                   uint16_t val,
                                   ByteOrder order = ByteOrder::kLittleEndian);
NETLINK_ROUTE_EXPORT void WriteU32(base::span<uint8_t> out,
                                   uint32_t val,
                                   ByteOrder order = ByteOrder::kLittleEndian);
NETLINK_ROUTE_EXPORT void WriteU64(base::span<uint8_t> out,
                                   uint64_t val,
                                   ByteOrder order = ByteOrder::kLittleEndian);

// Appends |val| to |bytes| in little-endian order.
NETLINK_ROUTE_EXPORT void AppendU8(std::vector<uint8_t>* bytes, uint8_t val);
NETLINK_ROUTE_EXPORT void AppendU16(std::vector<uint8_t>* bytes,
                                    uint16_t val);
NETLINK_ROUTE_EXPORT void AppendU32(std::vector<uint8_t>* bytes,
                                    uint32_t val);

// Converts a byte buffer to a std::string copying all bytes until a null
// character is found or until the end of the buffer. e.g.
// {'a', 'b'}            => std::string("ab")
// {'a', 'b', '\0'}      => std::string("ab")
// {'a', 'b', '\0', 'c'} => std::string("ab")
NETLINK_ROUTE_EXPORT std::string StringFromCStringBytes(
    base::span<const uint8_t> bytes);

// Converts a string to a byte buffer of the same size, keeping any null
// characters. Mostly useful to build test payloads.
NETLINK_ROUTE_EXPORT std::vector<uint8_t> ByteStringToBytes(
    std::string_view bytes);

}  // namespace netlink_route::byte_utils

#endif  // NETLINK_ROUTE_BYTE_UTILS_H_
