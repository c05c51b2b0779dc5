// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_NETLINK_HEADER_H_
#define NETLINK_ROUTE_NETLINK_HEADER_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include <base/containers/span.h>

#include "netlink-route/byte_view.h"
#include "netlink-route/error.h"
#include "netlink-route/export.h"

namespace netlink_route {

// Rounds |length| up to the 4-byte boundary netlink uses for messages and
// attributes alike.
constexpr size_t NetlinkAlign(size_t length) {
  return (length + 3) & ~static_cast<size_t>(3);
}

// The 16-byte envelope (struct nlmsghdr) in front of every netlink message:
//
//   0               1               2               3
//   +---------------+---------------+---------------+---------------+
//   |                          length (u32)                         |
//   +---------------+---------------+---------------+---------------+
//   |         message type (u16)    |            flags (u16)        |
//   +---------------+---------------+---------------+---------------+
//   |                         sequence (u32)                        |
//   +---------------+---------------+---------------+---------------+
//   |                         port id (u32)                         |
//   +---------------+---------------+---------------+---------------+
//
// |length| covers the envelope and everything after it. On decode it comes
// from the wire and is not trusted; on encode it is always recomputed from
// the content and whatever the caller put here is ignored.
struct NETLINK_ROUTE_EXPORT NetlinkHeader {
  static constexpr size_t kLength = 16;

  uint32_t length = 0;
  uint16_t message_type = 0;
  uint16_t flags = 0;
  uint32_t sequence = 0;
  uint32_t port_id = 0;

  // Parses the envelope at the front of |bytes|. Fails with kHeaderTooShort
  // if fewer than kLength bytes are available or if the declared length is
  // smaller than the envelope itself.
  static Result<NetlinkHeader> Parse(ByteView bytes);

  // Writes the envelope into the first kLength bytes of |out|.
  void Emit(base::span<uint8_t> out) const;

  std::string ToString() const;

  bool operator==(const NetlinkHeader& rhs) const = default;
};

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_NETLINK_HEADER_H_
