// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_BYTE_VIEW_H_
#define NETLINK_ROUTE_BYTE_VIEW_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include <base/containers/span.h>

#include "netlink-route/error.h"
#include "netlink-route/export.h"

namespace netlink_route {

// A read-only, bounds-checked window over bytes owned by somebody else. Every
// accessor verifies |offset + length <= size()| before touching memory and
// returns kBufferTooShort otherwise, so a ByteView built from an untrusted
// buffer can be handed to any parser.
//
// Multi-byte reads are little-endian, which is the byte order the kernel uses
// for netlink on the hosts we run on. The BigEndian variants are only meant
// for attribute payloads flagged with NLA_F_NET_BYTEORDER or defined by the
// kernel as network order.
//
// A ByteView never owns its data; it must not outlive the buffer it was
// created from.
class NETLINK_ROUTE_EXPORT ByteView {
 public:
  constexpr ByteView() = default;
  explicit ByteView(base::span<const uint8_t> data);
  ByteView(const ByteView&) = default;
  ByteView& operator=(const ByteView&) = default;

  size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }
  base::span<const uint8_t> span() const { return data_; }

  // Returns true if |length| bytes starting at |offset| are in range. Never
  // overflows, whatever the arguments.
  bool Contains(size_t offset, size_t length) const;

  // Returns the sub-view [offset, offset + length).
  Result<ByteView> Slice(size_t offset, size_t length) const;
  // Returns the sub-view [offset, size()).
  Result<ByteView> SliceFrom(size_t offset) const;
  // Returns the first min(length, size()) bytes. Never fails.
  ByteView Truncate(size_t length) const;

  Result<uint8_t> ReadU8(size_t offset) const;
  Result<uint16_t> ReadU16(size_t offset) const;
  Result<uint32_t> ReadU32(size_t offset) const;
  Result<int32_t> ReadI32(size_t offset) const;
  Result<uint64_t> ReadU64(size_t offset) const;

  Result<uint16_t> ReadU16BigEndian(size_t offset) const;
  Result<uint32_t> ReadU32BigEndian(size_t offset) const;
  Result<uint64_t> ReadU64BigEndian(size_t offset) const;

  // Copies the viewed bytes out. Decoded values hold these copies so nothing
  // keeps pointing into the caller's buffer after decode returns.
  std::vector<uint8_t> ToBytes() const;

 private:
  // Copies sizeof(T) bytes at |offset| into a T without any byte swapping.
  template <typename T>
  Result<T> ReadRaw(size_t offset) const;

  base::span<const uint8_t> data_;
};

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_BYTE_VIEW_H_
