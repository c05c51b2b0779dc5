// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_ATTRIBUTE_ITERATOR_H_
#define NETLINK_ROUTE_ATTRIBUTE_ITERATOR_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "netlink-route/byte_view.h"
#include "netlink-route/error.h"
#include "netlink-route/export.h"

namespace netlink_route {

// One type-length-value record (struct nlattr) as found on the wire:
//
//   +---------------+---------------+-+-+---------------------------+
//   |          length (u16)         |N|O|      type code (14 bits)  |
//   +---------------+---------------+-+-+---------------------------+
//   |                payload (length - 4 bytes) ...                 |
//   +---------------------------------------------------------------+
//   |    0-3 bytes of padding up to the next 4-byte boundary        |
//
// N is NLA_F_NESTED and O is NLA_F_NET_BYTEORDER. They are split off the type
// field before any dispatch on the type code.
struct NETLINK_ROUTE_EXPORT AttributeRecord {
  static constexpr size_t kHeaderLength = 4;
  static constexpr uint16_t kNestedFlag = 1 << 15;
  static constexpr uint16_t kNetworkByteOrderFlag = 1 << 14;
  static constexpr uint16_t kFlagsMask =
      kNestedFlag | kNetworkByteOrderFlag;
  static constexpr uint16_t kTypeMask = static_cast<uint16_t>(~kFlagsMask);

  // Splits a raw 16-bit type field.
  static AttributeRecord FromTypeField(uint16_t type_field);

  // Returns the flag bits in their wire position.
  uint16_t flags() const;

  // Declared length including the 4-byte header.
  uint16_t length = 0;
  uint16_t type_code = 0;
  bool is_nested = false;
  bool is_network_byte_order = false;
  // Exactly |length - 4| bytes; padding is excluded.
  ByteView payload;
  // Position of the record header inside the region being iterated.
  size_t offset = 0;
};

// Walks a byte region as a sequence of attribute records.
//
// From Positioned(o): if fewer than 4 bytes remain the iterator becomes
// Exhausted, which is the normal end. A runt of 1-3 bytes is ignored.
// Otherwise the header is read; a declared length below 4 or a record that
// does not fit in the region moves the iterator to Failed with
// kTlvMalformed. A valid record is returned and the iterator moves to
// Positioned(o + align4(length)).
// The padding of the last record may be cut off by the end of the region.
//
// Failed and Exhausted are terminal. The iterator never reads outside the
// region it was given.
class NETLINK_ROUTE_EXPORT AttributeIterator {
 public:
  enum class State {
    kPositioned,
    kExhausted,
    kFailed,
  };

  explicit AttributeIterator(ByteView region);
  AttributeIterator(const AttributeIterator&) = default;
  AttributeIterator& operator=(const AttributeIterator&) = default;

  // Returns the next record, or std::nullopt once the iterator is Exhausted
  // or Failed. Check state() or error() to tell the two apart.
  std::optional<AttributeRecord> Next();

  State state() const { return state_; }
  size_t offset() const { return offset_; }
  // Set once the iterator is Failed.
  const std::optional<Error>& error() const { return error_; }

 private:
  void Fail(std::string reason);

  ByteView region_;
  size_t offset_ = 0;
  State state_ = State::kPositioned;
  std::optional<Error> error_;
};

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_ATTRIBUTE_ITERATOR_H_
