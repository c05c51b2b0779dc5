// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/attribute_iterator.h"

#include <algorithm>
#include <utility>

#include <base/logging.h>
#include <base/strings/stringprintf.h>

#include "netlink-route/netlink_header.h"

namespace netlink_route {

// static
AttributeRecord AttributeRecord::FromTypeField(uint16_t type_field) {
  AttributeRecord record;
  record.type_code = static_cast<uint16_t>(type_field & kTypeMask);
  record.is_nested = (type_field & kNestedFlag) != 0;
  record.is_network_byte_order = (type_field & kNetworkByteOrderFlag) != 0;
  return record;
}

uint16_t AttributeRecord::flags() const {
  return static_cast<uint16_t>(
      (is_nested ? kNestedFlag : 0) |
      (is_network_byte_order ? kNetworkByteOrderFlag : 0));
}

AttributeIterator::AttributeIterator(ByteView region) : region_(region) {}

std::optional<AttributeRecord> AttributeIterator::Next() {
  if (state_ != State::kPositioned) {
    return std::nullopt;
  }

  const size_t remaining = region_.size() - offset_;
  if (remaining < AttributeRecord::kHeaderLength) {
    if (remaining > 0) {
      VLOG(3) << "Ignoring " << remaining << " trailing bytes at offset "
              << offset_;
    }
    state_ = State::kExhausted;
    return std::nullopt;
  }

  // Both reads are in range: at least kHeaderLength bytes remain.
  const uint16_t length = region_.ReadU16(offset_).value();
  const uint16_t type_field = region_.ReadU16(offset_ + 2).value();

  if (length < AttributeRecord::kHeaderLength) {
    Fail(base::StringPrintf("attribute at offset %zu declares length %u",
                            offset_, length));
    return std::nullopt;
  }
  if (length > remaining) {
    Fail(base::StringPrintf(
        "attribute at offset %zu declares length %u but only %zu bytes remain",
        offset_, length, remaining));
    return std::nullopt;
  }

  AttributeRecord record = AttributeRecord::FromTypeField(type_field);
  record.length = length;
  record.offset = offset_;
  record.payload =
      region_
          .Slice(offset_ + AttributeRecord::kHeaderLength,
                 length - AttributeRecord::kHeaderLength)
          .value();

  offset_ = std::min(offset_ + NetlinkAlign(length), region_.size());
  return record;
}

void AttributeIterator::Fail(std::string reason) {
  VLOG(2) << "Malformed attribute: " << reason;
  state_ = State::kFailed;
  error_ = Error(ErrorCode::kTlvMalformed, std::move(reason));
}

}  // namespace netlink_route
