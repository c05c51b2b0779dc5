// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/byte_view.h"

#include <string.h>

#include <base/strings/stringprintf.h>
#include <base/sys_byteorder.h>
#include <base/types/expected_macros.h>

namespace netlink_route {

namespace {

Error OutOfRange(size_t offset, size_t length, size_t size) {
  return Error(ErrorCode::kBufferTooShort,
               base::StringPrintf("read of %zu bytes at offset %zu exceeds "
                                  "%zu available bytes",
                                  length, offset, size));
}

}  // namespace

ByteView::ByteView(base::span<const uint8_t> data) : data_(data) {}

bool ByteView::Contains(size_t offset, size_t length) const {
  return offset <= data_.size() && length <= data_.size() - offset;
}

Result<ByteView> ByteView::Slice(size_t offset, size_t length) const {
  if (!Contains(offset, length)) {
    return base::unexpected(OutOfRange(offset, length, data_.size()));
  }
  return ByteView(data_.subspan(offset, length));
}

Result<ByteView> ByteView::SliceFrom(size_t offset) const {
  if (offset > data_.size()) {
    return base::unexpected(OutOfRange(offset, 0, data_.size()));
  }
  return ByteView(data_.subspan(offset));
}

ByteView ByteView::Truncate(size_t length) const {
  if (length >= data_.size()) {
    return *this;
  }
  return ByteView(data_.first(length));
}

template <typename T>
Result<T> ByteView::ReadRaw(size_t offset) const {
  if (!Contains(offset, sizeof(T))) {
    return base::unexpected(OutOfRange(offset, sizeof(T), data_.size()));
  }
  T val;
  memcpy(&val, data_.data() + offset, sizeof(T));
  return val;
}

Result<uint8_t> ByteView::ReadU8(size_t offset) const {
  return ReadRaw<uint8_t>(offset);
}

Result<uint16_t> ByteView::ReadU16(size_t offset) const {
  ASSIGN_OR_RETURN(const uint16_t raw, ReadRaw<uint16_t>(offset));
  return base::ByteSwapToLE16(raw);
}

Result<uint32_t> ByteView::ReadU32(size_t offset) const {
  ASSIGN_OR_RETURN(const uint32_t raw, ReadRaw<uint32_t>(offset));
  return base::ByteSwapToLE32(raw);
}

Result<int32_t> ByteView::ReadI32(size_t offset) const {
  ASSIGN_OR_RETURN(const uint32_t val, ReadU32(offset));
  return static_cast<int32_t>(val);
}

Result<uint64_t> ByteView::ReadU64(size_t offset) const {
  ASSIGN_OR_RETURN(const uint64_t raw, ReadRaw<uint64_t>(offset));
  return base::ByteSwapToLE64(raw);
}

Result<uint16_t> ByteView::ReadU16BigEndian(size_t offset) const {
  ASSIGN_OR_RETURN(const uint16_t raw, ReadRaw<uint16_t>(offset));
  return base::NetToHost16(raw);
}

Result<uint32_t> ByteView::ReadU32BigEndian(size_t offset) const {
  ASSIGN_OR_RETURN(const uint32_t raw, ReadRaw<uint32_t>(offset));
  return base::NetToHost32(raw);
}

Result<uint64_t> ByteView::ReadU64BigEndian(size_t offset) const {
  ASSIGN_OR_RETURN(const uint64_t raw, ReadRaw<uint64_t>(offset));
  return base::NetToHost64(raw);
}

std::vector<uint8_t> ByteView::ToBytes() const {
  return {data_.begin(), data_.end()};
}

}  // namespace netlink_route
