// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/netlink_attribute.h"

#include <arpa/inet.h>
#include <sys/socket.h>

#include <algorithm>
#include <utility>

#include <base/logging.h>
#include <base/memory/ptr_util.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/stringprintf.h>

#include "netlink-route/attribute_iterator.h"
#include "netlink-route/attribute_list.h"

namespace netlink_route {

namespace {

std::string FormatHex(const std::vector<uint8_t>& bytes) {
  return base::StringPrintf(
      "<%zu bytes: %s>", bytes.size(),
      base::HexEncode(bytes.data(), bytes.size()).c_str());
}

std::string FormatIPAddress(const std::vector<uint8_t>& bytes) {
  char buf[INET6_ADDRSTRLEN] = {};
  int family;
  if (bytes.size() == 4) {
    family = AF_INET;
  } else if (bytes.size() == 16) {
    family = AF_INET6;
  } else {
    return FormatHex(bytes);
  }
  if (inet_ntop(family, bytes.data(), buf, sizeof(buf)) == nullptr) {
    return FormatHex(bytes);
  }
  return buf;
}

std::string FormatLinkAddress(const std::vector<uint8_t>& bytes) {
  std::string output;
  for (size_t i = 0; i < bytes.size(); ++i) {
    base::StringAppendF(&output, i == 0 ? "%02x" : ":%02x", bytes[i]);
  }
  return output;
}

}  // namespace

NetlinkAttribute::NetlinkAttribute(Type datatype,
                                   uint16_t type_code,
                                   std::string_view name)
    : datatype_(datatype),
      type_code_(static_cast<uint16_t>(type_code & AttributeRecord::kTypeMask)),
      name_(name) {
  if (type_code != type_code_) {
    LOG(ERROR) << "Attribute type code " << type_code
               << " has flag bits set, using " << type_code_;
  }
}

NetlinkAttribute::~NetlinkAttribute() = default;

void NetlinkAttribute::set_flags(uint16_t flags) {
  flags_ = flags & AttributeRecord::kFlagsMask;
}

bool NetlinkAttribute::is_nested() const {
  return (flags_ & AttributeRecord::kNestedFlag) != 0;
}

bool NetlinkAttribute::is_network_byte_order() const {
  return (flags_ & AttributeRecord::kNetworkByteOrderFlag) != 0;
}

std::string NetlinkAttribute::ToString() const {
  std::string output;
  if (name_.empty()) {
    output = base::StringPrintf("attr%u", type_code_);
  } else {
    output = base::StringPrintf("%s(%u)", std::string(name_).c_str(),
                                type_code_);
  }
  output += "=" + ValueToString();
  return output;
}

std::vector<uint8_t> NetlinkAttribute::EncodePayload() const {
  std::vector<uint8_t> bytes(EncodedLength(), 0);
  const size_t written = Emit(bytes);
  if (written != bytes.size()) {
    LOG(ERROR) << ToString() << " wrote " << written << " bytes instead of "
               << bytes.size();
    bytes.resize(std::min(written, bytes.size()));
  }
  return bytes;
}

bool NetlinkAttribute::Equals(const NetlinkAttribute& other) const {
  return datatype_ == other.datatype_ && type_code_ == other.type_code_ &&
         flags_ == other.flags_ && ValueEquals(other);
}

bool NetlinkAttribute::ValueEquals(const NetlinkAttribute& other) const {
  return EncodePayload() == other.EncodePayload();
}

// static
std::string_view NetlinkAttribute::TypeToString(Type type) {
  switch (type) {
    case Type::kU8:
      return "u8";
    case Type::kU16:
      return "u16";
    case Type::kU32:
      return "u32";
    case Type::kS32:
      return "s32";
    case Type::kU64:
      return "u64";
    case Type::kFlag:
      return "flag";
    case Type::kString:
      return "string";
    case Type::kBinary:
      return "binary";
    case Type::kNested:
      return "nested";
    case Type::kUnknown:
      return "unknown";
  }
}

// NetlinkU8Attribute

NetlinkU8Attribute::NetlinkU8Attribute(uint16_t type_code,
                                       uint8_t value,
                                       std::string_view name)
    : NetlinkAttribute(Type::kU8, type_code, name), value_(value) {}

size_t NetlinkU8Attribute::EncodedLength() const {
  return sizeof(value_);
}

size_t NetlinkU8Attribute::Emit(base::span<uint8_t> out) const {
  out[0] = value_;
  return sizeof(value_);
}

std::unique_ptr<NetlinkAttribute> NetlinkU8Attribute::Clone() const {
  auto clone =
      std::make_unique<NetlinkU8Attribute>(type_code(), value_, name());
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkU8Attribute::ValueToString() const {
  return base::NumberToString(value_);
}

// NetlinkU16Attribute

NetlinkU16Attribute::NetlinkU16Attribute(uint16_t type_code,
                                         uint16_t value,
                                         std::string_view name,
                                         byte_utils::ByteOrder order)
    : NetlinkAttribute(Type::kU16, type_code, name),
      value_(value),
      order_(order) {}

size_t NetlinkU16Attribute::EncodedLength() const {
  return sizeof(value_);
}

size_t NetlinkU16Attribute::Emit(base::span<uint8_t> out) const {
  byte_utils::WriteU16(out, value_, order_);
  return sizeof(value_);
}

std::unique_ptr<NetlinkAttribute> NetlinkU16Attribute::Clone() const {
  auto clone = std::make_unique<NetlinkU16Attribute>(type_code(), value_,
                                                     name(), order_);
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkU16Attribute::ValueToString() const {
  return base::NumberToString(value_);
}

bool NetlinkU16Attribute::ValueEquals(const NetlinkAttribute& other) const {
  const auto& that = static_cast<const NetlinkU16Attribute&>(other);
  return value_ == that.value_ && order_ == that.order_;
}

// NetlinkU32Attribute

NetlinkU32Attribute::NetlinkU32Attribute(uint16_t type_code,
                                         uint32_t value,
                                         std::string_view name,
                                         byte_utils::ByteOrder order)
    : NetlinkAttribute(Type::kU32, type_code, name),
      value_(value),
      order_(order) {}

size_t NetlinkU32Attribute::EncodedLength() const {
  return sizeof(value_);
}

size_t NetlinkU32Attribute::Emit(base::span<uint8_t> out) const {
  byte_utils::WriteU32(out, value_, order_);
  return sizeof(value_);
}

std::unique_ptr<NetlinkAttribute> NetlinkU32Attribute::Clone() const {
  auto clone = std::make_unique<NetlinkU32Attribute>(type_code(), value_,
                                                     name(), order_);
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkU32Attribute::ValueToString() const {
  return base::NumberToString(value_);
}

bool NetlinkU32Attribute::ValueEquals(const NetlinkAttribute& other) const {
  const auto& that = static_cast<const NetlinkU32Attribute&>(other);
  return value_ == that.value_ && order_ == that.order_;
}

// NetlinkS32Attribute

NetlinkS32Attribute::NetlinkS32Attribute(uint16_t type_code,
                                         int32_t value,
                                         std::string_view name)
    : NetlinkAttribute(Type::kS32, type_code, name), value_(value) {}

size_t NetlinkS32Attribute::EncodedLength() const {
  return sizeof(value_);
}

size_t NetlinkS32Attribute::Emit(base::span<uint8_t> out) const {
  byte_utils::WriteU32(out, static_cast<uint32_t>(value_));
  return sizeof(value_);
}

std::unique_ptr<NetlinkAttribute> NetlinkS32Attribute::Clone() const {
  auto clone =
      std::make_unique<NetlinkS32Attribute>(type_code(), value_, name());
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkS32Attribute::ValueToString() const {
  return base::NumberToString(value_);
}

// NetlinkU64Attribute

NetlinkU64Attribute::NetlinkU64Attribute(uint16_t type_code,
                                         uint64_t value,
                                         std::string_view name,
                                         byte_utils::ByteOrder order)
    : NetlinkAttribute(Type::kU64, type_code, name),
      value_(value),
      order_(order) {}

size_t NetlinkU64Attribute::EncodedLength() const {
  return sizeof(value_);
}

size_t NetlinkU64Attribute::Emit(base::span<uint8_t> out) const {
  byte_utils::WriteU64(out, value_, order_);
  return sizeof(value_);
}

std::unique_ptr<NetlinkAttribute> NetlinkU64Attribute::Clone() const {
  auto clone = std::make_unique<NetlinkU64Attribute>(type_code(), value_,
                                                     name(), order_);
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkU64Attribute::ValueToString() const {
  return base::NumberToString(value_);
}

bool NetlinkU64Attribute::ValueEquals(const NetlinkAttribute& other) const {
  const auto& that = static_cast<const NetlinkU64Attribute&>(other);
  return value_ == that.value_ && order_ == that.order_;
}

// NetlinkFlagAttribute

NetlinkFlagAttribute::NetlinkFlagAttribute(uint16_t type_code,
                                           std::string_view name)
    : NetlinkAttribute(Type::kFlag, type_code, name) {}

size_t NetlinkFlagAttribute::EncodedLength() const {
  return 0;
}

size_t NetlinkFlagAttribute::Emit(base::span<uint8_t> out) const {
  return 0;
}

std::unique_ptr<NetlinkAttribute> NetlinkFlagAttribute::Clone() const {
  auto clone = std::make_unique<NetlinkFlagAttribute>(type_code(), name());
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkFlagAttribute::ValueToString() const {
  return "true";
}

// NetlinkStringAttribute

NetlinkStringAttribute::NetlinkStringAttribute(uint16_t type_code,
                                               std::string value,
                                               std::string_view name)
    : NetlinkStringAttribute(
          type_code, std::move(value), std::vector<uint8_t>{0}, name) {
  // Text past a null character could not be decoded back.
  const size_t nul = value_.find('\0');
  if (nul != std::string::npos) {
    value_.resize(nul);
  }
}

NetlinkStringAttribute::NetlinkStringAttribute(uint16_t type_code,
                                               std::string value,
                                               std::vector<uint8_t> terminator,
                                               std::string_view name)
    : NetlinkAttribute(Type::kString, type_code, name),
      value_(std::move(value)),
      terminator_(std::move(terminator)) {}

// static
std::unique_ptr<NetlinkStringAttribute> NetlinkStringAttribute::FromPayload(
    uint16_t type_code,
    base::span<const uint8_t> payload,
    std::string_view name) {
  std::string value = byte_utils::StringFromCStringBytes(payload);
  const base::span<const uint8_t> terminator = payload.subspan(value.size());
  // The private constructor is out of reach of std::make_unique.
  return base::WrapUnique(new NetlinkStringAttribute(
      type_code, std::move(value),
      std::vector<uint8_t>(terminator.begin(), terminator.end()), name));
}

size_t NetlinkStringAttribute::EncodedLength() const {
  return value_.size() + terminator_.size();
}

size_t NetlinkStringAttribute::Emit(base::span<uint8_t> out) const {
  base::span<uint8_t> dst = out.first(EncodedLength());
  auto it = std::copy(value_.begin(), value_.end(), dst.begin());
  std::copy(terminator_.begin(), terminator_.end(), it);
  return dst.size();
}

std::unique_ptr<NetlinkAttribute> NetlinkStringAttribute::Clone() const {
  auto clone = base::WrapUnique(
      new NetlinkStringAttribute(type_code(), value_, terminator_, name()));
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkStringAttribute::ValueToString() const {
  return "\"" + value_ + "\"";
}

// NetlinkBinaryAttribute

NetlinkBinaryAttribute::NetlinkBinaryAttribute(uint16_t type_code,
                                               std::vector<uint8_t> value,
                                               std::string_view name,
                                               Format format)
    : NetlinkAttribute(Type::kBinary, type_code, name),
      value_(std::move(value)),
      format_(format) {}

size_t NetlinkBinaryAttribute::EncodedLength() const {
  return value_.size();
}

size_t NetlinkBinaryAttribute::Emit(base::span<uint8_t> out) const {
  base::span<uint8_t> dst = out.first(value_.size());
  std::copy(value_.begin(), value_.end(), dst.begin());
  return value_.size();
}

std::unique_ptr<NetlinkAttribute> NetlinkBinaryAttribute::Clone() const {
  auto clone = std::make_unique<NetlinkBinaryAttribute>(type_code(), value_,
                                                        name(), format_);
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkBinaryAttribute::ValueToString() const {
  switch (format_) {
    case Format::kIPAddress:
      return FormatIPAddress(value_);
    case Format::kLinkAddress:
      return FormatLinkAddress(value_);
    case Format::kHex:
      break;
  }
  return FormatHex(value_);
}

// NetlinkNestedAttribute

NetlinkNestedAttribute::NetlinkNestedAttribute(uint16_t type_code,
                                               AttributeList value,
                                               std::string_view name)
    : NetlinkAttribute(Type::kNested, type_code, name),
      value_(std::make_unique<AttributeList>(std::move(value))) {
  set_flags(AttributeRecord::kNestedFlag);
}

NetlinkNestedAttribute::~NetlinkNestedAttribute() = default;

size_t NetlinkNestedAttribute::EncodedLength() const {
  return value_->EncodedLength();
}

size_t NetlinkNestedAttribute::Emit(base::span<uint8_t> out) const {
  return value_->Emit(out);
}

std::unique_ptr<NetlinkAttribute> NetlinkNestedAttribute::Clone() const {
  auto clone =
      std::make_unique<NetlinkNestedAttribute>(type_code(), *value_, name());
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkNestedAttribute::ValueToString() const {
  return value_->ToString();
}

// NetlinkUnknownAttribute

NetlinkUnknownAttribute::NetlinkUnknownAttribute(uint16_t type_code,
                                                 std::vector<uint8_t> value)
    : NetlinkAttribute(Type::kUnknown, type_code, {}),
      value_(std::move(value)) {}

size_t NetlinkUnknownAttribute::EncodedLength() const {
  return value_.size();
}

size_t NetlinkUnknownAttribute::Emit(base::span<uint8_t> out) const {
  base::span<uint8_t> dst = out.first(value_.size());
  std::copy(value_.begin(), value_.end(), dst.begin());
  return value_.size();
}

std::unique_ptr<NetlinkAttribute> NetlinkUnknownAttribute::Clone() const {
  auto clone = std::make_unique<NetlinkUnknownAttribute>(type_code(), value_);
  clone->set_flags(flags());
  return clone;
}

std::string NetlinkUnknownAttribute::ValueToString() const {
  return FormatHex(value_);
}

}  // namespace netlink_route
