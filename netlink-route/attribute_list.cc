// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/attribute_list.h"

#include <limits>
#include <utility>

#include <base/logging.h>
#include <base/strings/stringprintf.h>
#include <base/types/expected_macros.h>

#include "netlink-route/attribute_iterator.h"
#include "netlink-route/byte_utils.h"
#include "netlink-route/netlink_header.h"

namespace netlink_route {

namespace {

constexpr size_t kMaxPayloadLength =
    std::numeric_limits<uint16_t>::max() - AttributeRecord::kHeaderLength;

}  // namespace

AttributeList::AttributeList() = default;

AttributeList::AttributeList(const AttributeList& other) {
  *this = other;
}

AttributeList& AttributeList::operator=(const AttributeList& other) {
  if (this == &other) {
    return *this;
  }
  attributes_.clear();
  attributes_.reserve(other.attributes_.size());
  for (const auto& attribute : other.attributes_) {
    attributes_.push_back(attribute->Clone());
  }
  return *this;
}

AttributeList::AttributeList(AttributeList&& other) = default;
AttributeList& AttributeList::operator=(AttributeList&& other) = default;
AttributeList::~AttributeList() = default;

// static
Result<AttributeList> AttributeList::Decode(ByteView region,
                                            const AttributeCatalog& catalog,
                                            const DecodeContext& context) {
  if (context.depth > context.max_depth) {
    return base::unexpected(Error(
        ErrorCode::kNestingTooDeep,
        base::StringPrintf("%s: nesting deeper than %d levels",
                           std::string(catalog.name()).c_str(),
                           context.max_depth)));
  }

  AttributeList list;
  AttributeIterator it(region);
  while (std::optional<AttributeRecord> record = it.Next()) {
    ASSIGN_OR_RETURN(std::unique_ptr<NetlinkAttribute> attribute,
                     catalog.Decode(*record, context));
    list.attributes_.push_back(std::move(attribute));
  }
  if (it.state() == AttributeIterator::State::kFailed) {
    VLOG(2) << catalog.name() << ": " << *it.error();
    return base::unexpected(*it.error());
  }
  return list;
}

// static
bool AttributeList::IterateAttributes(base::span<const uint8_t> payload,
                                      size_t offset,
                                      const AttributeMethod& method) {
  if (offset > payload.size()) {
    return false;
  }
  AttributeIterator it(ByteView(payload.subspan(offset)));
  while (std::optional<AttributeRecord> record = it.Next()) {
    if (!method.Run(record->type_code, record->payload.span())) {
      return false;
    }
  }
  return it.state() != AttributeIterator::State::kFailed;
}

Result<void> AttributeList::Validate() const {
  for (const auto& attribute : attributes_) {
    const size_t length = attribute->EncodedLength();
    if (length > kMaxPayloadLength) {
      return base::unexpected(Error(
          ErrorCode::kAttributeTooLong, attribute->type_code(),
          base::StringPrintf("payload of %zu bytes exceeds %zu", length,
                             kMaxPayloadLength)));
    }
    if (const AttributeList* nested = attribute->nested_value()) {
      RETURN_IF_ERROR(nested->Validate());
    }
  }
  return base::ok();
}

size_t AttributeList::EncodedLength() const {
  size_t length = 0;
  for (const auto& attribute : attributes_) {
    length += NetlinkAlign(AttributeRecord::kHeaderLength +
                           attribute->EncodedLength());
  }
  return length;
}

size_t AttributeList::Emit(base::span<uint8_t> out) const {
  size_t offset = 0;
  for (const auto& attribute : attributes_) {
    const size_t payload_length = attribute->EncodedLength();
    const size_t record_length =
        AttributeRecord::kHeaderLength + payload_length;
    base::span<uint8_t> record =
        out.subspan(offset, NetlinkAlign(record_length));

    byte_utils::WriteU16(record, static_cast<uint16_t>(record_length));
    byte_utils::WriteU16(
        record.subspan(2),
        static_cast<uint16_t>(attribute->type_code() | attribute->flags()));

    base::span<uint8_t> payload =
        record.subspan(AttributeRecord::kHeaderLength, payload_length);
    const size_t written = attribute->Emit(payload);
    if (written != payload_length) {
      LOG(ERROR) << attribute->ToString() << " announced " << payload_length
                 << " bytes but wrote " << written;
      return offset;
    }
    for (size_t i = record_length; i < record.size(); ++i) {
      record[i] = 0;
    }
    offset += record.size();
  }
  return offset;
}

Result<std::vector<uint8_t>> AttributeList::Encode() const {
  RETURN_IF_ERROR(Validate());
  std::vector<uint8_t> bytes(EncodedLength(), 0);
  const size_t written = Emit(bytes);
  if (written != bytes.size()) {
    return base::unexpected(
        Error(ErrorCode::kEncodeLengthMismatch,
              base::StringPrintf("wrote %zu of %zu bytes", written,
                                 bytes.size())));
  }
  return bytes;
}

void AttributeList::Append(std::unique_ptr<NetlinkAttribute> attribute) {
  attributes_.push_back(std::move(attribute));
}

const NetlinkAttribute* AttributeList::Find(uint16_t type_code) const {
  for (const auto& attribute : attributes_) {
    if (attribute->type_code() == type_code) {
      return attribute.get();
    }
  }
  return nullptr;
}

bool AttributeList::HasAttribute(uint16_t type_code) const {
  return Find(type_code) != nullptr;
}

std::optional<uint8_t> AttributeList::GetU8(uint16_t type_code) const {
  const NetlinkAttribute* attribute = Find(type_code);
  if (!attribute || attribute->datatype() != NetlinkAttribute::Type::kU8) {
    return std::nullopt;
  }
  return static_cast<const NetlinkU8Attribute*>(attribute)->value();
}

std::optional<uint16_t> AttributeList::GetU16(uint16_t type_code) const {
  const NetlinkAttribute* attribute = Find(type_code);
  if (!attribute || attribute->datatype() != NetlinkAttribute::Type::kU16) {
    return std::nullopt;
  }
  return static_cast<const NetlinkU16Attribute*>(attribute)->value();
}

std::optional<uint32_t> AttributeList::GetU32(uint16_t type_code) const {
  const NetlinkAttribute* attribute = Find(type_code);
  if (!attribute || attribute->datatype() != NetlinkAttribute::Type::kU32) {
    return std::nullopt;
  }
  return static_cast<const NetlinkU32Attribute*>(attribute)->value();
}

std::optional<int32_t> AttributeList::GetS32(uint16_t type_code) const {
  const NetlinkAttribute* attribute = Find(type_code);
  if (!attribute || attribute->datatype() != NetlinkAttribute::Type::kS32) {
    return std::nullopt;
  }
  return static_cast<const NetlinkS32Attribute*>(attribute)->value();
}

std::optional<uint64_t> AttributeList::GetU64(uint16_t type_code) const {
  const NetlinkAttribute* attribute = Find(type_code);
  if (!attribute || attribute->datatype() != NetlinkAttribute::Type::kU64) {
    return std::nullopt;
  }
  return static_cast<const NetlinkU64Attribute*>(attribute)->value();
}

std::optional<std::string> AttributeList::GetString(uint16_t type_code) const {
  const NetlinkAttribute* attribute = Find(type_code);
  if (!attribute || attribute->datatype() != NetlinkAttribute::Type::kString) {
    return std::nullopt;
  }
  return static_cast<const NetlinkStringAttribute*>(attribute)->value();
}

std::optional<std::vector<uint8_t>> AttributeList::GetBytes(
    uint16_t type_code) const {
  const NetlinkAttribute* attribute = Find(type_code);
  if (!attribute) {
    return std::nullopt;
  }
  switch (attribute->datatype()) {
    case NetlinkAttribute::Type::kBinary:
      return static_cast<const NetlinkBinaryAttribute*>(attribute)->value();
    case NetlinkAttribute::Type::kUnknown:
      return static_cast<const NetlinkUnknownAttribute*>(attribute)->value();
    default:
      return std::nullopt;
  }
}

const AttributeList* AttributeList::GetNested(uint16_t type_code) const {
  const NetlinkAttribute* attribute = Find(type_code);
  return attribute ? attribute->nested_value() : nullptr;
}

std::string AttributeList::ToString() const {
  std::string output = "{";
  for (size_t i = 0; i < attributes_.size(); ++i) {
    if (i > 0) {
      output += ", ";
    }
    output += attributes_[i]->ToString();
  }
  output += "}";
  return output;
}

void AttributeList::Print(int log_level, int indent) const {
  const std::string prefix(indent, ' ');
  for (const auto& attribute : attributes_) {
    if (const AttributeList* nested = attribute->nested_value()) {
      VLOG(log_level) << prefix << attribute->name() << "("
                      << attribute->type_code() << "):";
      nested->Print(log_level, indent + 2);
      continue;
    }
    VLOG(log_level) << prefix << attribute->ToString();
  }
}

bool AttributeList::operator==(const AttributeList& rhs) const {
  if (attributes_.size() != rhs.attributes_.size()) {
    return false;
  }
  for (size_t i = 0; i < attributes_.size(); ++i) {
    if (!attributes_[i]->Equals(*rhs.attributes_[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace netlink_route
