// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/error.h"

#include <utility>

#include <base/strings/stringprintf.h>

namespace netlink_route {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kBufferTooShort:
      return "BufferTooShort";
    case ErrorCode::kHeaderTooShort:
      return "HeaderTooShort";
    case ErrorCode::kFamilyHeaderTooShort:
      return "FamilyHeaderTooShort";
    case ErrorCode::kTlvMalformed:
      return "TlvMalformed";
    case ErrorCode::kAttributeDecodeFailed:
      return "AttributeDecodeFailed";
    case ErrorCode::kNestingTooDeep:
      return "NestingTooDeep";
    case ErrorCode::kAttributeTooLong:
      return "AttributeTooLong";
    case ErrorCode::kMessageTooLong:
      return "MessageTooLong";
    case ErrorCode::kEncodeLengthMismatch:
      return "EncodeLengthMismatch";
    case ErrorCode::kUnsupportedMessage:
      return "UnsupportedMessage";
  }
}

std::ostream& operator<<(std::ostream& os, ErrorCode code) {
  os << ToString(code);
  return os;
}

Error::Error(ErrorCode code, std::string reason)
    : code_(code), reason_(std::move(reason)) {}

Error::Error(ErrorCode code, uint16_t type_code, std::string reason)
    : code_(code), type_code_(type_code), reason_(std::move(reason)) {}

// static
Error Error::AttributeDecodeFailed(uint16_t type_code, std::string reason) {
  return Error(ErrorCode::kAttributeDecodeFailed, type_code,
               std::move(reason));
}

std::string Error::ToString() const {
  std::string output(netlink_route::ToString(code_));
  if (type_code_.has_value()) {
    base::StringAppendF(&output, " (type %u)", *type_code_);
  }
  if (!reason_.empty()) {
    output += ": " + reason_;
  }
  return output;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
  os << error.ToString();
  return os;
}

}  // namespace netlink_route
