// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_ERROR_H_
#define NETLINK_ROUTE_ERROR_H_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <base/types/expected.h>

#include "netlink-route/export.h"

namespace netlink_route {

// The kinds of failure the codec reports. Decode failures are always caused
// by the bytes being structurally invalid; an unrecognized message type or
// attribute type code is never an error.
enum class ErrorCode {
  // A read went past the end of the available bytes.
  kBufferTooShort,
  // Fewer than 16 bytes for the netlink message header, or a header whose
  // declared length is smaller than the header itself.
  kHeaderTooShort,
  // Not enough bytes left for the fixed header of the message family.
  kFamilyHeaderTooShort,
  // An attribute record declares a length below 4 or beyond its region.
  kTlvMalformed,
  // A recognized attribute type code carries a payload of the wrong shape.
  kAttributeDecodeFailed,
  // Nested attribute sets are deeper than the configured limit.
  kNestingTooDeep,
  // Encoding: an attribute payload does not fit the 16-bit length field.
  kAttributeTooLong,
  // Encoding: a message does not fit the 32-bit length field.
  kMessageTooLong,
  // Encoding: an attribute wrote a different number of bytes than it
  // announced.
  kEncodeLengthMismatch,
  // Encoding: the message kind cannot be serialized.
  kUnsupportedMessage,
};

NETLINK_ROUTE_EXPORT std::string_view ToString(ErrorCode code);
NETLINK_ROUTE_EXPORT std::ostream& operator<<(std::ostream& os,
                                              ErrorCode code);

class NETLINK_ROUTE_EXPORT Error {
 public:
  Error(ErrorCode code, std::string reason);
  Error(ErrorCode code, uint16_t type_code, std::string reason);

  // Shorthand for a recognized attribute whose payload failed its check.
  static Error AttributeDecodeFailed(uint16_t type_code, std::string reason);

  ErrorCode code() const { return code_; }
  // The attribute type code the error refers to, if any.
  std::optional<uint16_t> type_code() const { return type_code_; }
  const std::string& reason() const { return reason_; }

  std::string ToString() const;

  bool operator==(const Error& rhs) const = default;

 private:
  ErrorCode code_;
  std::optional<uint16_t> type_code_;
  std::string reason_;
};

NETLINK_ROUTE_EXPORT std::ostream& operator<<(std::ostream& os,
                                              const Error& error);

// Every fallible codec operation returns a Result.
template <typename T>
using Result = base::expected<T, Error>;

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_ERROR_H_
