// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/netlink_header.h"

#include <linux/netlink.h>

#include <base/strings/stringprintf.h>
#include <base/types/expected_macros.h>

#include "netlink-route/byte_utils.h"

namespace netlink_route {

// static
Result<NetlinkHeader> NetlinkHeader::Parse(ByteView bytes) {
  if (bytes.size() < kLength) {
    return base::unexpected(
        Error(ErrorCode::kHeaderTooShort,
              base::StringPrintf("%zu bytes available, %zu needed",
                                 bytes.size(), kLength)));
  }

  NetlinkHeader header;
  ASSIGN_OR_RETURN(header.length, bytes.ReadU32(0));
  ASSIGN_OR_RETURN(header.message_type, bytes.ReadU16(4));
  ASSIGN_OR_RETURN(header.flags, bytes.ReadU16(6));
  ASSIGN_OR_RETURN(header.sequence, bytes.ReadU32(8));
  ASSIGN_OR_RETURN(header.port_id, bytes.ReadU32(12));

  if (header.length < kLength) {
    return base::unexpected(Error(
        ErrorCode::kHeaderTooShort,
        base::StringPrintf("declared length %u is smaller than the header",
                           header.length)));
  }
  return header;
}

void NetlinkHeader::Emit(base::span<uint8_t> out) const {
  byte_utils::WriteU32(out.subspan(0), length);
  byte_utils::WriteU16(out.subspan(4), message_type);
  byte_utils::WriteU16(out.subspan(6), flags);
  byte_utils::WriteU32(out.subspan(8), sequence);
  byte_utils::WriteU32(out.subspan(12), port_id);
}

std::string NetlinkHeader::ToString() const {
  return base::StringPrintf(
      "len %u type %u flags%s%s%s%s%s%s seq %u pid %u", length, message_type,
      (flags & NLM_F_REQUEST) ? " REQUEST" : "",
      (flags & NLM_F_MULTI) ? " MULTI" : "", (flags & NLM_F_ACK) ? " ACK" : "",
      (flags & NLM_F_ECHO) ? " ECHO" : "",
      (flags & NLM_F_DUMP_INTR) ? " BAD-SEQ" : "",
      flags == 0 ? " 0" : "", sequence, port_id);
}

}  // namespace netlink_route
