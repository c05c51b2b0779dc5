// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <vector>

#include <base/at_exit.h>
#include <base/check.h>
#include <base/check_op.h>
#include <base/containers/span.h>
#include <base/logging.h>

#include "netlink-route/rtnl_codec.h"
#include "netlink-route/rtnl_message.h"

namespace netlink_route {

class RTNLCodecFuzz {
 public:
  static void Run(const uint8_t* data, size_t size) {
    base::AtExitManager exit_manager;
    base::span<const uint8_t> input(data, size);

    RTNLCodec codec;
    codec.RegisterRouteFamilies();
    for (const Result<RTNLMessage>& message : codec.DecodeAll(input)) {
      if (message.has_value()) {
        Check(codec, *message);
      }
    }
  }

 private:
  // A decoded message always encodes, and its encoding is a fixed point.
  static void Check(const RTNLCodec& codec, const RTNLMessage& msg) {
    CHECK_NE(msg.ToString(), "");

    const Result<std::vector<uint8_t>> bytes = codec.Encode(msg);
    CHECK(bytes.has_value());
    const Result<RTNLMessage> decoded = codec.Decode(*bytes);
    CHECK(decoded.has_value());
    const Result<std::vector<uint8_t>> reencoded = codec.Encode(*decoded);
    CHECK(reencoded.has_value());
    CHECK(*reencoded == *bytes);
  }
};

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  // Turn off logging.
  logging::SetMinLogLevel(logging::LOGGING_FATAL);

  RTNLCodecFuzz::Run(data, size);
  return 0;
}

}  // namespace netlink_route
