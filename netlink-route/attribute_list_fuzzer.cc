// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <vector>

#include <base/check.h>
#include <base/logging.h>
#include <fuzzer/FuzzedDataProvider.h>

#include "netlink-route/attribute_catalog.h"
#include "netlink-route/attribute_list.h"
#include "netlink-route/rtnl_catalogs.h"

namespace netlink_route {

class Environment {
 public:
  Environment() { logging::SetMinLogLevel(logging::LOGGING_FATAL); }
};

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  static Environment env;

  FuzzedDataProvider provider(data, size);
  const int log_level = provider.ConsumeIntegralInRange<int>(0, 8);
  const int indent = provider.ConsumeIntegralInRange<int>(0, 1024);
  const bool use_link_catalog = provider.ConsumeBool();
  const std::vector<uint8_t> payload =
      provider.ConsumeRemainingBytes<uint8_t>();

  const AttributeCatalog& catalog =
      use_link_catalog ? LinkAttributeCatalog()
                       : OpaqueAttributeCatalog::GetInstance();
  const Result<AttributeList> attributes =
      AttributeList::Decode(ByteView(payload), catalog);
  if (!attributes.has_value()) {
    return 0;
  }

  const Result<std::vector<uint8_t>> encoded = attributes->Encode();
  CHECK(encoded.has_value());
  attributes->Print(log_level, indent);
  CHECK(!attributes->ToString().empty());

  return 0;
}

}  // namespace netlink_route
