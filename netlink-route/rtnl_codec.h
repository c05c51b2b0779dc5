// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_RTNL_CODEC_H_
#define NETLINK_ROUTE_RTNL_CODEC_H_

#include <cstdint>
#include <map>
#include <vector>

#include <base/containers/span.h>

#include "netlink-route/attribute_catalog.h"
#include "netlink-route/error.h"
#include "netlink-route/export.h"
#include "netlink-route/rtnl_message.h"

namespace netlink_route {

// Decodes route netlink messages into RTNLMessage and encodes them back.
//
// A codec knows which message types belong to which family through an
// explicit registry, filled by the caller before use. The four netlink
// control types (noop, error, done, overrun) are always known. Any other
// message type that is not registered decodes as kTypeUnknown with its
// payload kept verbatim.
//
// Decode and Encode are const and keep no state between calls, so a
// configured codec may be shared by threads.
class NETLINK_ROUTE_EXPORT RTNLCodec {
 public:
  struct Options {
    // Nested attribute sets deeper than this fail with kNestingTooDeep.
    int max_nesting_depth = DecodeContext::kDefaultMaxDepth;
    // When false, a message whose declared length exceeds the available
    // bytes fails with kBufferTooShort. When true, it is decoded from the
    // bytes that are there.
    bool tolerate_truncation = false;
    // Accept the family-only RTM_GETLINK, RTM_GETADDR and RTM_GETROUTE
    // requests sent by iproute2, whose fixed header is cut short to 4 bytes
    // (or 1 byte for RTM_GETROUTE).
    bool accept_short_dump_requests = true;
  };

  RTNLCodec();
  explicit RTNLCodec(const Options& options);
  RTNLCodec(const RTNLCodec&) = delete;
  RTNLCodec& operator=(const RTNLCodec&) = delete;
  ~RTNLCodec();

  // Registers the message types of the route netlink families together
  // with the built-in attribute catalogs of rtnl_catalogs.h.
  void RegisterRouteFamilies();

  // Maps |message_type| to a family and mode. Returns false if the type is
  // already registered or is a control type.
  bool RegisterMessageType(uint16_t message_type,
                           RTNLMessage::Type type,
                           RTNLMessage::Mode mode);

  // Sets the catalog used for the attributes of |type| messages, replacing
  // any previous one. |catalog| must outlive the codec. Families without a
  // catalog keep all their attributes as unknown attributes.
  bool RegisterAttributeCatalog(RTNLMessage::Type type,
                                const AttributeCatalog* catalog);

  // Decodes the message at the front of |bytes|. Bytes past the declared
  // message length are ignored.
  Result<RTNLMessage> Decode(base::span<const uint8_t> bytes) const;

  // Decodes every message of a buffer holding several of them back to back,
  // each starting at the 4-byte aligned end of the previous one. A message
  // that fails to decode gets an error entry and does not affect its
  // siblings. Splitting stops at the first envelope that cannot be read.
  std::vector<Result<RTNLMessage>> DecodeAll(
      base::span<const uint8_t> bytes) const;

  // Encodes |message|. Fails with kUnsupportedMessage if its message type is
  // registered to a different family.
  Result<std::vector<uint8_t>> Encode(const RTNLMessage& message) const;

  const Options& options() const { return options_; }

 private:
  struct MessageKind {
    RTNLMessage::Type type;
    RTNLMessage::Mode mode;
  };

  // Returns the family and mode of |message_type|, kTypeUnknown if none.
  MessageKind LookupMessageType(uint16_t message_type) const;
  const AttributeCatalog& CatalogFor(RTNLMessage::Type type) const;
  bool IsShortDumpRequest(uint16_t message_type, size_t payload_length) const;

  // Fills the family header and attributes of |message| from |payload|.
  Result<void> DecodeFamilyMessage(ByteView payload,
                                   RTNLMessage* message) const;
  Result<void> DecodeControlMessage(ByteView payload,
                                    RTNLMessage* message) const;

  Options options_;
  std::map<uint16_t, MessageKind> message_types_;
  std::map<RTNLMessage::Type, const AttributeCatalog*> catalogs_;
};

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_RTNL_CODEC_H_
