// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "netlink-route/rtnl_catalogs.h"

#include <linux/fib_rules.h>
#include <linux/gen_stats.h>
#include <linux/if_addr.h>
#include <linux/if_bridge.h>
#include <linux/if_link.h>
#include <linux/neighbour.h>
#include <linux/net_namespace.h>
#include <linux/rtnetlink.h>
#include <sys/socket.h>

#include <vector>

#include <base/no_destructor.h>

namespace netlink_route {

namespace {

using K = AttributeKind;

// The kernel structures kept as fixed-size blobs.
constexpr size_t kRtnlLinkStatsSize = 24 * sizeof(uint32_t);
constexpr size_t kCacheInfoSize = 4 * sizeof(uint32_t);
constexpr size_t kRtaCacheInfoSize = 8 * sizeof(uint32_t);
constexpr size_t kRtaMfcStatsSize = 3 * sizeof(uint64_t);
constexpr size_t kPrefixCacheInfoSize = 2 * sizeof(uint32_t);
constexpr size_t kBridgeVlanInfoSize = 2 * sizeof(uint16_t);

// The layout of IFLA_AF_SPEC follows the family of the ifinfomsg: a list
// keyed by family for AF_UNSPEC, bridge attributes for AF_BRIDGE.
const AttributeCatalog* LinkAfSpecCatalogForFamily(uint8_t family) {
  switch (family) {
    case AF_UNSPEC:
      return &LinkAfSpecAttributeCatalog();
    case AF_BRIDGE:
      return &LinkBridgeAfSpecAttributeCatalog();
    default:
      return nullptr;
  }
}

}  // namespace

const AttributeCatalog& LinkAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "link",
      std::vector<AttributeSpec>{
          {IFLA_ADDRESS, "IFLA_ADDRESS", K::kLinkAddress},
          {IFLA_BROADCAST, "IFLA_BROADCAST", K::kLinkAddress},
          {IFLA_IFNAME, "IFLA_IFNAME", K::kString},
          {IFLA_MTU, "IFLA_MTU", K::kU32},
          {IFLA_LINK, "IFLA_LINK", K::kU32},
          {IFLA_QDISC, "IFLA_QDISC", K::kString},
          {IFLA_STATS, "IFLA_STATS", K::kBinary, kRtnlLinkStatsSize},
          {IFLA_MASTER, "IFLA_MASTER", K::kU32},
          {IFLA_WIRELESS, "IFLA_WIRELESS", K::kBinary},
          {IFLA_PROTINFO, "IFLA_PROTINFO", K::kNested},
          {IFLA_TXQLEN, "IFLA_TXQLEN", K::kU32},
          {IFLA_MAP, "IFLA_MAP", K::kBinary},
          {IFLA_WEIGHT, "IFLA_WEIGHT", K::kU32},
          {IFLA_OPERSTATE, "IFLA_OPERSTATE", K::kU8},
          {IFLA_LINKMODE, "IFLA_LINKMODE", K::kU8},
          {IFLA_LINKINFO, "IFLA_LINKINFO",
           K::kNested, 0, &LinkInfoAttributeCatalog},
          {IFLA_NET_NS_PID, "IFLA_NET_NS_PID", K::kU32},
          {IFLA_IFALIAS, "IFLA_IFALIAS", K::kString},
          {IFLA_NUM_VF, "IFLA_NUM_VF", K::kU32},
          {IFLA_VFINFO_LIST, "IFLA_VFINFO_LIST", K::kNested},
          {IFLA_STATS64, "IFLA_STATS64", K::kBinary},
          {IFLA_VF_PORTS, "IFLA_VF_PORTS", K::kNested},
          {IFLA_PORT_SELF, "IFLA_PORT_SELF", K::kNested},
          {IFLA_AF_SPEC, "IFLA_AF_SPEC",
           K::kNested, 0, nullptr, &LinkAfSpecCatalogForFamily},
          {IFLA_GROUP, "IFLA_GROUP", K::kU32},
          {IFLA_NET_NS_FD, "IFLA_NET_NS_FD", K::kU32},
          {IFLA_EXT_MASK, "IFLA_EXT_MASK", K::kU32},
          {IFLA_PROMISCUITY, "IFLA_PROMISCUITY", K::kU32},
          {IFLA_NUM_TX_QUEUES, "IFLA_NUM_TX_QUEUES", K::kU32},
          {IFLA_NUM_RX_QUEUES, "IFLA_NUM_RX_QUEUES", K::kU32},
          {IFLA_CARRIER, "IFLA_CARRIER", K::kU8},
          {IFLA_PHYS_PORT_ID, "IFLA_PHYS_PORT_ID", K::kBinary},
          {IFLA_CARRIER_CHANGES, "IFLA_CARRIER_CHANGES", K::kU32},
          {IFLA_PHYS_SWITCH_ID, "IFLA_PHYS_SWITCH_ID", K::kBinary},
          {IFLA_LINK_NETNSID, "IFLA_LINK_NETNSID", K::kS32},
          {IFLA_PHYS_PORT_NAME, "IFLA_PHYS_PORT_NAME", K::kString},
          {IFLA_PROTO_DOWN, "IFLA_PROTO_DOWN", K::kU8},
          {IFLA_GSO_MAX_SEGS, "IFLA_GSO_MAX_SEGS", K::kU32},
          {IFLA_GSO_MAX_SIZE, "IFLA_GSO_MAX_SIZE", K::kU32},
          {IFLA_PAD, "IFLA_PAD", K::kBinary},
          {IFLA_XDP, "IFLA_XDP", K::kNested},
          {IFLA_EVENT, "IFLA_EVENT", K::kU32},
          {IFLA_NEW_NETNSID, "IFLA_NEW_NETNSID", K::kS32},
          {IFLA_TARGET_NETNSID, "IFLA_TARGET_NETNSID", K::kS32},
          {IFLA_CARRIER_UP_COUNT, "IFLA_CARRIER_UP_COUNT", K::kU32},
          {IFLA_CARRIER_DOWN_COUNT, "IFLA_CARRIER_DOWN_COUNT", K::kU32},
          {IFLA_NEW_IFINDEX, "IFLA_NEW_IFINDEX", K::kS32},
          {IFLA_MIN_MTU, "IFLA_MIN_MTU", K::kU32},
          {IFLA_MAX_MTU, "IFLA_MAX_MTU", K::kU32},
          {IFLA_PROP_LIST, "IFLA_PROP_LIST",
           K::kNested, 0, &LinkPropListAttributeCatalog},
          {IFLA_ALT_IFNAME, "IFLA_ALT_IFNAME", K::kString},
          {IFLA_PERM_ADDRESS, "IFLA_PERM_ADDRESS", K::kLinkAddress},
          {IFLA_PROTO_DOWN_REASON, "IFLA_PROTO_DOWN_REASON", K::kNested},
          {IFLA_PARENT_DEV_NAME, "IFLA_PARENT_DEV_NAME", K::kString},
          {IFLA_PARENT_DEV_BUS_NAME, "IFLA_PARENT_DEV_BUS_NAME", K::kString},
          {IFLA_GRO_MAX_SIZE, "IFLA_GRO_MAX_SIZE", K::kU32},
          {IFLA_TSO_MAX_SIZE, "IFLA_TSO_MAX_SIZE", K::kU32},
          {IFLA_TSO_MAX_SEGS, "IFLA_TSO_MAX_SEGS", K::kU32},
      });
  return *catalog;
}

const AttributeCatalog& LinkInfoAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "link/IFLA_LINKINFO",
      std::vector<AttributeSpec>{
          {IFLA_INFO_KIND, "IFLA_INFO_KIND", K::kString},
          {IFLA_INFO_DATA, "IFLA_INFO_DATA", K::kBinary},
          {IFLA_INFO_XSTATS, "IFLA_INFO_XSTATS", K::kBinary},
          {IFLA_INFO_SLAVE_KIND, "IFLA_INFO_SLAVE_KIND", K::kString},
          {IFLA_INFO_SLAVE_DATA, "IFLA_INFO_SLAVE_DATA", K::kBinary},
      });
  return *catalog;
}

const AttributeCatalog& LinkPropListAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "link/IFLA_PROP_LIST",
      std::vector<AttributeSpec>{
          {IFLA_ALT_IFNAME, "IFLA_ALT_IFNAME", K::kString},
      });
  return *catalog;
}

const AttributeCatalog& LinkAfSpecAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "link/IFLA_AF_SPEC",
      std::vector<AttributeSpec>{
          {AF_INET, "AF_INET", K::kNested, 0, &LinkInetAttributeCatalog},
          {AF_INET6, "AF_INET6", K::kNested, 0, &LinkInet6AttributeCatalog},
          {AF_BRIDGE, "AF_BRIDGE", K::kNested},
      });
  return *catalog;
}

const AttributeCatalog& LinkBridgeAfSpecAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "link/IFLA_AF_SPEC/bridge",
      std::vector<AttributeSpec>{
          {IFLA_BRIDGE_FLAGS, "IFLA_BRIDGE_FLAGS", K::kU16},
          {IFLA_BRIDGE_MODE, "IFLA_BRIDGE_MODE", K::kU16},
          {IFLA_BRIDGE_VLAN_INFO, "IFLA_BRIDGE_VLAN_INFO",
           K::kBinary, kBridgeVlanInfoSize},
          {IFLA_BRIDGE_VLAN_TUNNEL_INFO, "IFLA_BRIDGE_VLAN_TUNNEL_INFO",
           K::kNested, 0, &BridgeVlanTunnelAttributeCatalog},
          {IFLA_BRIDGE_MRP, "IFLA_BRIDGE_MRP", K::kNested},
          {IFLA_BRIDGE_CFM, "IFLA_BRIDGE_CFM", K::kNested},
          {IFLA_BRIDGE_MST, "IFLA_BRIDGE_MST", K::kNested},
      });
  return *catalog;
}

const AttributeCatalog& BridgeVlanTunnelAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "link/IFLA_AF_SPEC/bridge/IFLA_BRIDGE_VLAN_TUNNEL_INFO",
      std::vector<AttributeSpec>{
          {IFLA_BRIDGE_VLAN_TUNNEL_ID, "IFLA_BRIDGE_VLAN_TUNNEL_ID",
           K::kU32},
          {IFLA_BRIDGE_VLAN_TUNNEL_VID, "IFLA_BRIDGE_VLAN_TUNNEL_VID",
           K::kU16},
          {IFLA_BRIDGE_VLAN_TUNNEL_FLAGS, "IFLA_BRIDGE_VLAN_TUNNEL_FLAGS",
           K::kU16},
      });
  return *catalog;
}

const AttributeCatalog& LinkInetAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "link/IFLA_AF_SPEC/AF_INET",
      std::vector<AttributeSpec>{
          {IFLA_INET_CONF, "IFLA_INET_CONF", K::kBinary},
      });
  return *catalog;
}

const AttributeCatalog& LinkInet6AttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "link/IFLA_AF_SPEC/AF_INET6",
      std::vector<AttributeSpec>{
          {IFLA_INET6_FLAGS, "IFLA_INET6_FLAGS", K::kU32},
          {IFLA_INET6_CONF, "IFLA_INET6_CONF", K::kBinary},
          {IFLA_INET6_STATS, "IFLA_INET6_STATS", K::kBinary},
          {IFLA_INET6_MCAST, "IFLA_INET6_MCAST", K::kBinary},
          {IFLA_INET6_CACHEINFO, "IFLA_INET6_CACHEINFO",
           K::kBinary, kCacheInfoSize},
          {IFLA_INET6_ICMP6STATS, "IFLA_INET6_ICMP6STATS", K::kBinary},
          {IFLA_INET6_TOKEN, "IFLA_INET6_TOKEN", K::kIPAddress},
          {IFLA_INET6_ADDR_GEN_MODE, "IFLA_INET6_ADDR_GEN_MODE", K::kU8},
          {IFLA_INET6_RA_MTU, "IFLA_INET6_RA_MTU", K::kU32},
      });
  return *catalog;
}

const AttributeCatalog& AddressAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "address",
      std::vector<AttributeSpec>{
          {IFA_ADDRESS, "IFA_ADDRESS", K::kIPAddress},
          {IFA_LOCAL, "IFA_LOCAL", K::kIPAddress},
          {IFA_LABEL, "IFA_LABEL", K::kString},
          {IFA_BROADCAST, "IFA_BROADCAST", K::kIPAddress},
          {IFA_ANYCAST, "IFA_ANYCAST", K::kIPAddress},
          {IFA_CACHEINFO, "IFA_CACHEINFO", K::kBinary, kCacheInfoSize},
          {IFA_MULTICAST, "IFA_MULTICAST", K::kIPAddress},
          {IFA_FLAGS, "IFA_FLAGS", K::kU32},
          {IFA_RT_PRIORITY, "IFA_RT_PRIORITY", K::kU32},
          {IFA_TARGET_NETNSID, "IFA_TARGET_NETNSID", K::kS32},
          {IFA_PROTO, "IFA_PROTO", K::kU8},
      });
  return *catalog;
}

const AttributeCatalog& RouteAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "route",
      std::vector<AttributeSpec>{
          {RTA_DST, "RTA_DST", K::kIPAddress},
          {RTA_SRC, "RTA_SRC", K::kIPAddress},
          {RTA_IIF, "RTA_IIF", K::kU32},
          {RTA_OIF, "RTA_OIF", K::kU32},
          {RTA_GATEWAY, "RTA_GATEWAY", K::kIPAddress},
          {RTA_PRIORITY, "RTA_PRIORITY", K::kU32},
          {RTA_PREFSRC, "RTA_PREFSRC", K::kIPAddress},
          {RTA_METRICS, "RTA_METRICS",
           K::kNested, 0, &RouteMetricsAttributeCatalog},
          {RTA_MULTIPATH, "RTA_MULTIPATH", K::kBinary},
          {RTA_FLOW, "RTA_FLOW", K::kU32},
          {RTA_CACHEINFO, "RTA_CACHEINFO", K::kBinary, kRtaCacheInfoSize},
          {RTA_TABLE, "RTA_TABLE", K::kU32},
          {RTA_MARK, "RTA_MARK", K::kU32},
          {RTA_MFC_STATS, "RTA_MFC_STATS", K::kBinary, kRtaMfcStatsSize},
          {RTA_VIA, "RTA_VIA", K::kBinary},
          {RTA_NEWDST, "RTA_NEWDST", K::kBinary},
          {RTA_PREF, "RTA_PREF", K::kU8},
          {RTA_ENCAP_TYPE, "RTA_ENCAP_TYPE", K::kU16},
          {RTA_ENCAP, "RTA_ENCAP", K::kNested},
          {RTA_EXPIRES, "RTA_EXPIRES", K::kU32},
          {RTA_PAD, "RTA_PAD", K::kBinary},
          {RTA_UID, "RTA_UID", K::kU32},
          {RTA_TTL_PROPAGATE, "RTA_TTL_PROPAGATE", K::kU8},
          {RTA_IP_PROTO, "RTA_IP_PROTO", K::kU8},
          {RTA_SPORT, "RTA_SPORT", K::kBe16},
          {RTA_DPORT, "RTA_DPORT", K::kBe16},
          {RTA_NH_ID, "RTA_NH_ID", K::kU32},
      });
  return *catalog;
}

const AttributeCatalog& RouteMetricsAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "route/RTA_METRICS",
      std::vector<AttributeSpec>{
          {RTAX_LOCK, "RTAX_LOCK", K::kU32},
          {RTAX_MTU, "RTAX_MTU", K::kU32},
          {RTAX_WINDOW, "RTAX_WINDOW", K::kU32},
          {RTAX_RTT, "RTAX_RTT", K::kU32},
          {RTAX_RTTVAR, "RTAX_RTTVAR", K::kU32},
          {RTAX_SSTHRESH, "RTAX_SSTHRESH", K::kU32},
          {RTAX_CWND, "RTAX_CWND", K::kU32},
          {RTAX_ADVMSS, "RTAX_ADVMSS", K::kU32},
          {RTAX_REORDERING, "RTAX_REORDERING", K::kU32},
          {RTAX_HOPLIMIT, "RTAX_HOPLIMIT", K::kU32},
          {RTAX_INITCWND, "RTAX_INITCWND", K::kU32},
          {RTAX_FEATURES, "RTAX_FEATURES", K::kU32},
          {RTAX_RTO_MIN, "RTAX_RTO_MIN", K::kU32},
          {RTAX_INITRWND, "RTAX_INITRWND", K::kU32},
          {RTAX_QUICKACK, "RTAX_QUICKACK", K::kU32},
          {RTAX_CC_ALGO, "RTAX_CC_ALGO", K::kString},
          {RTAX_FASTOPEN_NO_COOKIE, "RTAX_FASTOPEN_NO_COOKIE", K::kU32},
      });
  return *catalog;
}

const AttributeCatalog& RuleAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "rule",
      std::vector<AttributeSpec>{
          {FRA_DST, "FRA_DST", K::kIPAddress},
          {FRA_SRC, "FRA_SRC", K::kIPAddress},
          {FRA_IIFNAME, "FRA_IIFNAME", K::kString},
          {FRA_GOTO, "FRA_GOTO", K::kU32},
          {FRA_PRIORITY, "FRA_PRIORITY", K::kU32},
          {FRA_FWMARK, "FRA_FWMARK", K::kU32},
          {FRA_FLOW, "FRA_FLOW", K::kU32},
          {FRA_TUN_ID, "FRA_TUN_ID", K::kBinary, 8},
          {FRA_SUPPRESS_IFGROUP, "FRA_SUPPRESS_IFGROUP", K::kU32},
          {FRA_SUPPRESS_PREFIXLEN, "FRA_SUPPRESS_PREFIXLEN", K::kU32},
          {FRA_TABLE, "FRA_TABLE", K::kU32},
          {FRA_FWMASK, "FRA_FWMASK", K::kU32},
          {FRA_OIFNAME, "FRA_OIFNAME", K::kString},
          {FRA_PAD, "FRA_PAD", K::kBinary},
          {FRA_L3MDEV, "FRA_L3MDEV", K::kU8},
          {FRA_UID_RANGE, "FRA_UID_RANGE", K::kBinary, 8},
          {FRA_PROTOCOL, "FRA_PROTOCOL", K::kU8},
          {FRA_IP_PROTO, "FRA_IP_PROTO", K::kU8},
          {FRA_SPORT_RANGE, "FRA_SPORT_RANGE", K::kBinary, 4},
          {FRA_DPORT_RANGE, "FRA_DPORT_RANGE", K::kBinary, 4},
      });
  return *catalog;
}

const AttributeCatalog& TrafficControlAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "tc",
      std::vector<AttributeSpec>{
          {TCA_KIND, "TCA_KIND", K::kString},
          {TCA_OPTIONS, "TCA_OPTIONS", K::kBinary},
          {TCA_STATS, "TCA_STATS", K::kBinary},
          {TCA_XSTATS, "TCA_XSTATS", K::kBinary},
          {TCA_RATE, "TCA_RATE", K::kBinary},
          {TCA_STATS2, "TCA_STATS2",
           K::kNested, 0, &TrafficControlStatsAttributeCatalog},
          {TCA_STAB, "TCA_STAB", K::kNested},
          {TCA_PAD, "TCA_PAD", K::kBinary},
          {TCA_DUMP_INVISIBLE, "TCA_DUMP_INVISIBLE", K::kFlag},
          {TCA_CHAIN, "TCA_CHAIN", K::kU32},
          {TCA_HW_OFFLOAD, "TCA_HW_OFFLOAD", K::kU8},
          {TCA_INGRESS_BLOCK, "TCA_INGRESS_BLOCK", K::kU32},
          {TCA_EGRESS_BLOCK, "TCA_EGRESS_BLOCK", K::kU32},
          {TCA_DUMP_FLAGS, "TCA_DUMP_FLAGS", K::kBinary, 8},
          {TCA_EXT_WARN_MSG, "TCA_EXT_WARN_MSG", K::kString},
      });
  return *catalog;
}

const AttributeCatalog& TrafficControlStatsAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "tc/TCA_STATS2",
      std::vector<AttributeSpec>{
          {TCA_STATS_BASIC, "TCA_STATS_BASIC", K::kBinary},
          {TCA_STATS_RATE_EST, "TCA_STATS_RATE_EST", K::kBinary, 8},
          {TCA_STATS_QUEUE, "TCA_STATS_QUEUE", K::kBinary, 20},
          {TCA_STATS_APP, "TCA_STATS_APP", K::kBinary},
          {TCA_STATS_RATE_EST64, "TCA_STATS_RATE_EST64", K::kBinary, 16},
          {TCA_STATS_PAD, "TCA_STATS_PAD", K::kBinary},
          {TCA_STATS_BASIC_HW, "TCA_STATS_BASIC_HW", K::kBinary},
          {TCA_STATS_PKT64, "TCA_STATS_PKT64", K::kU64},
      });
  return *catalog;
}

const AttributeCatalog& NeighborAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "neighbour",
      std::vector<AttributeSpec>{
          {NDA_DST, "NDA_DST", K::kIPAddress},
          {NDA_LLADDR, "NDA_LLADDR", K::kLinkAddress},
          {NDA_CACHEINFO, "NDA_CACHEINFO", K::kBinary, kCacheInfoSize},
          {NDA_PROBES, "NDA_PROBES", K::kU32},
          {NDA_VLAN, "NDA_VLAN", K::kU16},
          {NDA_PORT, "NDA_PORT", K::kBe16},
          {NDA_VNI, "NDA_VNI", K::kU32},
          {NDA_IFINDEX, "NDA_IFINDEX", K::kU32},
          {NDA_MASTER, "NDA_MASTER", K::kU32},
          {NDA_LINK_NETNSID, "NDA_LINK_NETNSID", K::kS32},
          {NDA_SRC_VNI, "NDA_SRC_VNI", K::kU32},
          {NDA_PROTOCOL, "NDA_PROTOCOL", K::kU8},
          {NDA_NH_ID, "NDA_NH_ID", K::kU32},
          {NDA_FDB_EXT_ATTRS, "NDA_FDB_EXT_ATTRS", K::kNested},
          {NDA_FLAGS_EXT, "NDA_FLAGS_EXT", K::kU32},
      });
  return *catalog;
}

const AttributeCatalog& NeighborTableAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "neighbour_table",
      std::vector<AttributeSpec>{
          {NDTA_NAME, "NDTA_NAME", K::kString},
          {NDTA_THRESH1, "NDTA_THRESH1", K::kU32},
          {NDTA_THRESH2, "NDTA_THRESH2", K::kU32},
          {NDTA_THRESH3, "NDTA_THRESH3", K::kU32},
          {NDTA_CONFIG, "NDTA_CONFIG", K::kBinary},
          {NDTA_PARMS, "NDTA_PARMS",
           K::kNested, 0, &NeighborTableParmsAttributeCatalog},
          {NDTA_STATS, "NDTA_STATS", K::kBinary},
          {NDTA_GC_INTERVAL, "NDTA_GC_INTERVAL", K::kU64},
          {NDTA_PAD, "NDTA_PAD", K::kBinary},
      });
  return *catalog;
}

const AttributeCatalog& NeighborTableParmsAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "neighbour_table/NDTA_PARMS",
      std::vector<AttributeSpec>{
          {NDTPA_IFINDEX, "NDTPA_IFINDEX", K::kU32},
          {NDTPA_REFCNT, "NDTPA_REFCNT", K::kU32},
          {NDTPA_REACHABLE_TIME, "NDTPA_REACHABLE_TIME", K::kU64},
          {NDTPA_BASE_REACHABLE_TIME, "NDTPA_BASE_REACHABLE_TIME", K::kU64},
          {NDTPA_RETRANS_TIME, "NDTPA_RETRANS_TIME", K::kU64},
          {NDTPA_GC_STALETIME, "NDTPA_GC_STALETIME", K::kU64},
          {NDTPA_DELAY_PROBE_TIME, "NDTPA_DELAY_PROBE_TIME", K::kU64},
          {NDTPA_QUEUE_LEN, "NDTPA_QUEUE_LEN", K::kU32},
          {NDTPA_APP_PROBES, "NDTPA_APP_PROBES", K::kU32},
          {NDTPA_UCAST_PROBES, "NDTPA_UCAST_PROBES", K::kU32},
          {NDTPA_MCAST_PROBES, "NDTPA_MCAST_PROBES", K::kU32},
          {NDTPA_ANYCAST_DELAY, "NDTPA_ANYCAST_DELAY", K::kU64},
          {NDTPA_PROXY_DELAY, "NDTPA_PROXY_DELAY", K::kU64},
          {NDTPA_PROXY_QLEN, "NDTPA_PROXY_QLEN", K::kU32},
          {NDTPA_LOCKTIME, "NDTPA_LOCKTIME", K::kU64},
          {NDTPA_QUEUE_LENBYTES, "NDTPA_QUEUE_LENBYTES", K::kU32},
          {NDTPA_MCAST_REPROBES, "NDTPA_MCAST_REPROBES", K::kU32},
          {NDTPA_PAD, "NDTPA_PAD", K::kBinary},
      });
  return *catalog;
}

const AttributeCatalog& NsidAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "nsid",
      std::vector<AttributeSpec>{
          {NETNSA_NSID, "NETNSA_NSID", K::kS32},
          {NETNSA_PID, "NETNSA_PID", K::kU32},
          {NETNSA_FD, "NETNSA_FD", K::kU32},
          {NETNSA_TARGET_NSID, "NETNSA_TARGET_NSID", K::kS32},
          {NETNSA_CURRENT_NSID, "NETNSA_CURRENT_NSID", K::kS32},
      });
  return *catalog;
}

const AttributeCatalog& PrefixAttributeCatalog() {
  static const base::NoDestructor<TableAttributeCatalog> catalog(
      "prefix",
      std::vector<AttributeSpec>{
          {PREFIX_ADDRESS, "PREFIX_ADDRESS", K::kIPAddress},
          {PREFIX_CACHEINFO, "PREFIX_CACHEINFO",
           K::kBinary, kPrefixCacheInfoSize},
      });
  return *catalog;
}

}  // namespace netlink_route
