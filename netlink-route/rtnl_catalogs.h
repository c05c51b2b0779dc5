// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_RTNL_CATALOGS_H_
#define NETLINK_ROUTE_RTNL_CATALOGS_H_

#include "netlink-route/attribute_catalog.h"
#include "netlink-route/export.h"

namespace netlink_route {

// Built-in attribute catalogs for the route netlink families. They cover the
// attributes of the kernel uapi headers; anything newer decodes as an unknown
// attribute. The returned references are valid for the process lifetime.

NETLINK_ROUTE_EXPORT const AttributeCatalog& LinkAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& AddressAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& RouteAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& RuleAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& TrafficControlAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& NeighborAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& NeighborTableAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& NsidAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& PrefixAttributeCatalog();

// Catalogs of nested attributes.

// IFLA_LINKINFO.
NETLINK_ROUTE_EXPORT const AttributeCatalog& LinkInfoAttributeCatalog();
// IFLA_PROP_LIST.
NETLINK_ROUTE_EXPORT const AttributeCatalog& LinkPropListAttributeCatalog();
// IFLA_AF_SPEC of an AF_UNSPEC link message, keyed by address family.
NETLINK_ROUTE_EXPORT const AttributeCatalog& LinkAfSpecAttributeCatalog();
// IFLA_AF_SPEC of an AF_BRIDGE link message.
NETLINK_ROUTE_EXPORT const AttributeCatalog&
LinkBridgeAfSpecAttributeCatalog();
// IFLA_BRIDGE_VLAN_TUNNEL_INFO.
NETLINK_ROUTE_EXPORT const AttributeCatalog&
BridgeVlanTunnelAttributeCatalog();
// AF_INET and AF_INET6 entries of IFLA_AF_SPEC.
NETLINK_ROUTE_EXPORT const AttributeCatalog& LinkInetAttributeCatalog();
NETLINK_ROUTE_EXPORT const AttributeCatalog& LinkInet6AttributeCatalog();
// RTA_METRICS.
NETLINK_ROUTE_EXPORT const AttributeCatalog& RouteMetricsAttributeCatalog();
// NDTA_PARMS.
NETLINK_ROUTE_EXPORT const AttributeCatalog&
NeighborTableParmsAttributeCatalog();
// TCA_STATS2.
NETLINK_ROUTE_EXPORT const AttributeCatalog&
TrafficControlStatsAttributeCatalog();

}  // namespace netlink_route

#endif  // NETLINK_ROUTE_RTNL_CATALOGS_H_
