// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef NETLINK_ROUTE_EXPORT_H_
#define NETLINK_ROUTE_EXPORT_H_

#include <brillo/brillo_export.h>

// Marks a class or function as part of the public ABI of libnetlink-route.
#define NETLINK_ROUTE_EXPORT BRILLO_EXPORT

#endif  // NETLINK_ROUTE_EXPORT_H_
