// Copyright 2024 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <base/at_exit.h>
#include <base/command_line.h>
#include <brillo/syslog_logging.h>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
  base::AtExitManager at_exit;
  base::CommandLine::Init(argc, argv);
  // Initialize logging so tests would be able to test logs by calling
  //   brillo::LogToString(true);
  //   brillo::ClearLog();
  brillo::InitLog(brillo::kLogToStderr);

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
