/*
 * Shell runner - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace nl2cmd::cli {

// Runs a generated command line through the host shell (/bin/sh -c or cmd /c)
// and waits for it. Returns the exit status, 128+signal when killed, 127 when
// the shell could not be started.
int run_shell_command(const std::string& command);

} // namespace nl2cmd::cli
