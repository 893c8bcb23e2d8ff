#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "util/Logging.h"

namespace vaultcheck
{

// The configuration tests run with: defaults, overridden by --conf and
// then by --fuzz-runs / --fuzz-seed.
Config const& getTestConfig();

int runTest(int argc, char* const* argv);
}
