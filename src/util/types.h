#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <string>

namespace vaultcheck
{
// case-insensitive equality on ASCII strings
bool iequals(std::string const& a, std::string const& b);
}
