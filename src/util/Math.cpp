// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Math.h"

#include <limits>

namespace vaultcheck
{

vaultcheck_default_random_engine gRandomEngine;

uint256
rand_uint256(vaultcheck_default_random_engine& engine)
{
    uint256 res = 0;
    for (int i = 0; i < 4; ++i)
    {
        res <<= 64;
        res |= uint256(rand_uniform<uint64_t>(
            0, std::numeric_limits<uint64_t>::max(), engine));
    }
    return res;
}

void
reinitializeAllGlobalStateWithSeed(unsigned int seed)
{
    gRandomEngine.seed(seed);
}
}
