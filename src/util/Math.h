#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/numeric.h"

#include <boost/random/uniform_int_distribution.hpp>
#include <random>

namespace vaultcheck
{
typedef std::mt19937_64 vaultcheck_default_random_engine;

extern vaultcheck_default_random_engine gRandomEngine;

template <typename T>
T
rand_uniform(T lo, T hi, vaultcheck_default_random_engine& engine)
{
    return boost::random::uniform_int_distribution<T>(lo, hi)(engine);
}

template <typename T>
T
rand_uniform(T lo, T hi)
{
    return rand_uniform<T>(lo, hi, gRandomEngine);
}

// A raw, unconstrained 256-bit word drawn from engine, the shape of a
// fuzzer input.
uint256 rand_uint256(vaultcheck_default_random_engine& engine);

// This function should be called any time you need to reset the global
// prng based on a seed value, such as before each fuzz run or each unit
// test.
void reinitializeAllGlobalStateWithSeed(unsigned int seed);
}
