#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstddef>
#include <string>

namespace vaultcheck
{

// Fuzzer is an encapsulation over some state that receives a file of raw
// input words and deterministically injects it, applying it to its state.
class Fuzzer
{
  public:
    virtual ~Fuzzer()
    {
    }
    // inject reads a fuzzed input file and applies it to the state according
    // to whatever apply means for the fuzzer, i.e. a sequence of vault
    // operations for the VaultFuzzer
    virtual void inject(std::string const& filename) = 0;
    virtual void initialize() = 0;
    virtual void shutdown() = 0;
    // genFuzz writes a random input for the given fuzzer, to seed the corpus
    // of an external fuzzer
    virtual void genFuzz(std::string const& filename) = 0;
    virtual size_t inputSizeLimit() const = 0;
};
}
