#pragma once
// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "fuzzer/VaultFuzzer.h"
#include "util/Logging.h"
#include "verifier/OutcomeComparator.h"

#include <cpptoml.h>

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace vaultcheck
{

class Config
{
    void processConfig(std::shared_ptr<cpptoml::table> t);

  public:
    typedef std::shared_ptr<Config> pointer;

    Config();

    // Throw std::invalid_argument for a missing file, a TOML syntax error,
    // an unknown key or a value of the wrong type.
    void load(std::string const& filename);
    void load(std::istream& in);

    // log level for every partition
    LogLevel LOG_LEVEL;

    // empty for console only
    std::string LOG_FILE_PATH;
    bool LOG_COLOR;

    // regexes of vault invariants to check after each committed operation
    std::vector<std::string> INVARIANT_CHECKS;

    // how far a batch's settlement may drift from the accumulated
    // prediction; the relative tolerance is a fraction of 1e18
    uint256 SETTLEMENT_ABSOLUTE_TOLERANCE;
    uint256 SETTLEMENT_RELATIVE_TOLERANCE;

    uint64_t FUZZ_RUNS;
    unsigned int FUZZ_SEED;
    InvariantKind FUZZ_POOL_KIND;
    uint256 FUZZ_MIN_BALANCE;
    uint256 FUZZ_MAX_BALANCE;
    uint256 FUZZ_MAX_SKEW;

    Tolerance getSettlementTolerance() const;
    FuzzOptions getFuzzOptions() const;

    // applies LOG_LEVEL, LOG_FILE_PATH and LOG_COLOR
    void configureLogging() const;
};
}
