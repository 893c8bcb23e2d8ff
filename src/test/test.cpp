// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#define CATCH_CONFIG_RUNNER

#include "test/test.h"
#include "test/Catch2.h"
#include "util/Logging.h"
#include "util/Math.h"

#include <ctime>
#include <fmt/format.h>
#include <memory>
#include <optional>

namespace vaultcheck
{

// We use a Catch event-listener to re-seed all the PRNGs we know about on every
// test, to minimize nondeterministic bleed from one test to the next.
struct ReseedPRNGListener : Catch::TestEventListenerBase
{
    using TestEventListenerBase::TestEventListenerBase;
    static unsigned int sCommandLineSeed;
    virtual void
    testCaseStarting(Catch::TestCaseInfo const& testInfo) override
    {
        reinitializeAllGlobalStateWithSeed(sCommandLineSeed);
    }
};

unsigned int ReseedPRNGListener::sCommandLineSeed = 0;

CATCH_REGISTER_LISTENER(ReseedPRNGListener)

static std::unique_ptr<Config> gTestConfig;
static std::string gTestConfigFile;
static std::optional<uint64_t> gFuzzRuns;
static std::optional<unsigned int> gFuzzSeed;

Config const&
getTestConfig()
{
    if (!gTestConfig)
    {
        auto cfg = std::make_unique<Config>();
        if (!gTestConfigFile.empty())
        {
            cfg->load(gTestConfigFile);
        }
        if (gFuzzRuns)
        {
            cfg->FUZZ_RUNS = *gFuzzRuns;
        }
        if (gFuzzSeed)
        {
            cfg->FUZZ_SEED = *gFuzzSeed;
        }
        gTestConfig = std::move(cfg);
    }
    return *gTestConfig;
}

int
runTest(int argc, char* const* argv)
{
    std::optional<LogLevel> logLevel;

    Catch::Session session{};

    auto& seed = session.configData().rngSeed;

    // rotate the seed every 24 hours
    seed = static_cast<unsigned int>(std::time(nullptr)) / (24 * 3600);

    auto parser = session.cli();
    parser |= Catch::clara::Opt(
        [&](std::string const& arg) {
            logLevel = Logging::getLLfromString(arg);
        },
        "LEVEL")["--ll"]("set the log level");
    parser |= Catch::clara::Opt(gTestConfigFile, "FILE")["--conf"](
        "load the test configuration from FILE");
    parser |= Catch::clara::Opt(
        [&](uint64_t runs) { gFuzzRuns = runs; },
        "N")["--fuzz-runs"]("number of inputs per fuzz campaign");
    parser |= Catch::clara::Opt(
        [&](unsigned int s) { gFuzzSeed = s; },
        "SEED")["--fuzz-seed"]("seed of the fuzz campaigns");

    session.cli(parser);

    auto result = session.applyCommandLine(argc, argv);
    if (result != 0)
    {
        return result;
    }

    if (session.configData().showHelp || session.configData().libIdentify)
    {
        return 0;
    }

    ReseedPRNGListener::sCommandLineSeed = seed;
    reinitializeAllGlobalStateWithSeed(seed);

    // Note: Have to setLogLevel twice here to ensure --list-test-names-only is
    // not mixed with vaultcheck logging.
    Logging::setFmt("<test>");
    auto const& cfg = getTestConfig();
    cfg.configureLogging();
    if (logLevel)
    {
        Logging::setLogLevel(*logLevel);
    }
    if (cfg.LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile("vaultcheck-tests.log");
        Logging::setLogLevel(logLevel.value_or(cfg.LOG_LEVEL));
    }

    CLOG_INFO(Test, "Testing vaultcheck with --rng-seed {}, fuzz seed {}",
              seed, cfg.FUZZ_SEED);

    auto r = session.run();
    // In the 'list' modes Catch returns the number of tests listed. We don't
    // want to treat this value as and error code.
    if (session.configData().listTests ||
        session.configData().listTestNamesOnly ||
        session.configData().listTags || session.configData().listReporters)
    {
        r = 0;
    }

    if (r != 0)
    {
        CLOG_ERROR(Test, "Nonzero test result with --rng-seed {}", seed);
    }
    gTestConfig.reset();
    return r;
}
}
