// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/distribution_params.h>

#include <hash.h>
#include <util.h>

#include <stdexcept>

namespace wefi {

const std::string NETWORK_MAIN = "main";
const std::string NETWORK_TESTNET = "test";
const std::string NETWORK_REGTEST = "regtest";

static const int64_t DAY = 24 * 60 * 60;
static const int64_t YEAR = 365 * DAY;

CAmount DistributionParams::GetScheduledEmission() const
{
    CAmount nTotal = 0;
    for (const EmissionInterval& interval : vEmissionSchedule) {
        nTotal += interval.nRate * interval.nDuration;
    }
    return nTotal;
}

uint160 DeriveDistributorAccount(const std::string& label)
{
    return Hash160(std::vector<unsigned char>(label.begin(), label.end()));
}

// Main network: four yearly halvings starting at 8 tokens per second
static DistributionParams CreateMainParams()
{
    DistributionParams params;
    params.strNetworkID = NETWORK_MAIN;
    params.nChainId = 1;
    params.vEmissionSchedule = {
        EmissionInterval(8 * COIN, YEAR),
        EmissionInterval(4 * COIN, YEAR),
        EmissionInterval(2 * COIN, YEAR),
        EmissionInterval(1 * COIN, YEAR),
    };
    params.nMiningCap = 473040000 * COIN;                   // 15 * 31,536,000 tokens
    params.nReferralCap = 200000000 * COIN;                 // 200M tokens
    params.nVestingDuration = 730 * DAY;                    // 2 years
    params.nLaunchTime = 1798761600;                        // 2027-01-01 00:00:00 UTC
    params.fAllowImmediateStart = false;
    params.nMigrationGracePeriod = 7 * DAY;                 // 7 days
    params.distributor = DeriveDistributorAccount("wefi.distribution.main");
    return params;
}

// Testnet (same curves, shorter grace period)
static DistributionParams CreateTestnetParams()
{
    DistributionParams params = CreateMainParams();
    params.strNetworkID = NETWORK_TESTNET;
    params.nChainId = 2;
    params.nLaunchTime = 1793491200;                        // 2026-11-01 00:00:00 UTC
    params.nMigrationGracePeriod = 1 * DAY;                 // 1 day
    params.distributor = DeriveDistributorAccount("wefi.distribution.test");
    return params;
}

// Regtest (very short schedules for testing)
static DistributionParams CreateRegtestParams()
{
    DistributionParams params;
    params.strNetworkID = NETWORK_REGTEST;
    params.nChainId = 3;
    params.vEmissionSchedule = {
        EmissionInterval(8 * COIN, 1000),
        EmissionInterval(4 * COIN, 1000),
        EmissionInterval(2 * COIN, 1000),
    };
    params.nMiningCap = 14000 * COIN;
    params.nReferralCap = 10000 * COIN;
    params.nVestingDuration = 2000;
    params.nLaunchTime = 0;                                 // chosen at initialization
    params.fAllowImmediateStart = true;
    params.nMigrationGracePeriod = 100;
    params.distributor = DeriveDistributorAccount("wefi.distribution.regtest");
    return params;
}

static const DistributionParams mainDistributionParams = CreateMainParams();
static const DistributionParams testnetDistributionParams = CreateTestnetParams();
static const DistributionParams regtestDistributionParams = CreateRegtestParams();

static const DistributionParams* g_currentParams = &mainDistributionParams;

const DistributionParams& MainDistributionParams()
{
    return mainDistributionParams;
}

const DistributionParams& TestnetDistributionParams()
{
    return testnetDistributionParams;
}

const DistributionParams& RegtestDistributionParams()
{
    return regtestDistributionParams;
}

const DistributionParams& DistributionParamsFor(const std::string& network)
{
    if (network == NETWORK_MAIN) {
        return mainDistributionParams;
    } else if (network == NETWORK_TESTNET) {
        return testnetDistributionParams;
    } else if (network == NETWORK_REGTEST) {
        return regtestDistributionParams;
    }
    throw std::runtime_error(strprintf("%s: Unknown network %s.", __func__, network));
}

const DistributionParams& GetDistributionParams()
{
    return *g_currentParams;
}

void SelectDistributionParams(const std::string& network)
{
    g_currentParams = &DistributionParamsFor(network);
}

std::string NetworkFromCommandLine()
{
    bool fRegTest = gArgs.GetBoolArg("-regtest", false);
    bool fTestNet = gArgs.GetBoolArg("-testnet", false);

    if (fTestNet && fRegTest)
        throw std::runtime_error("Invalid combination of -regtest and -testnet.");
    if (fRegTest)
        return NETWORK_REGTEST;
    if (fTestNet)
        return NETWORK_TESTNET;
    return NETWORK_MAIN;
}

} // namespace wefi
