// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_DISTRIBUTION_PARAMS_H
#define WEFI_DISTRIBUTION_DISTRIBUTION_PARAMS_H

/**
 * @file distribution_params.h
 * @brief Network-specific constants of the token distribution
 */

#include <amount.h>
#include <uint256.h>
#include <distribution/emission_curve.h>

#include <cstdint>
#include <string>
#include <vector>

namespace wefi {

/** Network names accepted by SelectDistributionParams() */
extern const std::string NETWORK_MAIN;
extern const std::string NETWORK_TESTNET;
extern const std::string NETWORK_REGTEST;

/**
 * Distribution parameters
 * These parameters are network-specific (main/test/regtest)
 */
struct DistributionParams {
    /** Network name */
    std::string strNetworkID;

    /** Identifier hashed into the voucher domain separator */
    uint32_t nChainId;

    // === Pools ===

    /** Hard cap of the mining pool (base units) */
    CAmount nMiningCap;

    /** Hard cap of the referral/staking pool (base units) */
    CAmount nReferralCap;

    /** Mining pool emission schedule */
    std::vector<EmissionInterval> vEmissionSchedule;

    /** Seconds over which the referral pool vests linearly */
    int64_t nVestingDuration;

    // === Lifecycle ===

    /** Origin of both unlock curves (Unix seconds) */
    int64_t nLaunchTime;

    /** Accept a launch time that is not in the future */
    bool fAllowImmediateStart;

    /** Minimum distance between starting a migration and its sweep (seconds) */
    int64_t nMigrationGracePeriod;

    // === Accounts ===

    /** Account holding the pre-funded allocation */
    uint160 distributor;

    /** Sum of rate * duration over the emission schedule */
    CAmount GetScheduledEmission() const;
};

/**
 * Get distribution parameters for the main network
 */
const DistributionParams& MainDistributionParams();

/**
 * Get distribution parameters for testnet
 */
const DistributionParams& TestnetDistributionParams();

/**
 * Get distribution parameters for regtest
 * Note: Regtest uses short schedules and small pools for testing
 */
const DistributionParams& RegtestDistributionParams();

/**
 * Get parameters for a named network
 * @throws std::runtime_error for an unknown network
 */
const DistributionParams& DistributionParamsFor(const std::string& network);

/**
 * Get distribution parameters for the selected network
 */
const DistributionParams& GetDistributionParams();

/**
 * Select the network whose parameters GetDistributionParams() returns
 * @throws std::runtime_error for an unknown network
 */
void SelectDistributionParams(const std::string& network);

/**
 * Network requested by -testnet / -regtest
 * @throws std::runtime_error if both are given
 */
std::string NetworkFromCommandLine();

/** Account id derived from a fixed label, used for the distributor account */
uint160 DeriveDistributorAccount(const std::string& label);

} // namespace wefi

#endif // WEFI_DISTRIBUTION_DISTRIBUTION_PARAMS_H
