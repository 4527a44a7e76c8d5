// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_DISTRIBUTION_CONFIG_H
#define WEFI_DISTRIBUTION_DISTRIBUTION_CONFIG_H

/**
 * @file distribution_config.h
 * @brief Command line and config file initialization of the distribution
 */

#include <pubkey.h>
#include <uint256.h>
#include <distribution/distribution_params.h>

#include <string>

namespace wefi {

/** Default grace period override, 0 keeps the network value */
static const int64_t DEFAULT_GRACE_SECS = 0;

/**
 * Effective settings after applying command line overrides to the
 * selected network's parameters.
 */
struct DistributionConfig {
    DistributionParams params;

    /** Voucher signer, null if not configured */
    CKeyID verifier;

    /** Administrator account, null if not configured */
    uint160 owner;
};

/**
 * Get help message for distribution options
 */
std::string GetDistributionHelpMessage();

/**
 * @brief Parse an account given as a 40 character key id or a hex public key
 * @return false if str is neither
 */
bool ParseAccountId(const std::string& str, uint160& account);

/**
 * @brief Build the configuration from gArgs
 *
 * Selects the network (-testnet, -regtest) and applies -launchtime,
 * -chainid, -gracesecs, -verifier, -owner and -mocktime.
 *
 * @throws std::runtime_error on malformed values
 */
DistributionConfig InitDistributionConfig();

} // namespace wefi

#endif // WEFI_DISTRIBUTION_DISTRIBUTION_CONFIG_H
