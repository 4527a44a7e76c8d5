// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/distribution_config.h>

#include <util.h>
#include <utilstrencodings.h>
#include <utiltime.h>

#include <limits>
#include <stdexcept>

namespace wefi {

std::string GetDistributionHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Distribution options:");
    strUsage += HelpMessageOpt("-launchtime=<n>", "Override the launch time of both unlock curves (Unix seconds)");
    strUsage += HelpMessageOpt("-chainid=<n>", "Override the chain id bound into claim vouchers");
    strUsage += HelpMessageOpt("-gracesecs=<n>", "Override the minimum migration grace period in seconds");
    strUsage += HelpMessageOpt("-verifier=<id>", "Key id or public key (hex) of the voucher signer");
    strUsage += HelpMessageOpt("-owner=<id>", "Key id or public key (hex) of the administrator");
    strUsage += HelpMessageOpt("-mocktime=<n>", "Replace the system clock with a fixed time (Unix seconds)");

    strUsage += HelpMessageGroup("Chain selection options:");
    strUsage += HelpMessageOpt("-testnet", "Use the test network parameters");
    strUsage += HelpMessageOpt("-regtest", "Use the regression test parameters (short schedules, immediate start)");

    return strUsage;
}

bool ParseAccountId(const std::string& str, uint160& account)
{
    if (!IsHex(str)) {
        return false;
    }
    if (str.size() == 40) {
        account = uint160S(str);
        return true;
    }
    if (str.size() == 2 * CPubKey::COMPRESSED_PUBLIC_KEY_SIZE || str.size() == 2 * CPubKey::PUBLIC_KEY_SIZE) {
        CPubKey pubkey(ParseHex(str));
        if (!pubkey.IsFullyValid()) {
            return false;
        }
        account = pubkey.GetID();
        return true;
    }
    return false;
}

static int64_t GetInt64Arg(const std::string& strArg, int64_t nDefault)
{
    if (!gArgs.IsArgSet(strArg)) {
        return nDefault;
    }
    std::string strValue = gArgs.GetArg(strArg, "");
    int64_t nValue;
    if (!ParseInt64(strValue, &nValue)) {
        throw std::runtime_error(strprintf("Invalid value for %s: '%s'", strArg, strValue));
    }
    return nValue;
}

DistributionConfig InitDistributionConfig()
{
    DistributionConfig config;

    std::string network = NetworkFromCommandLine();
    SelectDistributionParams(network);
    config.params = GetDistributionParams();

    if (gArgs.IsArgSet("-mocktime")) {
        int64_t nMockTime = GetInt64Arg("-mocktime", 0);
        if (nMockTime < 0) {
            throw std::runtime_error(strprintf("Invalid value for -mocktime: %d", nMockTime));
        }
        SetMockTime(nMockTime);
    }

    config.params.nLaunchTime = GetInt64Arg("-launchtime", config.params.nLaunchTime);
    if (config.params.nLaunchTime < 0) {
        throw std::runtime_error(strprintf("Invalid value for -launchtime: %d", config.params.nLaunchTime));
    }

    int64_t nChainId = GetInt64Arg("-chainid", config.params.nChainId);
    if (nChainId <= 0 || nChainId > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error(strprintf("Invalid value for -chainid: %d", nChainId));
    }
    config.params.nChainId = static_cast<uint32_t>(nChainId);

    int64_t nGrace = GetInt64Arg("-gracesecs", DEFAULT_GRACE_SECS);
    if (nGrace < 0) {
        throw std::runtime_error(strprintf("Invalid value for -gracesecs: %d", nGrace));
    }
    if (nGrace > 0) {
        config.params.nMigrationGracePeriod = nGrace;
    }

    if (gArgs.IsArgSet("-verifier")) {
        uint160 verifier;
        if (!ParseAccountId(gArgs.GetArg("-verifier", ""), verifier) || verifier.IsNull()) {
            throw std::runtime_error(strprintf("Invalid -verifier: '%s'", gArgs.GetArg("-verifier", "")));
        }
        config.verifier = CKeyID(verifier);
    }

    if (gArgs.IsArgSet("-owner")) {
        if (!ParseAccountId(gArgs.GetArg("-owner", ""), config.owner) || config.owner.IsNull()) {
            throw std::runtime_error(strprintf("Invalid -owner: '%s'", gArgs.GetArg("-owner", "")));
        }
    }

    LogPrint(WLog::CONFIG, "Distribution: network=%s chainid=%u launch=%d grace=%d verifier=%s owner=%s\n",
        config.params.strNetworkID, config.params.nChainId, config.params.nLaunchTime,
        config.params.nMigrationGracePeriod, config.verifier.ToString(), config.owner.ToString());

    return config;
}

} // namespace wefi
