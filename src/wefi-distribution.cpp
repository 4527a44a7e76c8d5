// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file wefi-distribution.cpp
 * @brief Command line front end of the token distribution ledger
 *
 * Every invocation opens the deployment stored under the data directory,
 * runs one command against it and, if the command changed anything,
 * writes the new state back in a single batch. Results are printed as
 * JSON on stdout.
 */

#include <amount.h>
#include <key.h>
#include <pubkey.h>
#include <random.h>
#include <uint256.h>
#include <util.h>
#include <utilstrencodings.h>
#include <utiltime.h>
#include <distribution/access_control.h>
#include <distribution/claim_voucher.h>
#include <distribution/distribution_config.h>
#include <distribution/distribution_ledger.h>
#include <distribution/distribution_params.h>
#include <distribution/ledger_db.h>
#include <distribution/token_ledger.h>

#include <univalue.h>

#include <cstdio>
#include <cstdlib>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wefi;

static DistributionConfig g_config;

struct CommandRequest {
    std::vector<std::string> params;
    bool fHelp;

    CommandRequest() : fHelp(false) {}
};

typedef UniValue (*CommandFn)(const CommandRequest& request);

struct CCommand {
    const char* name;
    CommandFn actor;
};

// ============================================================================
// Helpers
// ============================================================================

static UniValue ValueFromAmount(const CAmount& amount)
{
    bool sign = amount < 0;
    int64_t n_abs = (sign ? -amount : amount);
    int64_t quotient = n_abs / COIN;
    int64_t remainder = n_abs % COIN;
    return UniValue(UniValue::VNUM,
            strprintf("%s%d.%08d", sign ? "-" : "", quotient, remainder));
}

static CAmount AmountFromString(const std::string& str)
{
    CAmount amount;
    if (!ParseFixedPoint(str, 8, &amount) || !MoneyRange(amount)) {
        throw std::runtime_error(strprintf("Invalid amount '%s'", str));
    }
    return amount;
}

static int64_t Int64FromString(const std::string& str, const std::string& name)
{
    int64_t n;
    if (!ParseInt64(str, &n)) {
        throw std::runtime_error(strprintf("Invalid %s '%s'", name, str));
    }
    return n;
}

static uint160 AccountFromString(const std::string& str)
{
    uint160 account;
    if (!ParseAccountId(str, account)) {
        throw std::runtime_error(strprintf("Invalid account '%s' (expected a 40 character key id or a hex public key)", str));
    }
    return account;
}

static PoolKind PoolFromString(const std::string& str)
{
    PoolKind pool;
    if (!PoolKindFromString(str, pool)) {
        throw std::runtime_error(strprintf("Invalid pool '%s' (expected mining or referral)", str));
    }
    return pool;
}

static UniValue ClaimRecordToJSON(const ClaimRecord& record)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("claimkey", record.claimKey.GetHex());
    obj.pushKV("pool", PoolKindToString(record.pool));
    obj.pushKV("receiver", record.receiver.GetHex());
    obj.pushKV("claimant", record.claimant.GetHex());
    obj.pushKV("amount", ValueFromAmount(record.amount));
    obj.pushKV("validuntil", record.validUntil);
    obj.pushKV("nonce", strprintf("%u", record.nonce));
    obj.pushKV("time", record.timestamp);
    return obj;
}

static UniValue FailureToJSON(LedgerError error, const std::string& message)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", false);
    obj.pushKV("error", LedgerErrorToString(error));
    obj.pushKV("message", message);
    return obj;
}

// ============================================================================
// Deployment session
// ============================================================================

static fs::path GetLedgerDir(const std::string& network)
{
    return GetDataDir() / network / "ledger";
}

/** Parameters of an initialized deployment, resumed from its stored settings */
static DistributionParams ResumeParams(const DeploymentRecord& deployment)
{
    DistributionParams params = DistributionParamsFor(deployment.strNetworkID);
    params.nChainId = deployment.nChainId;
    params.nLaunchTime = deployment.nLaunchTime;
    params.nMigrationGracePeriod = deployment.nMigrationGracePeriod;
    params.fAllowImmediateStart = true;
    return params;
}

/**
 * The ledger and its collaborators, loaded from the data directory.
 */
class Session
{
public:
    DeploymentRecord deployment;
    std::unique_ptr<LedgerDB> db;
    MemoryTokenLedger tokens;
    std::unique_ptr<OwnerAccessControl> access;
    std::unique_ptr<DistributionLedger> ledger;

    Session()
    {
        const std::string& network = g_config.params.strNetworkID;
        db = std::make_unique<LedgerDB>(GetLedgerDir(network));
        if (!db->ReadDeployment(deployment)) {
            throw std::runtime_error(strprintf("No deployment found for network %s; run init first", network));
        }
        if (deployment.strNetworkID != network) {
            throw std::runtime_error(strprintf("Deployment belongs to network %s", deployment.strNetworkID));
        }

        AccessRecord accessRecord;
        if (!db->ReadAccess(accessRecord)) {
            throw std::runtime_error("Stored access state is missing or unreadable");
        }
        access = std::make_unique<OwnerAccessControl>(accessRecord.owner, accessRecord.fPaused);

        std::map<uint160, CAmount> balances;
        if (!db->ReadBalances(balances)) {
            throw std::runtime_error("Stored balances are unreadable");
        }
        tokens.SetBalances(balances);

        ledger = std::make_unique<DistributionLedger>(ResumeParams(deployment), deployment.verifier, tokens, *access);

        LedgerSnapshot snapshot;
        if (!db->ReadSnapshot(snapshot)) {
            throw std::runtime_error("Stored ledger snapshot is missing or unreadable");
        }
        if (!ledger->LoadSnapshot(snapshot)) {
            throw std::runtime_error("Stored ledger snapshot is inconsistent with the deployment");
        }
    }

    void Commit()
    {
        AccessRecord accessRecord(access->GetOwner(), access->IsPaused());
        if (!db->WriteState(ledger->GetSnapshot(), tokens.GetBalances(), accessRecord)) {
            throw std::runtime_error("Failed to write ledger state");
        }
    }
};

static std::unique_ptr<Session> g_session;

static Session& GetSession()
{
    if (!g_session) {
        g_session = std::make_unique<Session>();
    }
    return *g_session;
}

// ============================================================================
// Commands
// ============================================================================

static UniValue keygen(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 0)
        throw std::runtime_error(
            "keygen\n"
            "\nGenerate a new secp256k1 key pair.\n"
            "\nResult:\n"
            "{\n"
            "  \"privkey\": \"hex\",   (string) 32 byte private key\n"
            "  \"pubkey\": \"hex\",    (string) compressed public key\n"
            "  \"keyid\": \"hex\"      (string) account id of the key\n"
            "}\n");

    CKey key;
    key.MakeNewKey(true);
    CPubKey pubkey = key.GetPubKey();

    UniValue result(UniValue::VOBJ);
    result.pushKV("privkey", HexStr(key.begin(), key.end()));
    result.pushKV("pubkey", HexStr(pubkey.begin(), pubkey.end()));
    result.pushKV("keyid", pubkey.GetID().GetHex());
    return result;
}

static UniValue getinfo(const CommandRequest& request);

static UniValue init(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 0)
        throw std::runtime_error(
            "init\n"
            "\nCreate a deployment in the data directory, using -verifier, -owner and\n"
            "the selected network's parameters. The distributor account is funded\n"
            "with both pool caps.\n");

    const DistributionParams& base = g_config.params;
    if (g_config.verifier.IsNull()) {
        throw std::runtime_error("init requires -verifier");
    }
    if (g_config.owner.IsNull()) {
        throw std::runtime_error("init requires -owner");
    }

    const int64_t nNow = GetTime();
    DistributionParams params = base;
    if (params.nLaunchTime == 0) {
        if (!params.fAllowImmediateStart) {
            throw std::runtime_error("init requires -launchtime on this network");
        }
        params.nLaunchTime = nNow;
    }

    std::unique_ptr<LedgerDB> db = std::make_unique<LedgerDB>(GetLedgerDir(params.strNetworkID));
    if (db->HasDeployment()) {
        throw std::runtime_error(strprintf("A deployment already exists for network %s", params.strNetworkID));
    }

    MemoryTokenLedger tokens;
    OwnerAccessControl access(g_config.owner);
    DistributionLedger ledger(params, g_config.verifier, tokens, access, nNow);
    if (!tokens.Credit(params.distributor, params.nMiningCap + params.nReferralCap)) {
        throw std::runtime_error("Failed to fund the distributor account");
    }

    DeploymentRecord deployment;
    deployment.strNetworkID = params.strNetworkID;
    deployment.nChainId = params.nChainId;
    deployment.nLaunchTime = params.nLaunchTime;
    deployment.nMigrationGracePeriod = params.nMigrationGracePeriod;
    deployment.verifier = g_config.verifier;
    deployment.owner = g_config.owner;
    deployment.nCreateTime = nNow;

    if (!db->WriteDeployment(deployment) ||
        !db->WriteState(ledger.GetSnapshot(), tokens.GetBalances(), AccessRecord(access.GetOwner(), access.IsPaused()))) {
        throw std::runtime_error("Failed to write the deployment");
    }
    LogPrintf("Initialized %s deployment, launch %d\n", params.strNetworkID, params.nLaunchTime);

    db.reset();
    return getinfo(CommandRequest());
}

static UniValue getinfo(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() > 1)
        throw std::runtime_error(
            "getinfo ( time )\n"
            "\nShow the deployment, both pools and the migration state.\n"
            "\nArguments:\n"
            "1. time    (numeric, optional) evaluate at this Unix time instead of now\n");

    Session& session = GetSession();
    const DistributionLedger& ledger = *session.ledger;
    const int64_t nNow = request.params.size() > 0 ? Int64FromString(request.params[0], "time") : GetTime();

    UniValue result(UniValue::VOBJ);
    result.pushKV("network", session.deployment.strNetworkID);
    result.pushKV("chainid", (int64_t)session.deployment.nChainId);
    result.pushKV("time", nNow);
    result.pushKV("launchtime", session.deployment.nLaunchTime);
    result.pushKV("verifier", session.deployment.verifier.GetHex());
    result.pushKV("owner", session.access->GetOwner().GetHex());
    result.pushKV("paused", session.access->IsPaused());
    result.pushKV("distributor", ledger.GetParams().distributor.GetHex());
    result.pushKV("distributorbalance", ValueFromAmount(session.tokens.GetBalance(ledger.GetParams().distributor)));
    result.pushKV("claims", (int64_t)ledger.GetClaimCount());

    UniValue pools(UniValue::VOBJ);
    for (PoolKind pool : {PoolKind::MINING, PoolKind::REFERRAL}) {
        UniValue entry(UniValue::VOBJ);
        entry.pushKV("state", PoolStateToString(ledger.GetPoolState(pool, nNow)));
        entry.pushKV("cap", ValueFromAmount(ledger.GetCap(pool)));
        entry.pushKV("unlocked", ValueFromAmount(ledger.GetUnlocked(pool, nNow)));
        entry.pushKV("distributed", ValueFromAmount(ledger.GetDistributed(pool)));
        entry.pushKV("claimable", ValueFromAmount(ledger.GetClaimable(pool, nNow)));
        pools.pushKV(PoolKindToString(pool), entry);
    }
    result.pushKV("pools", pools);

    MigrationLock migration = ledger.GetMigrationLock();
    UniValue lock(UniValue::VOBJ);
    lock.pushKV("active", migration.IsActive());
    lock.pushKV("locktime", migration.GetLockTime());
    lock.pushKV("migrationtime", migration.GetMigrationTime());
    lock.pushKV("swept", migration.IsSwept());
    lock.pushKV("miningswept", ValueFromAmount(migration.GetSwept(PoolKind::MINING)));
    lock.pushKV("referralswept", ValueFromAmount(migration.GetSwept(PoolKind::REFERRAL)));
    lock.pushKV("graceperiod", session.deployment.nMigrationGracePeriod);
    result.pushKV("migration", lock);

    return result;
}

static UniValue getschedule(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 0)
        throw std::runtime_error(
            "getschedule\n"
            "\nShow the mining emission intervals and the referral vesting duration.\n");

    const DistributionLedger& ledger = *GetSession().ledger;
    const EmissionCurve& emission = ledger.GetEmissionCurve();

    UniValue intervals(UniValue::VARR);
    for (const EmissionInterval& interval : emission.GetIntervals()) {
        UniValue entry(UniValue::VOBJ);
        entry.pushKV("rate", ValueFromAmount(interval.nRate));
        entry.pushKV("duration", interval.nDuration);
        intervals.push_back(entry);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("intervals", intervals);
    result.pushKV("totalduration", emission.GetTotalDuration());
    result.pushKV("totalemission", ValueFromAmount(emission.GetTotalEmission()));
    result.pushKV("vestingduration", ledger.GetVestingCurve().GetDuration());
    return result;
}

static UniValue signvoucher(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() < 5 || request.params.size() > 6)
        throw std::runtime_error(
            "signvoucher \"privkey\" \"pool\" \"receiver\" amount validuntil ( nonce )\n"
            "\nSign a claim voucher for this deployment with the verifier key.\n"
            "\nArguments:\n"
            "1. \"privkey\"    (string, required) verifier private key (hex)\n"
            "2. \"pool\"       (string, required) mining or referral\n"
            "3. \"receiver\"   (string, required) account to be credited\n"
            "4. amount       (numeric, required) amount in tokens\n"
            "5. validuntil   (numeric, required) last Unix time the voucher is valid\n"
            "6. nonce        (numeric, optional) voucher nonce, random if omitted\n");

    std::vector<unsigned char> vchKey = ParseHex(request.params[0]);
    CKey key;
    key.Set(vchKey.begin(), vchKey.end(), true);
    if (!key.IsValid()) {
        throw std::runtime_error("Invalid private key");
    }

    ClaimVoucher voucher;
    voucher.pool = PoolFromString(request.params[1]);
    voucher.receiver = AccountFromString(request.params[2]);
    voucher.amount = AmountFromString(request.params[3]);
    voucher.validUntil = Int64FromString(request.params[4], "validuntil");
    if (request.params.size() > 5) {
        int64_t nNonce = Int64FromString(request.params[5], "nonce");
        if (nNonce < 0) {
            throw std::runtime_error("Nonce must not be negative");
        }
        voucher.nonce = static_cast<uint64_t>(nNonce);
    } else {
        voucher.nonce = GetRand(std::numeric_limits<int64_t>::max());
    }

    const ClaimAuthorizer& authorizer = GetSession().ledger->GetAuthorizer();
    if (!voucher.Sign(key, authorizer.GetDomainSeparator())) {
        throw std::runtime_error("Signing failed");
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("pool", PoolKindToString(voucher.pool));
    result.pushKV("receiver", voucher.receiver.GetHex());
    result.pushKV("amount", ValueFromAmount(voucher.amount));
    result.pushKV("validuntil", voucher.validUntil);
    result.pushKV("nonce", strprintf("%u", voucher.nonce));
    result.pushKV("signature", HexStr(voucher.vchSig));
    result.pushKV("claimkey", authorizer.GetSigningHash(voucher).GetHex());
    result.pushKV("signer", key.GetPubKey().GetID().GetHex());
    return result;
}

static UniValue claim(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 7)
        throw std::runtime_error(
            "claim \"caller\" \"pool\" \"receiver\" amount validuntil nonce \"signature\"\n"
            "\nRedeem a signed voucher.\n"
            "\nArguments:\n"
            "1. \"caller\"     (string, required) account submitting the claim\n"
            "2. \"pool\"       (string, required) mining or referral\n"
            "3. \"receiver\"   (string, required) account to be credited\n"
            "4. amount       (numeric, required) amount in tokens\n"
            "5. validuntil   (numeric, required) voucher expiry\n"
            "6. nonce        (numeric, required) voucher nonce\n"
            "7. \"signature\"  (string, required) compact signature (hex)\n");

    uint160 caller = AccountFromString(request.params[0]);
    PoolKind pool = PoolFromString(request.params[1]);
    uint160 receiver = AccountFromString(request.params[2]);
    CAmount amount = AmountFromString(request.params[3]);
    int64_t validUntil = Int64FromString(request.params[4], "validuntil");
    int64_t nNonce = Int64FromString(request.params[5], "nonce");
    if (nNonce < 0) {
        throw std::runtime_error("Nonce must not be negative");
    }
    if (!IsHex(request.params[6])) {
        throw std::runtime_error("Signature must be hex");
    }
    std::vector<unsigned char> vchSig = ParseHex(request.params[6]);

    Session& session = GetSession();
    ClaimResult res = session.ledger->Claim(caller, pool, receiver, amount, validUntil,
                                            static_cast<uint64_t>(nNonce), vchSig);
    if (!res.success) {
        return FailureToJSON(res.error, res.errorMessage);
    }
    session.Commit();

    UniValue result(UniValue::VOBJ);
    result.pushKV("success", true);
    result.pushKV("claimkey", res.claimKey.GetHex());
    result.pushKV("amount", ValueFromAmount(res.amount));
    result.pushKV("receiverbalance", ValueFromAmount(session.tokens.GetBalance(receiver)));
    return result;
}

static UniValue startmigration(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 2)
        throw std::runtime_error(
            "startmigration \"caller\" targettime\n"
            "\nFreeze both unlock curves now and allow the sweep after targettime.\n"
            "Only the owner may call this, and only once.\n");

    uint160 caller = AccountFromString(request.params[0]);
    int64_t nTarget = Int64FromString(request.params[1], "targettime");

    Session& session = GetSession();
    LedgerResult res = session.ledger->StartMigration(caller, nTarget);
    if (!res.success) {
        return FailureToJSON(res.error, res.errorMessage);
    }
    session.Commit();

    MigrationLock migration = session.ledger->GetMigrationLock();
    UniValue result(UniValue::VOBJ);
    result.pushKV("success", true);
    result.pushKV("locktime", migration.GetLockTime());
    result.pushKV("migrationtime", migration.GetMigrationTime());
    return result;
}

static UniValue sweep(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 2)
        throw std::runtime_error(
            "sweep \"caller\" \"destination\"\n"
            "\nTransfer the undistributed remainder of both pools after the migration time.\n");

    uint160 caller = AccountFromString(request.params[0]);
    uint160 destination = AccountFromString(request.params[1]);

    Session& session = GetSession();
    SweepResult res = session.ledger->SweepRemaining(caller, destination);
    if (!res.success) {
        return FailureToJSON(res.error, res.errorMessage);
    }
    session.Commit();

    UniValue result(UniValue::VOBJ);
    result.pushKV("success", true);
    result.pushKV("amount", ValueFromAmount(res.amount));
    result.pushKV("mining", ValueFromAmount(res.miningAmount));
    result.pushKV("referral", ValueFromAmount(res.referralAmount));
    return result;
}

static UniValue AccessResultToJSON(const LedgerResult& res, Session& session)
{
    if (!res.success) {
        return FailureToJSON(res.error, res.errorMessage);
    }
    session.Commit();

    UniValue result(UniValue::VOBJ);
    result.pushKV("success", true);
    result.pushKV("owner", session.access->GetOwner().GetHex());
    result.pushKV("paused", session.access->IsPaused());
    return result;
}

static UniValue pausedistribution(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 1)
        throw std::runtime_error(
            "pause \"caller\"\n"
            "\nSuspend claims. Owner only.\n");

    Session& session = GetSession();
    return AccessResultToJSON(session.access->Pause(AccountFromString(request.params[0])), session);
}

static UniValue unpausedistribution(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 1)
        throw std::runtime_error(
            "unpause \"caller\"\n"
            "\nResume claims. Owner only.\n");

    Session& session = GetSession();
    return AccessResultToJSON(session.access->Unpause(AccountFromString(request.params[0])), session);
}

static UniValue transferownership(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 2)
        throw std::runtime_error(
            "transferownership \"caller\" \"newowner\"\n"
            "\nHand administrative control to another account. Owner only.\n");

    Session& session = GetSession();
    return AccessResultToJSON(session.access->TransferOwnership(
        AccountFromString(request.params[0]), AccountFromString(request.params[1])), session);
}

static UniValue getclaim(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 1)
        throw std::runtime_error(
            "getclaim \"claimkey\"\n"
            "\nShow the record of a redeemed voucher.\n");

    if (request.params[0].size() != 64 || !IsHex(request.params[0])) {
        throw std::runtime_error("claimkey must be 64 hex characters");
    }
    std::optional<ClaimRecord> record = GetSession().ledger->GetClaimRecord(uint256S(request.params[0]));
    if (!record) {
        throw std::runtime_error("Claim not found");
    }
    return ClaimRecordToJSON(*record);
}

static UniValue listclaims(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 1)
        throw std::runtime_error(
            "listclaims \"receiver\"\n"
            "\nList the claims credited to an account, oldest first.\n");

    UniValue result(UniValue::VARR);
    for (const ClaimRecord& record : GetSession().ledger->GetClaimsForReceiver(AccountFromString(request.params[0]))) {
        result.push_back(ClaimRecordToJSON(record));
    }
    return result;
}

static UniValue getbalance(const CommandRequest& request)
{
    if (request.fHelp || request.params.size() != 1)
        throw std::runtime_error(
            "getbalance \"account\"\n"
            "\nToken balance of an account.\n");

    return ValueFromAmount(GetSession().tokens.GetBalance(AccountFromString(request.params[0])));
}

static const CCommand vCommands[] =
{ //  name                  actor
    { "keygen",             &keygen },
    { "init",               &init },
    { "getinfo",            &getinfo },
    { "getschedule",        &getschedule },
    { "signvoucher",        &signvoucher },
    { "claim",              &claim },
    { "startmigration",     &startmigration },
    { "sweep",              &sweep },
    { "pause",              &pausedistribution },
    { "unpause",            &unpausedistribution },
    { "transferownership",  &transferownership },
    { "getclaim",           &getclaim },
    { "listclaims",         &listclaims },
    { "getbalance",         &getbalance },
};

static const CCommand* FindCommand(const std::string& name)
{
    for (const CCommand& command : vCommands) {
        if (name == command.name) {
            return &command;
        }
    }
    return nullptr;
}

// ============================================================================
// Entry point
// ============================================================================

static std::string HelpMessage()
{
    std::string strUsage = "Usage:\n  wefi-distribution [options] <command> [params]\n\n";
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message, or help for a command when one is given");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", WEFI_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0). <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console instead of debug.log file");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += GetDistributionHelpMessage();

    strUsage += HelpMessageGroup("Commands:");
    for (const CCommand& command : vCommands) {
        strUsage += "  " + std::string(command.name) + "\n";
    }
    return strUsage;
}

static bool InitLogging()
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", false);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        for (const std::string& cat : categories) {
            uint32_t flag = 0;
            if (!GetLogCategory(&flag, &cat)) {
                fprintf(stderr, "Unsupported logging category -debug=%s\n", cat.c_str());
                return false;
            }
            logCategories |= flag;
        }
    }

    if (!fPrintToConsole && !OpenDebugLog()) {
        fprintf(stderr, "Could not open debug log file in %s\n", GetDataDir().string().c_str());
        return false;
    }
    return true;
}

int main(int argc, char* argv[])
{
    std::vector<std::string> args;
    try {
        args = gArgs.ParseParameters(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", e.what());
        return EXIT_FAILURE;
    }

    bool fHelp = gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help");
    if (args.empty()) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return fHelp ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-datadir") && !fs::is_directory(fs::system_complete(gArgs.GetArg("-datadir", "")))) {
        fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", "").c_str());
        return EXIT_FAILURE;
    }
    try {
        gArgs.ReadConfigFile(gArgs.GetArg("-conf", WEFI_CONF_FILENAME));
    } catch (const std::exception& e) {
        fprintf(stderr, "Error reading configuration file: %s\n", e.what());
        return EXIT_FAILURE;
    }

    if (!InitLogging()) {
        return EXIT_FAILURE;
    }

    const CCommand* command = FindCommand(args[0]);
    if (!command) {
        fprintf(stderr, "error: unknown command '%s'\n", args[0].c_str());
        return EXIT_FAILURE;
    }

    CommandRequest request;
    request.params.assign(args.begin() + 1, args.end());
    request.fHelp = fHelp;

    ECC_Start();
    int ret = EXIT_SUCCESS;
    {
        ECCVerifyHandle verifyHandle;
        try {
            if (!ECC_InitSanityCheck()) {
                throw std::runtime_error("Elliptic curve cryptography sanity check failure");
            }
            g_config = InitDistributionConfig();
            UniValue result = command->actor(request);
            fprintf(stdout, "%s\n", result.isStr() ? result.get_str().c_str() : result.write(2).c_str());
            if (result.isObject() && result.exists("success") && !result["success"].get_bool()) {
                ret = 2;
            }
        } catch (const std::exception& e) {
            std::string strError = e.what();
            fprintf(stderr, "%s\n", fHelp ? strError.c_str() : ("error: " + strError).c_str());
            if (!fHelp) {
                LogPrintf("%s: %s\n", args[0], strError);
                ret = EXIT_FAILURE;
            }
        }
        g_session.reset();
    }
    ECC_Stop();
    CloseDebugLog();
    return ret;
}
