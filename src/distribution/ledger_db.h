// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WEFI_DISTRIBUTION_LEDGER_DB_H
#define WEFI_DISTRIBUTION_LEDGER_DB_H

#include <amount.h>
#include <dbwrapper.h>
#include <pubkey.h>
#include <serialize.h>
#include <uint256.h>
#include <distribution/distribution_ledger.h>

#include <map>
#include <memory>
#include <string>

namespace wefi {

/**
 * Database keys for distribution state
 */
static const char DB_DEPLOYMENT = 'D';        // Deployment settings
static const char DB_SNAPSHOT = 'S';          // Ledger snapshot
static const char DB_BALANCE = 'B';           // Token balance: 'B' + account -> amount
static const char DB_ACCESS = 'A';            // Owner and pause flag

/**
 * Settings fixed when a deployment is initialized. Reloaded on every
 * later run so the ledger resumes with the same launch time and keys.
 */
struct DeploymentRecord {
    std::string strNetworkID;
    uint32_t nChainId;
    int64_t nLaunchTime;
    int64_t nMigrationGracePeriod;
    CKeyID verifier;
    uint160 owner;
    int64_t nCreateTime;

    DeploymentRecord()
        : nChainId(0)
        , nLaunchTime(0)
        , nMigrationGracePeriod(0)
        , nCreateTime(0) {}

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(strNetworkID);
        READWRITE(nChainId);
        READWRITE(nLaunchTime);
        READWRITE(nMigrationGracePeriod);
        READWRITE(verifier);
        READWRITE(owner);
        READWRITE(nCreateTime);
    }
};

/** Persisted state of the owner gate */
struct AccessRecord {
    uint160 owner;
    bool fPaused;

    AccessRecord() : fPaused(false) {}
    AccessRecord(const uint160& ownerIn, bool fPausedIn) : owner(ownerIn), fPaused(fPausedIn) {}

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(owner);
        READWRITE(fPaused);
    }
};

/**
 * LedgerDB - LevelDB-backed storage for the distribution ledger
 *
 * Stores:
 * - Deployment settings
 * - The ledger snapshot
 * - Token balances of the in-memory token ledger
 * - Owner and pause flag
 *
 * All mutable state is written in one batch so the parts can never
 * disagree on disk.
 */
class LedgerDB {
public:
    LedgerDB(const fs::path& dbPath, size_t nCacheSize = 1 << 20, bool fWipe = false);
    ~LedgerDB();

    bool WriteDeployment(const DeploymentRecord& deployment);
    bool ReadDeployment(DeploymentRecord& deployment) const;
    bool HasDeployment() const;

    /** Atomically replace the stored snapshot, balances and access state */
    bool WriteState(const LedgerSnapshot& snapshot,
                    const std::map<uint160, CAmount>& balances,
                    const AccessRecord& access);

    bool ReadSnapshot(LedgerSnapshot& snapshot) const;
    bool ReadBalances(std::map<uint160, CAmount>& balances) const;
    bool ReadAccess(AccessRecord& access) const;

private:
    std::unique_ptr<CDBWrapper> db;
};

} // namespace wefi

#endif // WEFI_DISTRIBUTION_LEDGER_DB_H
