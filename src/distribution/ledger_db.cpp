// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <distribution/ledger_db.h>

#include <util.h>
#include <utilstrencodings.h>

#include <utility>

namespace wefi {

LedgerDB::LedgerDB(const fs::path& dbPath, size_t nCacheSize, bool fWipe)
{
    db = std::make_unique<CDBWrapper>(dbPath, nCacheSize, fWipe);
}

LedgerDB::~LedgerDB() {
}

bool LedgerDB::WriteDeployment(const DeploymentRecord& deployment)
{
    try {
        db->Write(DB_DEPLOYMENT, deployment, true);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
    LogPrint(WLog::DB, "LedgerDB: wrote deployment network=%s launch=%d\n",
        deployment.strNetworkID, deployment.nLaunchTime);
    return true;
}

bool LedgerDB::ReadDeployment(DeploymentRecord& deployment) const
{
    try {
        return db->Read(DB_DEPLOYMENT, deployment);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
}

bool LedgerDB::HasDeployment() const
{
    try {
        return db->Exists(DB_DEPLOYMENT);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
}

bool LedgerDB::WriteState(const LedgerSnapshot& snapshot,
                          const std::map<uint160, CAmount>& balances,
                          const AccessRecord& access)
{
    try {
        std::map<uint160, CAmount> stored;
        if (!ReadBalances(stored)) {
            return false;
        }

        CDBBatch batch;
        batch.Write(DB_SNAPSHOT, snapshot);
        batch.Write(DB_ACCESS, access);
        for (const auto& entry : stored) {
            if (!balances.count(entry.first)) {
                batch.Erase(std::make_pair(DB_BALANCE, entry.first));
            }
        }
        for (const auto& entry : balances) {
            batch.Write(std::make_pair(DB_BALANCE, entry.first), entry.second);
        }
        db->WriteBatch(batch, true);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }

    LogPrint(WLog::DB, "LedgerDB: wrote snapshot %s (%u claims, %u balances)\n",
        snapshot.GetHash().ToString(), snapshot.claims.size(), balances.size());
    return true;
}

bool LedgerDB::ReadSnapshot(LedgerSnapshot& snapshot) const
{
    try {
        return db->Read(DB_SNAPSHOT, snapshot);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
}

bool LedgerDB::ReadAccess(AccessRecord& access) const
{
    try {
        return db->Read(DB_ACCESS, access);
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
}

bool LedgerDB::ReadBalances(std::map<uint160, CAmount>& balances) const
{
    balances.clear();
    try {
        std::unique_ptr<CDBIterator> pcursor(db->NewIterator());
        pcursor->Seek(std::make_pair(DB_BALANCE, uint160()));
        while (pcursor->Valid()) {
            std::pair<char, uint160> key;
            if (!pcursor->GetKey(key) || key.first != DB_BALANCE) {
                break;
            }
            CAmount nBalance;
            if (!pcursor->GetValue(nBalance)) {
                return error("%s: unreadable balance for %s", __func__, key.second.ToString());
            }
            balances[key.second] = nBalance;
            pcursor->Next();
        }
    } catch (const dbwrapper_error& e) {
        return error("%s: %s", __func__, e.what());
    }
    return true;
}

} // namespace wefi
