#ifndef REWARDLEDGER_CORE_SQLITE_LEDGER_STORE_HPP
#define REWARDLEDGER_CORE_SQLITE_LEDGER_STORE_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "core/ledger_store.hpp"

namespace rewardledger {
namespace core {

/*
  SqliteLedgerStore
  --------------------------------
  Durable ILedgerStore over a single SQLite database file.

  Schema:
    claims(affiliate, epoch, amount, path, settled_at)  PRIMARY KEY (affiliate, epoch)
    affiliate_totals(affiliate PRIMARY KEY, total)
    ledger_totals(id = 1, global_total)

  Settle() checks and writes every entry inside one BEGIN IMMEDIATE
  transaction, which takes the database write lock before the claimed-check
  so two processes sharing the file cannot both pass it. The transaction
  commits before the first effect runs. A failed effect is undone by a second
  transaction that deletes the undelivered claims and subtracts their amounts,
  so a Settle() issued from inside an effect survives it.

  Amounts and epochs are unsigned 64-bit; they are stored bit-for-bit in
  SQLite's signed INTEGER and all arithmetic happens in C++.
*/
class SqliteLedgerStore : public ILedgerStore
{
public:
    /**
     * @brief Open (or create) the database and its schema.
     * @throw std::runtime_error if the file cannot be opened or the schema created.
     */
    explicit SqliteLedgerStore(const std::string &dbFilePath);
    ~SqliteLedgerStore() override;

    SqliteLedgerStore(const SqliteLedgerStore&) = delete;
    SqliteLedgerStore& operator=(const SqliteLedgerStore&) = delete;

    bool HasClaimed(const Address &affiliate, Epoch epoch) const override;
    Amount AffiliateTotal(const Address &affiliate) const override;
    Amount GlobalTotal() const override;
    std::optional<ClaimRecord> GetClaimRecord(const Address &affiliate, Epoch epoch) const override;
    std::vector<ClaimRecord> ListClaims(Epoch epoch) const override;

    void Settle(const std::vector<SettlementEntry> &entries,
                Epoch epoch,
                SettlementPath path,
                const SettlementEffect &effect) override;

    const std::string& GetDatabasePath() const { return m_dbFilePath; }

private:
    void initDatabaseSchema();
    void exec(const char *sql) const;
    bool tryExec(const char *sql) const;

    Amount readAffiliateTotal(const Address &affiliate) const;
    Amount readGlobalTotal() const;
    bool claimExists(const Address &affiliate, Epoch epoch) const;
    void insertClaim(const SettlementEntry &entry, Epoch epoch, SettlementPath path, uint64_t now);
    void writeAffiliateTotal(const Address &affiliate, Amount total);
    void writeGlobalTotal(Amount total);
    void deleteClaim(const Address &affiliate, Epoch epoch);
    void undoFrom(const std::vector<SettlementEntry> &entries, size_t first, Epoch epoch);
    void rollbackQuietly();

    std::string m_dbFilePath;
    sqlite3 *m_db;
    mutable std::recursive_mutex m_mutex;
};

} // namespace core
} // namespace rewardledger

#endif // REWARDLEDGER_CORE_SQLITE_LEDGER_STORE_HPP
