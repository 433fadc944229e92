#include "core/sqlite_ledger_store.hpp"

#include <stdexcept>
#include <unordered_set>

namespace rewardledger {
namespace core {

namespace {

// Owns one prepared statement; finalized on every exit path.
class Statement
{
public:
    Statement(sqlite3 *db, const char *sql)
        : m_db(db), m_stmt(nullptr)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK || !m_stmt) {
            throw std::runtime_error(std::string("SqliteLedgerStore: prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int idx, const std::string &value)
    {
        check(sqlite3_bind_text(m_stmt, idx, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }

    void bindU64(int idx, uint64_t value)
    {
        check(sqlite3_bind_int64(m_stmt, idx, static_cast<sqlite3_int64>(value)));
    }

    // Returns true while a row is available.
    bool stepRow()
    {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw std::runtime_error(std::string("SqliteLedgerStore: step failed: ") + sqlite3_errmsg(m_db));
    }

    uint64_t columnU64(int col) const
    {
        return static_cast<uint64_t>(sqlite3_column_int64(m_stmt, col));
    }

    std::string columnText(int col) const
    {
        const unsigned char *text = sqlite3_column_text(m_stmt, col);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    }

private:
    void check(int rc)
    {
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::string("SqliteLedgerStore: bind failed: ") + sqlite3_errmsg(m_db));
        }
    }

    sqlite3 *m_db;
    sqlite3_stmt *m_stmt;
};

ClaimRecord readClaimRow(const Statement &stmt)
{
    ClaimRecord record;
    record.affiliate = stmt.columnText(0);
    record.epoch = stmt.columnU64(1);
    record.amount = stmt.columnU64(2);
    record.path = ParseSettlementPath(stmt.columnText(3));
    record.settledAt = stmt.columnU64(4);
    return record;
}

} // namespace

// -------------------------------------------------------------------------
// Construction / schema
// -------------------------------------------------------------------------
SqliteLedgerStore::SqliteLedgerStore(const std::string &dbFilePath)
    : m_dbFilePath(dbFilePath), m_db(nullptr)
{
    int rc = sqlite3_open(m_dbFilePath.c_str(), &m_db);
    if (rc != SQLITE_OK || m_db == nullptr) {
        std::string reason = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("SqliteLedgerStore: could not open " + m_dbFilePath + ": " + reason);
    }
    sqlite3_busy_timeout(m_db, 5000);

    try {
        initDatabaseSchema();
    }
    catch (...) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }

    rewardledger::util::logger::info("[SqliteLedgerStore] Opened ledger database " + m_dbFilePath);
}

SqliteLedgerStore::~SqliteLedgerStore()
{
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void SqliteLedgerStore::initDatabaseSchema()
{
    // WAL lets readers proceed while a settlement transaction holds the write lock.
    if (!tryExec("PRAGMA journal_mode=WAL;")) {
        rewardledger::util::logger::warn("[SqliteLedgerStore] WAL journal unavailable, using default journal.");
    }

    exec("CREATE TABLE IF NOT EXISTS claims ("
         " affiliate  TEXT    NOT NULL,"
         " epoch      INTEGER NOT NULL,"
         " amount     INTEGER NOT NULL,"
         " path       TEXT    NOT NULL,"
         " settled_at INTEGER NOT NULL,"
         " PRIMARY KEY (affiliate, epoch)"
         ");");
    exec("CREATE TABLE IF NOT EXISTS affiliate_totals ("
         " affiliate TEXT PRIMARY KEY,"
         " total     INTEGER NOT NULL"
         ");");
    exec("CREATE TABLE IF NOT EXISTS ledger_totals ("
         " id           INTEGER PRIMARY KEY CHECK (id = 1),"
         " global_total INTEGER NOT NULL"
         ");");
    exec("INSERT OR IGNORE INTO ledger_totals (id, global_total) VALUES (1, 0);");
    exec("CREATE INDEX IF NOT EXISTS idx_claims_epoch ON claims (epoch);");
}

void SqliteLedgerStore::exec(const char *sql) const
{
    char *errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string reason = errMsg ? errMsg : sqlite3_errmsg(m_db);
        sqlite3_free(errMsg);
        throw std::runtime_error("SqliteLedgerStore: '" + std::string(sql) + "' failed: " + reason);
    }
}

bool SqliteLedgerStore::tryExec(const char *sql) const
{
    return sqlite3_exec(m_db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
}

// -------------------------------------------------------------------------
// Reads
// -------------------------------------------------------------------------
bool SqliteLedgerStore::HasClaimed(const Address &affiliate, Epoch epoch) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return claimExists(affiliate, epoch);
}

Amount SqliteLedgerStore::AffiliateTotal(const Address &affiliate) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return readAffiliateTotal(affiliate);
}

Amount SqliteLedgerStore::GlobalTotal() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return readGlobalTotal();
}

std::optional<ClaimRecord> SqliteLedgerStore::GetClaimRecord(const Address &affiliate, Epoch epoch) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Statement stmt(m_db, "SELECT affiliate, epoch, amount, path, settled_at FROM claims"
                         " WHERE affiliate = ? AND epoch = ?;");
    stmt.bindText(1, affiliate);
    stmt.bindU64(2, epoch);
    if (!stmt.stepRow()) {
        return std::nullopt;
    }
    return readClaimRow(stmt);
}

std::vector<ClaimRecord> SqliteLedgerStore::ListClaims(Epoch epoch) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Statement stmt(m_db, "SELECT affiliate, epoch, amount, path, settled_at FROM claims"
                         " WHERE epoch = ? ORDER BY affiliate;");
    stmt.bindU64(1, epoch);
    std::vector<ClaimRecord> out;
    while (stmt.stepRow()) {
        out.push_back(readClaimRow(stmt));
    }
    return out;
}

bool SqliteLedgerStore::claimExists(const Address &affiliate, Epoch epoch) const
{
    Statement stmt(m_db, "SELECT 1 FROM claims WHERE affiliate = ? AND epoch = ?;");
    stmt.bindText(1, affiliate);
    stmt.bindU64(2, epoch);
    return stmt.stepRow();
}

Amount SqliteLedgerStore::readAffiliateTotal(const Address &affiliate) const
{
    Statement stmt(m_db, "SELECT total FROM affiliate_totals WHERE affiliate = ?;");
    stmt.bindText(1, affiliate);
    return stmt.stepRow() ? stmt.columnU64(0) : 0;
}

Amount SqliteLedgerStore::readGlobalTotal() const
{
    Statement stmt(m_db, "SELECT global_total FROM ledger_totals WHERE id = 1;");
    return stmt.stepRow() ? stmt.columnU64(0) : 0;
}

// -------------------------------------------------------------------------
// Writes
// -------------------------------------------------------------------------
void SqliteLedgerStore::insertClaim(const SettlementEntry &entry, Epoch epoch, SettlementPath path, uint64_t now)
{
    Statement stmt(m_db, "INSERT INTO claims (affiliate, epoch, amount, path, settled_at)"
                         " VALUES (?, ?, ?, ?, ?);");
    stmt.bindText(1, entry.affiliate);
    stmt.bindU64(2, epoch);
    stmt.bindU64(3, entry.amount);
    stmt.bindText(4, SettlementPathName(path));
    stmt.bindU64(5, now);
    stmt.stepRow();
}

void SqliteLedgerStore::writeAffiliateTotal(const Address &affiliate, Amount total)
{
    Statement stmt(m_db, "INSERT OR REPLACE INTO affiliate_totals (affiliate, total) VALUES (?, ?);");
    stmt.bindText(1, affiliate);
    stmt.bindU64(2, total);
    stmt.stepRow();
}

void SqliteLedgerStore::writeGlobalTotal(Amount total)
{
    Statement stmt(m_db, "UPDATE ledger_totals SET global_total = ? WHERE id = 1;");
    stmt.bindU64(1, total);
    stmt.stepRow();
}

void SqliteLedgerStore::deleteClaim(const Address &affiliate, Epoch epoch)
{
    Statement stmt(m_db, "DELETE FROM claims WHERE affiliate = ? AND epoch = ?;");
    stmt.bindText(1, affiliate);
    stmt.bindU64(2, epoch);
    stmt.stepRow();
}

void SqliteLedgerStore::rollbackQuietly()
{
    if (sqlite3_get_autocommit(m_db) == 0 && !tryExec("ROLLBACK;")) {
        rewardledger::util::logger::error("[SqliteLedgerStore] Rollback failed: "
                                          + std::string(sqlite3_errmsg(m_db)));
    }
}

void SqliteLedgerStore::Settle(const std::vector<SettlementEntry> &entries,
                               Epoch epoch,
                               SettlementPath path,
                               const SettlementEffect &effect)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    exec("BEGIN IMMEDIATE;");
    try {
        // Phase one: check every entry before writing anything.
        std::unordered_set<Address> seen;
        Amount projectedGlobal = readGlobalTotal();
        for (const auto &entry : entries) {
            if (!seen.insert(entry.affiliate).second || claimExists(entry.affiliate, epoch)) {
                throw SettlementError(ErrorCode::AlreadyClaimed,
                    "SqliteLedgerStore: " + entry.affiliate + " already settled for epoch "
                    + std::to_string(epoch));
            }
            Amount projected = 0;
            if (!CheckedAdd(readAffiliateTotal(entry.affiliate), entry.amount, projected)
                || !CheckedAdd(projectedGlobal, entry.amount, projectedGlobal)) {
                throw SettlementError(ErrorCode::InvalidAmount,
                    "SqliteLedgerStore: total overflow settling " + entry.affiliate);
            }
        }

        // Phase two: all bookkeeping, committed before any effect runs.
        const uint64_t now = NowSeconds();
        for (const auto &entry : entries) {
            insertClaim(entry, epoch, path, now);
            writeAffiliateTotal(entry.affiliate, readAffiliateTotal(entry.affiliate) + entry.amount);
            writeGlobalTotal(readGlobalTotal() + entry.amount);
        }
        exec("COMMIT;");
    }
    catch (...) {
        rollbackQuietly();
        throw;
    }

    // Phase three: effects run outside any transaction, so a Settle() made
    // from inside an effect commits independently of this call.
    if (effect) {
        for (size_t i = 0; i < entries.size(); ++i) {
            try {
                effect(entries[i]);
            }
            catch (...) {
                undoFrom(entries, i, epoch);
                throw;
            }
        }
    }

    rewardledger::util::logger::debug("[SqliteLedgerStore] Settled " + std::to_string(entries.size())
                                      + " entries for epoch " + std::to_string(epoch));
}

void SqliteLedgerStore::undoFrom(const std::vector<SettlementEntry> &entries, size_t first, Epoch epoch)
{
    try {
        exec("BEGIN IMMEDIATE;");
        for (size_t i = first; i < entries.size(); ++i) {
            const SettlementEntry &entry = entries[i];
            deleteClaim(entry.affiliate, epoch);
            writeAffiliateTotal(entry.affiliate, readAffiliateTotal(entry.affiliate) - entry.amount);
            writeGlobalTotal(readGlobalTotal() - entry.amount);
        }
        exec("COMMIT;");
    }
    catch (const std::exception &ex) {
        rollbackQuietly();
        // The undelivered entries stay recorded as settled; the operator must reconcile by hand.
        rewardledger::util::logger::critical(
            "[SqliteLedgerStore] Could not undo " + std::to_string(entries.size() - first)
            + " undelivered entries for epoch " + std::to_string(epoch) + ": " + ex.what());
    }
}

} // namespace core
} // namespace rewardledger
