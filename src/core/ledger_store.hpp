#ifndef REWARDLEDGER_CORE_LEDGER_STORE_HPP
#define REWARDLEDGER_CORE_LEDGER_STORE_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "core/settlement_error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

/**
 * @file ledger_store.hpp
 * @brief Authoritative record of settled (affiliate, epoch) pairs and running totals.
 *
 * The store is the single serialization point both settlement paths funnel
 * through. Invariants every implementation keeps:
 *   - A pair goes from unclaimed to claimed exactly once and never back.
 *   - GlobalTotal() equals the sum of AffiliateTotal() over all affiliates.
 *   - No intermediate state of a Settle() call is visible to another thread.
 */

namespace rewardledger {
namespace core {

/**
 * @brief Side effect run for each entry once the whole call's bookkeeping is
 *        committed. Throwing undoes that entry and every entry after it.
 */
using SettlementEffect = std::function<void(const SettlementEntry &entry)>;

/**
 * @class ILedgerStore
 * @brief Abstract ledger state store.
 */
class ILedgerStore
{
public:
    virtual ~ILedgerStore() = default;

    virtual bool HasClaimed(const Address &affiliate, Epoch epoch) const = 0;

    /// Cumulative amount settled to the affiliate (0 if never settled).
    virtual Amount AffiliateTotal(const Address &affiliate) const = 0;

    virtual Amount GlobalTotal() const = 0;

    virtual std::optional<ClaimRecord> GetClaimRecord(const Address &affiliate, Epoch epoch) const = 0;

    /// Every settlement committed for the epoch, ordered by affiliate.
    virtual std::vector<ClaimRecord> ListClaims(Epoch epoch) const = 0;

    /**
     * @brief Commit a group of settlements for one epoch.
     *
     * Phase one checks every entry (against committed state and against the
     * other entries of the same call) and throws AlreadyClaimed, or
     * InvalidAmount on total overflow, before anything changes.
     *
     * Phase two commits the claim flag and both totals of every entry as one
     * unit. Only then does phase three run effect(entry) for each entry in
     * order. If an effect throws, the bookkeeping of that entry and every
     * later entry is undone, entries whose effect already completed stay
     * committed, and the exception propagates.
     *
     * An effect may call Settle() again on the same thread. The nested call
     * commits on its own and is never undone by the outer call: undoing
     * subtracts the outer entries' amounts instead of restoring a snapshot.
     *
     * @param effect may be empty, in which case phase three is skipped.
     */
    virtual void Settle(const std::vector<SettlementEntry> &entries,
                        Epoch epoch,
                        SettlementPath path,
                        const SettlementEffect &effect) = 0;

    /**
     * @brief Single-entry mutation primitive.
     * @throw SettlementError(AlreadyClaimed) if the pair is already settled.
     */
    void RecordSettlement(const Address &affiliate, Epoch epoch, Amount amount, SettlementPath path)
    {
        Settle({SettlementEntry(affiliate, amount)}, epoch, path, SettlementEffect());
    }

protected:
    static uint64_t NowSeconds()
    {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
};

/**
 * @class InMemoryLedgerStore
 * @brief Hash-map store keyed by the composite (affiliate, epoch) key.
 *
 * Suitable for tests and single-process deployments that persist elsewhere.
 * The mutex is recursive so an effect running inside Settle() on the same
 * thread can still read and settle (and sees its own entries as claimed).
 */
class InMemoryLedgerStore : public ILedgerStore
{
public:
    InMemoryLedgerStore() = default;
    ~InMemoryLedgerStore() override = default;

    bool HasClaimed(const Address &affiliate, Epoch epoch) const override
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        return m_claims.find(ClaimKey{affiliate, epoch}) != m_claims.end();
    }

    Amount AffiliateTotal(const Address &affiliate) const override
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        auto it = m_affiliateTotals.find(affiliate);
        return it == m_affiliateTotals.end() ? 0 : it->second;
    }

    Amount GlobalTotal() const override
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        return m_globalTotal;
    }

    std::optional<ClaimRecord> GetClaimRecord(const Address &affiliate, Epoch epoch) const override
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        auto it = m_claims.find(ClaimKey{affiliate, epoch});
        if (it == m_claims.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<ClaimRecord> ListClaims(Epoch epoch) const override
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        std::vector<ClaimRecord> out;
        for (const auto &kv : m_claims) {
            if (kv.first.epoch == epoch) {
                out.push_back(kv.second);
            }
        }
        std::sort(out.begin(), out.end(), [](const ClaimRecord &a, const ClaimRecord &b) {
            return a.affiliate < b.affiliate;
        });
        return out;
    }

    void Settle(const std::vector<SettlementEntry> &entries,
                Epoch epoch,
                SettlementPath path,
                const SettlementEffect &effect) override
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);

        // Phase one: nothing is written until every entry is known to fit.
        std::unordered_set<Address> seen;
        std::unordered_map<Address, Amount> projected;
        Amount projectedGlobal = m_globalTotal;
        for (const auto &entry : entries) {
            if (!seen.insert(entry.affiliate).second
                || m_claims.find(ClaimKey{entry.affiliate, epoch}) != m_claims.end()) {
                throw SettlementError(ErrorCode::AlreadyClaimed,
                    "InMemoryLedgerStore: " + entry.affiliate + " already settled for epoch "
                    + std::to_string(epoch));
            }
            auto it = m_affiliateTotals.find(entry.affiliate);
            Amount current = (it == m_affiliateTotals.end()) ? 0 : it->second;
            if (!CheckedAdd(current, entry.amount, projected[entry.affiliate])
                || !CheckedAdd(projectedGlobal, entry.amount, projectedGlobal)) {
                throw SettlementError(ErrorCode::InvalidAmount,
                    "InMemoryLedgerStore: total overflow settling " + entry.affiliate);
            }
        }

        // Phase two: all bookkeeping before any effect.
        const uint64_t now = NowSeconds();
        for (const auto &entry : entries) {
            apply(entry, epoch, path, now);
        }

        // Phase three: effects in order; a failure undoes the undelivered tail.
        if (effect) {
            for (size_t i = 0; i < entries.size(); ++i) {
                try {
                    effect(entries[i]);
                }
                catch (...) {
                    for (size_t j = i; j < entries.size(); ++j) {
                        revert(entries[j], epoch);
                    }
                    throw;
                }
            }
        }

        rewardledger::util::logger::debug(
            "[InMemoryLedgerStore] Settled " + std::to_string(entries.size())
            + " entries for epoch " + std::to_string(epoch));
    }

private:
    struct ClaimKey
    {
        Address affiliate;
        Epoch   epoch;

        bool operator==(const ClaimKey &other) const
        {
            return epoch == other.epoch && affiliate == other.affiliate;
        }
    };

    struct ClaimKeyHash
    {
        size_t operator()(const ClaimKey &key) const
        {
            size_t h = std::hash<Address>()(key.affiliate);
            return h ^ (std::hash<Epoch>()(key.epoch) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        }
    };

    void apply(const SettlementEntry &entry, Epoch epoch, SettlementPath path, uint64_t now)
    {
        ClaimRecord record;
        record.affiliate = entry.affiliate;
        record.epoch = epoch;
        record.amount = entry.amount;
        record.path = path;
        record.settledAt = now;
        m_claims.emplace(ClaimKey{entry.affiliate, epoch}, record);
        m_affiliateTotals[entry.affiliate] += entry.amount;
        m_globalTotal += entry.amount;
    }

    void revert(const SettlementEntry &entry, Epoch epoch)
    {
        m_claims.erase(ClaimKey{entry.affiliate, epoch});
        auto it = m_affiliateTotals.find(entry.affiliate);
        it->second -= entry.amount;
        if (it->second == 0) {
            m_affiliateTotals.erase(it);
        }
        m_globalTotal -= entry.amount;
    }

    mutable std::recursive_mutex m_mutex;
    std::unordered_map<ClaimKey, ClaimRecord, ClaimKeyHash> m_claims;
    std::unordered_map<Address, Amount> m_affiliateTotals;
    Amount m_globalTotal{0};
};

} // namespace core
} // namespace rewardledger

#endif // REWARDLEDGER_CORE_LEDGER_STORE_HPP
