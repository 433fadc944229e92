#ifndef REWARDLEDGER_DISTRIBUTION_DISTRIBUTION_ENGINE_HPP
#define REWARDLEDGER_DISTRIBUTION_DISTRIBUTION_ENGINE_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "distribution/settlement_context.hpp"

/*
  DistributionEngine
  --------------------------------
  Authority-driven push path: settle one epoch's rewards for a list of
  affiliates in a single all-or-nothing step.

  Checks, in order:
    1. caller is the authority                         -> Unauthorized
    2. non-empty, within maxBatchSize, every affiliate
       well formed, every amount > 0, sum fits u64     -> InvalidBatch
    3. custodied balance >= sum                        -> InsufficientBalance
    4. no (affiliate, epoch) already settled, and no
       affiliate listed twice                          -> AlreadyClaimed
  Any of these aborts before a single total changes or a transfer is issued.

  Then each entry's bookkeeping commits and its transfer is issued. If a
  transfer fails, that entry and the rest of the batch are rolled back and
  TransferFailed reports how many entries were paid; paid entries stay
  settled because their value has already moved.

  Audit: one BatchEntry record per paid affiliate and one BatchSummary.
*/

namespace rewardledger {
namespace distribution {

struct BatchResult
{
    core::Epoch  epoch{0};
    size_t       entryCount{0};
    core::Amount totalAmount{0};
};

class DistributionEngine
{
public:
    explicit DistributionEngine(SettlementContext &context)
        : m_ctx(context)
    {
    }

    BatchResult BatchDistribute(const core::Address &caller,
                                const std::vector<core::SettlementEntry> &entries,
                                core::Epoch epoch)
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        try {
            return distribute(caller, entries, epoch);
        }
        catch (const core::SettlementError &ex) {
            rewardledger::util::logger::warn(
                "[DistributionEngine] Batch for epoch " + std::to_string(epoch) + " rejected ("
                + core::ErrorCodeName(ex.Code()) + "): " + ex.what());
            throw;
        }
    }

    /**
     * @brief Parallel-array form, as submitted by wire surfaces.
     * @throw core::SettlementError(InvalidBatch) if the arrays differ in length.
     */
    BatchResult BatchDistribute(const core::Address &caller,
                                const std::vector<core::Address> &affiliates,
                                const std::vector<core::Amount> &amounts,
                                core::Epoch epoch)
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        m_ctx.RequireAuthority(caller, "BatchDistribute");
        if (affiliates.size() != amounts.size()) {
            throw core::SettlementError(core::ErrorCode::InvalidBatch,
                "BatchDistribute: " + std::to_string(affiliates.size()) + " affiliates but "
                + std::to_string(amounts.size()) + " amounts");
        }
        std::vector<core::SettlementEntry> entries;
        entries.reserve(affiliates.size());
        for (size_t i = 0; i < affiliates.size(); ++i) {
            entries.emplace_back(affiliates[i], amounts[i]);
        }
        return BatchDistribute(caller, entries, epoch);
    }

private:
    BatchResult distribute(const core::Address &caller,
                           const std::vector<core::SettlementEntry> &entries,
                           core::Epoch epoch)
    {
        using core::ErrorCode;
        using core::SettlementError;

        m_ctx.RequireAuthority(caller, "BatchDistribute");

        if (entries.empty()) {
            throw SettlementError(ErrorCode::InvalidBatch, "BatchDistribute: empty batch");
        }
        if (entries.size() > m_ctx.params.maxBatchSize) {
            throw SettlementError(ErrorCode::InvalidBatch,
                "BatchDistribute: " + std::to_string(entries.size()) + " entries exceed the "
                + m_ctx.params.networkID + " limit of " + std::to_string(m_ctx.params.maxBatchSize));
        }

        std::vector<core::SettlementEntry> batch;
        batch.reserve(entries.size());
        core::Amount sum = 0;
        for (size_t i = 0; i < entries.size(); ++i) {
            core::SettlementEntry entry(core::NormalizeAddress(entries[i].affiliate), entries[i].amount);
            if (!core::IsWellFormedAddress(entry.affiliate)) {
                throw SettlementError(ErrorCode::InvalidBatch,
                    "BatchDistribute: entry " + std::to_string(i) + " has no valid affiliate");
            }
            if (entry.amount == 0) {
                throw SettlementError(ErrorCode::InvalidBatch,
                    "BatchDistribute: entry " + std::to_string(i) + " (" + entry.affiliate + ") has zero amount");
            }
            if (!core::CheckedAdd(sum, entry.amount, sum)) {
                throw SettlementError(ErrorCode::InvalidBatch, "BatchDistribute: batch sum overflows");
            }
            batch.push_back(std::move(entry));
        }

        const core::Amount balance = m_ctx.CustodiedBalance();
        if (balance < sum) {
            throw SettlementError(ErrorCode::InsufficientBalance,
                "BatchDistribute: batch needs " + std::to_string(sum) + " but custody holds "
                + std::to_string(balance));
        }

        std::shared_ptr<gateway::IAssetGateway> gateway = m_ctx.gateway;
        size_t delivered = 0;
        auto transfer = [&](const core::SettlementEntry &entry) {
            if (!gateway->Transfer(entry.affiliate, entry.amount)) {
                throw SettlementError(ErrorCode::TransferFailed,
                    "BatchDistribute: transfer of " + std::to_string(entry.amount) + " to "
                    + entry.affiliate + " failed; " + std::to_string(delivered) + " of "
                    + std::to_string(batch.size()) + " entries were paid");
            }
            ++delivered;
        };

        try {
            m_ctx.store->Settle(batch, epoch, core::SettlementPath::Batch, transfer);
        }
        catch (...) {
            if (delivered > 0) {
                rewardledger::util::logger::error(
                    "[DistributionEngine] Epoch " + std::to_string(epoch) + " batch stopped after "
                    + std::to_string(delivered) + " of " + std::to_string(batch.size()) + " transfers");
                emitAudit(batch, delivered, epoch);
            }
            throw;
        }

        emitAudit(batch, batch.size(), epoch);
        rewardledger::util::logger::info(
            "[DistributionEngine] Distributed " + std::to_string(sum) + " to "
            + std::to_string(batch.size()) + " affiliates for epoch " + std::to_string(epoch));

        BatchResult result;
        result.epoch = epoch;
        result.entryCount = batch.size();
        result.totalAmount = sum;
        return result;
    }

    // Records the first `paid` entries and a summary over them.
    void emitAudit(const std::vector<core::SettlementEntry> &batch, size_t paid, core::Epoch epoch)
    {
        const uint64_t now = SettlementContext::NowSeconds();
        core::Amount paidSum = 0;
        for (size_t i = 0; i < paid; ++i) {
            core::AuditRecord record;
            record.kind = core::AuditKind::BatchEntry;
            record.affiliate = batch[i].affiliate;
            record.amount = batch[i].amount;
            record.epoch = epoch;
            record.timestamp = now;
            m_ctx.EmitAudit(record);
            paidSum += batch[i].amount;
        }

        core::AuditRecord summary;
        summary.kind = core::AuditKind::BatchSummary;
        summary.amount = paidSum;
        summary.epoch = epoch;
        summary.entryCount = paid;
        summary.timestamp = now;
        m_ctx.EmitAudit(summary);
    }

    SettlementContext &m_ctx;
};

} // namespace distribution
} // namespace rewardledger

#endif // REWARDLEDGER_DISTRIBUTION_DISTRIBUTION_ENGINE_HPP
