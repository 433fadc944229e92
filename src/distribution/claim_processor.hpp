#ifndef REWARDLEDGER_DISTRIBUTION_CLAIM_PROCESSOR_HPP
#define REWARDLEDGER_DISTRIBUTION_CLAIM_PROCESSOR_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "distribution/settlement_context.hpp"

namespace rewardledger {
namespace distribution {

struct ClaimResult
{
    core::Address affiliate;
    core::Amount  amount{0};
    core::Epoch   epoch{0};
    core::Address authorizedBy;
};

/**
 * @class ClaimProcessor
 * @brief Affiliate-driven pull path, gated by the authorization verifier.
 *
 * The caller's identity is the claiming affiliate. Checks run in this order
 * and any failure leaves the ledger untouched:
 *   amount > 0, pair not yet settled, signature valid, custody covers amount.
 *
 * A transfer failure after the bookkeeping is written rolls that bookkeeping
 * back, so the affiliate can resubmit the same token.
 */
class ClaimProcessor
{
public:
    explicit ClaimProcessor(SettlementContext &context)
        : m_ctx(context)
    {
    }

    ClaimResult Claim(const core::Address &caller,
                      core::Amount amount,
                      core::Epoch epoch,
                      const std::vector<uint8_t> &signature)
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        try {
            return claim(core::NormalizeAddress(caller), amount, epoch, signature);
        }
        catch (const core::SettlementError &ex) {
            rewardledger::util::logger::warn(
                "[ClaimProcessor] Claim by " + caller + " for epoch " + std::to_string(epoch)
                + " rejected (" + core::ErrorCodeName(ex.Code()) + "): " + ex.what());
            throw;
        }
    }

private:
    ClaimResult claim(const core::Address &affiliate,
                      core::Amount amount,
                      core::Epoch epoch,
                      const std::vector<uint8_t> &signature)
    {
        using core::ErrorCode;
        using core::SettlementError;

        if (!core::IsWellFormedAddress(affiliate)) {
            throw SettlementError(ErrorCode::Unauthorized, "Claim: no caller identity");
        }
        if (amount == 0) {
            throw SettlementError(ErrorCode::InvalidAmount, "Claim: amount must be positive");
        }
        if (m_ctx.store->HasClaimed(affiliate, epoch)) {
            throw SettlementError(ErrorCode::AlreadyClaimed,
                "Claim: " + affiliate + " already settled for epoch " + std::to_string(epoch));
        }

        crypto::AuthorizationToken token;
        token.affiliate = affiliate;
        token.amount = amount;
        token.epoch = epoch;
        token.signature = signature;
        const core::Address authorizedBy = m_ctx.verifier->Verify(token);

        const core::Amount balance = m_ctx.CustodiedBalance();
        if (balance < amount) {
            throw SettlementError(ErrorCode::InsufficientBalance,
                "Claim: " + std::to_string(amount) + " requested but custody holds " + std::to_string(balance));
        }

        std::shared_ptr<gateway::IAssetGateway> gateway = m_ctx.gateway;
        m_ctx.store->Settle({core::SettlementEntry(affiliate, amount)}, epoch, core::SettlementPath::Claim,
            [&gateway](const core::SettlementEntry &entry) {
                if (!gateway->Transfer(entry.affiliate, entry.amount)) {
                    throw SettlementError(ErrorCode::TransferFailed,
                        "Claim: transfer of " + std::to_string(entry.amount) + " to " + entry.affiliate
                        + " failed; claim rolled back");
                }
            });

        core::AuditRecord record;
        record.kind = core::AuditKind::Claim;
        record.affiliate = affiliate;
        record.amount = amount;
        record.epoch = epoch;
        record.timestamp = SettlementContext::NowSeconds();
        m_ctx.EmitAudit(record);

        rewardledger::util::logger::info(
            "[ClaimProcessor] " + affiliate + " claimed " + std::to_string(amount) + " for epoch "
            + std::to_string(epoch) + " (authorized by " + authorizedBy + ")");

        ClaimResult result;
        result.affiliate = affiliate;
        result.amount = amount;
        result.epoch = epoch;
        result.authorizedBy = authorizedBy;
        return result;
    }

    SettlementContext &m_ctx;
};

} // namespace distribution
} // namespace rewardledger

#endif // REWARDLEDGER_DISTRIBUTION_CLAIM_PROCESSOR_HPP
