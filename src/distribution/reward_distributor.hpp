#ifndef REWARDLEDGER_DISTRIBUTION_REWARD_DISTRIBUTOR_HPP
#define REWARDLEDGER_DISTRIBUTION_REWARD_DISTRIBUTOR_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "distribution/claim_processor.hpp"
#include "distribution/distribution_engine.hpp"
#include "distribution/settlement_context.hpp"

/**
 * @file reward_distributor.hpp
 * @brief Public face of one reward ledger instance.
 *
 * Owns the shared settlement context and routes each request to the push
 * path (DistributionEngine), the pull path (ClaimProcessor) or the
 * authority-only administrative operations implemented here.
 *
 * USAGE:
 *   @code
 *   RewardDistributor ledger("0xledger", "0xauthority", params,
 *                            store, gateway, verifier, audit);
 *   ledger.BatchDistribute("0xauthority", {{"0xaff1", 1000}}, 20250101);
 *   ledger.Claim("0xaff2", 500, 20250101, signature);
 *   @endcode
 */

namespace rewardledger {
namespace distribution {

/// Snapshot returned by RewardDistributor::Status().
struct LedgerStatus
{
    core::Address ledgerIdentity;
    core::Address authority;
    std::string   network;
    std::string   gateway;
    std::string   verifierScheme;
    core::Address verifierAuthority;
    core::Amount  custodiedBalance{0};
    core::Amount  globalTotal{0};
    size_t        auditRecords{0};
};

class RewardDistributor
{
public:
    /**
     * @throw std::invalid_argument if a dependency is missing, an identity is
     *        empty, or the verifier is bound to a different ledger identity.
     */
    RewardDistributor(const core::Address &ledgerIdentity,
                      const core::Address &authority,
                      const config::LedgerParams &params,
                      std::shared_ptr<core::ILedgerStore> store,
                      std::shared_ptr<gateway::IAssetGateway> gateway,
                      std::shared_ptr<const crypto::IAuthorizationVerifier> verifier,
                      std::shared_ptr<core::AuditLog> audit)
        : m_engine(m_ctx)
        , m_claims(m_ctx)
    {
        m_ctx.ledgerIdentity = core::NormalizeAddress(ledgerIdentity);
        m_ctx.authority = core::NormalizeAddress(authority);
        m_ctx.params = params;

        if (!core::IsWellFormedAddress(m_ctx.ledgerIdentity)) {
            throw std::invalid_argument("RewardDistributor: ledger identity is empty or malformed");
        }
        if (!core::IsWellFormedAddress(m_ctx.authority)) {
            throw std::invalid_argument("RewardDistributor: authority is empty or malformed");
        }
        if (!store || !audit) {
            throw std::invalid_argument("RewardDistributor: store and audit log are required");
        }
        checkGateway(gateway);
        checkVerifier(verifier);

        m_ctx.store = std::move(store);
        m_ctx.gateway = std::move(gateway);
        m_ctx.verifier = std::move(verifier);
        m_ctx.audit = std::move(audit);

        rewardledger::util::logger::info(
            "[RewardDistributor] Ledger " + m_ctx.ledgerIdentity + " ready on " + m_ctx.params.networkID
            + " (authority " + m_ctx.authority + ", verifier " + m_ctx.verifier->Scheme()
            + ", gateway " + m_ctx.gateway->Name() + ")");
    }

    RewardDistributor(const RewardDistributor&) = delete;
    RewardDistributor& operator=(const RewardDistributor&) = delete;

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------
    bool HasClaimed(const core::Address &affiliate, core::Epoch epoch) const
    {
        return m_ctx.store->HasClaimed(core::NormalizeAddress(affiliate), epoch);
    }

    core::Amount AffiliateTotal(const core::Address &affiliate) const
    {
        return m_ctx.store->AffiliateTotal(core::NormalizeAddress(affiliate));
    }

    core::Amount GlobalTotal() const
    {
        return m_ctx.store->GlobalTotal();
    }

    std::optional<core::ClaimRecord> GetClaimRecord(const core::Address &affiliate, core::Epoch epoch) const
    {
        return m_ctx.store->GetClaimRecord(core::NormalizeAddress(affiliate), epoch);
    }

    std::vector<core::ClaimRecord> ListClaims(core::Epoch epoch) const
    {
        return m_ctx.store->ListClaims(epoch);
    }

    std::vector<core::AuditRecord> AuditTrail() const
    {
        return m_ctx.audit->Records();
    }

    /// Balance held by the gateway under the ledger identity.
    core::Amount CustodiedBalance()
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        return m_ctx.CustodiedBalance();
    }

    LedgerStatus Status()
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        LedgerStatus status;
        status.ledgerIdentity = m_ctx.ledgerIdentity;
        status.authority = m_ctx.authority;
        status.network = m_ctx.params.networkID;
        status.gateway = m_ctx.gateway->Name();
        status.verifierScheme = m_ctx.verifier->Scheme();
        status.verifierAuthority = m_ctx.verifier->AuthorityIdentity();
        status.custodiedBalance = m_ctx.CustodiedBalance();
        status.globalTotal = m_ctx.store->GlobalTotal();
        status.auditRecords = m_ctx.audit->Size();
        return status;
    }

    const core::Address& LedgerIdentity() const { return m_ctx.ledgerIdentity; }
    const config::LedgerParams& Params() const { return m_ctx.params; }

    // ---------------------------------------------------------------------
    // Settlement
    // ---------------------------------------------------------------------
    BatchResult BatchDistribute(const core::Address &caller,
                                const std::vector<core::SettlementEntry> &entries,
                                core::Epoch epoch)
    {
        return m_engine.BatchDistribute(caller, entries, epoch);
    }

    BatchResult BatchDistribute(const core::Address &caller,
                                const std::vector<core::Address> &affiliates,
                                const std::vector<core::Amount> &amounts,
                                core::Epoch epoch)
    {
        return m_engine.BatchDistribute(caller, affiliates, amounts, epoch);
    }

    ClaimResult Claim(const core::Address &caller,
                      core::Amount amount,
                      core::Epoch epoch,
                      const std::vector<uint8_t> &signature)
    {
        return m_claims.Claim(caller, amount, epoch, signature);
    }

    // ---------------------------------------------------------------------
    // Administration (authority only)
    // ---------------------------------------------------------------------

    /**
     * @brief Point the ledger at a different asset gateway.
     *
     * Subsequent balance reads and transfers use the new handle. Operations
     * already running keep the handle they started with.
     *
     * @throw core::SettlementError(Unauthorized) for any caller but the authority.
     * @throw std::invalid_argument for a null gateway or one whose custody
     *        account is not this ledger.
     */
    void UpdateAssetReference(const core::Address &caller, std::shared_ptr<gateway::IAssetGateway> gateway)
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        m_ctx.RequireAuthority(caller, "UpdateAssetReference");
        checkGateway(gateway);

        const std::string previous = m_ctx.gateway->Name();
        m_ctx.gateway = std::move(gateway);
        rewardledger::util::logger::warn(
            "[RewardDistributor] Asset gateway changed from " + previous + " to " + m_ctx.gateway->Name());
    }

    /**
     * @brief Swap the verifier used for pull-path authorizations, e.g. after
     *        the off-chain signer's key is rotated.
     */
    void RotateAuthorizationVerifier(const core::Address &caller,
                                     std::shared_ptr<const crypto::IAuthorizationVerifier> verifier)
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        m_ctx.RequireAuthority(caller, "RotateAuthorizationVerifier");
        checkVerifier(verifier);

        const core::Address previous = m_ctx.verifier->AuthorityIdentity();
        m_ctx.verifier = std::move(verifier);
        rewardledger::util::logger::warn(
            "[RewardDistributor] Authorization signer rotated from " + previous + " to "
            + m_ctx.verifier->AuthorityIdentity() + " (" + m_ctx.verifier->Scheme() + ")");
    }

    /**
     * @brief Hand the authority role to another identity.
     * @throw std::invalid_argument if the new identity is malformed.
     */
    void TransferAuthority(const core::Address &caller, const core::Address &newAuthority)
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        m_ctx.RequireAuthority(caller, "TransferAuthority");

        const core::Address next = core::NormalizeAddress(newAuthority);
        if (!core::IsWellFormedAddress(next)) {
            throw std::invalid_argument("RewardDistributor: new authority is empty or malformed");
        }
        rewardledger::util::logger::warn(
            "[RewardDistributor] Authority transferred from " + m_ctx.authority + " to " + next);
        m_ctx.authority = next;
    }

    /**
     * @brief Move custodied value to the authority without touching any
     *        per-affiliate bookkeeping.
     *
     * @throw core::SettlementError Unauthorized, InvalidAmount (zero),
     *        InsufficientBalance or TransferFailed.
     */
    void EmergencyWithdraw(const core::Address &caller, core::Amount amount)
    {
        std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex);
        try {
            m_ctx.RequireAuthority(caller, "EmergencyWithdraw");
            if (amount == 0) {
                throw core::SettlementError(core::ErrorCode::InvalidAmount,
                    "EmergencyWithdraw: amount must be positive");
            }
            const core::Amount balance = m_ctx.CustodiedBalance();
            if (balance < amount) {
                throw core::SettlementError(core::ErrorCode::InsufficientBalance,
                    "EmergencyWithdraw: " + std::to_string(amount) + " requested but custody holds "
                    + std::to_string(balance));
            }
            if (!m_ctx.gateway->Transfer(m_ctx.authority, amount)) {
                throw core::SettlementError(core::ErrorCode::TransferFailed,
                    "EmergencyWithdraw: transfer of " + std::to_string(amount) + " to "
                    + m_ctx.authority + " failed");
            }
        }
        catch (const core::SettlementError &ex) {
            rewardledger::util::logger::warn(
                std::string("[RewardDistributor] Emergency withdrawal rejected (")
                + core::ErrorCodeName(ex.Code()) + "): " + ex.what());
            throw;
        }

        rewardledger::util::logger::critical(
            "[RewardDistributor] EMERGENCY WITHDRAWAL of " + std::to_string(amount) + " from "
            + m_ctx.ledgerIdentity + " to " + m_ctx.authority);

        core::AuditRecord record;
        record.kind = core::AuditKind::EmergencyWithdrawal;
        record.affiliate = m_ctx.authority;
        record.amount = amount;
        record.timestamp = SettlementContext::NowSeconds();
        m_ctx.EmitAudit(record);
    }

private:
    void checkGateway(const std::shared_ptr<gateway::IAssetGateway> &gateway) const
    {
        if (!gateway) {
            throw std::invalid_argument("RewardDistributor: asset gateway is required");
        }
        if (gateway->CustodyAccount() != m_ctx.ledgerIdentity) {
            throw std::invalid_argument("RewardDistributor: gateway custody account "
                + gateway->CustodyAccount() + " is not " + m_ctx.ledgerIdentity);
        }
    }

    void checkVerifier(const std::shared_ptr<const crypto::IAuthorizationVerifier> &verifier) const
    {
        if (!verifier) {
            throw std::invalid_argument("RewardDistributor: authorization verifier is required");
        }
        if (core::NormalizeAddress(verifier->LedgerIdentity()) != m_ctx.ledgerIdentity) {
            throw std::invalid_argument("RewardDistributor: verifier is bound to ledger "
                + verifier->LedgerIdentity() + ", not " + m_ctx.ledgerIdentity);
        }
    }

    SettlementContext  m_ctx;
    DistributionEngine m_engine;
    ClaimProcessor     m_claims;
};

} // namespace distribution
} // namespace rewardledger

#endif // REWARDLEDGER_DISTRIBUTION_REWARD_DISTRIBUTOR_HPP
