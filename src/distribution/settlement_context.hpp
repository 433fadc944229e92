#ifndef REWARDLEDGER_DISTRIBUTION_SETTLEMENT_CONTEXT_HPP
#define REWARDLEDGER_DISTRIBUTION_SETTLEMENT_CONTEXT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include "config/ledger_params.hpp"
#include "core/audit_log.hpp"
#include "core/ledger_store.hpp"
#include "core/settlement_error.hpp"
#include "crypto/authorization_verifier.hpp"
#include "gateway/asset_gateway.hpp"
#include "util/logger.hpp"

namespace rewardledger {
namespace distribution {

/**
 * @struct SettlementContext
 * @brief State shared by the push path, the pull path and the admin surface.
 *
 * Every mutating operation holds `mutex` from its first check to its last
 * transfer, which makes the balance check, the claimed check, the
 * bookkeeping and the transfer one linearizable step. The mutex is
 * recursive: a gateway calling back into the distributor from inside a
 * transfer re-enters on the same thread and sees committed state.
 */
struct SettlementContext
{
    core::Address ledgerIdentity;
    core::Address authority;
    config::LedgerParams params;

    std::shared_ptr<core::ILedgerStore> store;
    std::shared_ptr<gateway::IAssetGateway> gateway;
    std::shared_ptr<const crypto::IAuthorizationVerifier> verifier;
    std::shared_ptr<core::AuditLog> audit;

    std::recursive_mutex mutex;

    bool IsAuthority(const core::Address &caller) const
    {
        return !authority.empty() && core::NormalizeAddress(caller) == authority;
    }

    void RequireAuthority(const core::Address &caller, const std::string &operation) const
    {
        if (!IsAuthority(caller)) {
            throw core::SettlementError(core::ErrorCode::Unauthorized,
                operation + ": caller " + (caller.empty() ? std::string("<none>") : caller)
                + " is not the authority");
        }
    }

    static uint64_t NowSeconds()
    {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }

    core::Amount CustodiedBalance() const
    {
        return gateway->BalanceOf(ledgerIdentity);
    }

    /**
     * @brief Append an audit record for a settlement that already committed.
     *
     * The settlement is final at this point, so a failing audit write must
     * not surface as a failed operation. It is reported at CRITICAL instead.
     */
    void EmitAudit(const core::AuditRecord &record)
    {
        try {
            audit->Append(record);
        }
        catch (const std::exception &ex) {
            rewardledger::util::logger::critical(
                std::string("[Audit] Audit trail gap, record not written (")
                + core::AuditKindName(record.kind) + " " + record.affiliate + " "
                + std::to_string(record.amount) + " epoch " + std::to_string(record.epoch)
                + "): " + ex.what());
        }
    }
};

} // namespace distribution
} // namespace rewardledger

#endif // REWARDLEDGER_DISTRIBUTION_SETTLEMENT_CONTEXT_HPP
