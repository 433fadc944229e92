#ifndef REWARDLEDGER_GATEWAY_ASSET_GATEWAY_HPP
#define REWARDLEDGER_GATEWAY_ASSET_GATEWAY_HPP

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include "core/settlement_error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

/**
 * @file asset_gateway.hpp
 * @brief Contract with the external ledger that actually holds the reward asset.
 *
 * The settlement paths depend only on this interface. A gateway handle is
 * bound to one custody account (the ledger identity) and moves value out of it.
 */

namespace rewardledger {
namespace gateway {

/**
 * @class IAssetGateway
 * @brief Move value out of the custody account and read balances.
 */
class IAssetGateway
{
public:
    virtual ~IAssetGateway() = default;

    /**
     * @brief Transfer from the custody account to another account.
     * @return true once the external ledger confirmed the transfer.
     */
    virtual bool Transfer(const core::Address &to, core::Amount amount) = 0;

    /**
     * @brief Current balance of any account.
     * @throw core::SettlementError(TransferFailed) if the external ledger is unreachable.
     */
    virtual core::Amount BalanceOf(const core::Address &account) const = 0;

    /// The account this handle moves value out of.
    virtual const core::Address& CustodyAccount() const = 0;

    /// Human-readable description for logs and status output.
    virtual std::string Name() const = 0;
};

/**
 * @class InMemoryAssetGateway
 * @brief A self-contained token ledger of balances.
 *
 * Used for local runs and tests. Supports minting into any account, forced
 * transfer failures and a hook invoked during each transfer (after the
 * balance moves), which lets tests play a gateway that calls back into the
 * distributor mid-transfer.
 */
class InMemoryAssetGateway : public IAssetGateway
{
public:
    using TransferHook = std::function<void(const core::Address &to, core::Amount amount)>;

    explicit InMemoryAssetGateway(const core::Address &custodyAccount)
        : m_custodyAccount(core::NormalizeAddress(custodyAccount))
        , m_failTransfers(false)
        , m_failAfter(-1)
    {
    }

    bool Transfer(const core::Address &to, core::Amount amount) override
    {
        TransferHook hook;
        {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            if (m_failTransfers || m_failAfter == 0) {
                rewardledger::util::logger::warn("[InMemoryAssetGateway] Transfer to " + to + " rejected");
                return false;
            }
            core::Amount &from = m_balances[m_custodyAccount];
            if (from < amount) {
                return false;
            }
            const core::Address recipient = core::NormalizeAddress(to);
            if (recipient != m_custodyAccount) {
                core::Amount credited = 0;
                if (!core::CheckedAdd(m_balances[recipient], amount, credited)) {
                    return false;
                }
                from -= amount;
                m_balances[recipient] = credited;
            }
            if (m_failAfter > 0) {
                --m_failAfter;
            }
            hook = m_hook;
        }
        if (hook) {
            hook(to, amount);
        }
        return true;
    }

    core::Amount BalanceOf(const core::Address &account) const override
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        auto it = m_balances.find(core::NormalizeAddress(account));
        return it == m_balances.end() ? 0 : it->second;
    }

    const core::Address& CustodyAccount() const override { return m_custodyAccount; }

    std::string Name() const override { return "in-memory:" + m_custodyAccount; }

    /**
     * @brief Credit an account out of thin air (fixed supply is the asset's concern).
     * @throw core::SettlementError(InvalidAmount) on balance overflow.
     */
    void Mint(const core::Address &account, core::Amount amount)
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        core::Amount &balance = m_balances[core::NormalizeAddress(account)];
        if (!core::CheckedAdd(balance, amount, balance)) {
            throw core::SettlementError(core::ErrorCode::InvalidAmount, "InMemoryAssetGateway: mint overflow");
        }
    }

    /// Make every subsequent transfer fail (true) or behave normally (false).
    void SetFailTransfers(bool fail)
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        m_failTransfers = fail;
    }

    /// Let `count` transfers succeed, then fail all after that. Negative disables.
    void FailAfter(int count)
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        m_failAfter = count;
    }

    void SetTransferHook(TransferHook hook)
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        m_hook = std::move(hook);
    }

private:
    mutable std::recursive_mutex m_mutex;
    core::Address m_custodyAccount;
    std::unordered_map<core::Address, core::Amount> m_balances;
    bool m_failTransfers;
    int m_failAfter;
    TransferHook m_hook;
};

} // namespace gateway
} // namespace rewardledger

#endif // REWARDLEDGER_GATEWAY_ASSET_GATEWAY_HPP
