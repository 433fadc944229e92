#ifndef REWARDLEDGER_CONFIG_LEDGER_PARAMS_HPP
#define REWARDLEDGER_CONFIG_LEDGER_PARAMS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file ledger_params.hpp
 * @brief Network-level limits for the reward ledger (batch size, asset precision).
 *
 * Example usage:
 *  @code
 *    auto params = rewardledger::config::getParamsForNetwork("testnet");
 *    if (entries.size() > params.maxBatchSize) { ... }
 *  @endcode
 */

namespace rewardledger {
namespace config {

/**
 * @struct LedgerParams
 * @brief Encapsulates per-network settlement limits.
 */
struct LedgerParams
{
    // Identifies the network type: "mainnet", "testnet", "devnet".
    std::string networkID;

    // Upper bound on entries in one BatchDistribute call.
    uint64_t maxBatchSize;

    // Decimal places of the reward asset. Amounts are always integers in the
    // smallest unit; this is only used when formatting for humans.
    uint32_t assetDecimals;
};

inline LedgerParams getMainnetParams()
{
    LedgerParams lp;
    lp.networkID     = "mainnet";
    lp.maxBatchSize  = 500;
    lp.assetDecimals = 8;
    return lp;
}

inline LedgerParams getTestnetParams()
{
    LedgerParams lp;
    lp.networkID     = "testnet";
    lp.maxBatchSize  = 200;
    lp.assetDecimals = 8;
    return lp;
}

inline LedgerParams getDevnetParams()
{
    LedgerParams lp;
    lp.networkID     = "devnet";
    lp.maxBatchSize  = 50;
    lp.assetDecimals = 8;
    return lp;
}

/**
 * @brief Look up a preset by name.
 * @throw std::invalid_argument for an unknown network.
 */
inline LedgerParams getParamsForNetwork(const std::string &networkID)
{
    if (networkID == "mainnet") return getMainnetParams();
    if (networkID == "testnet") return getTestnetParams();
    if (networkID == "devnet")  return getDevnetParams();
    throw std::invalid_argument("LedgerParams: unknown network '" + networkID + "'");
}

} // namespace config
} // namespace rewardledger

#endif // REWARDLEDGER_CONFIG_LEDGER_PARAMS_HPP
