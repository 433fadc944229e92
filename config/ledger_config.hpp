#ifndef REWARDLEDGER_CONFIG_LEDGER_CONFIG_HPP
#define REWARDLEDGER_CONFIG_LEDGER_CONFIG_HPP

#include <cstdint>
#include <string>

/**
 * @file ledger_config.hpp
 * @brief Local configuration of one reward ledger instance.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp.
 *   - Consumed by service/ledger_bootstrap.hpp to wire store, verifier and gateway.
 */

namespace rewardledger {
namespace config {

/**
 * @struct LedgerConfig
 * @brief Identity, authority key material, storage and gateway settings.
 */
struct LedgerConfig
{
    LedgerConfig()
        : ledgerIdentity("0xrewardledger"),
          verifierScheme("ecdsa"),
          storeBackend("sqlite"),
          databasePath("./reward_ledger.sqlite"),
          auditLogPath("./reward_audit.log"),
          network("mainnet"),
          logLevel("INFO"),
          rewardPerClick(250000),
          inMemorySeedBalance(0)
    {
    }

    /// This ledger's own address. Signed claims bind to it, and the gateway
    /// holds the custodied balance under it.
    std::string ledgerIdentity;

    /// The privileged identity allowed to push batches and run admin operations.
    std::string authorityAddress;

    /// "ecdsa" (secp256k1, public key below) or "hmac" (shared secret below).
    std::string verifierScheme;

    /// Hex SEC1 public key of the off-chain signer, used when verifierScheme=ecdsa.
    std::string authorityPublicKey;

    /// Shared secret, used when verifierScheme=hmac.
    std::string authoritySecret;

    /// "memory" or "sqlite".
    std::string storeBackend;

    std::string databasePath;

    /// Append-only audit file; empty keeps audit records in memory only.
    std::string auditLogPath;

    /// REST custody endpoint; empty selects the in-memory gateway.
    std::string gatewayEndpoint;

    /// Parameter preset, see ledger_params.hpp.
    std::string network;

    std::string logLevel;

    /// Log file; empty logs to the console only.
    std::string logFile;

    /// Smallest asset units paid per valid click when computing epoch rewards.
    uint64_t rewardPerClick;

    /// Amount minted into custody when the in-memory gateway is selected (local runs).
    uint64_t inMemorySeedBalance;
};

} // namespace config
} // namespace rewardledger

#endif // REWARDLEDGER_CONFIG_LEDGER_CONFIG_HPP
