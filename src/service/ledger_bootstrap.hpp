#ifndef REWARDLEDGER_SERVICE_LEDGER_BOOTSTRAP_HPP
#define REWARDLEDGER_SERVICE_LEDGER_BOOTSTRAP_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include "config/ledger_config.hpp"
#include "config/ledger_params.hpp"
#include "core/audit_log.hpp"
#include "core/ledger_store.hpp"
#include "core/sqlite_ledger_store.hpp"
#include "crypto/authorization_verifier.hpp"
#include "distribution/reward_distributor.hpp"
#include "gateway/asset_gateway.hpp"
#include "gateway/http_asset_gateway.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

/**
 * @file ledger_bootstrap.hpp
 * @brief Wire a RewardDistributor from a validated LedgerConfig.
 *
 *   storeBackend    memory | sqlite(databasePath)
 *   verifierScheme  ecdsa(authorityPublicKey) | hmac(authorityAddress, authoritySecret)
 *   gatewayEndpoint empty -> in-memory gateway seeded with inMemorySeedBalance
 *                            (storeBackend=memory only)
 *                   set   -> HTTP custody service
 */

namespace rewardledger {
namespace service {

inline std::shared_ptr<core::ILedgerStore> MakeLedgerStore(const config::LedgerConfig &cfg)
{
    if (cfg.storeBackend == "memory") {
        return std::make_shared<core::InMemoryLedgerStore>();
    }
    if (cfg.storeBackend == "sqlite") {
        return std::make_shared<core::SqliteLedgerStore>(cfg.databasePath);
    }
    throw std::invalid_argument("MakeLedgerStore: unknown storeBackend '" + cfg.storeBackend + "'");
}

inline std::shared_ptr<const crypto::IAuthorizationVerifier> MakeVerifier(const config::LedgerConfig &cfg)
{
    if (cfg.verifierScheme == "ecdsa") {
        return std::make_shared<crypto::EcdsaAuthorizationVerifier>(
            cfg.ledgerIdentity, rewardledger::util::hashing::fromHex(cfg.authorityPublicKey));
    }
    if (cfg.verifierScheme == "hmac") {
        return std::make_shared<crypto::HmacAuthorizationVerifier>(
            cfg.ledgerIdentity, cfg.authorityAddress, cfg.authoritySecret);
    }
    throw std::invalid_argument("MakeVerifier: unknown verifierScheme '" + cfg.verifierScheme + "'");
}

/**
 * @throw std::invalid_argument for an in-memory gateway over a durable store:
 *        custody would be re-minted on every start while settlements persist.
 */
inline std::shared_ptr<gateway::IAssetGateway> MakeGateway(const config::LedgerConfig &cfg)
{
    if (!cfg.gatewayEndpoint.empty()) {
        return std::make_shared<gateway::HttpAssetGateway>(cfg.gatewayEndpoint, cfg.ledgerIdentity);
    }
    if (cfg.storeBackend != "memory") {
        throw std::invalid_argument("MakeGateway: storeBackend=" + cfg.storeBackend
                                    + " needs a gatewayEndpoint; the in-memory gateway is only for storeBackend=memory");
    }

    auto local = std::make_shared<gateway::InMemoryAssetGateway>(cfg.ledgerIdentity);
    if (cfg.inMemorySeedBalance > 0) {
        local->Mint(cfg.ledgerIdentity, cfg.inMemorySeedBalance);
        rewardledger::util::logger::info("[Bootstrap] Seeded in-memory custody with "
                                         + std::to_string(cfg.inMemorySeedBalance));
    }
    return local;
}

/**
 * @brief Build every component named by the configuration.
 * @throw std::invalid_argument or std::runtime_error if one cannot be built
 *        (bad key material, unopenable database, unknown backend).
 */
inline std::shared_ptr<distribution::RewardDistributor> BuildLedger(const config::LedgerConfig &cfg)
{
    const config::LedgerParams params = config::getParamsForNetwork(cfg.network);
    auto gateway = MakeGateway(cfg);
    auto store = MakeLedgerStore(cfg);
    auto verifier = MakeVerifier(cfg);
    auto audit = std::make_shared<core::AuditLog>(cfg.auditLogPath);

    rewardledger::util::logger::debug("[Bootstrap] store=" + cfg.storeBackend + " verifier="
                                      + verifier->Scheme() + " gateway=" + gateway->Name()
                                      + " audit=" + (cfg.auditLogPath.empty() ? "memory" : cfg.auditLogPath));

    return std::make_shared<distribution::RewardDistributor>(
        cfg.ledgerIdentity, cfg.authorityAddress, params, store, gateway, verifier, audit);
}

} // namespace service
} // namespace rewardledger

#endif // REWARDLEDGER_SERVICE_LEDGER_BOOTSTRAP_HPP
