#ifndef REWARDLEDGER_CRYPTO_AUTHORIZATION_VERIFIER_HPP
#define REWARDLEDGER_CRYPTO_AUTHORIZATION_VERIFIER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/types.hpp"

/*
  authorization_verifier.hpp
  ----------------------------------------------------------------
  Verifies pull-path AuthorizationTokens produced by the external signer.

  The signed message binds affiliate, amount, epoch and this ledger's own
  identity, so a token issued for one ledger instance is useless on another:

    "REWARD_LEDGER_CLAIM_V1" 0x00 affiliate 0x00 amount(u64 BE) epoch(u64 BE) 0x00 ledgerIdentity

  Two schemes are provided; the one in use is chosen at construction:
    - EcdsaAuthorizationVerifier: ECDSA/secp256k1 over SHA-256(message),
      DER-encoded signature, checked with the OpenSSL 3 EVP interface
      against the authority's SEC1 public key.
    - HmacAuthorizationVerifier: HMAC-SHA256(secret, message), 32 bytes.

  Verifiers hold no mutable state after construction; Verify() is const
  and may be called concurrently.
*/

namespace rewardledger {
namespace crypto {

/// (affiliate, amount, epoch, signature) approving one pull-path payout.
struct AuthorizationToken
{
    core::Address affiliate;
    core::Amount amount{0};
    core::Epoch epoch{0};
    std::vector<uint8_t> signature;
};

/**
 * @brief Build the exact byte string the authority signs for a token.
 */
std::vector<uint8_t> CanonicalClaimMessage(const core::Address &affiliate,
                                           core::Amount amount,
                                           core::Epoch epoch,
                                           const core::Address &ledgerIdentity);

class IAuthorizationVerifier
{
public:
    virtual ~IAuthorizationVerifier() = default;

    /**
     * @brief Check the token's signature.
     * @return The authority identity that approved the payout.
     * @throw core::SettlementError(InvalidSignature) on any mismatch or
     *        malformed input; nothing else is thrown.
     */
    virtual core::Address Verify(const AuthorizationToken &token) const = 0;

    /// Identity this verifier accepts signatures from.
    virtual const core::Address& AuthorityIdentity() const = 0;

    /// Ledger identity bound into every verified message.
    virtual const core::Address& LedgerIdentity() const = 0;

    /// Short scheme name for logs ("ecdsa-secp256k1", "hmac-sha256").
    virtual const char* Scheme() const = 0;
};

/**
 * @class EcdsaAuthorizationVerifier
 * @brief secp256k1 ECDSA verification via OpenSSL EVP.
 */
class EcdsaAuthorizationVerifier : public IAuthorizationVerifier
{
public:
    /**
     * @param ledgerIdentity This ledger's address.
     * @param authorityPublicKey SEC1 encoded point: 65 bytes (0x04 X Y) or 33 bytes (0x02/0x03 X).
     * @throw std::invalid_argument if the key is not a valid secp256k1 point.
     */
    EcdsaAuthorizationVerifier(const core::Address &ledgerIdentity,
                               const std::vector<uint8_t> &authorityPublicKey);
    ~EcdsaAuthorizationVerifier() override;

    EcdsaAuthorizationVerifier(const EcdsaAuthorizationVerifier&) = delete;
    EcdsaAuthorizationVerifier& operator=(const EcdsaAuthorizationVerifier&) = delete;

    core::Address Verify(const AuthorizationToken &token) const override;
    const core::Address& AuthorityIdentity() const override { return m_authorityIdentity; }
    const core::Address& LedgerIdentity() const override { return m_ledgerIdentity; }
    const char* Scheme() const override { return "ecdsa-secp256k1"; }

    /**
     * @brief Identity derived from a public key: "0x" + hex of the last
     *        20 bytes of SHA-256(encoded key).
     */
    static core::Address DeriveIdentity(const std::vector<uint8_t> &publicKey);

private:
    struct KeyHandle;

    core::Address m_ledgerIdentity;
    core::Address m_authorityIdentity;
    std::unique_ptr<KeyHandle> m_key;
};

/**
 * @class HmacAuthorizationVerifier
 * @brief Shared-secret variant for deployments where signer and ledger are
 *        operated by the same party.
 */
class HmacAuthorizationVerifier : public IAuthorizationVerifier
{
public:
    /**
     * @throw std::invalid_argument if the secret is empty.
     */
    HmacAuthorizationVerifier(const core::Address &ledgerIdentity,
                              const core::Address &authorityIdentity,
                              const std::string &secret);

    core::Address Verify(const AuthorizationToken &token) const override;
    const core::Address& AuthorityIdentity() const override { return m_authorityIdentity; }
    const core::Address& LedgerIdentity() const override { return m_ledgerIdentity; }
    const char* Scheme() const override { return "hmac-sha256"; }

private:
    std::vector<uint8_t> computeMac(const std::vector<uint8_t> &message) const;

    core::Address m_ledgerIdentity;
    core::Address m_authorityIdentity;
    std::string m_secret;
};

} // namespace crypto
} // namespace rewardledger

#endif // REWARDLEDGER_CRYPTO_AUTHORIZATION_VERIFIER_HPP
