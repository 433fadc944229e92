#include "crypto/authorization_verifier.hpp"

#include <stdexcept>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/params.h>
#include "core/settlement_error.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace rewardledger {
namespace crypto {

namespace {

const char kClaimDomain[] = "REWARD_LEDGER_CLAIM_V1";

// Longest DER encoding of a secp256k1 ECDSA signature.
const size_t kMaxDerSignatureSize = 72;

void appendU64BigEndian(std::vector<uint8_t> &out, uint64_t value)
{
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xff));
    }
}

core::SettlementError invalidSignature(const std::string &reason)
{
    return core::SettlementError(core::ErrorCode::InvalidSignature, "AuthorizationVerifier: " + reason);
}

} // namespace

std::vector<uint8_t> CanonicalClaimMessage(const core::Address &affiliate,
                                           core::Amount amount,
                                           core::Epoch epoch,
                                           const core::Address &ledgerIdentity)
{
    std::vector<uint8_t> msg(kClaimDomain, kClaimDomain + sizeof(kClaimDomain) - 1);
    msg.push_back(0x00);
    msg.insert(msg.end(), affiliate.begin(), affiliate.end());
    msg.push_back(0x00);
    appendU64BigEndian(msg, amount);
    appendU64BigEndian(msg, epoch);
    msg.push_back(0x00);
    msg.insert(msg.end(), ledgerIdentity.begin(), ledgerIdentity.end());
    return msg;
}

// ---------------------------------------------------------------------------
// EcdsaAuthorizationVerifier
// ---------------------------------------------------------------------------
struct EcdsaAuthorizationVerifier::KeyHandle
{
    explicit KeyHandle(EVP_PKEY *k) : pkey(k) {}
    ~KeyHandle() { EVP_PKEY_free(pkey); }

    EVP_PKEY *pkey;
};

EcdsaAuthorizationVerifier::EcdsaAuthorizationVerifier(const core::Address &ledgerIdentity,
                                                       const std::vector<uint8_t> &authorityPublicKey)
    : m_ledgerIdentity(core::NormalizeAddress(ledgerIdentity))
{
    const bool uncompressed = authorityPublicKey.size() == 65 && authorityPublicKey[0] == 0x04;
    const bool compressed = authorityPublicKey.size() == 33
                            && (authorityPublicKey[0] == 0x02 || authorityPublicKey[0] == 0x03);
    if (!uncompressed && !compressed) {
        throw std::invalid_argument("EcdsaAuthorizationVerifier: public key must be a 33 or 65 byte SEC1 point");
    }

    EVP_PKEY_CTX *ctx = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr);
    if (!ctx) {
        throw std::runtime_error("EcdsaAuthorizationVerifier: EVP_PKEY_CTX_new_from_name failed");
    }

    std::vector<uint8_t> keyBytes(authorityPublicKey);
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char*>("secp256k1"), 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, keyBytes.data(), keyBytes.size()),
        OSSL_PARAM_construct_end()
    };

    EVP_PKEY *pkey = nullptr;
    int rc = EVP_PKEY_fromdata_init(ctx);
    if (rc == 1) {
        rc = EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params);
    }
    EVP_PKEY_CTX_free(ctx);
    if (rc != 1 || !pkey) {
        ERR_clear_error();
        throw std::invalid_argument("EcdsaAuthorizationVerifier: public key is not a secp256k1 point");
    }
    m_key = std::make_unique<KeyHandle>(pkey);

    EVP_PKEY_CTX *check = EVP_PKEY_CTX_new_from_pkey(nullptr, pkey, nullptr);
    rc = check ? EVP_PKEY_public_check(check) : 0;
    EVP_PKEY_CTX_free(check);
    if (rc != 1) {
        ERR_clear_error();
        throw std::invalid_argument("EcdsaAuthorizationVerifier: public key failed validation");
    }

    m_authorityIdentity = DeriveIdentity(authorityPublicKey);
    rewardledger::util::logger::info("[EcdsaAuthorizationVerifier] Accepting claims signed by "
                                     + m_authorityIdentity + " for ledger " + m_ledgerIdentity);
}

EcdsaAuthorizationVerifier::~EcdsaAuthorizationVerifier() = default;

core::Address EcdsaAuthorizationVerifier::DeriveIdentity(const std::vector<uint8_t> &publicKey)
{
    std::vector<uint8_t> digest = rewardledger::util::hashing::sha256Digest(publicKey);
    std::vector<uint8_t> tail(digest.end() - 20, digest.end());
    return "0x" + rewardledger::util::hashing::toHex(tail);
}

core::Address EcdsaAuthorizationVerifier::Verify(const AuthorizationToken &token) const
{
    if (token.signature.empty() || token.signature.size() > kMaxDerSignatureSize) {
        throw invalidSignature("signature has invalid length " + std::to_string(token.signature.size()));
    }

    const std::vector<uint8_t> message =
        CanonicalClaimMessage(token.affiliate, token.amount, token.epoch, m_ledgerIdentity);

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw invalidSignature("EVP_MD_CTX_new failed");
    }

    int rc = EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, m_key->pkey);
    if (rc == 1) {
        rc = EVP_DigestVerify(ctx, token.signature.data(), token.signature.size(),
                              message.data(), message.size());
    }
    EVP_MD_CTX_free(ctx);

    if (rc != 1) {
        // Malformed DER leaves entries on the thread's error queue.
        ERR_clear_error();
        throw invalidSignature("signature does not match authority " + m_authorityIdentity
                               + " for affiliate " + token.affiliate
                               + " epoch " + std::to_string(token.epoch));
    }
    return m_authorityIdentity;
}

// ---------------------------------------------------------------------------
// HmacAuthorizationVerifier
// ---------------------------------------------------------------------------
HmacAuthorizationVerifier::HmacAuthorizationVerifier(const core::Address &ledgerIdentity,
                                                     const core::Address &authorityIdentity,
                                                     const std::string &secret)
    : m_ledgerIdentity(core::NormalizeAddress(ledgerIdentity))
    , m_authorityIdentity(core::NormalizeAddress(authorityIdentity))
    , m_secret(secret)
{
    if (m_secret.empty()) {
        throw std::invalid_argument("HmacAuthorizationVerifier: secret must not be empty");
    }
}

std::vector<uint8_t> HmacAuthorizationVerifier::computeMac(const std::vector<uint8_t> &message) const
{
    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int macLen = 0;
    if (!HMAC(EVP_sha256(), m_secret.data(), static_cast<int>(m_secret.size()),
              message.data(), message.size(), mac.data(), &macLen)) {
        ERR_clear_error();
        throw invalidSignature("HMAC computation failed");
    }
    mac.resize(macLen);
    return mac;
}

core::Address HmacAuthorizationVerifier::Verify(const AuthorizationToken &token) const
{
    const std::vector<uint8_t> expected =
        computeMac(CanonicalClaimMessage(token.affiliate, token.amount, token.epoch, m_ledgerIdentity));

    if (token.signature.size() != expected.size()
        || CRYPTO_memcmp(token.signature.data(), expected.data(), expected.size()) != 0) {
        throw invalidSignature("MAC does not match for affiliate " + token.affiliate
                               + " epoch " + std::to_string(token.epoch));
    }
    return m_authorityIdentity;
}

} // namespace crypto
} // namespace rewardledger
