// test/unit/test_claim_processor.cpp
// -----------------------------------------------------------
// Affiliate pull path: signature gating, exactly-once settlement,
// rollback on transfer failure and reentrant gateways.

#include <atomic>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "distribution/reward_distributor.hpp"
#include "test_support.hpp"

namespace {

using rewardledger::core::AuditKind;
using rewardledger::core::ErrorCode;
using rewardledger::core::SettlementError;
using rewardledger::test::kAuthority;
using rewardledger::test::kLedger;
using rewardledger::test::LedgerHarness;
using rewardledger::test::StoreKind;

class ClaimProcessorTest : public ::testing::TestWithParam<StoreKind>
{
};

// Custody that, on its first transfer to one recipient, calls back into the
// ledger and then refuses that transfer.
class CallbackThenRefuseGateway : public rewardledger::gateway::InMemoryAssetGateway
{
public:
    CallbackThenRefuseGateway(const std::string &custody, const std::string &refused, std::function<void()> callback)
        : InMemoryAssetGateway(custody), m_refused(refused), m_callback(std::move(callback))
    {
    }

    bool Transfer(const std::string &to, uint64_t amount) override
    {
        if (to != m_refused) {
            return InMemoryAssetGateway::Transfer(to, amount);
        }
        std::function<void()> callback;
        callback.swap(m_callback);
        if (callback) {
            callback();
        }
        return false;
    }

private:
    std::string m_refused;
    std::function<void()> m_callback;
};

ErrorCode claimError(LedgerHarness &h, const std::string &caller, uint64_t amount, uint64_t epoch,
                     const std::vector<uint8_t> &sig)
{
    try {
        h.ledger->Claim(caller, amount, epoch, sig);
    }
    catch (const SettlementError &ex) {
        return ex.Code();
    }
    ADD_FAILURE() << "Claim unexpectedly succeeded";
    return ErrorCode::TransferFailed;
}

TEST_P(ClaimProcessorTest, SignedClaimSettlesExactlyOnce) {
    LedgerHarness h(GetParam(), 500);
    auto sig = h.signer->SignClaim("0xx", 100, 5);

    auto result = h.ledger->Claim("0xx", 100, 5, sig);
    EXPECT_EQ(result.affiliate, "0xx");
    EXPECT_EQ(result.amount, 100u);
    EXPECT_EQ(h.ledger->AffiliateTotal("0xx"), 100u);
    EXPECT_EQ(h.Custody(), 400u);
    EXPECT_EQ(h.gateway->BalanceOf("0xx"), 100u);

    EXPECT_EQ(claimError(h, "0xx", 100, 5, sig), ErrorCode::AlreadyClaimed);
    EXPECT_EQ(h.Custody(), 400u);
    EXPECT_EQ(h.ledger->AffiliateTotal("0xx"), 100u);
    EXPECT_EQ(h.ledger->GlobalTotal(), 100u);

    auto record = h.ledger->GetClaimRecord("0xx", 5);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->path, rewardledger::core::SettlementPath::Claim);

    auto trail = h.audit->Records();
    ASSERT_EQ(trail.size(), 1u);
    EXPECT_EQ(trail[0].kind, AuditKind::Claim);
    EXPECT_EQ(trail[0].amount, 100u);
}

TEST_P(ClaimProcessorTest, ClaimAfterBatchForSameEpochIsRejected) {
    LedgerHarness h(GetParam(), 500);
    h.ledger->BatchDistribute(kAuthority, {{"0xx", 100}}, 5);
    EXPECT_EQ(claimError(h, "0xx", 100, 5, h.signer->SignClaim("0xx", 100, 5)), ErrorCode::AlreadyClaimed);
    EXPECT_EQ(h.Custody(), 400u);
}

TEST_P(ClaimProcessorTest, TokenIsBoundToCallerAmountEpochAndLedger) {
    LedgerHarness h(GetParam(), 500);
    auto sig = h.signer->SignClaim("0xx", 100, 5);

    EXPECT_EQ(claimError(h, "0xy", 100, 5, sig), ErrorCode::InvalidSignature);
    EXPECT_EQ(claimError(h, "0xx", 101, 5, sig), ErrorCode::InvalidSignature);
    EXPECT_EQ(claimError(h, "0xx", 100, 6, sig), ErrorCode::InvalidSignature);
    EXPECT_EQ(claimError(h, "0xx", 100, 5, h.signer->SignClaim("0xx", 100, 5, "0xotherledger")),
              ErrorCode::InvalidSignature);

    EXPECT_EQ(h.ledger->GlobalTotal(), 0u);
    EXPECT_EQ(h.Custody(), 500u);
}

TEST_P(ClaimProcessorTest, ChecksRunInDocumentedOrder) {
    LedgerHarness h(GetParam(), 50);
    const std::vector<uint8_t> garbage(70, 0x30);

    EXPECT_EQ(claimError(h, "0xx", 0, 5, garbage), ErrorCode::InvalidAmount);
    EXPECT_EQ(claimError(h, "0xx", 100, 5, garbage), ErrorCode::InvalidSignature);
    EXPECT_EQ(claimError(h, "0xx", 100, 5, h.signer->SignClaim("0xx", 100, 5)), ErrorCode::InsufficientBalance);

    h.ledger->BatchDistribute(kAuthority, {{"0xx", 10}}, 5);
    EXPECT_EQ(claimError(h, "0xx", 100, 5, garbage), ErrorCode::AlreadyClaimed);
}

TEST_P(ClaimProcessorTest, AnonymousCallerIsUnauthorized) {
    LedgerHarness h(GetParam(), 500);
    EXPECT_EQ(claimError(h, "", 100, 5, h.signer->SignClaim("", 100, 5)), ErrorCode::Unauthorized);
}

TEST_P(ClaimProcessorTest, TransferFailureRollsBackAndTokenStaysUsable) {
    LedgerHarness h(GetParam(), 500);
    auto sig = h.signer->SignClaim("0xx", 100, 5);

    h.gateway->SetFailTransfers(true);
    EXPECT_EQ(claimError(h, "0xx", 100, 5, sig), ErrorCode::TransferFailed);
    EXPECT_FALSE(h.ledger->HasClaimed("0xx", 5));
    EXPECT_EQ(h.ledger->AffiliateTotal("0xx"), 0u);
    EXPECT_EQ(h.ledger->GlobalTotal(), 0u);
    EXPECT_EQ(h.Custody(), 500u);
    EXPECT_EQ(h.audit->Size(), 0u);

    h.gateway->SetFailTransfers(false);
    h.ledger->Claim("0xx", 100, 5, sig);
    EXPECT_TRUE(h.ledger->HasClaimed("0xx", 5));
    EXPECT_EQ(h.Custody(), 400u);
}

TEST_P(ClaimProcessorTest, ReentrantGatewaySeesCommittedClaim) {
    LedgerHarness h(GetParam(), 500);
    auto sig = h.signer->SignClaim("0xx", 100, 5);

    int calls = 0;
    bool claimedInsideTransfer = false;
    ErrorCode reentrantError = ErrorCode::TransferFailed;
    h.gateway->SetTransferHook([&](const std::string &, uint64_t) {
        if (++calls > 1) {
            return;
        }
        claimedInsideTransfer = h.ledger->HasClaimed("0xx", 5);
        try {
            h.ledger->Claim("0xx", 100, 5, sig);
        }
        catch (const SettlementError &ex) {
            reentrantError = ex.Code();
        }
    });

    h.ledger->Claim("0xx", 100, 5, sig);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(claimedInsideTransfer);
    EXPECT_EQ(reentrantError, ErrorCode::AlreadyClaimed);
    EXPECT_EQ(h.ledger->AffiliateTotal("0xx"), 100u);
    EXPECT_EQ(h.Custody(), 400u);
}

TEST_P(ClaimProcessorTest, ClaimSettledDuringFailedTransferIsNotUndone) {
    LedgerHarness h(GetParam(), 500);
    auto sigA = h.signer->SignClaim("0xa", 50, 7);
    auto sigC = h.signer->SignClaim("0xc", 100, 7);

    auto custody = std::make_shared<CallbackThenRefuseGateway>(kLedger, "0xa", [&]() {
        h.ledger->Claim("0xc", 100, 7, sigC);
    });
    custody->Mint(kLedger, 500);
    h.ledger->UpdateAssetReference(kAuthority, custody);

    EXPECT_EQ(claimError(h, "0xa", 50, 7, sigA), ErrorCode::TransferFailed);
    EXPECT_FALSE(h.ledger->HasClaimed("0xa", 7));
    EXPECT_TRUE(h.ledger->HasClaimed("0xc", 7));
    EXPECT_EQ(h.ledger->AffiliateTotal("0xc"), 100u);
    EXPECT_EQ(h.ledger->GlobalTotal(), 100u);
    EXPECT_EQ(custody->BalanceOf("0xc"), 100u);

    EXPECT_EQ(claimError(h, "0xc", 100, 7, sigC), ErrorCode::AlreadyClaimed);
    EXPECT_EQ(custody->BalanceOf("0xc"), 100u);
    EXPECT_EQ(custody->BalanceOf(kLedger), 400u);
}

TEST_P(ClaimProcessorTest, ConcurrentClaimsOfOneTokenPayOnce) {
    LedgerHarness h(GetParam(), 1000);
    auto sig = h.signer->SignClaim("0xx", 100, 5);

    std::atomic<int> succeeded{0};
    std::atomic<int> alreadyClaimed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                h.ledger->Claim("0xx", 100, 5, sig);
                ++succeeded;
            }
            catch (const SettlementError &ex) {
                if (ex.Code() == ErrorCode::AlreadyClaimed) {
                    ++alreadyClaimed;
                }
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(alreadyClaimed.load(), 7);
    EXPECT_EQ(h.Custody(), 900u);
    EXPECT_EQ(h.ledger->GlobalTotal(), 100u);
}

TEST_P(ClaimProcessorTest, ConcurrentClaimsCannotOverdrawCustody) {
    LedgerHarness h(GetParam(), 250);
    std::vector<std::vector<uint8_t>> sigs;
    for (int i = 0; i < 5; ++i) {
        sigs.push_back(h.signer->SignClaim("0xaff" + std::to_string(i), 100, 9));
    }

    std::atomic<int> paid{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&, i]() {
            try {
                h.ledger->Claim("0xaff" + std::to_string(i), 100, 9, sigs[i]);
                ++paid;
            }
            catch (const SettlementError &) {
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(paid.load(), 2);
    EXPECT_EQ(h.Custody(), 50u);
    EXPECT_EQ(h.ledger->GlobalTotal(), 200u);
}

INSTANTIATE_TEST_SUITE_P(Stores, ClaimProcessorTest,
                         ::testing::Values(StoreKind::Memory, StoreKind::Sqlite),
                         rewardledger::test::StoreKindName);

} // namespace
