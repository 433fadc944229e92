// test/unit/test_ledger_store.cpp
// -----------------------------------------------------------
// Both ILedgerStore implementations run the same suite.

#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "core/ledger_store.hpp"
#include "core/sqlite_ledger_store.hpp"
#include "test_support.hpp"

namespace {

using rewardledger::core::Amount;
using rewardledger::core::ErrorCode;
using rewardledger::core::ILedgerStore;
using rewardledger::core::InMemoryLedgerStore;
using rewardledger::core::SettlementEntry;
using rewardledger::core::SettlementError;
using rewardledger::core::SettlementPath;
using rewardledger::core::SqliteLedgerStore;

struct InMemoryFactory
{
    std::unique_ptr<ILedgerStore> Make() { return std::make_unique<InMemoryLedgerStore>(); }
};

struct SqliteFactory
{
    SqliteFactory() : file("test_ledger_store.sqlite") {}
    std::unique_ptr<ILedgerStore> Make() { return std::make_unique<SqliteLedgerStore>(file.Path()); }
    rewardledger::test::ScratchFile file;
};

template <typename Factory>
class LedgerStoreTest : public ::testing::Test
{
protected:
    LedgerStoreTest() : store(factory.Make()) {}

    Factory factory;
    std::unique_ptr<ILedgerStore> store;
};

using StoreFactories = ::testing::Types<InMemoryFactory, SqliteFactory>;
TYPED_TEST_SUITE(LedgerStoreTest, StoreFactories);

TYPED_TEST(LedgerStoreTest, StartsEmpty) {
    EXPECT_FALSE(this->store->HasClaimed("0xa", 1));
    EXPECT_EQ(this->store->AffiliateTotal("0xa"), 0u);
    EXPECT_EQ(this->store->GlobalTotal(), 0u);
    EXPECT_FALSE(this->store->GetClaimRecord("0xa", 1).has_value());
    EXPECT_TRUE(this->store->ListClaims(1).empty());
}

TYPED_TEST(LedgerStoreTest, RecordSettlementUpdatesTotalsAndRecord) {
    this->store->RecordSettlement("0xa", 20250101, 300, SettlementPath::Claim);
    this->store->RecordSettlement("0xa", 20250102, 200, SettlementPath::Batch);

    EXPECT_TRUE(this->store->HasClaimed("0xa", 20250101));
    EXPECT_TRUE(this->store->HasClaimed("0xa", 20250102));
    EXPECT_FALSE(this->store->HasClaimed("0xa", 20250103));
    EXPECT_EQ(this->store->AffiliateTotal("0xa"), 500u);
    EXPECT_EQ(this->store->GlobalTotal(), 500u);

    auto record = this->store->GetClaimRecord("0xa", 20250101);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->amount, 300u);
    EXPECT_EQ(record->path, SettlementPath::Claim);
    EXPECT_GT(record->settledAt, 0u);
}

TYPED_TEST(LedgerStoreTest, SecondSettlementOfSamePairIsRejected) {
    this->store->RecordSettlement("0xa", 7, 100, SettlementPath::Batch);
    try {
        this->store->RecordSettlement("0xa", 7, 50, SettlementPath::Claim);
        FAIL() << "expected AlreadyClaimed";
    }
    catch (const SettlementError &ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::AlreadyClaimed);
    }
    EXPECT_EQ(this->store->AffiliateTotal("0xa"), 100u);
    EXPECT_EQ(this->store->GlobalTotal(), 100u);
}

TYPED_TEST(LedgerStoreTest, ConflictingEntryAbortsWholeSettlement) {
    this->store->RecordSettlement("0xb", 9, 10, SettlementPath::Claim);

    std::vector<SettlementEntry> entries{{"0xa", 1}, {"0xb", 2}, {"0xc", 3}};
    int effects = 0;
    EXPECT_THROW(this->store->Settle(entries, 9, SettlementPath::Batch,
                                     [&effects](const SettlementEntry &) { ++effects; }),
                 SettlementError);

    EXPECT_EQ(effects, 0);
    EXPECT_FALSE(this->store->HasClaimed("0xa", 9));
    EXPECT_FALSE(this->store->HasClaimed("0xc", 9));
    EXPECT_EQ(this->store->GlobalTotal(), 10u);
}

TYPED_TEST(LedgerStoreTest, DuplicateAffiliateWithinOneSettlementIsRejected) {
    std::vector<SettlementEntry> entries{{"0xa", 1}, {"0xa", 2}};
    EXPECT_THROW(this->store->Settle(entries, 3, SettlementPath::Batch, nullptr), SettlementError);
    EXPECT_FALSE(this->store->HasClaimed("0xa", 3));
    EXPECT_EQ(this->store->GlobalTotal(), 0u);
}

TYPED_TEST(LedgerStoreTest, TotalOverflowIsRejected) {
    const Amount max = std::numeric_limits<Amount>::max();
    this->store->RecordSettlement("0xa", 1, max, SettlementPath::Batch);
    try {
        this->store->RecordSettlement("0xb", 1, 1, SettlementPath::Batch);
        FAIL() << "expected InvalidAmount";
    }
    catch (const SettlementError &ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::InvalidAmount);
    }
    EXPECT_EQ(this->store->GlobalTotal(), max);
    EXPECT_FALSE(this->store->HasClaimed("0xb", 1));
}

TYPED_TEST(LedgerStoreTest, FailingEffectKeepsEarlierEntriesOnly) {
    std::vector<SettlementEntry> entries{{"0xa", 10}, {"0xb", 20}, {"0xc", 30}};
    auto effect = [](const SettlementEntry &entry) {
        if (entry.affiliate == "0xb") {
            throw SettlementError(ErrorCode::TransferFailed, "refused");
        }
    };
    EXPECT_THROW(this->store->Settle(entries, 4, SettlementPath::Batch, effect), SettlementError);

    EXPECT_TRUE(this->store->HasClaimed("0xa", 4));
    EXPECT_FALSE(this->store->HasClaimed("0xb", 4));
    EXPECT_FALSE(this->store->HasClaimed("0xc", 4));
    EXPECT_EQ(this->store->AffiliateTotal("0xa"), 10u);
    EXPECT_EQ(this->store->AffiliateTotal("0xb"), 0u);
    EXPECT_EQ(this->store->GlobalTotal(), 10u);

    // The rolled-back pair can be settled again.
    this->store->RecordSettlement("0xb", 4, 20, SettlementPath::Claim);
    EXPECT_EQ(this->store->GlobalTotal(), 30u);
}

TYPED_TEST(LedgerStoreTest, EffectSeesItsOwnEntryAsClaimed) {
    bool seen = false;
    ILedgerStore *store = this->store.get();
    this->store->Settle({SettlementEntry("0xa", 5)}, 8, SettlementPath::Claim,
                        [&](const SettlementEntry &entry) {
                            seen = store->HasClaimed(entry.affiliate, 8);
                            EXPECT_THROW(store->RecordSettlement(entry.affiliate, 8, 5, SettlementPath::Claim),
                                         SettlementError);
                        });
    EXPECT_TRUE(seen);
    EXPECT_EQ(this->store->AffiliateTotal("0xa"), 5u);
    EXPECT_EQ(this->store->GlobalTotal(), 5u);
}

TYPED_TEST(LedgerStoreTest, NestedSettlementSurvivesFailingOuterEffect) {
    ILedgerStore *store = this->store.get();
    Amount paidToC = 0;
    auto payC = [&paidToC](const SettlementEntry &entry) { paidToC += entry.amount; };

    auto outerEffect = [&](const SettlementEntry &) {
        store->Settle({SettlementEntry("0xc", 100)}, 7, SettlementPath::Claim, payC);
        throw SettlementError(ErrorCode::TransferFailed, "outer transfer refused");
    };
    EXPECT_THROW(store->Settle({SettlementEntry("0xa", 40)}, 7, SettlementPath::Claim, outerEffect),
                 SettlementError);

    EXPECT_FALSE(store->HasClaimed("0xa", 7));
    EXPECT_TRUE(store->HasClaimed("0xc", 7));
    EXPECT_EQ(store->AffiliateTotal("0xa"), 0u);
    EXPECT_EQ(store->AffiliateTotal("0xc"), 100u);
    EXPECT_EQ(store->GlobalTotal(), 100u);

    // The delivered nested settlement cannot be paid a second time.
    EXPECT_THROW(store->Settle({SettlementEntry("0xc", 100)}, 7, SettlementPath::Claim, payC), SettlementError);
    EXPECT_EQ(paidToC, 100u);
}

TYPED_TEST(LedgerStoreTest, NestedSettlementOfLaterEntryInSameCallIsRejected) {
    ILedgerStore *store = this->store.get();
    bool nestedRejected = false;
    auto effect = [&](const SettlementEntry &entry) {
        if (entry.affiliate != "0xa") {
            return;
        }
        try {
            store->RecordSettlement("0xb", 5, 20, SettlementPath::Claim);
        }
        catch (const SettlementError &ex) {
            nestedRejected = (ex.Code() == ErrorCode::AlreadyClaimed);
        }
    };
    store->Settle({SettlementEntry("0xa", 10), SettlementEntry("0xb", 20)}, 5, SettlementPath::Batch, effect);

    EXPECT_TRUE(nestedRejected);
    EXPECT_EQ(store->AffiliateTotal("0xb"), 20u);
    EXPECT_EQ(store->GlobalTotal(), 30u);
}

TYPED_TEST(LedgerStoreTest, ListClaimsIsOrderedByAffiliate) {
    this->store->Settle({SettlementEntry("0xc", 3), SettlementEntry("0xa", 1), SettlementEntry("0xb", 2)},
                        11, SettlementPath::Batch, nullptr);
    this->store->RecordSettlement("0xa", 12, 1, SettlementPath::Claim);

    auto claims = this->store->ListClaims(11);
    ASSERT_EQ(claims.size(), 3u);
    EXPECT_EQ(claims[0].affiliate, "0xa");
    EXPECT_EQ(claims[1].affiliate, "0xb");
    EXPECT_EQ(claims[2].affiliate, "0xc");
    EXPECT_EQ(this->store->ListClaims(12).size(), 1u);
}

TEST(SqliteLedgerStoreTest, StatePersistsAcrossReopen) {
    rewardledger::test::ScratchFile file("test_ledger_reopen.sqlite");
    {
        SqliteLedgerStore store(file.Path());
        store.RecordSettlement("0xa", 20250101, 42, SettlementPath::Claim);
    }
    SqliteLedgerStore reopened(file.Path());
    EXPECT_TRUE(reopened.HasClaimed("0xa", 20250101));
    EXPECT_EQ(reopened.AffiliateTotal("0xa"), 42u);
    EXPECT_EQ(reopened.GlobalTotal(), 42u);
    EXPECT_THROW(reopened.RecordSettlement("0xa", 20250101, 1, SettlementPath::Batch), SettlementError);
}

TEST(SqliteLedgerStoreTest, FullRangeAmountsRoundTrip) {
    rewardledger::test::ScratchFile file("test_ledger_u64.sqlite");
    SqliteLedgerStore store(file.Path());
    const Amount big = std::numeric_limits<Amount>::max() - 5;
    store.RecordSettlement("0xa", std::numeric_limits<uint64_t>::max(), big, SettlementPath::Batch);
    EXPECT_TRUE(store.HasClaimed("0xa", std::numeric_limits<uint64_t>::max()));
    EXPECT_EQ(store.AffiliateTotal("0xa"), big);
    EXPECT_EQ(store.GetClaimRecord("0xa", std::numeric_limits<uint64_t>::max())->amount, big);
}

TEST(SqliteLedgerStoreTest, FailedUndoStillReportsTransferFailure) {
    rewardledger::test::ScratchFile file("test_store_failed_undo.sqlite");
    SqliteLedgerStore store(file.Path());

    auto breakSchemaThenFail = [&file](const SettlementEntry &) {
        sqlite3 *other = nullptr;
        ASSERT_EQ(sqlite3_open(file.Path().c_str(), &other), SQLITE_OK);
        EXPECT_EQ(sqlite3_exec(other, "DROP TABLE affiliate_totals;", nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(other);
        throw SettlementError(ErrorCode::TransferFailed, "transfer refused");
    };

    try {
        store.Settle({SettlementEntry("0xa", 40)}, 3, SettlementPath::Claim, breakSchemaThenFail);
        FAIL() << "expected TransferFailed";
    }
    catch (const SettlementError &ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::TransferFailed);
    }

    // The undo was rolled back as a whole, so the committed claim is still there.
    EXPECT_TRUE(store.HasClaimed("0xa", 3));
    EXPECT_EQ(store.GlobalTotal(), 40u);
}

TEST(SqliteLedgerStoreTest, UnopenableFileThrows) {
    EXPECT_THROW(SqliteLedgerStore("/nonexistent-dir/ledger.sqlite"), std::runtime_error);
}

} // namespace
