// test/unit/test_reward_calculator.cpp
// -----------------------------------------------------------

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <vector>

#include "core/settlement_error.hpp"
#include "distribution/reward_calculator.hpp"

namespace {

using rewardledger::distribution::AffiliateActivity;
using rewardledger::distribution::RewardCalculator;

AffiliateActivity activity(const std::string &user, const std::string &wallet, uint64_t total, uint64_t valid)
{
    AffiliateActivity a;
    a.userId = user;
    a.walletAddress = wallet;
    a.totalClicks = total;
    a.validClicks = valid;
    return a;
}

TEST(RewardCalculatorTest, PaysValidClicksTimesRate) {
    RewardCalculator calc(250000);
    auto entries = calc.CalculateEpochRewards({
        activity("u2", "0xBBB", 10, 4),
        activity("u1", "0xaaa", 3, 3),
    });

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].affiliate, "0xaaa");
    EXPECT_EQ(entries[0].amount, 750000u);
    EXPECT_EQ(entries[1].affiliate, "0xbbb");
    EXPECT_EQ(entries[1].amount, 1000000u);
}

TEST(RewardCalculatorTest, SkipsMissingWalletsAndIdleAffiliates) {
    RewardCalculator calc(10);
    auto entries = calc.CalculateEpochRewards({
        activity("u1", "", 5, 5),
        activity("u2", "no_wallet_configured", 5, 5),
        activity("u3", "0xidle", 7, 0),
        activity("u4", "0xactive", 2, 2),
    });

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].affiliate, "0xactive");
    EXPECT_EQ(entries[0].amount, 20u);
}

TEST(RewardCalculatorTest, RowsSharingAWalletAreMerged) {
    RewardCalculator calc(5);
    auto entries = calc.CalculateEpochRewards({
        activity("u1", "0xshared", 1, 1),
        activity("u2", "0xSHARED", 2, 2),
    });
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].amount, 15u);
}

TEST(RewardCalculatorTest, OverflowIsRejected) {
    RewardCalculator calc(2);
    EXPECT_THROW(calc.CalculateEpochRewards({activity("u1", "0xa", 0, std::numeric_limits<uint64_t>::max())}),
                 rewardledger::core::SettlementError);
}

TEST(RewardCalculatorTest, ZeroRateIsRejected) {
    EXPECT_THROW(RewardCalculator(0), std::invalid_argument);
}

TEST(RewardCalculatorTest, EpochFromDate) {
    EXPECT_EQ(RewardCalculator::EpochFromDate("2025-03-07"), 20250307u);
    EXPECT_EQ(RewardCalculator::EpochFromDate("2024-02-29"), 20240229u);

    EXPECT_THROW(RewardCalculator::EpochFromDate("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(RewardCalculator::EpochFromDate("2025-13-01"), std::invalid_argument);
    EXPECT_THROW(RewardCalculator::EpochFromDate("2025-1-01"), std::invalid_argument);
    EXPECT_THROW(RewardCalculator::EpochFromDate("2025/01/01"), std::invalid_argument);
    EXPECT_THROW(RewardCalculator::EpochFromDate("20250101"), std::invalid_argument);
    EXPECT_THROW(RewardCalculator::EpochFromDate(""), std::invalid_argument);
}

} // namespace
