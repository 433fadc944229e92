#ifndef REWARDLEDGER_DISTRIBUTION_REWARD_CALCULATOR_HPP
#define REWARDLEDGER_DISTRIBUTION_REWARD_CALCULATOR_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/settlement_error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

namespace rewardledger {
namespace distribution {

/*
  RewardCalculator
  --------------------------------
  Turns one epoch's click tallies into BatchDistribute entries.

    amount(affiliate) = sum of validClicks over the affiliate's rows * rewardPerClick

  Rows are grouped by wallet address. Rows without a wallet (empty or the
  "no_wallet_configured" marker) and wallets that end up with zero valid
  clicks are left out. Output is ordered by affiliate address.

  EpochFromDate maps a calendar day "YYYY-MM-DD" to the numeric epoch
  YYYYMMDD used everywhere else.
*/

/// Click tally for one user during one epoch.
struct AffiliateActivity
{
    std::string   userId;
    core::Address walletAddress;
    uint64_t      totalClicks{0};
    uint64_t      validClicks{0};
};

class RewardCalculator
{
public:
    explicit RewardCalculator(core::Amount rewardPerClick)
        : m_rewardPerClick(rewardPerClick)
    {
        if (m_rewardPerClick == 0) {
            throw std::invalid_argument("RewardCalculator: rewardPerClick must be positive");
        }
    }

    core::Amount GetRewardPerClick() const { return m_rewardPerClick; }

    /**
     * @throw core::SettlementError(InvalidAmount) if an affiliate's reward overflows.
     */
    std::vector<core::SettlementEntry> CalculateEpochRewards(const std::vector<AffiliateActivity> &activities) const
    {
        std::map<core::Address, uint64_t> clicksByWallet;
        size_t skipped = 0;
        for (const auto &activity : activities) {
            const core::Address wallet = core::NormalizeAddress(activity.walletAddress);
            if (wallet.empty() || wallet == kNoWallet || !core::IsWellFormedAddress(wallet)) {
                ++skipped;
                continue;
            }
            uint64_t &clicks = clicksByWallet[wallet];
            if (!core::CheckedAdd(clicks, activity.validClicks, clicks)) {
                throw core::SettlementError(core::ErrorCode::InvalidAmount,
                    "RewardCalculator: click count overflows for " + wallet);
            }
        }

        std::vector<core::SettlementEntry> entries;
        for (const auto &kv : clicksByWallet) {
            if (kv.second == 0) {
                continue;
            }
            if (kv.second > UINT64_MAX / m_rewardPerClick) {
                throw core::SettlementError(core::ErrorCode::InvalidAmount,
                    "RewardCalculator: reward overflows for " + kv.first);
            }
            entries.emplace_back(kv.first, kv.second * m_rewardPerClick);
        }

        if (skipped > 0) {
            rewardledger::util::logger::warn("[RewardCalculator] Skipped " + std::to_string(skipped)
                                             + " activity rows without a wallet");
        }
        rewardledger::util::logger::info("[RewardCalculator] " + std::to_string(entries.size())
                                         + " affiliates eligible out of " + std::to_string(activities.size())
                                         + " activity rows");
        return entries;
    }

    /**
     * @brief "2025-03-07" -> 20250307.
     * @throw std::invalid_argument unless the input is a valid calendar date.
     */
    static core::Epoch EpochFromDate(const std::string &date)
    {
        if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
            throw std::invalid_argument("EpochFromDate: expected YYYY-MM-DD, got '" + date + "'");
        }
        for (size_t i = 0; i < date.size(); ++i) {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i]))) {
                throw std::invalid_argument("EpochFromDate: non-digit in '" + date + "'");
            }
        }

        const int year = std::stoi(date.substr(0, 4));
        const int month = std::stoi(date.substr(5, 2));
        const int day = std::stoi(date.substr(8, 2));
        if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
            throw std::invalid_argument("EpochFromDate: no such day '" + date + "'");
        }
        return static_cast<core::Epoch>(year) * 10000 + static_cast<core::Epoch>(month) * 100
               + static_cast<core::Epoch>(day);
    }

private:
    static int daysInMonth(int year, int month)
    {
        static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0))
            return 29;
        return kDays[month - 1];
    }

    static constexpr const char *kNoWallet = "no_wallet_configured";

    core::Amount m_rewardPerClick;
};

} // namespace distribution
} // namespace rewardledger

#endif // REWARDLEDGER_DISTRIBUTION_REWARD_CALCULATOR_HPP
