#ifndef REWARDLEDGER_SERVICE_LEDGER_SERVICE_HPP
#define REWARDLEDGER_SERVICE_LEDGER_SERVICE_HPP

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "distribution/reward_calculator.hpp"
#include "distribution/reward_distributor.hpp"
#include "service/request.hpp"
#include "service/response.hpp"
#include "util/logger.hpp"

namespace rewardledger {
namespace service {

/*
  LedgerService
  --------------------------------
  String-typed front door to a RewardDistributor, used by the CLI.

  Request types and parameters:
    HasClaimed        affiliate, epoch
    AffiliateTotal    affiliate
    GlobalTotal       -
    Status            -
    BatchDistribute   caller, epoch, affiliates=a,b,...  amounts=1,2,...
    Claim             caller, epoch, amount, signature (hex)
    EmergencyWithdraw caller, amount
    DistributeActivity caller, epoch, wallets=a,b,...  validClicks=3,0,...
                      (amounts computed with the configured rewardPerClick)

  Every outcome is a Response: settlement errors carry their error code name,
  malformed parameters "bad_request", unknown types "unknown_request". A bad
  item inside a list parameter is "invalid_batch".
*/
class LedgerService
{
public:
    LedgerService(std::shared_ptr<distribution::RewardDistributor> ledger, core::Amount rewardPerClick)
        : m_ledger(std::move(ledger))
        , m_calculator(rewardPerClick)
    {
        if (!m_ledger) {
            throw std::invalid_argument("LedgerService: ledger is required");
        }
        m_handlers["HasClaimed"]        = [this](const Request &r) { return hasClaimed(r); };
        m_handlers["AffiliateTotal"]    = [this](const Request &r) { return affiliateTotal(r); };
        m_handlers["GlobalTotal"]       = [this](const Request &r) { return globalTotal(r); };
        m_handlers["Status"]            = [this](const Request &r) { return status(r); };
        m_handlers["BatchDistribute"]   = [this](const Request &r) { return batchDistribute(r); };
        m_handlers["Claim"]             = [this](const Request &r) { return claim(r); };
        m_handlers["EmergencyWithdraw"] = [this](const Request &r) { return emergencyWithdraw(r); };
        m_handlers["DistributeActivity"] = [this](const Request &r) { return distributeActivity(r); };
    }

    LedgerService(const LedgerService&) = delete;
    LedgerService& operator=(const LedgerService&) = delete;

    Response Handle(const Request &req)
    {
        auto it = m_handlers.find(req.requestType);
        if (it == m_handlers.end()) {
            rewardledger::util::logger::warn("[LedgerService] Unknown request type '" + req.requestType + "'");
            return Response::Error("unknown_request", "unknown request type '" + req.requestType + "'");
        }

        try {
            return it->second(req);
        }
        catch (const core::SettlementError &ex) {
            return Response::FromError(ex);
        }
        catch (const std::invalid_argument &ex) {
            rewardledger::util::logger::warn("[LedgerService] Bad " + req.requestType + " request: " + ex.what());
            return Response::Error("bad_request", ex.what());
        }
        catch (const std::exception &ex) {
            rewardledger::util::logger::error("[LedgerService] " + req.requestType + " failed: " + ex.what());
            return Response::Error("internal_error", ex.what());
        }
    }

    std::vector<std::string> RequestTypes() const
    {
        std::vector<std::string> out;
        for (const auto &kv : m_handlers) {
            out.push_back(kv.first);
        }
        return out;
    }

private:
    Response hasClaimed(const Request &req)
    {
        const core::Address affiliate = core::NormalizeAddress(RequireParam(req, "affiliate"));
        const core::Epoch epoch = EpochParam(req);
        const bool claimed = m_ledger->HasClaimed(affiliate, epoch);

        std::map<std::string, std::string> fields{
            {"affiliate", affiliate},
            {"epoch", std::to_string(epoch)},
            {"claimed", claimed ? "true" : "false"}};
        if (claimed) {
            auto record = m_ledger->GetClaimRecord(affiliate, epoch);
            if (record) {
                fields["amount"] = std::to_string(record->amount);
                fields["path"] = core::SettlementPathName(record->path);
            }
        }
        return Response::Ok(claimed ? "settled" : "not settled", fields);
    }

    Response affiliateTotal(const Request &req)
    {
        const core::Address affiliate = core::NormalizeAddress(RequireParam(req, "affiliate"));
        return Response::Ok("affiliate total", {
            {"affiliate", affiliate},
            {"total", std::to_string(m_ledger->AffiliateTotal(affiliate))}});
    }

    Response globalTotal(const Request &)
    {
        return Response::Ok("global total", {{"total", std::to_string(m_ledger->GlobalTotal())}});
    }

    Response status(const Request &)
    {
        const distribution::LedgerStatus st = m_ledger->Status();
        return Response::Ok("ledger status", {
            {"ledgerIdentity", st.ledgerIdentity},
            {"authority", st.authority},
            {"network", st.network},
            {"gateway", st.gateway},
            {"verifierScheme", st.verifierScheme},
            {"verifierAuthority", st.verifierAuthority},
            {"custodiedBalance", std::to_string(st.custodiedBalance)},
            {"globalTotal", std::to_string(st.globalTotal)},
            {"auditRecords", std::to_string(st.auditRecords)}});
    }

    Response batchDistribute(const Request &req)
    {
        const core::Epoch epoch = EpochParam(req);
        const std::vector<std::string> affiliates = SplitList(RequireParam(req, "affiliates"));
        const std::vector<std::string> rawAmounts = SplitList(RequireParam(req, "amounts"));

        std::vector<core::Amount> amounts;
        amounts.reserve(rawAmounts.size());
        for (const auto &raw : rawAmounts) {
            amounts.push_back(batchItem("BatchDistribute", "amounts", raw));
        }

        const distribution::BatchResult result = m_ledger->BatchDistribute(req.caller, affiliates, amounts, epoch);
        return Response::Ok("batch distributed", {
            {"epoch", std::to_string(result.epoch)},
            {"entries", std::to_string(result.entryCount)},
            {"total", std::to_string(result.totalAmount)}});
    }

    Response claim(const Request &req)
    {
        const core::Epoch epoch = EpochParam(req);
        const core::Amount amount = AmountParam(req);

        std::vector<uint8_t> signature;
        try {
            signature = SignatureParam(req);
        }
        catch (const std::invalid_argument &ex) {
            throw core::SettlementError(core::ErrorCode::InvalidSignature,
                std::string("Claim: signature is not valid hex: ") + ex.what());
        }

        const distribution::ClaimResult result = m_ledger->Claim(req.caller, amount, epoch, signature);
        return Response::Ok("claimed", {
            {"affiliate", result.affiliate},
            {"amount", std::to_string(result.amount)},
            {"epoch", std::to_string(result.epoch)},
            {"authorizedBy", result.authorizedBy}});
    }

    Response emergencyWithdraw(const Request &req)
    {
        const core::Amount amount = AmountParam(req);
        m_ledger->EmergencyWithdraw(req.caller, amount);
        return Response::Ok("emergency withdrawal executed", {{"amount", std::to_string(amount)}});
    }

    // Pushes one epoch's click tallies through the batch path.
    Response distributeActivity(const Request &req)
    {
        const core::Epoch epoch = EpochParam(req);
        const std::vector<std::string> wallets = SplitList(RequireParam(req, "wallets"));
        const std::vector<std::string> clicks = SplitList(RequireParam(req, "validClicks"));
        if (wallets.size() != clicks.size()) {
            throw core::SettlementError(core::ErrorCode::InvalidBatch,
                "DistributeActivity: " + std::to_string(wallets.size()) + " wallets but "
                + std::to_string(clicks.size()) + " click counts");
        }

        std::vector<distribution::AffiliateActivity> activity;
        activity.reserve(wallets.size());
        for (size_t i = 0; i < wallets.size(); ++i) {
            distribution::AffiliateActivity row;
            row.userId = "row" + std::to_string(i);
            row.walletAddress = wallets[i];
            row.validClicks = batchItem("DistributeActivity", "validClicks", clicks[i]);
            row.totalClicks = row.validClicks;
            activity.push_back(row);
        }

        // An empty result is rejected by BatchDistribute as invalid_batch.
        const std::vector<core::SettlementEntry> entries = m_calculator.CalculateEpochRewards(activity);
        const distribution::BatchResult result = m_ledger->BatchDistribute(req.caller, entries, epoch);
        return Response::Ok("activity distributed", {
            {"epoch", std::to_string(result.epoch)},
            {"entries", std::to_string(result.entryCount)},
            {"total", std::to_string(result.totalAmount)},
            {"rewardPerClick", std::to_string(m_calculator.GetRewardPerClick())}});
    }

    // An empty or non-numeric list item makes the whole batch malformed.
    static uint64_t batchItem(const std::string &operation, const std::string &key, const std::string &raw)
    {
        try {
            return ParseUnsigned(key, raw);
        }
        catch (const std::invalid_argument &ex) {
            throw core::SettlementError(core::ErrorCode::InvalidBatch, operation + ": " + ex.what());
        }
    }

    std::shared_ptr<distribution::RewardDistributor> m_ledger;
    distribution::RewardCalculator m_calculator;
    std::map<std::string, std::function<Response(const Request&)>> m_handlers;
};

} // namespace service
} // namespace rewardledger

#endif // REWARDLEDGER_SERVICE_LEDGER_SERVICE_HPP
