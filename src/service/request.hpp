#ifndef REWARDLEDGER_SERVICE_REQUEST_HPP
#define REWARDLEDGER_SERVICE_REQUEST_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/types.hpp"
#include "distribution/reward_calculator.hpp"
#include "util/hashing.hpp"

/**
 * @file request.hpp
 * @brief A LedgerService request and the helpers that read its parameters.
 *
 * A request is a type name, the caller's identity and string parameters:
 *   @code
 *   // reward_ledger ledger.conf Claim caller=0xaff epoch=2025-01-01 amount=500 signature=3045...
 *   Request req = ParseRequest({"Claim", "caller=0xaff", "epoch=2025-01-01",
 *                               "amount=500", "signature=3045..."});
 *   @endcode
 *
 * Parameter helpers throw std::invalid_argument for missing or malformed
 * values; LedgerService reports those as "bad_request".
 */

namespace rewardledger {
namespace service {

struct Request
{
    std::string requestType;  ///< "Claim", "BatchDistribute", ...
    core::Address caller;     ///< Identity the request is made as
    std::unordered_map<std::string, std::string> params;
};

/**
 * @brief Build a Request from "Type key=value key=value ..." tokens.
 *        The "caller" key fills Request::caller.
 * @throw std::invalid_argument on a token without '=' or an empty type.
 */
inline Request ParseRequest(const std::vector<std::string> &tokens)
{
    if (tokens.empty() || tokens[0].empty()) {
        throw std::invalid_argument("ParseRequest: missing request type");
    }

    Request req;
    req.requestType = tokens[0];
    for (size_t i = 1; i < tokens.size(); ++i) {
        const std::string &tok = tokens[i];
        auto pos = tok.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw std::invalid_argument("ParseRequest: expected key=value, got '" + tok + "'");
        }
        std::string key = tok.substr(0, pos);
        std::string val = tok.substr(pos + 1);
        if (key == "caller") {
            req.caller = val;
        } else {
            req.params[key] = val;
        }
    }
    return req;
}

inline const std::string& RequireParam(const Request &req, const std::string &key)
{
    auto it = req.params.find(key);
    if (it == req.params.end() || it->second.empty()) {
        throw std::invalid_argument(req.requestType + ": missing parameter '" + key + "'");
    }
    return it->second;
}

inline uint64_t ParseUnsigned(const std::string &key, const std::string &val)
{
    if (val.empty() || val.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("parameter '" + key + "' is not an unsigned integer: '" + val + "'");
    }
    try {
        return std::stoull(val);
    }
    catch (const std::out_of_range &) {
        throw std::invalid_argument("parameter '" + key + "' is out of range: '" + val + "'");
    }
}

inline core::Amount AmountParam(const Request &req, const std::string &key = "amount")
{
    return ParseUnsigned(key, RequireParam(req, key));
}

/// Numeric epoch, or a calendar day "YYYY-MM-DD" mapped to YYYYMMDD.
inline core::Epoch EpochParam(const Request &req)
{
    const std::string &val = RequireParam(req, "epoch");
    if (val.find('-') != std::string::npos) {
        return rewardledger::distribution::RewardCalculator::EpochFromDate(val);
    }
    return ParseUnsigned("epoch", val);
}

/// Hex signature with or without a 0x prefix.
inline std::vector<uint8_t> SignatureParam(const Request &req)
{
    return rewardledger::util::hashing::fromHex(RequireParam(req, "signature"));
}

/// "a,b,c" -> {"a","b","c"}; empty items are kept so length checks see them.
inline std::vector<std::string> SplitList(const std::string &val)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t comma = val.find(',', start);
        out.push_back(val.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

} // namespace service
} // namespace rewardledger

#endif // REWARDLEDGER_SERVICE_REQUEST_HPP
