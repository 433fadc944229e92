#ifndef REWARDLEDGER_CORE_TYPES_HPP
#define REWARDLEDGER_CORE_TYPES_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file types.hpp
 * @brief Value types shared by the store, the verifier and both settlement paths.
 */

namespace rewardledger {
namespace core {

/// Stable identity of an affiliate, the authority or the ledger itself.
using Address = std::string;

/// Asset amount in its smallest unit.
using Amount = uint64_t;

/// Reward period ordinal.
using Epoch = uint64_t;

/**
 * @brief Canonical form of an address: surrounding whitespace removed, and
 *        "0x"-prefixed hex addresses lower-cased so mixed-case checksummed
 *        input maps to the same key.
 */
inline Address NormalizeAddress(const std::string &raw)
{
    static const std::string whitespace = " \t\r\n";
    auto first = raw.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return Address();
    }
    auto last = raw.find_last_not_of(whitespace);
    Address addr = raw.substr(first, last - first + 1);

    if (addr.size() >= 2 && addr[0] == '0' && (addr[1] == 'x' || addr[1] == 'X')) {
        std::transform(addr.begin(), addr.end(), addr.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return addr;
}

/**
 * @brief Non-empty, and free of whitespace and control characters
 *        (addresses are written as single tokens into the audit file).
 */
inline bool IsWellFormedAddress(const Address &addr)
{
    if (addr.empty()) {
        return false;
    }
    return std::none_of(addr.begin(), addr.end(), [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c);
    });
}

/**
 * @brief Overflow-checked addition.
 * @return false (and leaves out untouched) if a + b does not fit.
 */
inline bool CheckedAdd(Amount a, Amount b, Amount &out)
{
    if (a > std::numeric_limits<Amount>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

enum class SettlementPath {
    Batch,
    Claim
};

inline const char* SettlementPathName(SettlementPath path)
{
    return path == SettlementPath::Batch ? "batch" : "claim";
}

inline SettlementPath ParseSettlementPath(const std::string &name)
{
    if (name == "batch") return SettlementPath::Batch;
    if (name == "claim") return SettlementPath::Claim;
    throw std::invalid_argument("ParseSettlementPath: unknown path '" + name + "'");
}

/// One (affiliate, amount) pair of a push distribution.
struct SettlementEntry
{
    Address affiliate;
    Amount  amount{0};

    SettlementEntry() = default;
    SettlementEntry(Address a, Amount amt)
        : affiliate(std::move(a))
        , amount(amt)
    {
    }
};

/**
 * @struct ClaimRecord
 * @brief Committed settlement of one (affiliate, epoch) pair. Never modified
 *        or removed once written.
 */
struct ClaimRecord
{
    Address        affiliate;
    Epoch          epoch{0};
    Amount         amount{0};
    SettlementPath path{SettlementPath::Batch};
    uint64_t       settledAt{0}; ///< unix seconds
};

} // namespace core
} // namespace rewardledger

#endif // REWARDLEDGER_CORE_TYPES_HPP
