#ifndef REWARDLEDGER_UTIL_JSON_HPP
#define REWARDLEDGER_UTIL_JSON_HPP

#include <iomanip>
#include <sstream>
#include <string>

/**
 * @file json.hpp
 * @brief String escaping for the hand-built flat JSON objects the service
 *        layer and the HTTP gateway emit.
 */

namespace rewardledger {
namespace util {
namespace json {

/**
 * @brief Escape a value for use inside a JSON string literal.
 *        Quotes, backslashes and control characters are escaped; other bytes pass through.
 */
inline std::string escapeString(const std::string &in)
{
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

} // namespace json
} // namespace util
} // namespace rewardledger

#endif // REWARDLEDGER_UTIL_JSON_HPP
