#ifndef REWARDLEDGER_UTIL_HASHING_HPP
#define REWARDLEDGER_UTIL_HASHING_HPP

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 and hex helpers shared by the verifier and the address code.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   using namespace rewardledger::util::hashing;
 *
 *   std::vector<uint8_t> key = fromHex("04ab...");
 *   std::string digestHex = sha256(key);
 *   @endcode
 */

namespace rewardledger {
namespace util {
namespace hashing {

/**
 * @brief Raw 32-byte SHA-256 digest.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::vector<uint8_t> sha256Digest(const std::vector<uint8_t> &input)
{
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    if (!SHA256(input.data(), input.size(), digest.data())) {
        throw std::runtime_error("hashing::sha256Digest: SHA256 computation failed.");
    }
    return digest;
}

/**
 * @brief Lowercase hex encoding of arbitrary bytes.
 */
inline std::string toHex(const std::vector<uint8_t> &bytes)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(b);
    }
    return oss.str();
}

/**
 * @brief Decode a hex string. An optional "0x" prefix is accepted.
 * @throw std::invalid_argument on odd length or a non-hex character.
 */
inline std::vector<uint8_t> fromHex(const std::string &hex)
{
    std::string body = hex;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        body.erase(0, 2);
    }
    if (body.size() % 2 != 0) {
        throw std::invalid_argument("hashing::fromHex: odd number of hex digits");
    }

    auto nibble = [&hex](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("hashing::fromHex: invalid hex input '" + hex + "'");
    };

    std::vector<uint8_t> out;
    out.reserve(body.size() / 2);
    for (size_t i = 0; i < body.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibble(body[i]) << 4) | nibble(body[i + 1])));
    }
    return out;
}

/**
 * @brief SHA-256 of the input, as 64 lowercase hex characters.
 */
inline std::string sha256(const std::vector<uint8_t> &input)
{
    return toHex(sha256Digest(input));
}

inline std::string sha256(const std::string &input)
{
    return sha256(std::vector<uint8_t>(input.begin(), input.end()));
}

} // namespace hashing
} // namespace util
} // namespace rewardledger

#endif // REWARDLEDGER_UTIL_HASHING_HPP
