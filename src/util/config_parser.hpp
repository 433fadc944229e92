#ifndef REWARDLEDGER_UTIL_CONFIG_PARSER_HPP
#define REWARDLEDGER_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include "config/ledger_config.hpp"
#include "config/ledger_params.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for the reward ledger's "key=value" configuration file.
 *
 * FORMAT:
 *   - One "key=value" per line; whitespace around key and value is trimmed.
 *   - Lines starting with '#' and blank lines are ignored.
 *   - Unknown keys are logged and skipped; malformed lines throw.
 *
 * USAGE:
 *   @code
 *   rewardledger::config::LedgerConfig cfg;
 *   rewardledger::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("reward_ledger.conf");
 *   parser.validate();
 *   @endcode
 */

namespace rewardledger {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(rewardledger::config::LedgerConfig &ledgerConfig)
        : ledgerConfig_(ledgerConfig)
    {
    }

    /**
     * @brief Read the given file and apply every recognized key.
     * @return false if the file does not exist (defaults are kept).
     * @throw std::runtime_error on a malformed line or value.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            rewardledger::util::logger::warn("[ConfigParser] File not found: " + filepath);
            return false;
        }

        rewardledger::util::logger::info("[ConfigParser] Loading config from " + filepath);
        loadFromStream(inFile);
        return true;
    }

    /**
     * @brief Same as loadFromFile, for an in-memory or already opened source.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: line " + std::to_string(lineNo)
                                         + " has no '=': " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    /**
     * @brief Cross-field checks that only make sense once the whole file is read.
     * @throw std::runtime_error describing the first problem found.
     */
    inline void validate() const
    {
        const auto &c = ledgerConfig_;
        if (c.ledgerIdentity.empty()) {
            throw std::runtime_error("ConfigParser: ledgerIdentity must not be empty");
        }
        if (c.authorityAddress.empty()) {
            throw std::runtime_error("ConfigParser: authorityAddress is required");
        }
        if (c.verifierScheme == "ecdsa") {
            if (c.authorityPublicKey.empty()) {
                throw std::runtime_error("ConfigParser: authorityPublicKey is required for verifierScheme=ecdsa");
            }
        }
        else if (c.verifierScheme == "hmac") {
            if (c.authoritySecret.empty()) {
                throw std::runtime_error("ConfigParser: authoritySecret is required for verifierScheme=hmac");
            }
        }
        else {
            throw std::runtime_error("ConfigParser: unknown verifierScheme '" + c.verifierScheme + "'");
        }
        if (c.storeBackend != "memory" && c.storeBackend != "sqlite") {
            throw std::runtime_error("ConfigParser: unknown storeBackend '" + c.storeBackend + "'");
        }
        if (c.storeBackend == "sqlite" && c.databasePath.empty()) {
            throw std::runtime_error("ConfigParser: databasePath is required for storeBackend=sqlite");
        }
        if (c.storeBackend != "memory" && c.gatewayEndpoint.empty()) {
            throw std::runtime_error("ConfigParser: gatewayEndpoint is required for storeBackend="
                                     + c.storeBackend + " (the in-memory gateway needs storeBackend=memory)");
        }
        if (c.rewardPerClick == 0) {
            throw std::runtime_error("ConfigParser: rewardPerClick must be positive");
        }
        try {
            rewardledger::config::getParamsForNetwork(c.network);
            rewardledger::util::logger::parseLogLevel(c.logLevel);
        }
        catch (const std::invalid_argument &ex) {
            throw std::runtime_error(std::string("ConfigParser: ") + ex.what());
        }
    }

private:
    rewardledger::config::LedgerConfig &ledgerConfig_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        auto &c = ledgerConfig_;
        if (key == "ledgerIdentity") {
            c.ledgerIdentity = val;
        }
        else if (key == "authorityAddress") {
            c.authorityAddress = val;
        }
        else if (key == "verifierScheme") {
            c.verifierScheme = val;
        }
        else if (key == "authorityPublicKey") {
            c.authorityPublicKey = val;
        }
        else if (key == "authoritySecret") {
            c.authoritySecret = val;
            // never echo the secret
            rewardledger::util::logger::debug("[ConfigParser] authoritySecret set");
            return;
        }
        else if (key == "storeBackend") {
            c.storeBackend = val;
        }
        else if (key == "databasePath") {
            c.databasePath = val;
        }
        else if (key == "auditLogPath") {
            c.auditLogPath = val;
        }
        else if (key == "gatewayEndpoint") {
            c.gatewayEndpoint = val;
        }
        else if (key == "network") {
            c.network = val;
        }
        else if (key == "logLevel") {
            c.logLevel = val;
        }
        else if (key == "logFile") {
            c.logFile = val;
        }
        else if (key == "rewardPerClick") {
            c.rewardPerClick = parseUInt(val);
        }
        else if (key == "inMemorySeedBalance") {
            c.inMemorySeedBalance = parseUInt(val);
        }
        else {
            rewardledger::util::logger::warn("[ConfigParser] Unrecognized key '" + key + "'");
            return;
        }
        rewardledger::util::logger::debug("[ConfigParser] " + key + " set to " + val);
    }

    inline static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        s.erase(pos + 1);
    }

    inline static uint64_t parseUInt(const std::string &val)
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw std::runtime_error("ConfigParser: expected an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace rewardledger

#endif // REWARDLEDGER_UTIL_CONFIG_PARSER_HPP
