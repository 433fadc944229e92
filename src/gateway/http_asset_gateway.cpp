#include "gateway/http_asset_gateway.hpp"

#include <mutex>
#include <stdexcept>
#include <sstream>
#include <curl/curl.h>
#include "util/json.hpp"

namespace rewardledger {
namespace gateway {

using rewardledger::util::logger::Logger;
using rewardledger::util::logger::LogLevel;

HttpAssetGateway::HttpAssetGateway(const std::string &endpoint, const core::Address &custodyAccount,
                                   long timeoutSeconds)
    : m_endpoint(endpoint)
    , m_custodyAccount(core::NormalizeAddress(custodyAccount))
    , m_timeoutSeconds(timeoutSeconds)
{
    while (!m_endpoint.empty() && m_endpoint.back() == '/') {
        m_endpoint.pop_back();
    }
    initCurl();
}

// -------------------------------------------------------------------------
// IAssetGateway
// -------------------------------------------------------------------------
bool HttpAssetGateway::Transfer(const core::Address &to, core::Amount amount)
{
    std::string response;
    if (!httpPostJson(m_endpoint + "/transfer", BuildTransferBody(m_custodyAccount, to, amount), response)) {
        Logger::getInstance().log(LogLevel::ERROR, "[HttpAssetGateway] Transfer request to " + to + " failed.");
        return false;
    }

    if (ParseValueFromResponse(response, "ok") != "true") {
        Logger::getInstance().log(LogLevel::WARN, "[HttpAssetGateway] Transfer rejected by custody service: " + response);
        return false;
    }

    Logger::getInstance().log(LogLevel::DEBUG, "[HttpAssetGateway] Transferred " + std::to_string(amount) + " to " + to);
    return true;
}

core::Amount HttpAssetGateway::BalanceOf(const core::Address &account) const
{
    std::string response;
    if (!httpGet(m_endpoint + "/balance/" + EncodePathSegment(account), response)) {
        throw core::SettlementError(core::ErrorCode::TransferFailed,
                                    "HttpAssetGateway: balance query for " + account + " failed");
    }

    std::string value = ParseValueFromResponse(response, "balance");
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw core::SettlementError(core::ErrorCode::TransferFailed,
                                    "HttpAssetGateway: unexpected balance response: " + response);
    }
    try {
        return static_cast<core::Amount>(std::stoull(value));
    }
    catch (const std::out_of_range &) {
        throw core::SettlementError(core::ErrorCode::TransferFailed,
                                    "HttpAssetGateway: balance out of range: " + value);
    }
}

// -------------------------------------------------------------------------
// Request building
// -------------------------------------------------------------------------
std::string HttpAssetGateway::BuildTransferBody(const core::Address &from, const core::Address &to,
                                                core::Amount amount)
{
    using rewardledger::util::json::escapeString;

    std::ostringstream body;
    body << "{\"from\":\"" << escapeString(from) << "\",\"to\":\"" << escapeString(to)
         << "\",\"amount\":\"" << amount << "\"}";
    return body.str();
}

std::string HttpAssetGateway::EncodePathSegment(const std::string &segment)
{
    initCurl();
    CURL *curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("HttpAssetGateway: curl_easy_init failed");
    }
    char *escaped = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.size()));
    curl_easy_cleanup(curl);
    if (!escaped) {
        throw std::runtime_error("HttpAssetGateway: could not URL-encode '" + segment + "'");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

// -------------------------------------------------------------------------
// Response parsing
// -------------------------------------------------------------------------
std::string HttpAssetGateway::ParseValueFromResponse(const std::string &response, const std::string &key)
{
    std::string search = "\"" + key + "\"";
    size_t pos = response.find(search);
    if (pos == std::string::npos)
        return std::string();
    pos = response.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string();
    pos = response.find_first_not_of(" \t\r\n", pos + 1);
    if (pos == std::string::npos)
        return std::string();

    if (response[pos] == '"') {
        size_t endPos = response.find('"', pos + 1);
        if (endPos == std::string::npos)
            return std::string();
        return response.substr(pos + 1, endPos - pos - 1);
    }

    // bare literal: number, true, false, null
    size_t endPos = response.find_first_of(",} \t\r\n", pos);
    return response.substr(pos, endPos == std::string::npos ? std::string::npos : endPos - pos);
}

// -------------------------------------------------------------------------
// libcurl plumbing
// -------------------------------------------------------------------------
void HttpAssetGateway::initCurl()
{
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t HttpAssetGateway::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    if (!userdata) return 0;
    std::string &resp = *reinterpret_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    resp.append(ptr, total);
    return total;
}

bool HttpAssetGateway::httpGet(const std::string &url, std::string &responseOut) const
{
    CURL *curl = curl_easy_init();
    if (!curl) return false;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        Logger::getInstance().log(LogLevel::ERROR,
            "[HttpAssetGateway] httpGet error: " + std::string(curl_easy_strerror(res)));
        return false;
    }
    return status >= 200 && status < 300;
}

bool HttpAssetGateway::httpPostJson(const std::string &url, const std::string &body, std::string &responseOut) const
{
    CURL *curl = curl_easy_init();
    if (!curl) return false;

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        Logger::getInstance().log(LogLevel::ERROR,
            "[HttpAssetGateway] httpPostJson error: " + std::string(curl_easy_strerror(res)));
        return false;
    }
    return status >= 200 && status < 300;
}

} // namespace gateway
} // namespace rewardledger
