#ifndef REWARDLEDGER_GATEWAY_HTTP_ASSET_GATEWAY_HPP
#define REWARDLEDGER_GATEWAY_HTTP_ASSET_GATEWAY_HPP

#include <string>
#include "gateway/asset_gateway.hpp"

namespace rewardledger {
namespace gateway {

/*
  HttpAssetGateway
  --------------------------------
  IAssetGateway over a REST custody service, using libcurl.

  Endpoints (relative to the configured base URL):
    GET  /balance/<account>   -> {"balance":"<u64>"}   (account percent-encoded)
    POST /transfer            <- {"from":"<custody>","to":"<account>","amount":"<u64>"}
                              -> {"ok":true,...}

  Amounts travel as decimal strings so 64-bit values survive JSON number
  handling on the other side.

  - Transfer() returns false on any network error, non-2xx status or a body
    without "ok":true. It never throws.
  - BalanceOf() throws SettlementError(TransferFailed) when the balance
    cannot be read, so a settlement aborts before any bookkeeping.
  - Responses are parsed by plain key search; the service returns flat JSON.
*/
class HttpAssetGateway : public IAssetGateway
{
public:
    HttpAssetGateway(const std::string &endpoint, const core::Address &custodyAccount,
                     long timeoutSeconds = 30);

    bool Transfer(const core::Address &to, core::Amount amount) override;
    core::Amount BalanceOf(const core::Address &account) const override;
    const core::Address& CustodyAccount() const override { return m_custodyAccount; }
    std::string Name() const override { return "http:" + m_endpoint; }

    /**
     * @brief JSON body of a POST /transfer. Addresses are JSON-escaped.
     */
    static std::string BuildTransferBody(const core::Address &from, const core::Address &to,
                                         core::Amount amount);

    /// Percent-encodes one URL path segment (libcurl rules).
    static std::string EncodePathSegment(const std::string &segment);

    /**
     * @brief Extract the value of "key" from a flat JSON object, string or bare literal.
     * @return Empty string if the key is absent.
     */
    static std::string ParseValueFromResponse(const std::string &response, const std::string &key);

private:
    static void initCurl();
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    bool httpGet(const std::string &url, std::string &responseOut) const;
    bool httpPostJson(const std::string &url, const std::string &body, std::string &responseOut) const;

    std::string m_endpoint;
    core::Address m_custodyAccount;
    long m_timeoutSeconds;
};

} // namespace gateway
} // namespace rewardledger

#endif // REWARDLEDGER_GATEWAY_HTTP_ASSET_GATEWAY_HPP
