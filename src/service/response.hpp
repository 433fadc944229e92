#ifndef REWARDLEDGER_SERVICE_RESPONSE_HPP
#define REWARDLEDGER_SERVICE_RESPONSE_HPP

#include <map>
#include <sstream>
#include <string>
#include "core/settlement_error.hpp"
#include "util/json.hpp"

/**
 * @file response.hpp
 * @brief Result of one LedgerService request, serializable to JSON.
 *
 * USAGE EXAMPLE:
 *   @code
 *   Response resp = Response::Ok("claimed", {{"amount", "500"}});
 *   std::string jsonOut = resp.ToJson();
 *   // => {"success":true,"code":"ok","message":"claimed","fields":{"amount":"500"}}
 *   @endcode
 */

namespace rewardledger {
namespace service {

/**
 * @struct Response
 * @brief `code` is "ok" on success, otherwise a stable error code name
 *        ("already_claimed", "invalid_signature", ..., "bad_request").
 */
struct Response
{
    bool success;
    std::string code;
    std::string message;
    std::map<std::string, std::string> fields;

    Response(bool ok = true,
             const std::string &c = "ok",
             const std::string &msg = "",
             const std::map<std::string, std::string> &extra = {})
        : success(ok), code(c), message(msg), fields(extra)
    {
    }

    static Response Ok(const std::string &msg, const std::map<std::string, std::string> &extra = {})
    {
        return Response(true, "ok", msg, extra);
    }

    static Response Error(const std::string &c, const std::string &msg)
    {
        return Response(false, c, msg);
    }

    static Response FromError(const core::SettlementError &ex)
    {
        Response resp(false, core::ErrorCodeName(ex.Code()), ex.what());
        resp.fields["category"] = core::ErrorCategoryName(ex.Category());
        return resp;
    }

    /**
     * @brief {"success":bool,"code":"...","message":"...","fields":{...}}
     *        Field values are always strings, keys in sorted order.
     */
    inline std::string ToJson() const
    {
        std::ostringstream oss;
        oss << "{";
        oss << R"("success":)" << (success ? "true" : "false") << ",";
        oss << R"("code":")" << util::json::escapeString(code) << "\",";
        oss << R"("message":")" << util::json::escapeString(message) << "\",";
        oss << R"("fields":{)";
        bool first = true;
        for (const auto &kv : fields) {
            if (!first) {
                oss << ",";
            }
            oss << "\"" << util::json::escapeString(kv.first) << "\":\"" << util::json::escapeString(kv.second) << "\"";
            first = false;
        }
        oss << "}}";
        return oss.str();
    }

};

} // namespace service
} // namespace rewardledger

#endif // REWARDLEDGER_SERVICE_RESPONSE_HPP
