#include "infrastructure/JsonRpcChainReader.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace sourceproof::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kRequestId = 1;
}

JsonRpcChainReader::JsonRpcChainReader(const std::string& url, int timeoutSeconds)
    : m_url(url), m_timeoutSeconds(timeoutSeconds) {
    size_t schemeEnd = m_url.find("://");
    size_t pathStart = m_url.find('/', schemeEnd == std::string::npos ? 0 : schemeEnd + 3);
    if (pathStart == std::string::npos) {
        m_origin = m_url;
        m_path = "/";
    } else {
        m_origin = m_url.substr(0, pathStart);
        m_path = m_url.substr(pathStart);
    }
}

domain::CodeReadResult JsonRpcChainReader::getCode(const std::string& address) const {
    httplib::Client cli(m_origin);
    if (!cli.is_valid()) {
        return domain::CodeReadResult::Failure("Unsupported endpoint: " + m_url);
    }
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_write_timeout(m_timeoutSeconds);

    json requestData = {
        {"jsonrpc", "2.0"},
        {"id", kRequestId},
        {"method", "eth_getCode"},
        {"params", json::array({address, "latest"})}
    };

    auto res = cli.Post(m_path, requestData.dump(), "application/json");
    if (!res) {
        return domain::CodeReadResult::Failure("Connection failed, error code " + std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        return domain::CodeReadResult::Failure("HTTP Error " + std::to_string(res->status) + ": " + res->body);
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("error")) {
            return domain::CodeReadResult::Failure("RPC Error: " + body["error"].dump());
        }
        if (body.contains("result") && body["result"].is_string()) {
            return domain::CodeReadResult::Success(body["result"].get<std::string>());
        }
        return domain::CodeReadResult::Failure("Response JSON missing 'result' field: " + res->body);
    } catch (const json::exception& e) {
        return domain::CodeReadResult::Failure(std::string("JSON Parse Error: ") + e.what());
    }
}

} // namespace sourceproof::infrastructure
