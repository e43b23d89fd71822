/**
 * @file JsonRpcChainReader.hpp
 * @brief ChainReader backed by a node's HTTP JSON-RPC endpoint.
 */

#pragma once

#include <string>
#include "domain/ChainReader.hpp"

namespace sourceproof::infrastructure {

/**
 * @class JsonRpcChainReader
 * @brief Issues eth_getCode against one endpoint. Every call opens its own
 *        client, so a single instance can serve concurrent verifications.
 */
class JsonRpcChainReader : public domain::ChainReader {
public:
    /**
     * @param url Endpoint URL, e.g. "https://mainnet.infura.io/v3/<id>" or "http://localhost:8545".
     * @param timeoutSeconds Connection and read timeout applied to every call.
     */
    explicit JsonRpcChainReader(const std::string& url, int timeoutSeconds = 10);

    /** @brief Calls eth_getCode(address, "latest"). @see domain::ChainReader::getCode */
    domain::CodeReadResult getCode(const std::string& address) const override;

    const std::string& url() const { return m_url; }

private:
    std::string m_url;
    std::string m_origin; ///< scheme://host[:port]
    std::string m_path;   ///< Request path, "/" when the URL has none.
    int m_timeoutSeconds;
};

} // namespace sourceproof::infrastructure
