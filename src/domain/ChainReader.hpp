/**
 * @file ChainReader.hpp
 * @brief Interface for reading deployed code from a chain.
 */

#pragma once
#include <optional>
#include <string>

namespace sourceproof::domain {

/**
 * @struct CodeReadResult
 * @brief Explicit outcome of a single code read.
 */
struct CodeReadResult {
    std::optional<std::string> code; ///< Hex code as returned by the node, when the read succeeded.
    std::string error;               ///< Transport or RPC error description otherwise.

    bool ok() const { return code.has_value(); }

    static CodeReadResult Success(std::string hex) { return {std::move(hex), {}}; }
    static CodeReadResult Failure(std::string message) { return {std::nullopt, std::move(message)}; }
};

/**
 * @class ChainReader
 * @brief Read-only handle on one chain. Safe for concurrent use.
 */
class ChainReader {
public:
    virtual ~ChainReader() = default;

    /**
     * @brief Fetches the runtime code at an address.
     * @param address Checksummed hex address.
     * @return Success with the code, or failure. Never throws for transport errors.
     */
    virtual CodeReadResult getCode(const std::string& address) const = 0;
};

} // namespace sourceproof::domain
