/**
 * @file Compiler.hpp
 * @brief Interface for the external language compiler.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace sourceproof::domain {

/**
 * @class Compiler
 * @brief Abstract interface for a compiler speaking the standard JSON protocol.
 */
class Compiler {
public:
    virtual ~Compiler() = default;

    /**
     * @brief Compiles a standard JSON input with an exact compiler release.
     * @param version Full version string from the metadata (e.g. "0.6.6+commit.6c089d02").
     * @param standardInput Standard JSON input document.
     * @return The compiler's standard JSON output document.
     * @throws std::runtime_error if the compiler cannot be run or its output is unreadable.
     */
    virtual nlohmann::json compile(const std::string& version, const nlohmann::json& standardInput) = 0;
};

} // namespace sourceproof::domain
