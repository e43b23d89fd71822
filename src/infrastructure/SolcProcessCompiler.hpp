#pragma once

#include "domain/Compiler.hpp"
#include <string>

namespace sourceproof::infrastructure {

/**
 * @class SolcProcessCompiler
 * @brief Runs a solc binary in --standard-json mode as an external process.
 *
 * The binary for a version V is {compilerDirectory}/solc-vV when present,
 * otherwise the default binary is used.
 */
class SolcProcessCompiler : public domain::Compiler {
public:
    SolcProcessCompiler(const std::string& defaultBinary,
                        const std::string& compilerDirectory);
    ~SolcProcessCompiler() override = default;

    nlohmann::json compile(const std::string& version, const nlohmann::json& standardInput) override;

    /** @brief Binary that would be used for a version. */
    std::string resolveBinary(const std::string& version) const;

private:
    std::string m_defaultBinary;
    std::string m_compilerDirectory;
};

} // namespace sourceproof::infrastructure
