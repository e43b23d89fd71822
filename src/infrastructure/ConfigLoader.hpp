/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the verifier configuration (settings.json).
 *
 * Provides a unified way to access repository, compiler and chain settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sourceproof::infrastructure {

/**
 * @struct ChainEndpoint
 * @brief One configured chain and the JSON-RPC endpoint serving it.
 */
struct ChainEndpoint {
    std::string id;   ///< Identifier used in submissions and repository paths.
    std::string name; ///< Human readable name (e.g. "mainnet").
    std::string rpc;  ///< Endpoint URL, with ${INFURA_ID} already substituted.
};

/**
 * @struct VerifierConfig
 * @brief Effective configuration after defaults are applied.
 */
struct VerifierConfig {
    std::string repository = "repository";
    std::string layout = "current";
    std::string solcPath = "solc";
    std::string solcDirectory;   ///< Holds per-release binaries named solc-v{version}.
    int readTimeoutSeconds = 10;
    std::string infuraId;
    std::string localChainUrl;
    std::vector<ChainEndpoint> chains;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json at the given path.
     * @return Defaults when the file does not exist.
     * @throws std::runtime_error if the file exists but is not valid JSON.
     */
    static VerifierConfig Load(const std::string& configPath);

    /** @brief Builds a configuration from an already parsed document. */
    static VerifierConfig FromJson(const nlohmann::json& j);

    /** @brief $XDG_CONFIG_HOME/sourceproof/settings.json (or the ~/.config equivalent). */
    static std::string DefaultConfigPath();

    /** @brief Public networks configured when settings.json lists no chains. */
    static std::vector<ChainEndpoint> DefaultChains(const std::string& infuraId, const std::string& localChainUrl);
};

} // namespace sourceproof::infrastructure
