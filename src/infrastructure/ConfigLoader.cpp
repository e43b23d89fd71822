/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "infrastructure/PathUtils.hpp"

namespace sourceproof::infrastructure {

namespace {

constexpr const char* kInfuraPlaceholder = "${INFURA_ID}";

std::string SubstituteInfuraId(std::string url, const std::string& infuraId) {
    size_t pos = url.find(kInfuraPlaceholder);
    if (pos != std::string::npos) {
        url.replace(pos, std::string(kInfuraPlaceholder).size(), infuraId);
    }
    return url;
}

} // namespace

std::vector<ChainEndpoint> ConfigLoader::DefaultChains(const std::string& infuraId, const std::string& localChainUrl) {
    std::vector<ChainEndpoint> chains;
    if (infuraId.empty()) {
        std::cerr << "[ConfigLoader] No infuraId configured, public networks disabled. "
                  << "Set \"infuraId\" or list \"chains\" in settings.json." << std::endl;
    } else {
        chains = {
            {"1", "mainnet", "https://mainnet.infura.io/v3/${INFURA_ID}"},
            {"3", "ropsten", "https://ropsten.infura.io/v3/${INFURA_ID}"},
            {"4", "rinkeby", "https://rinkeby.infura.io/v3/${INFURA_ID}"},
            {"42", "kovan", "https://kovan.infura.io/v3/${INFURA_ID}"},
            {"5", "goerli", "https://goerli.infura.io/v3/${INFURA_ID}"}
        };
        for (auto& chain : chains) {
            chain.rpc = SubstituteInfuraId(chain.rpc, infuraId);
        }
    }

    // For testing against a local development node.
    if (!localChainUrl.empty()) {
        chains.push_back({"1337", "localhost", localChainUrl});
    }
    return chains;
}

VerifierConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    VerifierConfig config;
    config.solcDirectory = PathUtils::GetCompilerDir().string();
    if (!j.is_object()) {
        config.chains = DefaultChains(config.infuraId, config.localChainUrl);
        return config;
    }

    config.repository = j.value("repository", config.repository);
    config.layout = j.value("layout", config.layout);
    config.readTimeoutSeconds = j.value("readTimeoutSeconds", config.readTimeoutSeconds);
    config.infuraId = j.value("infuraId", config.infuraId);
    config.localChainUrl = j.value("localChainUrl", config.localChainUrl);

    if (j.contains("solc") && j["solc"].is_object()) {
        config.solcPath = j["solc"].value("path", config.solcPath);
        config.solcDirectory = j["solc"].value("directory", config.solcDirectory);
    }

    if (j.contains("chains") && j["chains"].is_array() && !j["chains"].empty()) {
        for (const auto& item : j["chains"]) {
            if (!item.is_object()) continue;
            ChainEndpoint chain;
            chain.id = item.value("id", "");
            chain.name = item.value("name", chain.id);
            chain.rpc = SubstituteInfuraId(item.value("rpc", ""), config.infuraId);
            if (chain.id.empty() || chain.rpc.empty()) {
                std::cerr << "[ConfigLoader] Ignoring chain entry without id or rpc: " << item.dump() << std::endl;
                continue;
            }
            config.chains.push_back(chain);
        }
    } else {
        config.chains = DefaultChains(config.infuraId, config.localChainUrl);
    }
    return config;
}

VerifierConfig ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] No settings at " << configPath << ", using defaults." << std::endl;
        return FromJson(nlohmann::json::object());
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open settings file: " + configPath);
    }

    try {
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        throw std::runtime_error("Invalid settings file " + configPath + ": " + e.what());
    }
}

std::string ConfigLoader::DefaultConfigPath() {
    return (PathUtils::GetConfigHome() / "sourceproof" / "settings.json").string();
}

} // namespace sourceproof::infrastructure
