#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"

using namespace sourceproof::infrastructure;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const fs::path testRoot = "test_config_root";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    // Missing file -> defaults.
    VerifierConfig defaults = ConfigLoader::Load((testRoot / "absent.json").string());
    assert(defaults.repository == "repository");
    assert(defaults.layout == "current");
    assert(defaults.solcPath == "solc");
    assert(defaults.readTimeoutSeconds == 10);
    // Without an infura id there is no usable public endpoint.
    assert(defaults.chains.empty());
    std::cout << "[PASS] Defaults when settings.json is absent." << std::endl;

    // Infura id and local chain.
    auto chains = ConfigLoader::DefaultChains("abc123", "http://localhost:8545");
    assert(chains.size() == 6);
    assert(chains[4].id == "5" && chains[4].rpc == "https://goerli.infura.io/v3/abc123");
    assert(chains[5].id == "1337" && chains[5].rpc == "http://localhost:8545");
    assert(chains[0].id == "1" && chains[0].name == "mainnet");
    auto localOnly = ConfigLoader::DefaultChains("", "http://localhost:8545");
    assert(localOnly.size() == 1 && localOnly[0].id == "1337");
    std::cout << "[PASS] Default chains with infura id and local node." << std::endl;

    // Explicit settings.
    const fs::path settings = testRoot / "settings.json";
    {
        std::ofstream out(settings);
        out << R"({
            "repository": "/srv/repository",
            "layout": "legacy",
            "solc": { "path": "/usr/bin/solc", "directory": "/opt/solc" },
            "readTimeoutSeconds": 3,
            "infuraId": "xyz",
            "chains": [
                { "id": "1", "name": "mainnet", "rpc": "https://mainnet.infura.io/v3/${INFURA_ID}" },
                { "id": "100", "rpc": "https://rpc.gnosischain.com" },
                { "name": "no-id", "rpc": "http://example" },
                "garbage"
            ]
        })";
    }
    VerifierConfig config = ConfigLoader::Load(settings.string());
    assert(config.repository == "/srv/repository");
    assert(config.layout == "legacy");
    assert(config.solcPath == "/usr/bin/solc");
    assert(config.solcDirectory == "/opt/solc");
    assert(config.readTimeoutSeconds == 3);
    assert(config.chains.size() == 2);
    assert(config.chains[0].rpc == "https://mainnet.infura.io/v3/xyz");
    assert(config.chains[1].id == "100" && config.chains[1].name == "100");
    std::cout << "[PASS] Explicit settings parsed." << std::endl;

    // Malformed file.
    {
        std::ofstream out(settings);
        out << "{ \"repository\": ";
    }
    bool thrown = false;
    try {
        ConfigLoader::Load(settings.string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Malformed settings rejected." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
