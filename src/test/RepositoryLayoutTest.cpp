#include <cassert>
#include <iostream>

#include "application/RepositoryLayout.hpp"

using namespace sourceproof;
using application::RepositoryLayout;
using domain::MatchStatus;

int main() {
    std::cout << "[Test] Starting RepositoryLayout Test..." << std::endl;

    // Sanitizer
    assert(RepositoryLayout::Sanitize("contracts/Token.sol") == "contracts/Token.sol");
    assert(RepositoryLayout::Sanitize("my contract (v2).sol") == "my_contract__v2_.sol");
    assert(RepositoryLayout::Sanitize("../../etc/passwd") == "_../etc/passwd");
    assert(RepositoryLayout::Sanitize("a/../b.sol") == "a_b.sol");
    assert(RepositoryLayout::Sanitize("a/./b.sol") == "a_b.sol");
    assert(RepositoryLayout::Sanitize("dir/..") == "dir_");
    assert(RepositoryLayout::Sanitize("...") == "_");
    assert(RepositoryLayout::Sanitize("lib/.hidden.sol") == "lib/.hidden.sol");
    assert(RepositoryLayout::Sanitize("@openzeppelin/contracts/ERC20.sol") == "_openzeppelin/contracts/ERC20.sol");
    std::cout << "[PASS] Sanitize removes traversal segments." << std::endl;

    const std::string address = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";

    RepositoryLayout current("repo");
    assert(current.metadataPath(MatchStatus::Perfect, "1", address)
           == "repo/contracts/full_match/1/" + address + "/metadata.json");
    assert(current.metadataPath(MatchStatus::Partial, "1", address)
           == "repo/contracts/partial_match/1/" + address + "/metadata.json");
    assert(current.sourcePath(MatchStatus::Perfect, "5", address, "../../x.sol")
           == "repo/contracts/full_match/5/" + address + "/sources/_../x.sol");
    assert(current.sourcePath(MatchStatus::Perfect, "5", address, "/abs/Token.sol")
           == "repo/contracts/full_match/5/" + address + "/sources/abs/Token.sol");
    assert(current.contentPath({"ipfs", "QmTest"}) == "repo/ipfs/QmTest");
    assert(current.contentPath({"swarm/bzzr0", "abcd"}) == "repo/swarm/bzzr0/abcd");
    std::cout << "[PASS] Current layout paths." << std::endl;

    RepositoryLayout legacy("/var/lib/repo/", application::StorageLayout::Legacy);
    assert(legacy.metadataPath(MatchStatus::Perfect, "1", address)
           == "/var/lib/repo/contract/1/" + address + "/metadata.json");
    assert(legacy.sourcePath(MatchStatus::Partial, "1", address, "Token.sol")
           == "/var/lib/repo/partial_matches/1/" + address + "/sources/Token.sol");
    assert(application::ParseStorageLayout("legacy") == application::StorageLayout::Legacy);
    assert(application::ParseStorageLayout("current") == application::StorageLayout::Current);
    std::cout << "[PASS] Legacy layout paths." << std::endl;

    bool thrown = false;
    try {
        current.contractDirectory(MatchStatus::None, "1", address);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Unmatched contracts have no directory." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
