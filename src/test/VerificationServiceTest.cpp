#include <cassert>
#include <iostream>
#include <memory>

#include "application/VerificationService.hpp"
#include "domain/VerificationErrors.hpp"
#include "TestSupport.hpp"

using namespace sourceproof;
using domain::MatchStatus;

namespace {

const std::string kAddrA = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
const std::string kAddrB = "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359";
const std::string kAddrC = "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB";
const std::string kSource = "pragma solidity ^0.6.0;\ncontract A { uint x; }\n";
const std::string kCompiledMetadata = "{\"compiler\":{\"version\":\"0.6.6+commit.6c089d02\"},\"language\":\"Solidity\"}";

struct Fixture {
    std::shared_ptr<test::FakeChainReader> reader = std::make_shared<test::FakeChainReader>();
    std::shared_ptr<test::FakeCompiler> compiler =
        std::make_shared<test::FakeCompiler>(test::kRuntimePrefix + test::IpfsTrailer(0x11), kCompiledMetadata);
    std::shared_ptr<test::InMemoryRepository> repository = std::make_shared<test::InMemoryRepository>();
    std::unique_ptr<application::VerificationService> service;

    explicit Fixture(application::StorageLayout layout = application::StorageLayout::Current) {
        domain::ChainRegistry::ReaderMap readers;
        readers["1"] = reader;
        service = std::make_unique<application::VerificationService>(
            std::make_shared<const domain::ChainRegistry>(readers), compiler, repository, layout);
    }
};

domain::InputData Submission(const std::vector<std::string>& addresses) {
    domain::InputData input;
    input.repository = "repo";
    input.chain = "1";
    input.addresses = addresses;
    input.files = {
        {"A.sol", kSource},
        {"metadata.json", test::MakeMetadata("A.sol", "A", {{"A.sol", kSource}}).dump()},
    };
    return input;
}

bool HasPrefix(const test::InMemoryRepository& repo, const std::string& prefix) {
    for (const auto& [path, content] : repo.files) {
        (void)content;
        if (path.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

void testPerfectMatch() {
    Fixture f;
    f.reader->deploy(kAddrA, test::DeployedCode(0x11));

    domain::Match match = f.service->inject(Submission({kAddrA}));
    assert(match.status == MatchStatus::Perfect);
    assert(*match.address == kAddrA);

    const std::string dir = "repo/contracts/full_match/1/" + kAddrA;
    assert(f.repository->files.at(dir + "/metadata.json") == kCompiledMetadata);
    assert(f.repository->files.at(dir + "/sources/A.sol") == kSource);
    assert(HasPrefix(*f.repository, "repo/ipfs/Qm"));
    assert(f.repository->size() == 3);

    // The compiler saw a target-specific output selection and no compilationTarget.
    const auto& input = f.compiler->lastInput;
    assert(f.compiler->lastVersion == "0.6.6+commit.6c089d02");
    assert(input.at("language") == "Solidity");
    assert(input.at("sources").at("A.sol").at("content") == kSource);
    assert(!input.at("settings").contains("compilationTarget"));
    assert(input.at("settings").at("outputSelection").at("A.sol").contains("A"));
    std::cout << "[PASS] Perfect match stores content and full_match paths." << std::endl;
}

void testPartialMatch() {
    Fixture f;
    f.reader->deploy(kAddrA, test::DeployedCode(0x22));

    domain::Match match = f.service->inject(Submission({kAddrA}));
    assert(match.status == MatchStatus::Partial);
    assert(f.repository->has("repo/contracts/partial_match/1/" + kAddrA + "/metadata.json"));
    assert(f.repository->has("repo/contracts/partial_match/1/" + kAddrA + "/sources/A.sol"));
    assert(!HasPrefix(*f.repository, "repo/ipfs"));
    assert(!HasPrefix(*f.repository, "repo/swarm"));
    assert(!HasPrefix(*f.repository, "repo/contracts/full_match"));
    std::cout << "[PASS] Partial match stores only partial_match paths." << std::endl;
}

void testNoMatch() {
    Fixture f;
    f.reader->deploy(kAddrA, "0x");
    f.reader->deploy(kAddrB, "0x6000");
    f.reader->breakAddress(kAddrC);

    bool thrown = false;
    try {
        f.service->inject(Submission({kAddrA, kAddrB, kAddrC}));
    } catch (const domain::NoMatch& e) {
        thrown = true;
        const std::string message = e.what();
        assert(message.find("\"A.sol\": \"A\"") != std::string::npos);
        assert(message.find(kAddrA) != std::string::npos);
        assert(message.find(kAddrB) != std::string::npos);
        assert(message.find(kAddrC) != std::string::npos);
        assert(e.fileName() == "A.sol");
        assert(e.contractName() == "A");
        assert(e.context().chain == "1");
        assert(e.context().addresses.size() == 3);
    }
    assert(thrown);
    assert(f.reader->reads.size() == 3);
    assert(f.repository->size() == 0);
    std::cout << "[PASS] NoMatch lists the target and every address." << std::endl;
}

void testSourceNotFound() {
    Fixture f;
    f.reader->deploy(kAddrA, test::DeployedCode(0x11));
    domain::InputData input = Submission({kAddrA});
    input.files.erase(input.files.begin());

    bool thrown = false;
    try {
        f.service->inject(input);
    } catch (const domain::SourceNotFound& e) {
        thrown = true;
        assert(e.fileName() == "A.sol");
        assert(e.digest() == domain::encoding::Keccak256Hex(kSource));
        assert(e.context().chain == "1");
        assert(e.context().addresses == std::vector<std::string>({kAddrA}));
    }
    assert(thrown);
    assert(f.compiler->calls == 0);
    assert(f.reader->reads.empty());
    assert(f.repository->size() == 0);
    std::cout << "[PASS] SourceNotFound stops before compilation." << std::endl;
}

void testDirectBytecode() {
    Fixture f;
    domain::InputData input = Submission({kAddrB, kAddrC});
    input.chain = "5";
    input.bytecode = test::DeployedCode(0x11);

    domain::Match match = f.service->inject(input);
    assert(match.status == MatchStatus::Perfect);
    assert(*match.address == kAddrB);
    assert(f.reader->reads.empty());
    assert(f.repository->has("repo/contracts/full_match/5/" + kAddrB + "/metadata.json"));
    std::cout << "[PASS] Pre-fetched bytecode skips chain reads." << std::endl;
}

void testInputValidation() {
    Fixture f;
    auto expectInvalid = [&](domain::InputData input) {
        bool thrown = false;
        try {
            f.service->inject(input);
        } catch (const domain::InputValidationError& e) {
            thrown = true;
            assert(e.context().loc == "[INJECT]");
        }
        assert(thrown);
    };

    expectInvalid(Submission({}));
    expectInvalid(Submission({"0x1234"}));
    domain::InputData noChain = Submission({kAddrA});
    noChain.chain = "";
    expectInvalid(noChain);
    domain::InputData traversal = Submission({kAddrA});
    traversal.chain = "../1";
    expectInvalid(traversal);
    domain::InputData unknown = Submission({kAddrA});
    unknown.chain = "42";
    expectInvalid(unknown);
    assert(f.compiler->calls == 0);
    std::cout << "[PASS] Invalid submissions rejected up front." << std::endl;
}

void testCompilerFailures() {
    Fixture f;
    f.reader->deploy(kAddrA, test::DeployedCode(0x11));

    f.compiler->fatalError = "ParserError: Expected ';' but got '}'";
    bool thrown = false;
    try {
        f.service->inject(Submission({kAddrA}));
    } catch (const domain::CompilationError& e) {
        thrown = true;
        assert(std::string(e.what()).find("ParserError") != std::string::npos);
        assert(e.context().loc == "[RECOMPILE]");
        assert(e.context().chain == "1");
    }
    assert(thrown);

    f.compiler->fatalError.clear();
    f.compiler->failWith = "solc-v0.6.6 not found";
    thrown = false;
    try {
        f.service->inject(Submission({kAddrA}));
    } catch (const domain::CompilationError&) {
        thrown = true;
    }
    assert(thrown);
    assert(f.reader->reads.empty());
    assert(f.repository->size() == 0);
    std::cout << "[PASS] Compiler failures become CompilationError." << std::endl;
}

void testAmbiguousTarget() {
    Fixture f;
    domain::InputData input = Submission({kAddrA});
    nlohmann::json metadata = test::MakeMetadata("A.sol", "A", {{"A.sol", kSource}});
    metadata["settings"]["compilationTarget"]["B.sol"] = "B";
    input.files[1].content = metadata.dump();

    bool thrown = false;
    try {
        f.service->inject(input);
    } catch (const domain::AmbiguousOrMissingTarget& e) {
        thrown = true;
        assert(e.context().loc == "[REFORMAT]");
    }
    assert(thrown);
    assert(f.compiler->calls == 0);
    std::cout << "[PASS] Ambiguous compilationTarget rejected." << std::endl;
}

void testMissingMetadataReference() {
    Fixture f;
    // Compiled code whose trailer carries no content address.
    f.compiler = std::make_shared<test::FakeCompiler>(test::kRuntimePrefix + "a0" + "0001");
    domain::ChainRegistry::ReaderMap readers;
    readers["1"] = f.reader;
    f.service = std::make_unique<application::VerificationService>(
        std::make_shared<const domain::ChainRegistry>(readers), f.compiler, f.repository);
    f.reader->deploy(kAddrA, "0x" + test::kRuntimePrefix + "a00001");

    bool thrown = false;
    try {
        f.service->inject(Submission({kAddrA}));
    } catch (const domain::MetadataReferenceMissing& e) {
        thrown = true;
        assert(e.context().loc == "[STOREDATA]");
        assert(e.context().chain == "1");
    }
    assert(thrown);
    assert(f.repository->size() == 0);
    std::cout << "[PASS] Missing metadata reference writes nothing." << std::endl;
}

void testPreassembledContracts() {
    Fixture f;
    f.reader->deploy(kAddrA, test::DeployedCode(0x11));

    domain::InputData input = Submission({kAddrA});
    input.contracts = f.service->checkFiles(input.files);
    assert(input.contracts.size() == 1);
    assert(input.contracts[0].sources.at("A.sol") == kSource);
    input.files.clear();

    domain::Match match = f.service->inject(input);
    assert(match.status == MatchStatus::Perfect);
    std::cout << "[PASS] Pre-assembled contracts verified." << std::endl;
}

void testLegacyLayout() {
    Fixture f(application::StorageLayout::Legacy);
    f.reader->deploy(kAddrA, test::DeployedCode(0x11));

    f.service->inject(Submission({kAddrA}));
    assert(f.repository->has("repo/contract/1/" + kAddrA + "/metadata.json"));
    assert(f.repository->has("repo/contract/1/" + kAddrA + "/sources/A.sol"));
    std::cout << "[PASS] Legacy layout honored." << std::endl;
}

void testAsync() {
    Fixture f;
    f.reader->deploy(kAddrA, test::DeployedCode(0x22));
    auto future = f.service->injectAsync(Submission({kAddrA}));
    assert(future.get().status == MatchStatus::Partial);
    std::cout << "[PASS] injectAsync resolves to the match." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting VerificationService Test..." << std::endl;

    testPerfectMatch();
    testPartialMatch();
    testNoMatch();
    testSourceNotFound();
    testDirectBytecode();
    testInputValidation();
    testCompilerFailures();
    testAmbiguousTarget();
    testMissingMetadataReference();
    testPreassembledContracts();
    testLegacyLayout();
    testAsync();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
