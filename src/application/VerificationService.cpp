/**
 * @file VerificationService.cpp
 * @brief Implementation of VerificationService.
 */
#include "application/VerificationService.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>
#include "application/Recompiler.hpp"
#include "application/RepositoryWriter.hpp"
#include "domain/VerificationErrors.hpp"
#include "domain/encoding/Address.hpp"

namespace sourceproof::application {

namespace {

bool IsSafeChainId(const std::string& chain) {
    return std::all_of(chain.begin(), chain.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

} // namespace

VerificationService::VerificationService(std::shared_ptr<const domain::ChainRegistry> registry,
                                         std::shared_ptr<domain::Compiler> compiler,
                                         std::shared_ptr<domain::Repository> repository,
                                         StorageLayout layout)
    : m_registry(std::move(registry))
    , m_compiler(std::move(compiler))
    , m_repository(std::move(repository))
    , m_layout(layout)
    , m_matcher(*m_registry) {}

void VerificationService::validateInput(const domain::InputData& input) const {
    if (input.addresses.empty()
        || std::any_of(input.addresses.begin(), input.addresses.end(), [](const std::string& a) { return a.empty(); })) {
        throw domain::InputValidationError("Missing address for submitted sources/metadata",
                                           {"[INJECT]", input.chain, input.addresses});
    }
    for (const auto& address : input.addresses) {
        if (!domain::encoding::IsAddress(address)) {
            throw domain::InputValidationError("Invalid address for submitted sources/metadata: " + address,
                                               {"[INJECT]", input.chain, input.addresses});
        }
    }

    if (input.chain.empty()) {
        throw domain::InputValidationError("Missing chain name for submitted sources/metadata",
                                           {"[INJECT]", input.chain, input.addresses});
    }
    if (!IsSafeChainId(input.chain)) {
        throw domain::InputValidationError("Invalid chain name: " + input.chain,
                                           {"[INJECT]", input.chain, input.addresses});
    }
    if (!input.bytecode && !m_registry->contains(input.chain)) {
        throw domain::InputValidationError("Chain " + input.chain + " is not supported",
                                           {"[INJECT]", input.chain, input.addresses});
    }
}

std::vector<domain::CheckedContract> VerificationService::checkFiles(const std::vector<domain::RawFile>& files) const {
    std::vector<domain::CheckedContract> contracts;
    for (auto& metadata : m_selector.select(files)) {
        domain::SourceSet sources = m_assembler.assemble(metadata, files);
        contracts.push_back({std::move(metadata), std::move(sources)});
    }
    return contracts;
}

domain::Match VerificationService::inject(const domain::InputData& input) {
    validateInput(input);

    domain::Match match;
    try {
        if (!input.contracts.empty()) {
            for (const auto& contract : input.contracts) {
                match = verifyContract(contract.metadata, contract.sources, input);
            }
        } else {
            // Sources are assembled per descriptor, right before that descriptor is compiled.
            for (const auto& metadata : m_selector.select(input.files)) {
                domain::SourceSet sources = m_assembler.assemble(metadata, input.files);
                match = verifyContract(metadata, sources, input);
            }
        }
    } catch (domain::VerificationError& e) {
        e.attach(input.chain, input.addresses);
        throw;
    }
    return match;
}

std::future<domain::Match> VerificationService::injectAsync(domain::InputData input) {
    return std::async(std::launch::async, [this, input = std::move(input)]() {
        return inject(input);
    });
}

domain::Match VerificationService::verifyContract(const domain::MetadataDescriptor& metadata,
                                                  const domain::SourceSet& sources,
                                                  const domain::InputData& input) {
    const nlohmann::json target = metadata.compilationTargetJson();

    Recompiler recompiler(*m_compiler);
    const domain::CompilationResult compilation = recompiler.recompile(metadata, sources);

    // A monitor that already fetched the code only needs the comparison.
    domain::Match match = input.bytecode
        ? m_matcher.matchBytecode(input.addresses.front(), *input.bytecode, compilation.deployedBytecode)
        : m_matcher.matchAddress(input.chain, input.addresses, compilation.deployedBytecode);

    // A matching bytecode proves the sources and (up to formatting) the metadata,
    // so the recompiled metadata is what gets stored.
    RepositoryLayout layout(input.repository, m_layout);
    RepositoryWriter writer(*m_repository);
    if (match.matched() && match.status == domain::MatchStatus::Perfect) {
        writer.storePerfectMatch(layout, input.chain, *match.address, compilation, sources);
    } else if (match.matched() && match.status == domain::MatchStatus::Partial) {
        writer.storePartialMatch(layout, input.chain, *match.address, compilation, sources);
    } else {
        const auto resolved = metadata.compilationTarget();
        const std::string message =
            "Could not match on-chain deployed bytecode to recompiled bytecode for:\n" + target.dump(1) + "\n"
            "Addresses checked:\n" + nlohmann::json(input.addresses).dump(1);
        std::cerr << "[VerificationService] [INJECT] chain=" << input.chain
                  << " addresses=" << nlohmann::json(input.addresses).dump() << " " << message << std::endl;
        throw domain::NoMatch(message, {"[INJECT]", input.chain, input.addresses},
                              resolved ? resolved->fileName : std::string(),
                              resolved ? resolved->contractName : std::string());
    }
    return match;
}

} // namespace sourceproof::application
