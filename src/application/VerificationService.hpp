/**
 * @file VerificationService.hpp
 * @brief Orchestrates one verification submission end to end.
 */

#pragma once
#include <future>
#include <memory>
#include <vector>
#include "application/BytecodeMatcher.hpp"
#include "application/MetadataSelector.hpp"
#include "application/RepositoryLayout.hpp"
#include "application/SourceAssembler.hpp"
#include "domain/ChainRegistry.hpp"
#include "domain/Compiler.hpp"
#include "domain/InputData.hpp"
#include "domain/Repository.hpp"

namespace sourceproof::application {

/**
 * @class VerificationService
 * @brief Runs select -> assemble -> compile -> match -> store for each submitted contract.
 *
 * Stages run strictly in order and storage is always last, so a failure at any
 * earlier stage leaves the repository untouched for that contract. The service
 * holds no mutable state; concurrent calls share only the read-only chain
 * registry and the repository.
 */
class VerificationService {
public:
    /**
     * @brief Constructor for VerificationService.
     * @param registry Chain readers, built once at startup.
     * @param compiler External compiler.
     * @param repository Durable storage for verified artifacts.
     * @param layout Directory scheme used when storing.
     */
    VerificationService(std::shared_ptr<const domain::ChainRegistry> registry,
                        std::shared_ptr<domain::Compiler> compiler,
                        std::shared_ptr<domain::Repository> repository,
                        StorageLayout layout = StorageLayout::Current);

    /**
     * @brief Verifies and stores every contract of a submission.
     * @return The match of the last contract processed.
     * @throws domain::VerificationError subclasses; the first error halts the submission.
     */
    domain::Match inject(const domain::InputData& input);

    /** @brief Runs inject on a separate thread. */
    std::future<domain::Match> injectAsync(domain::InputData input);

    /**
     * @brief Selects metadata from a raw upload and assembles each descriptor's sources.
     * @throws domain::NoMetadataFound, domain::SourceHashMismatch, domain::SourceNotFound.
     */
    std::vector<domain::CheckedContract> checkFiles(const std::vector<domain::RawFile>& files) const;

private:
    void validateInput(const domain::InputData& input) const;

    domain::Match verifyContract(const domain::MetadataDescriptor& metadata,
                                 const domain::SourceSet& sources,
                                 const domain::InputData& input);

    std::shared_ptr<const domain::ChainRegistry> m_registry;
    std::shared_ptr<domain::Compiler> m_compiler;
    std::shared_ptr<domain::Repository> m_repository;
    StorageLayout m_layout;

    MetadataSelector m_selector;
    SourceAssembler m_assembler;
    BytecodeMatcher m_matcher;
};

} // namespace sourceproof::application
