/**
 * @file RepositoryWriter.hpp
 * @brief Persists a confirmed match through the Repository collaborator.
 */

#pragma once
#include <string>
#include "application/MetadataLocator.hpp"
#include "application/RepositoryLayout.hpp"
#include "domain/CheckedContract.hpp"
#include "domain/CompilationResult.hpp"
#include "domain/Repository.hpp"

namespace sourceproof::application {

/**
 * @class RepositoryWriter
 * @brief Writes metadata and sources for perfect and partial matches.
 *
 * Writes are overwrites, so re-verifying the same contract reproduces the same
 * bytes at the same paths.
 */
class RepositoryWriter {
public:
    explicit RepositoryWriter(domain::Repository& repository);

    /**
     * @brief Stores metadata at its content address and under full_match, plus every source.
     * @throws domain::MetadataReferenceMissing if the bytecode carries no metadata reference.
     *         Nothing is written in that case.
     */
    void storePerfectMatch(const RepositoryLayout& layout,
                           const std::string& chain,
                           const std::string& address,
                           const domain::CompilationResult& compilation,
                           const domain::SourceSet& sources);

    /** @brief Stores metadata and sources under partial_match only. */
    void storePartialMatch(const RepositoryLayout& layout,
                           const std::string& chain,
                           const std::string& address,
                           const domain::CompilationResult& compilation,
                           const domain::SourceSet& sources);

private:
    void storeAddressed(const RepositoryLayout& layout,
                        domain::MatchStatus status,
                        const std::string& chain,
                        const std::string& address,
                        const domain::CompilationResult& compilation,
                        const domain::SourceSet& sources);

    domain::Repository& m_repository;
    MetadataLocator m_locator;
};

} // namespace sourceproof::application
