/**
 * @file RepositoryWriter.cpp
 * @brief Implementation of RepositoryWriter.
 */
#include "application/RepositoryWriter.hpp"

#include <iostream>
#include "domain/VerificationErrors.hpp"

namespace sourceproof::application {

RepositoryWriter::RepositoryWriter(domain::Repository& repository) : m_repository(repository) {}

void RepositoryWriter::storePerfectMatch(const RepositoryLayout& layout,
                                         const std::string& chain,
                                         const std::string& address,
                                         const domain::CompilationResult& compilation,
                                         const domain::SourceSet& sources) {
    ContentAddress contentAddress;
    try {
        contentAddress = m_locator.locate(compilation.deployedBytecode);
    } catch (domain::MetadataReferenceMissing& e) {
        e.attach(chain, {address});
        throw;
    }

    m_repository.write(layout.contentPath(contentAddress), compilation.metadata);
    storeAddressed(layout, domain::MatchStatus::Perfect, chain, address, compilation, sources);
}

void RepositoryWriter::storePartialMatch(const RepositoryLayout& layout,
                                         const std::string& chain,
                                         const std::string& address,
                                         const domain::CompilationResult& compilation,
                                         const domain::SourceSet& sources) {
    storeAddressed(layout, domain::MatchStatus::Partial, chain, address, compilation, sources);
}

void RepositoryWriter::storeAddressed(const RepositoryLayout& layout,
                                      domain::MatchStatus status,
                                      const std::string& chain,
                                      const std::string& address,
                                      const domain::CompilationResult& compilation,
                                      const domain::SourceSet& sources) {
    m_repository.write(layout.metadataPath(status, chain, address), compilation.metadata);
    for (const auto& [fileName, content] : sources) {
        m_repository.write(layout.sourcePath(status, chain, address, fileName), content);
    }
    std::cout << "[RepositoryWriter] Stored " << domain::MatchStatusToString(status) << " match for chain="
              << chain << " address=" << address << " (" << sources.size() << " sources)" << std::endl;
}

} // namespace sourceproof::application
