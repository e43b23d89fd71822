/**
 * @file RepositoryLayout.hpp
 * @brief Deterministic path scheme for verified artifacts.
 */

#pragma once
#include <string>
#include "application/MetadataLocator.hpp"
#include "domain/Match.hpp"

namespace sourceproof::application {

/**
 * @enum StorageLayout
 * @brief Directory scheme version.
 */
enum class StorageLayout {
    Current, ///< contracts/full_match/..., contracts/partial_match/...
    Legacy   ///< contract/..., partial_matches/...
};

/** @brief Parses "current" / "legacy" (case-sensitive); anything else yields Current. */
StorageLayout ParseStorageLayout(const std::string& name);

/**
 * @class RepositoryLayout
 * @brief Computes where each verified artifact lives under a repository root.
 *
 * Address keyed: {root}/contracts/{full_match|partial_match}/{chain}/{address}/metadata.json
 * and .../sources/{sanitized filename}. Content keyed (full matches only):
 * {root}/swarm/bzzr0/{hex}, {root}/swarm/bzzr1/{hex}, {root}/ipfs/{base58}.
 */
class RepositoryLayout {
public:
    explicit RepositoryLayout(std::string root, StorageLayout layout = StorageLayout::Current);

    /**
     * @brief Makes a submitted filename safe to use as a relative path.
     *
     * Characters outside [A-Za-z0-9_./-] become '_'. A segment made only of
     * dots, together with its delimiting slashes, collapses to '_' until none
     * is left, so the result cannot climb out of the sources directory.
     */
    static std::string Sanitize(const std::string& fileName);

    /** @brief {root}/{content address}. */
    std::string contentPath(const ContentAddress& address) const;

    /** @brief Directory holding one verified contract. status must not be None. */
    std::string contractDirectory(domain::MatchStatus status, const std::string& chain, const std::string& address) const;

    /** @brief .../metadata.json under contractDirectory. */
    std::string metadataPath(domain::MatchStatus status, const std::string& chain, const std::string& address) const;

    /** @brief .../sources/{sanitized fileName} under contractDirectory. */
    std::string sourcePath(domain::MatchStatus status, const std::string& chain, const std::string& address,
                           const std::string& fileName) const;

private:
    std::string m_root;
    StorageLayout m_layout;
};

} // namespace sourceproof::application
