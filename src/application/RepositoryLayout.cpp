/**
 * @file RepositoryLayout.cpp
 * @brief Implementation of RepositoryLayout.
 */
#include "application/RepositoryLayout.hpp"

#include <cctype>
#include <filesystem>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sourceproof::application {

namespace {

bool IsAllowedPathChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '.' || c == '/' || c == '-';
}

std::string Normalized(const fs::path& p) {
    return p.lexically_normal().generic_string();
}

} // namespace

StorageLayout ParseStorageLayout(const std::string& name) {
    return name == "legacy" ? StorageLayout::Legacy : StorageLayout::Current;
}

RepositoryLayout::RepositoryLayout(std::string root, StorageLayout layout)
    : m_root(std::move(root)), m_layout(layout) {}

std::string RepositoryLayout::Sanitize(const std::string& fileName) {
    std::string sanitized;
    sanitized.reserve(fileName.size());
    for (char ch : fileName) {
        sanitized.push_back(IsAllowedPathChar(static_cast<unsigned char>(ch)) ? ch : '_');
    }

    static const std::regex kDotSegment("(^|/)[.]+($|/)");
    while (std::regex_search(sanitized, kDotSegment)) {
        sanitized = std::regex_replace(sanitized, kDotSegment, "_", std::regex_constants::format_first_only);
    }
    return sanitized;
}

std::string RepositoryLayout::contentPath(const ContentAddress& address) const {
    return Normalized(fs::path(m_root) / fs::path(address.path()).relative_path());
}

std::string RepositoryLayout::contractDirectory(domain::MatchStatus status, const std::string& chain,
                                                const std::string& address) const {
    fs::path base(m_root);
    switch (status) {
        case domain::MatchStatus::Perfect:
            base /= (m_layout == StorageLayout::Legacy) ? fs::path("contract") : fs::path("contracts") / "full_match";
            break;
        case domain::MatchStatus::Partial:
            base /= (m_layout == StorageLayout::Legacy) ? fs::path("partial_matches") : fs::path("contracts") / "partial_match";
            break;
        case domain::MatchStatus::None:
            throw std::invalid_argument("Unmatched contracts have no repository directory");
    }
    return Normalized(base / chain / address);
}

std::string RepositoryLayout::metadataPath(domain::MatchStatus status, const std::string& chain,
                                           const std::string& address) const {
    return Normalized(fs::path(contractDirectory(status, chain, address)) / "metadata.json");
}

std::string RepositoryLayout::sourcePath(domain::MatchStatus status, const std::string& chain,
                                         const std::string& address, const std::string& fileName) const {
    // relative_path() keeps a leading '/' from discarding the directory prefix.
    const fs::path relative = fs::path(Sanitize(fileName)).relative_path();
    return Normalized(fs::path(contractDirectory(status, chain, address)) / "sources" / relative);
}

} // namespace sourceproof::application
