/**
 * @file MetadataDescriptor.hpp
 * @brief Read-only view over a compiler metadata document.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace sourceproof::domain {

/**
 * @struct CompilationTarget
 * @brief The single (filename, contract name) pair a descriptor designates.
 */
struct CompilationTarget {
    std::string fileName;
    std::string contractName;
};

/**
 * @struct DeclaredSource
 * @brief One entry of the descriptor's "sources" map.
 */
struct DeclaredSource {
    std::optional<std::string> content; ///< Inline literal content, if embedded.
    std::string keccak256;              ///< Declared digest ("0x" + 64 hex).
};

/**
 * @class MetadataDescriptor
 * @brief Immutable wrapper around parsed metadata JSON.
 *
 * Accessors return copies or const references, never mutable handles, so the
 * document stays identical to what its author committed to for the lifetime
 * of a verification run.
 */
class MetadataDescriptor {
public:
    explicit MetadataDescriptor(nlohmann::json document);

    /** @brief Value of the top-level "language" field, empty if absent. */
    std::string language() const;

    /** @brief Value of "compiler.version", empty if absent. */
    std::string compilerVersion() const;

    /** @brief Raw "settings" object (null if absent). */
    const nlohmann::json& settings() const { return m_settings; }

    /** @brief Raw "settings.compilationTarget" object, for diagnostics. */
    nlohmann::json compilationTargetJson() const;

    /**
     * @brief Resolves settings.compilationTarget.
     * @return The target, or nullopt when zero or several targets are declared.
     */
    std::optional<CompilationTarget> compilationTarget() const;

    /** @brief Declared sources, keyed by filename. */
    std::map<std::string, DeclaredSource> sources() const;


private:
    nlohmann::json m_document;
    nlohmann::json m_settings;
};

} // namespace sourceproof::domain
