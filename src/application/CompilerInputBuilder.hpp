/**
 * @file CompilerInputBuilder.hpp
 * @brief Derives a standard JSON compiler input from a metadata descriptor.
 */

#pragma once
#include <nlohmann/json.hpp>
#include "domain/CheckedContract.hpp"

namespace sourceproof::application {

/**
 * @struct CompilerInput
 * @brief A standard JSON input plus the single contract it selects.
 */
struct CompilerInput {
    nlohmann::json input;
    domain::CompilationTarget target;
};

/**
 * @class CompilerInputBuilder
 * @brief Builds a fresh compiler input; the descriptor itself is never modified.
 */
class CompilerInputBuilder {
public:
    /**
     * @brief Copies the descriptor's settings, replaces compilationTarget with
     *        an output selection for the target, and embeds the sources.
     * @throws domain::AmbiguousOrMissingTarget if the target does not resolve to exactly one contract.
     */
    CompilerInput build(const domain::MetadataDescriptor& descriptor, const domain::SourceSet& sources) const;
};

} // namespace sourceproof::application
