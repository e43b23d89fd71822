/**
 * @file Recompiler.hpp
 * @brief Runs the external compiler for one checked contract.
 */

#pragma once
#include "application/CompilerInputBuilder.hpp"
#include "domain/CompilationResult.hpp"
#include "domain/Compiler.hpp"

namespace sourceproof::application {

/**
 * @class Recompiler
 * @brief Compiles a descriptor's target under its exact settings and extracts the artifacts.
 */
class Recompiler {
public:
    explicit Recompiler(domain::Compiler& compiler);

    /**
     * @throws domain::AmbiguousOrMissingTarget if the target is not unique.
     * @throws domain::CompilationError on fatal diagnostics or a missing contract.
     */
    domain::CompilationResult recompile(const domain::MetadataDescriptor& descriptor,
                                        const domain::SourceSet& sources);

    /** @brief Extracts the target's artifacts from a standard JSON output. */
    static domain::CompilationResult ExtractArtifacts(const nlohmann::json& output,
                                                      const domain::CompilationTarget& target);

private:
    domain::Compiler& m_compiler;
    CompilerInputBuilder m_builder;
};

} // namespace sourceproof::application
