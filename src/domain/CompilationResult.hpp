/**
 * @file CompilationResult.hpp
 * @brief Artifacts extracted from a recompilation.
 */

#pragma once
#include <string>

namespace sourceproof::domain {

struct CompilationResult {
    std::string bytecode;         ///< Creation bytecode, as emitted.
    std::string deployedBytecode; ///< Runtime bytecode, "0x"-prefixed.
    std::string metadata;         ///< Canonical metadata text emitted by the compiler.
};

} // namespace sourceproof::domain
