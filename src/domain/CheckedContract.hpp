/**
 * @file CheckedContract.hpp
 * @brief A metadata descriptor paired with its validated sources.
 */

#pragma once
#include <map>
#include <string>
#include "domain/MetadataDescriptor.hpp"

namespace sourceproof::domain {

/** @brief Filename -> content. Every entry hashes to its declared digest. */
using SourceSet = std::map<std::string, std::string>;

/**
 * @struct CheckedContract
 * @brief Descriptor plus the exact source set it references.
 */
struct CheckedContract {
    MetadataDescriptor metadata;
    SourceSet sources;
};

} // namespace sourceproof::domain
