/**
 * @file InputData.hpp
 * @brief A single verification submission.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/CheckedContract.hpp"
#include "domain/RawFile.hpp"

namespace sourceproof::domain {

/**
 * @struct InputData
 * @brief Everything a client hands to the pipeline for one submission.
 */
struct InputData {
    std::string repository;              ///< Root path for verified output.
    std::string chain;                   ///< Chain identifier.
    std::vector<std::string> addresses;  ///< Candidate addresses, order-significant.
    std::vector<RawFile> files;          ///< Raw upload; used when contracts is empty.
    std::vector<CheckedContract> contracts; ///< Pre-assembled submissions.
    std::optional<std::string> bytecode; ///< Pre-fetched on-chain code for addresses[0].
};

} // namespace sourceproof::domain
