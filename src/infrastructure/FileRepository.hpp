/**
 * @file FileRepository.hpp
 * @brief Filesystem-based implementation of the Repository.
 */

#pragma once
#include "domain/Repository.hpp"
#include <string>

namespace sourceproof::infrastructure {

/**
 * @class FileRepository
 * @brief Stores verified artifacts as plain files.
 *
 * Each write goes to a unique temp file next to the target and is renamed
 * over it, so concurrent writers of the same path never expose a torn file.
 */
class FileRepository : public domain::Repository {
public:
    FileRepository() = default;

    /** @brief Atomic overwrite, creating parent directories. @see domain::Repository::write */
    void write(const std::string& path, const std::string& content) override;

    /** @brief Reads back a stored file; empty if it does not exist. Used to inspect the repository. */
    std::string read(const std::string& path) const;
};

} // namespace sourceproof::infrastructure
