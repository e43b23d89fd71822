/**
 * @file UploadScanner.hpp
 * @brief Reads a submission's files from disk.
 */

#pragma once
#include <vector>
#include <string>
#include "domain/RawFile.hpp"

namespace sourceproof::infrastructure {

/**
 * @class UploadScanner
 * @brief Infrastructure adapter turning file and directory arguments into raw files.
 */
class UploadScanner {
public:
    /**
     * @brief Reads every given file, and every regular file directly inside each given directory.
     * @throws std::runtime_error if a path does not exist or cannot be read.
     */
    std::vector<domain::RawFile> scan(const std::vector<std::string>& paths) const;

private:
    domain::RawFile readFile(const std::string& path) const;
};

} // namespace sourceproof::infrastructure
