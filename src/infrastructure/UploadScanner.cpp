/**
 * @file UploadScanner.cpp
 * @brief Implementation of the UploadScanner.
 */

#include "infrastructure/UploadScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sourceproof::infrastructure {

domain::RawFile UploadScanner::readFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot read uploaded file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return {fs::path(path).filename().string(), buffer.str()};
}

std::vector<domain::RawFile> UploadScanner::scan(const std::vector<std::string>& paths) const {
    std::vector<domain::RawFile> files;

    for (const auto& path : paths) {
        if (!fs::exists(path)) {
            throw std::runtime_error("No such file or directory: " + path);
        }
        if (!fs::is_directory(path)) {
            files.push_back(readFile(path));
            continue;
        }

        // Directory order is unspecified; sort for a stable submission order.
        std::vector<fs::path> entries;
        for (const auto& entry : fs::directory_iterator(path)) {
            if (entry.is_regular_file()) {
                entries.push_back(entry.path());
            }
        }
        std::sort(entries.begin(), entries.end());
        for (const auto& entry : entries) {
            files.push_back(readFile(entry.string()));
        }
    }

    return files;
}

} // namespace sourceproof::infrastructure
