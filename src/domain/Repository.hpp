/**
 * @file Repository.hpp
 * @brief Interface for durable storage of verified artifacts.
 */

#pragma once
#include <string>

namespace sourceproof::domain {

/**
 * @class Repository
 * @brief Abstract key/value writer. Keys are filesystem-style paths.
 */
class Repository {
public:
    virtual ~Repository() = default;

    /**
     * @brief Writes content at path, overwriting and creating parents as needed.
     * @throws std::runtime_error if the write fails.
     */
    virtual void write(const std::string& path, const std::string& content) = 0;
};

} // namespace sourceproof::domain
