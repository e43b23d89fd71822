/**
 * @file ChainRegistry.hpp
 * @brief Immutable chain identifier -> reader map.
 */

#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "domain/ChainReader.hpp"

namespace sourceproof::domain {

/**
 * @class ChainRegistry
 * @brief Built once at startup and shared read-only between verification runs.
 */
class ChainRegistry {
public:
    using ReaderMap = std::map<std::string, std::shared_ptr<const ChainReader>>;

    ChainRegistry() = default;
    explicit ChainRegistry(ReaderMap readers) : m_readers(std::move(readers)) {}

    /** @brief Reader for a chain, or nullptr if the chain is not configured. */
    std::shared_ptr<const ChainReader> find(const std::string& chain) const {
        auto it = m_readers.find(chain);
        return it == m_readers.end() ? nullptr : it->second;
    }

    bool contains(const std::string& chain) const { return m_readers.count(chain) != 0; }

    std::vector<std::string> chains() const {
        std::vector<std::string> ids;
        for (const auto& [id, reader] : m_readers) {
            (void)reader;
            ids.push_back(id);
        }
        return ids;
    }

private:
    ReaderMap m_readers;
};

} // namespace sourceproof::domain
