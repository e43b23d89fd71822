/**
 * @file BytecodeMatcher.hpp
 * @brief Perfect/partial comparison of recompiled and deployed bytecode.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/ChainRegistry.hpp"
#include "domain/Match.hpp"

namespace sourceproof::application {

/**
 * @class BytecodeMatcher
 * @brief Classifies bytecode agreement and searches candidate addresses for it.
 */
class BytecodeMatcher {
public:
    explicit BytecodeMatcher(const domain::ChainRegistry& registry);

    /**
     * @brief Removes the length-prefixed CBOR metadata trailer.
     *
     * The last two bytes (four hex chars) hold the big-endian byte length of
     * the CBOR blob preceding them. Removes 2 * length + 4 hex chars.
     *
     * @return The remaining code, or nullopt if the declared length overruns
     *         the string or the length field is not hex.
     */
    static std::optional<std::string> TrimTrailer(const std::string& bytecode);

    /**
     * @brief Compares deployed code with compiled code.
     * @return Perfect if identical, Partial if identical apart from the trailer, None otherwise
     *         (including empty deployed code, i.e. "" or "0x").
     */
    static domain::MatchStatus CompareBytecodes(const std::string& deployed, const std::string& compiled);

    /**
     * @brief Scans candidate addresses in order and returns the first that matches.
     *
     * Addresses are checksum-normalized before reading. A failed read is logged
     * and the scan moves on. The first Perfect or Partial result ends the scan.
     *
     * @return The first match, or {nullopt, None} when no address matches.
     */
    domain::Match matchAddress(const std::string& chain,
                               const std::vector<std::string>& addresses,
                               const std::string& compiledBytecode) const;

    /** @brief Direct comparison against code the caller already holds; performs no reads. */
    domain::Match matchBytecode(const std::string& address,
                                const std::string& deployedBytecode,
                                const std::string& compiledBytecode) const;

private:
    const domain::ChainRegistry& m_registry;
};

} // namespace sourceproof::application
