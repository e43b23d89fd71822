/**
 * @file BytecodeMatcher.cpp
 * @brief Implementation of BytecodeMatcher.
 */
#include "application/BytecodeMatcher.hpp"

#include <iostream>
#include "domain/encoding/Address.hpp"
#include "domain/encoding/Hex.hpp"

namespace sourceproof::application {

namespace {

constexpr size_t kLengthFieldChars = 4;
constexpr const char* kEmptyCode = "0x";

} // namespace

BytecodeMatcher::BytecodeMatcher(const domain::ChainRegistry& registry) : m_registry(registry) {}

std::optional<std::string> BytecodeMatcher::TrimTrailer(const std::string& bytecode) {
    // The declared length counts code bytes only, never the "0x" prefix.
    const std::string digits = domain::encoding::StripHexPrefix(bytecode);
    const std::string prefix = bytecode.substr(0, bytecode.size() - digits.size());
    if (digits.size() < kLengthFieldChars) {
        return std::nullopt;
    }

    size_t declaredLength = 0;
    for (size_t i = digits.size() - kLengthFieldChars; i < digits.size(); ++i) {
        char c = digits[i];
        if (!domain::encoding::IsHexDigit(c)) {
            return std::nullopt;
        }
        int nibble = (c <= '9') ? c - '0' : (c | 0x20) - 'a' + 10;
        declaredLength = declaredLength * 16 + static_cast<size_t>(nibble);
    }

    const size_t trailerChars = declaredLength * 2 + kLengthFieldChars;
    if (trailerChars > digits.size()) {
        return std::nullopt;
    }
    return prefix + digits.substr(0, digits.size() - trailerChars);
}

domain::MatchStatus BytecodeMatcher::CompareBytecodes(const std::string& deployed, const std::string& compiled) {
    if (deployed.empty() || deployed == kEmptyCode) {
        return domain::MatchStatus::None;
    }
    if (deployed == compiled) {
        return domain::MatchStatus::Perfect;
    }

    const auto trimmedDeployed = TrimTrailer(deployed);
    const auto trimmedCompiled = TrimTrailer(compiled);
    if (trimmedDeployed && trimmedCompiled && *trimmedDeployed == *trimmedCompiled) {
        return domain::MatchStatus::Partial;
    }
    return domain::MatchStatus::None;
}

domain::Match BytecodeMatcher::matchAddress(const std::string& chain,
                                            const std::vector<std::string>& addresses,
                                            const std::string& compiledBytecode) const {
    auto reader = m_registry.find(chain);
    if (!reader) {
        std::cerr << "[BytecodeMatcher] [MATCH] chain=" << chain << " No reader configured for chain" << std::endl;
        return {};
    }

    for (const auto& candidate : addresses) {
        auto address = domain::encoding::ToChecksumAddress(candidate);
        if (!address) {
            std::cerr << "[BytecodeMatcher] [MATCH] chain=" << chain << " address=" << candidate
                      << " Skipping malformed address" << std::endl;
            continue;
        }

        std::cout << "[BytecodeMatcher] [MATCH] chain=" << chain << " address=" << *address
                  << " Retrieving contract bytecode" << std::endl;

        domain::CodeReadResult read = reader->getCode(*address);
        if (!read.ok()) {
            std::cerr << "[BytecodeMatcher] [MATCH] chain=" << chain << " address=" << *address
                      << " Read failed, trying next candidate: " << read.error << std::endl;
            continue;
        }

        domain::MatchStatus status = CompareBytecodes(*read.code, compiledBytecode);
        if (status != domain::MatchStatus::None) {
            return domain::Match{*address, status};
        }
    }
    return {};
}

domain::Match BytecodeMatcher::matchBytecode(const std::string& address,
                                             const std::string& deployedBytecode,
                                             const std::string& compiledBytecode) const {
    domain::Match match;
    match.address = domain::encoding::ToChecksumAddress(address).value_or(address);
    match.status = CompareBytecodes(deployedBytecode, compiledBytecode);
    return match;
}

} // namespace sourceproof::application
