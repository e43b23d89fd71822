/**
 * @file Match.hpp
 * @brief Outcome of comparing recompiled bytecode against on-chain code.
 */

#pragma once
#include <optional>
#include <string>

namespace sourceproof::domain {

/**
 * @enum MatchStatus
 * @brief How closely two bytecodes agree.
 */
enum class MatchStatus {
    None,    ///< No agreement. Never persisted.
    Partial, ///< Identical apart from the trailing metadata segment.
    Perfect  ///< Byte-identical.
};

inline std::string MatchStatusToString(MatchStatus status) {
    switch (status) {
        case MatchStatus::Perfect: return "perfect";
        case MatchStatus::Partial: return "partial";
        case MatchStatus::None: return "none";
    }
    return "none";
}

/**
 * @struct Match
 * @brief Address (if any) and status of a verification.
 */
struct Match {
    std::optional<std::string> address;
    MatchStatus status = MatchStatus::None;

    bool matched() const { return address.has_value() && status != MatchStatus::None; }
};

} // namespace sourceproof::domain
