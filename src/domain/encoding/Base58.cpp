/**
 * @file Base58.cpp
 * @brief Implementation of base58 encoding.
 */
#include "domain/encoding/Base58.hpp"

namespace sourceproof::domain::encoding {

namespace {

constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

} // namespace

std::string EncodeBase58(const Bytes& bytes) {
    auto begin = bytes.begin();
    size_t zeroes = 0;
    while (begin != bytes.end() && *begin == 0) {
        ++begin;
        ++zeroes;
    }

    // log(256) / log(58), rounded up.
    std::vector<std::uint8_t> b58(static_cast<size_t>(bytes.end() - begin) * 138 / 100 + 1);
    size_t length = 0;
    for (auto it = begin; it != bytes.end(); ++it) {
        int carry = *it;
        size_t i = 0;
        for (auto digit = b58.rbegin(); (carry != 0 || i < length) && digit != b58.rend(); ++digit, ++i) {
            carry += 256 * (*digit);
            *digit = static_cast<std::uint8_t>(carry % 58);
            carry /= 58;
        }
        length = i;
    }

    auto digit = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length);
    while (digit != b58.end() && *digit == 0) {
        ++digit;
    }

    std::string out(zeroes, '1');
    out.reserve(zeroes + static_cast<size_t>(b58.end() - digit));
    for (; digit != b58.end(); ++digit) {
        out.push_back(kAlphabet[*digit]);
    }
    return out;
}

} // namespace sourceproof::domain::encoding
