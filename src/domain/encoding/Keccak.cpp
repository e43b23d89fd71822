/**
 * @file Keccak.cpp
 * @brief Keccak-f[1600] sponge with rate 1088 bits.
 */
#include "domain/encoding/Keccak.hpp"

#include <array>

namespace sourceproof::domain::encoding {

namespace {

constexpr size_t kRateBytes = 136;
constexpr int kRounds = 24;

constexpr std::array<std::uint64_t, kRounds> kRoundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL, 0x8000000080008000ULL,
    0x000000000000808BULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008AULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800AULL, 0x800000008000000AULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

constexpr std::array<int, 24> kRotations = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

constexpr std::array<int, 24> kPiLanes = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

inline std::uint64_t Rotl(std::uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

void KeccakF(std::array<std::uint64_t, 25>& st) {
    std::uint64_t bc[5];
    for (int round = 0; round < kRounds; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            std::uint64_t t = bc[(i + 4) % 5] ^ Rotl(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho and Pi
        std::uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = kPiLanes[i];
            bc[0] = st[j];
            st[j] = Rotl(t, kRotations[i]);
            t = bc[0];
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= kRoundConstants[round];
    }
}

void AbsorbByte(std::array<std::uint64_t, 25>& st, size_t offset, std::uint8_t byte) {
    st[offset / 8] ^= static_cast<std::uint64_t>(byte) << (8 * (offset % 8));
}

} // namespace

Bytes Keccak256(const std::uint8_t* data, size_t size) {
    std::array<std::uint64_t, 25> st{};

    size_t offset = 0;
    for (size_t i = 0; i < size; ++i) {
        AbsorbByte(st, offset++, data[i]);
        if (offset == kRateBytes) {
            KeccakF(st);
            offset = 0;
        }
    }

    // Keccak padding (0x01 ... 0x80), not the SHA-3 domain byte.
    AbsorbByte(st, offset, 0x01);
    AbsorbByte(st, kRateBytes - 1, 0x80);
    KeccakF(st);

    Bytes digest(32);
    for (size_t i = 0; i < digest.size(); ++i) {
        digest[i] = static_cast<std::uint8_t>(st[i / 8] >> (8 * (i % 8)));
    }
    return digest;
}

Bytes Keccak256(const std::string& data) {
    return Keccak256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::string Keccak256Hex(const std::string& data) {
    return ToPrefixedHex(Keccak256(data));
}

} // namespace sourceproof::domain::encoding
