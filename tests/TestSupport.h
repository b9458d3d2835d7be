#pragma once

#include "xorhunt/Rc4.h"
#include "xorhunt/ScanTypes.h"
#include "xorhunt/XorKey.h"

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace xorhunt {
namespace testing {

// Deterministic filler that never contains 0x68 / 0x73 / 0x45 / 0x28 / 0x85 / 0x19
// in clear text, so only planted magics match under key 0.
inline std::vector<uint8_t> makeFiller(size_t size, uint32_t seed = 0x5eed) {
    std::vector<uint8_t> out(size);
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0xA0, 0xFF);
    for (auto &b : out) b = static_cast<uint8_t>(dist(rng));
    return out;
}

// Writes sig XOR key at offset using the given key model.
inline void plant(std::vector<uint8_t> &buffer, uint64_t offset, const std::vector<uint8_t> &sig, uint32_t key,
                  unsigned width = 4, KeyPhase phase = KeyPhase::Signature) {
    for (size_t k = 0; k < sig.size(); ++k) {
        buffer[offset + k] = static_cast<uint8_t>(sig[k] ^ keyByteAt(key, width, phase, offset, k));
    }
}

inline void rc4Encrypt(std::vector<uint8_t> &buffer, uint32_t key, unsigned width) {
    uint8_t keyBytes[kMaxKeyWidth] = {};
    for (unsigned i = 0; i < width; ++i) keyBytes[i] = keyByte(key, i);
    Rc4 rc4(keyBytes, width);
    rc4.apply(buffer.data(), buffer.data(), buffer.size());
}

inline bool containsMatch(const std::vector<Match> &matches, uint32_t key, uint64_t offset,
                          const std::string &name, Endianness endianness) {
    return std::any_of(matches.begin(), matches.end(), [&](const Match &m) {
        return m.key == key && m.offset == offset && m.signature == name && m.endianness == endianness;
    });
}

inline ScanParams singleKey(uint32_t key, size_t workers = 1, unsigned width = 4) {
    ScanParams p;
    p.mode = ScanMode::SingleKey;
    p.key = key;
    p.workers = workers;
    p.keyWidth = width;
    return p;
}

inline ScanParams keyRange(uint64_t first, uint64_t last, size_t workers = 1, unsigned width = 4) {
    ScanParams p;
    p.mode = ScanMode::Exhaustive;
    p.firstKey = first;
    p.lastKey = last;
    p.workers = workers;
    p.keyWidth = width;
    return p;
}

} // namespace testing
} // namespace xorhunt
