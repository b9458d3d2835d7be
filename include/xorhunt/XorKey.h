#pragma once

#include <cstdint>
#include <string>

namespace xorhunt {

constexpr unsigned kMaxKeyWidth = 4;

// Where the repeating key is anchored.
enum class KeyPhase {
    Signature, // key byte 0 lines up with the candidate offset
    Buffer     // key byte 0 lines up with buffer offset 0
};

// How a candidate key turns the buffer back into plain text.
enum class Cipher {
    Xor, // repeating key XORed byte-wise
    Rc4  // RC4 keystream keyed with the low width bytes of the key
};

struct KeySpec {
    bool exhaustive{false};
    uint64_t first{0};
    uint64_t last{0}; // inclusive
};

inline bool validKeyWidth(unsigned width) { return width >= 1 && width <= kMaxKeyWidth; }

inline uint64_t keySpaceSize(unsigned width) { return uint64_t{1} << (8 * width); }

inline uint8_t keyByte(uint32_t key, unsigned index) {
    return static_cast<uint8_t>((key >> (8 * index)) & 0xFF);
}

// Key byte applied at signature position k of a candidate at offset j.
inline uint8_t keyByteAt(uint32_t key, unsigned width, KeyPhase phase, uint64_t offset, uint64_t k) {
    uint64_t pos = phase == KeyPhase::Signature ? k : offset + k;
    return keyByte(key, static_cast<unsigned>(pos % width));
}

// Decimal or 0x-prefixed hex.
bool parseKeyValue(const std::string &text, uint64_t &out);
// "0x2A", "0x1000-0x1FFF", "all" or "*".
bool parseKeySpec(const std::string &text, unsigned width, KeySpec &out, std::string &error);

bool parseKeyPhase(const std::string &text, KeyPhase &out);
const char *keyPhaseName(KeyPhase phase);

bool parseCipher(const std::string &text, Cipher &out);
const char *cipherName(Cipher cipher);

// Zero-padded to the key width, e.g. 0x002A for a two byte key.
std::string formatKey(uint32_t key, unsigned width);

} // namespace xorhunt
