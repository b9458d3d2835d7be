#include "xorhunt/XorKey.h"

#include <charconv>
#include <cstdio>

namespace xorhunt {

bool parseKeyValue(const std::string &text, uint64_t &out) {
    if (text.empty()) return false;
    const char *begin = text.data();
    const char *end = text.data() + text.size();
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        begin += 2;
        base = 16;
    }
    uint64_t value = 0;
    auto res = std::from_chars(begin, end, value, base);
    if (res.ec != std::errc() || res.ptr != end) return false;
    out = value;
    return true;
}

bool parseKeySpec(const std::string &text, unsigned width, KeySpec &out, std::string &error) {
    if (!validKeyWidth(width)) {
        error = "key width must be 1 to 4 bytes";
        return false;
    }
    const uint64_t space = keySpaceSize(width);
    if (text == "all" || text == "*") {
        out.exhaustive = true;
        out.first = 0;
        out.last = space - 1;
        return true;
    }

    auto dash = text.find('-');
    if (dash == std::string::npos) {
        uint64_t key = 0;
        if (!parseKeyValue(text, key)) {
            error = "'" + text + "' is not a valid key";
            return false;
        }
        if (key >= space) {
            error = "key " + text + " does not fit in " + std::to_string(width) + " byte(s)";
            return false;
        }
        out.exhaustive = false;
        out.first = key;
        out.last = key;
        return true;
    }

    uint64_t first = 0;
    uint64_t last = 0;
    if (!parseKeyValue(text.substr(0, dash), first) || !parseKeyValue(text.substr(dash + 1), last)) {
        error = "'" + text + "' is not a valid key range";
        return false;
    }
    if (first > last) {
        error = "key range " + text + " is reversed";
        return false;
    }
    if (last >= space) {
        error = "key range " + text + " does not fit in " + std::to_string(width) + " byte(s)";
        return false;
    }
    out.exhaustive = true;
    out.first = first;
    out.last = last;
    return true;
}

bool parseKeyPhase(const std::string &text, KeyPhase &out) {
    if (text == "signature" || text == "offset") {
        out = KeyPhase::Signature;
        return true;
    }
    if (text == "buffer" || text == "file") {
        out = KeyPhase::Buffer;
        return true;
    }
    return false;
}

const char *keyPhaseName(KeyPhase phase) {
    return phase == KeyPhase::Signature ? "signature" : "buffer";
}

bool parseCipher(const std::string &text, Cipher &out) {
    if (text == "xor") {
        out = Cipher::Xor;
        return true;
    }
    if (text == "rc4") {
        out = Cipher::Rc4;
        return true;
    }
    return false;
}

const char *cipherName(Cipher cipher) {
    return cipher == Cipher::Xor ? "XOR" : "RC4";
}

std::string formatKey(uint32_t key, unsigned width) {
    char buf[16];
    int digits = validKeyWidth(width) ? static_cast<int>(width * 2) : 8;
    std::snprintf(buf, sizeof(buf), "0x%0*X", digits, static_cast<unsigned>(key));
    return buf;
}

} // namespace xorhunt
