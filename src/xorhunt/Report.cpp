#include "xorhunt/Report.h"

#include <cstdio>
#include <sstream>

namespace xorhunt {

std::string formatOffset(uint64_t offset) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "0x%llX (%llu bytes)", static_cast<unsigned long long>(offset),
                  static_cast<unsigned long long>(offset));
    return buf;
}

std::string formatMatch(const Match &match, unsigned keyWidth, Cipher cipher) {
    std::ostringstream os;
    os << "  [+] " << cipherName(cipher) << " Key: " << formatKey(match.key, keyWidth) << "\n"
       << "      Filesystem: " << match.signature << "\n"
       << "      Offset: " << formatOffset(match.offset) << "\n"
       << "      Endianness: " << endiannessName(match.endianness) << "\n";
    return os.str();
}

std::string formatShard(const ShardReport &shard, const ScanParams &params) {
    std::ostringstream os;
    const auto &a = shard.assignment;
    os << "shard " << a.worker << " ";
    if (params.mode == ScanMode::SingleKey) {
        os << "offsets " << formatOffset(a.offsetBegin) << " .. " << formatOffset(a.offsetEnd);
    } else {
        os << "keys " << formatKey(static_cast<uint32_t>(a.keyBegin), params.keyWidth) << " .. "
           << formatKey(static_cast<uint32_t>(a.keyEnd - 1), params.keyWidth);
    }
    if (shard.completed) {
        os << ": " << shard.matches << " match(es)";
    } else {
        os << ": INCOMPLETE (" << shard.error << ")";
    }
    return os.str();
}

std::string describeScan(const ScanParams &params) {
    std::ostringstream os;
    if (params.cipher == Cipher::Rc4) os << "RC4 ";
    if (params.mode == ScanMode::SingleKey) {
        os << "single key " << formatKey(params.key, params.keyWidth);
    } else {
        os << "keys " << formatKey(static_cast<uint32_t>(params.firstKey), params.keyWidth) << " to "
           << formatKey(static_cast<uint32_t>(params.lastKey), params.keyWidth)
           << (params.cipher == Cipher::Rc4 || params.strategy == KeyStrategy::Enumerate ? " (enumerated)"
                                                                                          : " (derived)");
    }
    os << ", " << params.keyWidth << " byte key, ";
    if (params.cipher == Cipher::Xor) os << keyPhaseName(params.phase) << " phase, ";
    os << params.workers << " worker(s)";
    return os.str();
}

} // namespace xorhunt
