#pragma once

#include "xorhunt/SignatureCatalog.h"
#include "xorhunt/XorKey.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

namespace xorhunt {

enum class ScanMode {
    SingleKey,  // one key, offsets split across workers
    Exhaustive  // key range split across workers, each scanning the whole buffer
};

// How an exhaustive worker walks its key range. Both produce the same matches.
enum class KeyStrategy {
    Derive,   // solve the key bytes from each offset, emit keys of the range that satisfy them
    Enumerate // try every key of the range against the whole buffer
};

struct Match {
    uint32_t key{0};
    uint64_t offset{0};
    std::string signature;
    size_t signatureIndex{0};
    Endianness endianness{Endianness::Little};
};

inline bool operator<(const Match &a, const Match &b) {
    return std::tie(a.key, a.offset, a.signatureIndex, a.endianness) <
           std::tie(b.key, b.offset, b.signatureIndex, b.endianness);
}

inline bool operator==(const Match &a, const Match &b) {
    return a.key == b.key && a.offset == b.offset && a.signatureIndex == b.signatureIndex &&
           a.endianness == b.endianness && a.signature == b.signature;
}

inline bool operator!=(const Match &a, const Match &b) { return !(a == b); }

struct WorkAssignment {
    size_t worker{0};
    uint64_t offsetBegin{0}; // half-open byte range
    uint64_t offsetEnd{0};
    uint64_t keyBegin{0};    // half-open key range
    uint64_t keyEnd{0};
};

inline size_t defaultWorkerCount() {
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<size_t>(hw);
}

struct ScanParams {
    ScanMode mode{ScanMode::SingleKey};
    uint32_t key{0};               // single-key mode
    uint64_t firstKey{0};          // exhaustive mode, inclusive
    uint64_t lastKey{0xFFFFFFFFull};
    unsigned keyWidth{4};
    Cipher cipher{Cipher::Xor};
    KeyPhase phase{KeyPhase::Signature};    // XOR only
    KeyStrategy strategy{KeyStrategy::Derive}; // RC4 always enumerates
    size_t workers{defaultWorkerCount()};
    // Keep only the first matchLimit matches in sort order; 0 means unlimited.
    size_t matchLimit{0};
    // Invoked from worker threads for every hit a shard keeps; must be
    // thread-safe. Under a match limit a kept hit can later be displaced.
    std::function<void(const Match &)> onMatch;
};

struct ShardReport {
    WorkAssignment assignment;
    bool completed{false};
    size_t matches{0};
    std::string error;
};

struct ScanReport {
    std::vector<Match> matches;
    std::vector<ShardReport> shards;
    bool cancelled{false};
    bool limitReached{false};
    uint64_t workDone{0};
    uint64_t workTotal{0};

    size_t failedShards() const {
        size_t n = 0;
        for (const auto &s : shards) {
            if (!s.completed) ++n;
        }
        return n;
    }
    bool complete() const { return !cancelled && !limitReached && failedShards() == 0; }
};

} // namespace xorhunt
