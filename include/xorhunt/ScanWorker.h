#pragma once

#include "xorhunt/ScanTypes.h"
#include "xorhunt/SignatureCatalog.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace xorhunt {

// Shared between the scanner and its workers. All pointers are optional.
struct ScanControl {
    const std::atomic<bool> *cancel{nullptr};
    std::atomic<uint64_t> *progress{nullptr};
    std::atomic<bool> *limitReached{nullptr}; // set when a shard drops a match
    size_t matchLimit{0};                     // per shard, smallest matches win
};

class ScanWorker {
public:
    ScanWorker(const std::vector<uint8_t> &buffer, const SignatureCatalog &catalog, const ScanParams &params,
               const ScanControl &control = ScanControl{});

    // Appends the matches of one assignment to out, which must hold only
    // this worker's matches. Under a match limit out is kept as a max-heap of
    // the smallest matchLimit matches. Exceptions thrown by the match
    // listener propagate to the caller.
    void run(const WorkAssignment &assignment, std::vector<Match> &out);

    void scanKey(uint32_t key, uint64_t offsetBegin, uint64_t offsetEnd, std::vector<Match> &out);
    void enumerateKeys(uint64_t keyBegin, uint64_t keyEnd, std::vector<Match> &out);
    void deriveKeys(uint64_t keyBegin, uint64_t keyEnd, std::vector<Match> &out);

    bool stoppedEarly() const { return stoppedEarly_; }

private:
    // Signature bytes pre-XORed with the key so the hot loop is a plain compare.
    struct EncodedPattern {
        size_t entry{0};
        Endianness endianness{Endianness::Little};
        unsigned residue{0}; // buffer phase: applies where offset % width == residue
        std::vector<uint8_t> bytes;
    };

    void encodeFor(uint32_t key);
    void decryptRc4(uint32_t key, uint64_t length);
    void scanOffsets(const uint8_t *data, uint64_t offsetBegin, uint64_t offsetEnd, uint32_t key,
                     bool countProgress, std::vector<Match> &out);
    void deriveAt(uint64_t offset, size_t entry, Endianness endianness, uint64_t keyBegin, uint64_t keyEnd,
                  std::vector<Match> &out);
    bool emit(std::vector<Match> &out, uint32_t key, uint64_t offset, size_t entry, Endianness endianness);
    uint64_t scanLimit() const;
    bool shouldStop();
    void progressAdd(uint64_t units);

    const std::vector<uint8_t> &buffer_;
    const SignatureCatalog &catalog_;
    const ScanParams &params_;
    ScanControl control_;
    std::vector<EncodedPattern> patterns_;
    std::vector<uint8_t> plain_; // RC4 keystream applied to the buffer
    bool bufferPhase_{false};
    bool stoppedEarly_{false};
};

} // namespace xorhunt
