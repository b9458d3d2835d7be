#include "xorhunt/ScanWorker.h"

#include "xorhunt/Rc4.h"

#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <utility>

namespace xorhunt {

namespace {
constexpr uint64_t kBlock = 64 * 1024;
} // namespace

ScanWorker::ScanWorker(const std::vector<uint8_t> &buffer, const SignatureCatalog &catalog,
                       const ScanParams &params, const ScanControl &control)
    : buffer_(buffer), catalog_(catalog), params_(params), control_(control),
      bufferPhase_(params.cipher == Cipher::Xor && params.phase == KeyPhase::Buffer) {}

void ScanWorker::run(const WorkAssignment &assignment, std::vector<Match> &out) {
    stoppedEarly_ = false;
    if (params_.mode == ScanMode::SingleKey) {
        scanKey(static_cast<uint32_t>(assignment.keyBegin), assignment.offsetBegin, assignment.offsetEnd, out);
        return;
    }
    if (params_.cipher == Cipher::Rc4 || params_.strategy == KeyStrategy::Enumerate) {
        enumerateKeys(assignment.keyBegin, assignment.keyEnd, out);
    } else {
        deriveKeys(assignment.keyBegin, assignment.keyEnd, out);
    }
}

void ScanWorker::scanKey(uint32_t key, uint64_t offsetBegin, uint64_t offsetEnd, std::vector<Match> &out) {
    offsetEnd = std::min<uint64_t>(offsetEnd, buffer_.size());
    encodeFor(key);
    if (params_.cipher == Cipher::Rc4) {
        // The keystream runs from offset 0; only the window this shard reads is decrypted.
        decryptRc4(key, offsetEnd + catalog_.maxLength());
        scanOffsets(plain_.data(), offsetBegin, offsetEnd, key, true, out);
        return;
    }
    scanOffsets(buffer_.data(), offsetBegin, offsetEnd, key, true, out);
}

void ScanWorker::enumerateKeys(uint64_t keyBegin, uint64_t keyEnd, std::vector<Match> &out) {
    const bool rc4 = params_.cipher == Cipher::Rc4;
    for (uint64_t key = keyBegin; key < keyEnd; ++key) {
        if (shouldStop()) return;
        encodeFor(static_cast<uint32_t>(key));
        if (rc4) {
            decryptRc4(static_cast<uint32_t>(key), buffer_.size());
            scanOffsets(plain_.data(), 0, buffer_.size(), static_cast<uint32_t>(key), false, out);
        } else {
            scanOffsets(buffer_.data(), 0, buffer_.size(), static_cast<uint32_t>(key), false, out);
        }
        if (stoppedEarly_) return;
        progressAdd(1);
    }
}

void ScanWorker::deriveKeys(uint64_t keyBegin, uint64_t keyEnd, std::vector<Match> &out) {
    const uint64_t size = buffer_.size();
    const uint64_t limit = scanLimit();
    const auto &entries = catalog_.entries();
    for (uint64_t block = 0; block < size; block += kBlock) {
        if (shouldStop()) return;
        uint64_t blockEnd = std::min(size, block + kBlock);
        uint64_t scanEnd = std::min(blockEnd, limit);
        for (uint64_t j = block; j < scanEnd; ++j) {
            for (size_t i = 0; i < entries.size(); ++i) {
                deriveAt(j, i, Endianness::Little, keyBegin, keyEnd, out);
                if (stoppedEarly_) return;
                if (entries[i].hasBig()) {
                    deriveAt(j, i, Endianness::Big, keyBegin, keyEnd, out);
                    if (stoppedEarly_) return;
                }
            }
        }
        progressAdd(blockEnd - block);
    }
}

void ScanWorker::encodeFor(uint32_t key) {
    const unsigned width = params_.keyWidth;
    const bool rc4 = params_.cipher == Cipher::Rc4;
    const unsigned residues = bufferPhase_ ? width : 1;
    size_t n = 0;
    for (size_t i = 0; i < catalog_.size(); ++i) {
        const auto &entry = catalog_.at(i);
        for (Endianness e : {Endianness::Little, Endianness::Big}) {
            if (e == Endianness::Big && !entry.hasBig()) continue;
            const auto &sig = entry.bytes(e);
            for (unsigned r = 0; r < residues; ++r) {
                if (n == patterns_.size()) patterns_.emplace_back();
                auto &p = patterns_[n++];
                p.entry = i;
                p.endianness = e;
                p.residue = r;
                p.bytes.resize(sig.size());
                for (size_t k = 0; k < sig.size(); ++k) {
                    p.bytes[k] = rc4 ? sig[k]
                                     : static_cast<uint8_t>(sig[k] ^ keyByteAt(key, width, params_.phase, r, k));
                }
            }
        }
    }
    patterns_.resize(n);
}

void ScanWorker::decryptRc4(uint32_t key, uint64_t length) {
    uint8_t keyBytes[kMaxKeyWidth] = {};
    for (unsigned i = 0; i < params_.keyWidth; ++i) keyBytes[i] = keyByte(key, i);
    Rc4 rc4(keyBytes, params_.keyWidth);
    length = std::min<uint64_t>(length, buffer_.size());
    plain_.resize(static_cast<size_t>(length));
    rc4.apply(buffer_.data(), plain_.data(), plain_.size());
}

// Offsets below this leave room for the longest signature.
uint64_t ScanWorker::scanLimit() const {
    const uint64_t size = buffer_.size();
    const uint64_t maxLen = catalog_.maxLength();
    return size >= maxLen ? size - maxLen + 1 : 0;
}

// Matches come out in sort order here, so the first one a full shard
// rejects ends the scan.
void ScanWorker::scanOffsets(const uint8_t *data, uint64_t offsetBegin, uint64_t offsetEnd, uint32_t key,
                             bool countProgress, std::vector<Match> &out) {
    const uint64_t limit = scanLimit();
    const unsigned width = params_.keyWidth;
    for (uint64_t block = offsetBegin; block < offsetEnd; block += kBlock) {
        if (shouldStop()) return;
        uint64_t blockEnd = std::min(offsetEnd, block + kBlock);
        uint64_t scanEnd = std::min(blockEnd, limit);
        for (uint64_t j = block; j < scanEnd; ++j) {
            for (const auto &p : patterns_) {
                if (bufferPhase_ && j % width != p.residue) continue;
                if (data[j] != p.bytes[0]) continue;
                if (std::memcmp(data + j, p.bytes.data(), p.bytes.size()) != 0) continue;
                if (!emit(out, key, j, p.entry, p.endianness)) {
                    stoppedEarly_ = true;
                    return;
                }
            }
        }
        if (countProgress) progressAdd(blockEnd - block);
    }
}

void ScanWorker::deriveAt(uint64_t offset, size_t entry, Endianness endianness, uint64_t keyBegin,
                          uint64_t keyEnd, std::vector<Match> &out) {
    const auto &sig = catalog_.at(entry).bytes(endianness);
    const unsigned width = params_.keyWidth;
    uint8_t fixed[kMaxKeyWidth] = {};
    bool known[kMaxKeyWidth] = {};
    for (size_t k = 0; k < sig.size(); ++k) {
        uint64_t pos = params_.phase == KeyPhase::Signature ? k : offset + k;
        unsigned idx = static_cast<unsigned>(pos % width);
        uint8_t b = static_cast<uint8_t>(buffer_[offset + k] ^ sig[k]);
        if (known[idx]) {
            if (fixed[idx] != b) return;
        } else {
            known[idx] = true;
            fixed[idx] = b;
        }
    }

    uint64_t base = 0;
    unsigned freeIdx[kMaxKeyWidth] = {};
    unsigned nfree = 0;
    for (unsigned i = 0; i < width; ++i) {
        if (known[i]) {
            base |= uint64_t{fixed[i]} << (8 * i);
        } else {
            freeIdx[nfree++] = i;
        }
    }

    if (nfree == 0) {
        if (base >= keyBegin && base < keyEnd) {
            emit(out, static_cast<uint32_t>(base), offset, entry, endianness);
        }
        return;
    }

    // Free key bytes are deposited low to high, so keyAt() is monotonic in t.
    auto keyAt = [&](uint64_t t) {
        uint64_t key = base;
        for (unsigned n = 0; n < nfree; ++n) {
            key |= ((t >> (8 * n)) & 0xFF) << (8 * freeIdx[n]);
        }
        return key;
    };
    const uint64_t combos = uint64_t{1} << (8 * nfree);
    auto lowerBound = [&](uint64_t bound) {
        uint64_t lo = 0;
        uint64_t hi = combos;
        while (lo < hi) {
            uint64_t mid = lo + (hi - lo) / 2;
            if (keyAt(mid) < bound) lo = mid + 1;
            else hi = mid;
        }
        return lo;
    };
    const uint64_t last = lowerBound(keyEnd);
    for (uint64_t t = lowerBound(keyBegin); t < last; ++t) {
        if ((t & 0xFFF) == 0 && shouldStop()) return;
        // keys rise with t, so once one is rejected the rest would be too
        if (!emit(out, static_cast<uint32_t>(keyAt(t)), offset, entry, endianness)) return;
    }
}

// Returns false when a full shard rejects the match.
bool ScanWorker::emit(std::vector<Match> &out, uint32_t key, uint64_t offset, size_t entry,
                      Endianness endianness) {
    Match match{key, offset, catalog_.at(entry).name, entry, endianness};
    const size_t limit = control_.matchLimit;
    if (limit > 0 && out.size() >= limit) {
        if (control_.limitReached) control_.limitReached->store(true, std::memory_order_relaxed);
        if (!(match < out.front())) return false;
        if (params_.onMatch) params_.onMatch(match);
        std::pop_heap(out.begin(), out.end());
        out.back() = std::move(match);
        std::push_heap(out.begin(), out.end());
        return true;
    }
    if (params_.onMatch) params_.onMatch(match);
    out.push_back(std::move(match));
    if (limit > 0) std::push_heap(out.begin(), out.end());
    return true;
}

bool ScanWorker::shouldStop() {
    if (control_.cancel && control_.cancel->load(std::memory_order_relaxed)) {
        stoppedEarly_ = true;
        return true;
    }
    return false;
}

void ScanWorker::progressAdd(uint64_t units) {
    if (!control_.progress) return;
    control_.progress->fetch_add(units, std::memory_order_relaxed);
}

} // namespace xorhunt
