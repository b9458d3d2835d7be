#pragma once

#include "xorhunt/ScanTypes.h"

#include <mutex>
#include <vector>

namespace xorhunt {

// Collects worker-local match lists. submit() may be called from any thread;
// finalize() runs after the workers have joined.
class ResultAggregator {
public:
    void submit(std::vector<Match> &&local);

    // Sorted by (key, offset, signature index, endianness) and cut to the
    // first limit matches when limit is non-zero. Leaves the aggregator empty.
    std::vector<Match> finalize(size_t limit = 0, bool *truncated = nullptr);

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Match> matches_;
};

} // namespace xorhunt
