#pragma once

#include "xorhunt/ScanTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace xorhunt {

struct Range {
    uint64_t begin{0};
    uint64_t end{0};

    uint64_t length() const { return end - begin; }
};

// Splits [0, total) into min(workers, total) contiguous ranges. The last
// range takes the remainder. Fails on total == 0 or workers == 0.
bool partitionRange(uint64_t total, size_t workers, std::vector<Range> &out, std::string *error = nullptr);

// Offsets are split in single-key mode, keys in exhaustive mode.
bool planAssignments(const ScanParams &params, size_t bufferSize, std::vector<WorkAssignment> &out,
                     std::string *error = nullptr);

} // namespace xorhunt
