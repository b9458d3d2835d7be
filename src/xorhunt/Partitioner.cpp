#include "xorhunt/Partitioner.h"

#include <algorithm>

namespace xorhunt {

namespace {
void setError(std::string *error, const std::string &text) {
    if (error) *error = text;
}
} // namespace

bool partitionRange(uint64_t total, size_t workers, std::vector<Range> &out, std::string *error) {
    out.clear();
    if (workers == 0) {
        setError(error, "worker count must be at least 1");
        return false;
    }
    if (total == 0) {
        setError(error, "nothing to search");
        return false;
    }
    uint64_t count = std::min<uint64_t>(workers, total);
    uint64_t chunk = total / count;
    out.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        Range r;
        r.begin = i * chunk;
        r.end = (i == count - 1) ? total : r.begin + chunk;
        out.push_back(r);
    }
    return true;
}

bool planAssignments(const ScanParams &params, size_t bufferSize, std::vector<WorkAssignment> &out,
                     std::string *error) {
    out.clear();
    if (!validKeyWidth(params.keyWidth)) {
        setError(error, "key width must be 1 to 4 bytes");
        return false;
    }
    const uint64_t space = keySpaceSize(params.keyWidth);
    std::vector<Range> ranges;

    if (params.mode == ScanMode::SingleKey) {
        if (params.key >= space) {
            setError(error, "key does not fit in the key width");
            return false;
        }
        if (!partitionRange(bufferSize, params.workers, ranges, error)) return false;
        for (size_t i = 0; i < ranges.size(); ++i) {
            WorkAssignment a;
            a.worker = i;
            a.offsetBegin = ranges[i].begin;
            a.offsetEnd = ranges[i].end;
            a.keyBegin = params.key;
            a.keyEnd = uint64_t{params.key} + 1;
            out.push_back(a);
        }
        return true;
    }

    if (bufferSize == 0) {
        setError(error, "nothing to search");
        return false;
    }
    if (params.firstKey > params.lastKey) {
        setError(error, "key range is reversed");
        return false;
    }
    if (params.lastKey >= space) {
        setError(error, "key range does not fit in the key width");
        return false;
    }
    if (!partitionRange(params.lastKey - params.firstKey + 1, params.workers, ranges, error)) return false;
    for (size_t i = 0; i < ranges.size(); ++i) {
        WorkAssignment a;
        a.worker = i;
        a.offsetBegin = 0;
        a.offsetEnd = bufferSize;
        a.keyBegin = params.firstKey + ranges[i].begin;
        a.keyEnd = params.firstKey + ranges[i].end;
        out.push_back(a);
    }
    return true;
}

} // namespace xorhunt
