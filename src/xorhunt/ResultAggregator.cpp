#include "xorhunt/ResultAggregator.h"

#include <algorithm>
#include <iterator>

namespace xorhunt {

void ResultAggregator::submit(std::vector<Match> &&local) {
    if (local.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    matches_.insert(matches_.end(), std::make_move_iterator(local.begin()), std::make_move_iterator(local.end()));
    local.clear();
}

std::vector<Match> ResultAggregator::finalize(size_t limit, bool *truncated) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Match> result;
    result.swap(matches_);
    std::sort(result.begin(), result.end());
    bool cut = limit > 0 && result.size() > limit;
    if (cut) result.resize(limit);
    if (truncated) *truncated = cut;
    return result;
}

size_t ResultAggregator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return matches_.size();
}

void ResultAggregator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    matches_.clear();
}

} // namespace xorhunt
