#pragma once

#include "xorhunt/ScanError.h"
#include "xorhunt/ScanTypes.h"
#include "xorhunt/SignatureCatalog.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xorhunt {

class XorScanner {
public:
    explicit XorScanner(const SignatureCatalog &catalog);

    // Runs one worker thread per assignment and fills report. Returns false on
    // a configuration error (nothing scanned) or when a shard failed; in the
    // latter case report still carries the matches of the healthy shards.
    // A cancel requested before the call is honoured; call resetCancel()
    // before reusing a cancelled scanner.
    bool scan(const std::vector<uint8_t> &buffer, const ScanParams &params, ScanReport &report);

    bool validate(size_t bufferSize, const ScanParams &params);
    uint64_t estimateWork(size_t bufferSize, const ScanParams &params) const;

    void requestCancel() { cancel_.store(true, std::memory_order_relaxed); }
    void resetCancel() { cancel_.store(false, std::memory_order_relaxed); }
    bool cancelRequested() const { return cancel_.load(std::memory_order_relaxed); }
    void setProgressSink(std::atomic<uint64_t> *done, uint64_t total);

    const SignatureCatalog &catalog() const { return catalog_; }
    ScanError lastErrorCode() const { return lastErrorCode_; }
    const std::string &lastError() const { return lastError_; }

private:
    bool fail(ScanError code, const std::string &message);

    const SignatureCatalog &catalog_;
    std::atomic<bool> cancel_{false};
    std::atomic<uint64_t> *progressDone_{nullptr};
    uint64_t progressTotal_{0};
    ScanError lastErrorCode_{ScanError::None};
    std::string lastError_;
};

} // namespace xorhunt
