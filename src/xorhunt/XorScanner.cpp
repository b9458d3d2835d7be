#include "xorhunt/XorScanner.h"

#include "xorhunt/Log.h"
#include "xorhunt/Partitioner.h"
#include "xorhunt/ResultAggregator.h"
#include "xorhunt/ScanWorker.h"

#include <algorithm>
#include <exception>
#include <thread>

namespace xorhunt {

XorScanner::XorScanner(const SignatureCatalog &catalog) : catalog_(catalog) {}

void XorScanner::setProgressSink(std::atomic<uint64_t> *done, uint64_t total) {
    progressDone_ = done;
    progressTotal_ = total;
    if (progressDone_) progressDone_->store(0, std::memory_order_relaxed);
}

bool XorScanner::fail(ScanError code, const std::string &message) {
    lastErrorCode_ = code;
    lastError_ = message;
    return false;
}

bool XorScanner::validate(size_t bufferSize, const ScanParams &params) {
    lastErrorCode_ = ScanError::None;
    lastError_.clear();
    if (catalog_.empty()) return fail(ScanError::InvalidConfiguration, "signature catalog is empty");
    if (bufferSize == 0) return fail(ScanError::InvalidConfiguration, "buffer is empty, nothing to search");
    if (params.workers == 0) return fail(ScanError::InvalidConfiguration, "worker count must be at least 1");
    std::vector<WorkAssignment> plan;
    std::string error;
    if (!planAssignments(params, bufferSize, plan, &error)) return fail(ScanError::InvalidConfiguration, error);
    return true;
}

uint64_t XorScanner::estimateWork(size_t bufferSize, const ScanParams &params) const {
    if (params.mode == ScanMode::SingleKey) return bufferSize;
    if (params.firstKey > params.lastKey) return 0;
    uint64_t keys = params.lastKey - params.firstKey + 1;
    if (params.cipher == Cipher::Rc4 || params.strategy == KeyStrategy::Enumerate) return keys;
    uint64_t shards = std::min<uint64_t>(keys, params.workers);
    return uint64_t{bufferSize} * shards;
}

bool XorScanner::scan(const std::vector<uint8_t> &buffer, const ScanParams &params, ScanReport &report) {
    report = ScanReport{};
    if (!validate(buffer.size(), params)) return false;

    std::vector<WorkAssignment> assignments;
    std::string error;
    if (!planAssignments(params, buffer.size(), assignments, &error)) {
        return fail(ScanError::InvalidConfiguration, error);
    }

    if (params.mode == ScanMode::SingleKey) {
        logf("scanning %zu bytes with %s key %s over %zu shard(s)", buffer.size(), cipherName(params.cipher),
             formatKey(params.key, params.keyWidth).c_str(), assignments.size());
    } else {
        logf("scanning %zu bytes for %s keys %s-%s over %zu shard(s)", buffer.size(), cipherName(params.cipher),
             formatKey(static_cast<uint32_t>(params.firstKey), params.keyWidth).c_str(),
             formatKey(static_cast<uint32_t>(params.lastKey), params.keyWidth).c_str(), assignments.size());
    }

    std::atomic<uint64_t> localProgress{0};
    std::atomic<bool> limitReached{false};
    ScanControl control;
    control.cancel = &cancel_;
    control.progress = progressDone_ ? progressDone_ : &localProgress;
    control.limitReached = &limitReached;
    control.matchLimit = params.matchLimit;
    const uint64_t progressStart = control.progress->load(std::memory_order_relaxed);

    report.workTotal = estimateWork(buffer.size(), params);
    report.shards.resize(assignments.size());
    for (size_t i = 0; i < assignments.size(); ++i) {
        report.shards[i].assignment = assignments[i];
    }

    ResultAggregator aggregator;
    std::vector<std::thread> threads;
    threads.reserve(assignments.size());
    size_t spawned = 0;
    bool spawnFailed = false;
    try {
        for (; spawned < assignments.size(); ++spawned) {
            threads.emplace_back([&, spawned]() {
                auto &shard = report.shards[spawned];
                std::vector<Match> local;
                try {
                    ScanWorker worker(buffer, catalog_, params, control);
                    worker.run(assignments[spawned], local);
                    shard.completed = true;
                } catch (const std::exception &e) {
                    shard.error = e.what();
                    logf("shard %zu failed: %s", spawned, e.what());
                } catch (...) {
                    shard.error = "unknown exception";
                    logf("shard %zu failed with an unknown exception", spawned);
                }
                shard.matches = local.size();
                aggregator.submit(std::move(local));
            });
        }
    } catch (const std::exception &e) {
        // Could not start every worker; stop the running ones and mark the rest failed.
        spawnFailed = true;
        cancel_.store(true, std::memory_order_relaxed);
        for (size_t i = spawned; i < assignments.size(); ++i) {
            report.shards[i].error = std::string("worker not started: ") + e.what();
        }
        logf("could not start worker %zu: %s", spawned, e.what());
    }
    for (auto &th : threads) th.join();

    bool truncated = false;
    report.matches = aggregator.finalize(params.matchLimit, &truncated);
    report.cancelled = !spawnFailed && cancel_.load(std::memory_order_relaxed);
    report.limitReached = truncated || limitReached.load(std::memory_order_relaxed);
    if (spawnFailed) cancel_.store(false, std::memory_order_relaxed);
    report.workDone = control.progress->load(std::memory_order_relaxed) - progressStart;

    if (report.limitReached) {
        logf("match limit of %zu reached, result set is partial", params.matchLimit);
    }
    if (report.cancelled) {
        logf("scan cancelled, %zu match(es) kept", report.matches.size());
    }

    size_t failed = report.failedShards();
    if (failed > 0) {
        std::string first;
        for (const auto &s : report.shards) {
            if (!s.completed) {
                first = s.error;
                break;
            }
        }
        return fail(ScanError::WorkerFailure,
                    std::to_string(failed) + " of " + std::to_string(report.shards.size()) +
                        " shard(s) failed: " + first);
    }
    return true;
}

} // namespace xorhunt
