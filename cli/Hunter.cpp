#include "Hunter.h"

#include "xorhunt/Log.h"
#include "xorhunt/Report.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <vector>

namespace {
Hunter *gActiveHunter = nullptr;

std::string hexBytes(const std::vector<uint8_t> &bytes) {
    std::string out;
    char buf[4];
    for (size_t i = 0; i < bytes.size(); ++i) {
        std::snprintf(buf, sizeof(buf), "%02X", bytes[i]);
        if (i) out += ' ';
        out += buf;
    }
    return out;
}

void onSignal(int) {
    if (gActiveHunter) {
        gActiveHunter->requestStop();
    }
}
} // namespace

Hunter::Hunter(HuntOptions options) : options_(std::move(options)) {
    auto &p = options_.params;
    if (options_.keys.exhaustive) {
        p.mode = xorhunt::ScanMode::Exhaustive;
        p.firstKey = options_.keys.first;
        p.lastKey = options_.keys.last;
    } else {
        p.mode = xorhunt::ScanMode::SingleKey;
        p.key = static_cast<uint32_t>(options_.keys.first);
    }
}

Hunter::~Hunter() {
    stopProgress();
    if (gActiveHunter == this) gActiveHunter = nullptr;
}

void Hunter::requestStop() {
    if (scanner_) scanner_->requestCancel();
}

int Hunter::exitCodeFor(xorhunt::ScanError error) {
    switch (error) {
        case xorhunt::ScanError::None: return kExitOk;
        case xorhunt::ScanError::InvalidConfiguration: return kExitConfig;
        case xorhunt::ScanError::InputNotFound:
        case xorhunt::ScanError::InputUnreadable: return kExitInput;
        case xorhunt::ScanError::OversizedInput: return kExitOversized;
        case xorhunt::ScanError::WorkerFailure: return kExitWorkerFailure;
    }
    return kExitConfig;
}

bool Hunter::buildCatalog() {
    if (!xorhunt::SignatureCatalog::byName(options_.catalogName, catalog_)) {
        std::cerr << "Unknown catalog \"" << options_.catalogName << "\" (use filesystems or firmware)\n";
        return false;
    }
    if (!options_.signatureFile.empty() && !catalog_.loadFromFile(options_.signatureFile)) {
        std::cerr << catalog_.lastError() << "\n";
        return false;
    }
    return true;
}

int Hunter::run() {
    if (!buildCatalog()) return kExitConfig;

    if (!image_.load(options_.path, options_.load)) {
        std::cerr << "Error (" << xorhunt::scanErrorName(image_.lastErrorCode()) << "): " << image_.lastError()
                  << "\n";
        return exitCodeFor(image_.lastErrorCode());
    }

    scanner_ = std::make_unique<xorhunt::XorScanner>(catalog_);
    const auto &params = options_.params;
    if (!scanner_->validate(image_.bytes().size(), params)) {
        std::cerr << "Error (" << xorhunt::scanErrorName(scanner_->lastErrorCode()) << "): "
                  << scanner_->lastError() << "\n";
        return exitCodeFor(scanner_->lastErrorCode());
    }
    if (params.cipher == xorhunt::Cipher::Xor && params.mode == xorhunt::ScanMode::Exhaustive &&
        params.keyWidth >= catalog_.minLength()) {
        xorhunt::logf("a %u byte key can produce any %zu byte signature, expect a candidate at nearly every offset",
                      params.keyWidth, catalog_.minLength());
    }

    printBanner();

    scanner_->resetCancel();
    struct sigaction sa{};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    gActiveHunter = this;

    progressTotal_ = scanner_->estimateWork(image_.bytes().size(), params);
    scanner_->setProgressSink(&progressDone_, progressTotal_);
    startProgress();

    auto started = std::chrono::steady_clock::now();
    xorhunt::ScanReport report;
    bool ok = scanner_->scan(image_.bytes(), params, report);
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    stopProgress();
    gActiveHunter = nullptr;
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (!ok && scanner_->lastErrorCode() != xorhunt::ScanError::WorkerFailure) {
        std::cerr << "Error (" << xorhunt::scanErrorName(scanner_->lastErrorCode()) << "): "
                  << scanner_->lastError() << "\n";
        return exitCodeFor(scanner_->lastErrorCode());
    }

    printReport(report, seconds);

    if (!ok) {
        std::cerr << "Error (" << xorhunt::scanErrorName(scanner_->lastErrorCode()) << "): "
                  << scanner_->lastError() << "\n";
        return exitCodeFor(scanner_->lastErrorCode());
    }
    if (report.cancelled) return kExitCancelled;
    if (report.limitReached) return kExitLimit;
    return kExitOk;
}

void Hunter::printBanner() const {
    std::cout << "[*] " << xorhunt::cipherName(options_.params.cipher) << " filesystem hunter\n";
    std::cout << "[*] Input: " << options_.path << "\n";
    if (image_.truncated()) {
        std::cout << "[!] File is " << image_.fileSize() << " bytes; scanning only the first "
                  << image_.bytes().size() << " bytes\n";
    } else {
        std::cout << "[*] Read " << image_.bytes().size() << " bytes\n";
    }
    std::cout << "[*] Scan: " << xorhunt::describeScan(options_.params) << "\n";
    std::cout << "[*] Searching for:\n";
    for (const auto &entry : catalog_.entries()) {
        std::cout << "    - " << entry.name << " (LE: " << hexBytes(entry.little);
        if (entry.hasBig()) std::cout << ", BE: " << hexBytes(entry.big);
        std::cout << ")\n";
    }
    std::cout << std::endl;
}

void Hunter::printReport(const xorhunt::ScanReport &report, double seconds) const {
    const auto &params = options_.params;
    std::cout << "\n[*] Scan " << (report.cancelled ? "cancelled" : "complete") << " in " << seconds << " s\n";
    if (report.matches.empty()) {
        std::cout << "[*] No filesystems detected\n";
    } else {
        std::cout << "[+] Found " << report.matches.size() << " filesystem signature(s):\n\n";
        for (const auto &m : report.matches) {
            std::cout << xorhunt::formatMatch(m, params.keyWidth, params.cipher) << "\n";
        }
    }
    if (report.limitReached) {
        std::cout << "[!] Match limit of " << params.matchLimit
                  << " reached; only the lowest keys are listed, narrow the key range or raise --limit\n";
    }
    if (report.cancelled) {
        std::cout << "[!] Scan was cancelled; results are partial\n";
    }
    for (const auto &shard : report.shards) {
        if (!shard.completed) {
            std::cout << "[!] " << xorhunt::formatShard(shard, params) << "\n";
        }
    }
    if (image_.truncated()) {
        std::cout << "[!] Only the first " << image_.bytes().size() << " of " << image_.fileSize()
                  << " bytes were scanned\n";
    }
    if (seconds > 0 && report.workDone > 0) {
        const char *unit = params.mode == xorhunt::ScanMode::Exhaustive &&
                                   (params.cipher == xorhunt::Cipher::Rc4 ||
                                    params.strategy == xorhunt::KeyStrategy::Enumerate)
                               ? "keys"
                               : "bytes";
        std::cout << "[*] Performance: " << static_cast<uint64_t>(report.workDone / seconds) << " " << unit
                  << "/second\n";
    }
}

void Hunter::startProgress() {
    if (options_.quiet || progressTotal_ == 0) return;
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        progressRunning_ = true;
    }
    progressThread_ = std::thread([this]() {
        std::unique_lock<std::mutex> lock(progressMutex_);
        while (progressRunning_) {
            progressCv_.wait_for(lock, std::chrono::milliseconds(500));
            if (!progressRunning_) break;
            uint64_t done = std::min(progressDone_.load(std::memory_order_relaxed), progressTotal_);
            double pct = 100.0 * static_cast<double>(done) / static_cast<double>(progressTotal_);
            std::fprintf(stderr, "\r[*] Progress: %5.1f%%", pct);
            std::fflush(stderr);
        }
        std::fprintf(stderr, "\r[*] Progress: done  \n");
        std::fflush(stderr);
    });
}

void Hunter::stopProgress() {
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        if (!progressRunning_) return;
        progressRunning_ = false;
    }
    progressCv_.notify_all();
    if (progressThread_.joinable()) progressThread_.join();
}
