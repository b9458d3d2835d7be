#pragma once

#include "xorhunt/FirmwareImage.h"
#include "xorhunt/ScanTypes.h"
#include "xorhunt/SignatureCatalog.h"
#include "xorhunt/XorScanner.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

enum ExitCode {
    kExitOk = 0,
    kExitConfig = 1,
    kExitInput = 2,
    kExitOversized = 3,
    kExitWorkerFailure = 4,
    kExitLimit = 5,
    kExitCancelled = 130
};

struct HuntOptions {
    std::string path;
    xorhunt::KeySpec keys;
    xorhunt::ScanParams params;
    xorhunt::LoadOptions load;
    std::string catalogName{"filesystems"};
    std::string signatureFile;
    bool quiet{false};
};

class Hunter {
public:
    explicit Hunter(HuntOptions options);
    ~Hunter();

    int run();
    void requestStop();

    static int exitCodeFor(xorhunt::ScanError error);

private:
    HuntOptions options_;
    xorhunt::SignatureCatalog catalog_;
    xorhunt::FirmwareImage image_;
    std::unique_ptr<xorhunt::XorScanner> scanner_;

    std::atomic<uint64_t> progressDone_{0};
    uint64_t progressTotal_{0};
    std::thread progressThread_;
    std::mutex progressMutex_;
    std::condition_variable progressCv_;
    bool progressRunning_{false};

    bool buildCatalog();
    void printBanner() const;
    void printReport(const xorhunt::ScanReport &report, double seconds) const;
    void startProgress();
    void stopProgress();
};
