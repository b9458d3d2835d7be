#pragma once

#include "xorhunt/ScanError.h"

#include <cstdint>
#include <string>
#include <vector>

namespace xorhunt {

constexpr uint64_t kDefaultMaxBytes = 1024 * 1024;

enum class OversizePolicy {
    Truncate, // keep the first maxBytes and flag the image as truncated
    Reject    // fail with OversizedInput
};

struct LoadOptions {
    uint64_t maxBytes{kDefaultMaxBytes};
    OversizePolicy policy{OversizePolicy::Truncate};
};

// The scanned window of a firmware file. Bytes are never modified after load().
class FirmwareImage {
public:
    bool load(const std::string &path, const LoadOptions &options = LoadOptions{});

    const std::vector<uint8_t> &bytes() const { return bytes_; }
    const std::string &path() const { return path_; }
    uint64_t fileSize() const { return fileSize_; }
    bool truncated() const { return truncated_; }

    ScanError lastErrorCode() const { return lastErrorCode_; }
    const std::string &lastError() const { return lastError_; }

    // "4096", "512K", "1M", "1G".
    static bool parseByteSize(const std::string &text, uint64_t &out);

private:
    bool fail(ScanError code, const std::string &message);

    std::vector<uint8_t> bytes_;
    std::string path_;
    uint64_t fileSize_{0};
    bool truncated_{false};
    ScanError lastErrorCode_{ScanError::None};
    std::string lastError_;
};

} // namespace xorhunt
