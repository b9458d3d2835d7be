#include "xorhunt/FirmwareImage.h"

#include "xorhunt/Log.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace xorhunt {

bool FirmwareImage::fail(ScanError code, const std::string &message) {
    lastErrorCode_ = code;
    lastError_ = message;
    return false;
}

bool FirmwareImage::load(const std::string &path, const LoadOptions &options) {
    lastErrorCode_ = ScanError::None;
    lastError_.clear();
    bytes_.clear();
    truncated_ = false;
    fileSize_ = 0;
    path_ = path;

    if (options.maxBytes == 0) {
        return fail(ScanError::InvalidConfiguration, "size cap must be greater than zero");
    }

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return fail(ScanError::InputNotFound, path + ": file not found");
    }
    if (!fs::is_regular_file(status)) {
        return fail(ScanError::InputUnreadable, path + ": not a regular file");
    }
    uint64_t size = fs::file_size(path, ec);
    if (ec) {
        return fail(ScanError::InputUnreadable, path + ": " + ec.message());
    }
    fileSize_ = size;

    if (size > options.maxBytes) {
        if (options.policy == OversizePolicy::Reject) {
            return fail(ScanError::OversizedInput, path + ": " + std::to_string(size) +
                                                       " bytes exceeds the cap of " +
                                                       std::to_string(options.maxBytes));
        }
        truncated_ = true;
        logf("%s is %llu bytes, only the first %llu are scanned", path.c_str(),
             static_cast<unsigned long long>(size), static_cast<unsigned long long>(options.maxBytes));
    }

    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.good()) {
        return fail(ScanError::InputUnreadable, path + ": cannot open for reading");
    }
    uint64_t toRead = std::min(size, options.maxBytes);
    bytes_.resize(static_cast<size_t>(toRead));
    f.read(reinterpret_cast<char *>(bytes_.data()), static_cast<std::streamsize>(toRead));
    if (f.bad() || static_cast<uint64_t>(f.gcount()) != toRead) {
        bytes_.clear();
        return fail(ScanError::InputUnreadable, path + ": short read");
    }
    return true;
}

bool FirmwareImage::parseByteSize(const std::string &text, uint64_t &out) {
    if (text.empty()) return false;
    std::string digits = text;
    uint64_t scale = 1;
    char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(digits.back())));
    if (suffix == 'K' || suffix == 'M' || suffix == 'G') {
        digits.pop_back();
        scale = suffix == 'K' ? (uint64_t{1} << 10) : suffix == 'M' ? (uint64_t{1} << 20) : (uint64_t{1} << 30);
    }
    if (digits.empty()) return false;
    uint64_t value = 0;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value, 10);
    if (res.ec != std::errc() || res.ptr != digits.data() + digits.size()) return false;
    if (value > UINT64_MAX / scale) return false;
    out = value * scale;
    return true;
}

} // namespace xorhunt
