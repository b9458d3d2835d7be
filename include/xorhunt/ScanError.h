#pragma once

namespace xorhunt {

enum class ScanError {
    None,
    InvalidConfiguration,
    InputNotFound,
    InputUnreadable,
    OversizedInput,
    WorkerFailure
};

inline const char *scanErrorName(ScanError e) {
    switch (e) {
        case ScanError::None: return "None";
        case ScanError::InvalidConfiguration: return "InvalidConfiguration";
        case ScanError::InputNotFound: return "InputNotFound";
        case ScanError::InputUnreadable: return "InputUnreadable";
        case ScanError::OversizedInput: return "OversizedInput";
        case ScanError::WorkerFailure: return "WorkerFailure";
    }
    return "Unknown";
}

} // namespace xorhunt
