#pragma once

namespace xorhunt {

// Diagnostic lines go to stderr as "[xorhunt] ...".
void logf(const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

void setLogEnabled(bool enabled);

} // namespace xorhunt
