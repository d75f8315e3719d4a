#include "DiagnosticLog.h"
#include <SDL3/SDL_log.h>
#include <cstdarg>
#include <cstdio>

void DiagnosticLog::report(double time, const char* fmt, ...) {
    char buffer[512];

    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[t=%.2f] %s", time, buffer);

    totalReported_++;
    if (capacity_ == 0) return;
    if (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(Diagnostic{time, buffer});
}

bool DiagnosticLog::contains(const std::string& text) const {
    for (const auto& entry : entries_) {
        if (entry.message.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}
