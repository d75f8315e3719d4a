#pragma once

#include <cstddef>
#include <deque>
#include <string>

// Record of a rejected or impossible request (unknown entity, illegal transition).
struct Diagnostic {
    double time = 0.0;
    std::string message;
};

// Bounded ring of diagnostics. Every report is also forwarded to SDL_LogWarn.
class DiagnosticLog {
public:
    explicit DiagnosticLog(size_t capacity = 128) : capacity_(capacity) {}

    // printf-style report, stamped with simulation time
    void report(double time, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    const std::deque<Diagnostic>& entries() const { return entries_; }
    size_t count() const { return entries_.size(); }
    size_t totalReported() const { return totalReported_; }
    bool empty() const { return entries_.empty(); }

    // True if any retained entry contains the given text
    bool contains(const std::string& text) const;

    void clear() { entries_.clear(); }

private:
    size_t capacity_;
    size_t totalReported_ = 0;
    std::deque<Diagnostic> entries_;
};
