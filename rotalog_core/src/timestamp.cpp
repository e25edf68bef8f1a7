#include "rotalog/timestamp.hpp"
#include "rotalog/platform.hpp"
#include <cstdio>
#include <ctime>

#if ROTALOG_EMBEDDED

extern "C" __attribute__((weak)) uint64_t rotalog_monotonic_ns() { return 0; }
extern "C" __attribute__((weak)) uint64_t rotalog_wall_clock_ns() { return 0; }

namespace rotalog {

uint64_t monotonic_now_ns() { return rotalog_monotonic_ns(); }
uint64_t wall_clock_now_ns() { return rotalog_wall_clock_ns(); }

} // namespace rotalog

#elif defined(ROTALOG_PLATFORM_LINUX) || defined(ROTALOG_PLATFORM_MACOS)

#include <time.h>

namespace rotalog {

uint64_t monotonic_now_ns() {
    struct timespec ts;
#if defined(ROTALOG_PLATFORM_LINUX)
    clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
#else
    clock_gettime(CLOCK_MONOTONIC, &ts);
#endif
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL
         + static_cast<uint64_t>(ts.tv_nsec);
}

uint64_t wall_clock_now_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL
         + static_cast<uint64_t>(ts.tv_nsec);
}

} // namespace rotalog

#elif defined(ROTALOG_PLATFORM_WINDOWS)

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace rotalog {

static uint64_t qpc_frequency() {
    LARGE_INTEGER freq;
    QueryPerformanceFrequency(&freq);
    return static_cast<uint64_t>(freq.QuadPart);
}

uint64_t monotonic_now_ns() {
    static const uint64_t freq = qpc_frequency();
    LARGE_INTEGER counter;
    QueryPerformanceCounter(&counter);
    uint64_t ticks = static_cast<uint64_t>(counter.QuadPart);
    return (ticks / freq) * 1'000'000'000ULL + (ticks % freq) * 1'000'000'000ULL / freq;
}

uint64_t wall_clock_now_ns() {
    FILETIME ft;
    GetSystemTimePreciseAsFileTime(&ft);
    uint64_t ticks = (static_cast<uint64_t>(ft.dwHighDateTime) << 32)
                   | static_cast<uint64_t>(ft.dwLowDateTime);
    // FILETIME epoch: 1601-01-01, Unix epoch offset: 11644473600 seconds
    constexpr uint64_t epoch_offset = 11644473600ULL * 10'000'000ULL;
    return (ticks - epoch_offset) * 100ULL;
}

} // namespace rotalog

#endif

namespace rotalog {

namespace {

void to_tm(uint64_t wall_ns, bool utc, struct tm& tm_out) {
    time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
#if defined(ROTALOG_PLATFORM_WINDOWS)
    if (utc) gmtime_s(&tm_out, &sec); else localtime_s(&tm_out, &sec);
#else
    if (utc) gmtime_r(&sec, &tm_out); else localtime_r(&sec, &tm_out);
#endif
}

size_t clamp_written(int n, size_t buf_size) {
    return (n > 0 && static_cast<size_t>(n) < buf_size)
         ? static_cast<size_t>(n) : (buf_size - 1);
}

} // namespace

size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    struct tm tm_val{};
    to_tm(wall_ns, false, tm_val);
    uint32_t us = static_cast<uint32_t>((wall_ns % 1'000'000'000ULL) / 1'000ULL);
    int n = snprintf(buf, buf_size, "%04d-%02d-%02d %02d:%02d:%02d.%06u",
                     tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                     tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, us);
    return clamp_written(n, buf_size);
}

size_t format_archive_stamp(uint64_t wall_ns, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    struct tm tm_val{};
    to_tm(wall_ns, true, tm_val);
    int n = snprintf(buf, buf_size, "%04d%02d%02dT%02d%02d%02dZ",
                     tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                     tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec);
    return clamp_written(n, buf_size);
}

} // namespace rotalog
