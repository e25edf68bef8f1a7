#pragma once

// ===== Platform detection =====
#if defined(__linux__)
    #define ROTALOG_PLATFORM_LINUX 1
#elif defined(_WIN32)
    #define ROTALOG_PLATFORM_WINDOWS 1
#elif defined(__APPLE__)
    #define ROTALOG_PLATFORM_MACOS 1
#endif

// ===== Build mode =====
#ifndef ROTALOG_EMBEDDED
    #define ROTALOG_EMBEDDED 0
#endif

#ifndef ROTALOG_HAS_THREAD
    #if ROTALOG_EMBEDDED
        #define ROTALOG_HAS_THREAD 0
    #else
        #define ROTALOG_HAS_THREAD 1
    #endif
#endif

// ===== Record queue capacity (power of 2) =====
#ifndef ROTALOG_QUEUE_SIZE
    #if ROTALOG_EMBEDDED
        #define ROTALOG_QUEUE_SIZE 256
    #else
        #define ROTALOG_QUEUE_SIZE 8192
    #endif
#endif

// ===== Max message length per record =====
#ifndef ROTALOG_MAX_MSG_LEN
    #if ROTALOG_EMBEDDED
        #define ROTALOG_MAX_MSG_LEN 128
    #else
        #define ROTALOG_MAX_MSG_LEN 384
    #endif
#endif

// ===== Rotation throttle =====
#ifndef ROTALOG_CHECK_FREQUENCY
    #define ROTALOG_CHECK_FREQUENCY 50000
#endif
#ifndef ROTALOG_CHECK_INTERVAL_SEC
    #define ROTALOG_CHECK_INTERVAL_SEC 480
#endif

// ===== Write buffer =====
#ifndef ROTALOG_FLUSH_THRESHOLD
    #define ROTALOG_FLUSH_THRESHOLD 200
#endif

// ===== Rotation defaults =====
#ifndef ROTALOG_DEFAULT_MAX_FILE_SIZE
    #define ROTALOG_DEFAULT_MAX_FILE_SIZE (10ULL * 1024ULL * 1024ULL)
#endif
#ifndef ROTALOG_DEFAULT_MAX_ARCHIVES
    #define ROTALOG_DEFAULT_MAX_ARCHIVES 5
#endif

// ===== cacheline size =====
#ifndef ROTALOG_CACHELINE_SIZE
    #define ROTALOG_CACHELINE_SIZE 64
#endif
