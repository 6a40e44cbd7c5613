#pragma once

// ===== Platform =====
#if defined(__linux__)
    #define DIAG_SINK_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define DIAG_SINK_PLATFORM_MACOS 1
#endif

// ===== Internal logger ring size (power of 2) =====
#ifndef DIAG_SINK_LOG_RING_SIZE
    #define DIAG_SINK_LOG_RING_SIZE 4096
#endif

// ===== Internal log message length =====
#ifndef DIAG_SINK_LOG_MAX_MSG_LEN
    #define DIAG_SINK_LOG_MAX_MSG_LEN 384
#endif

// ===== Segment defaults (CMake may inject overrides) =====
#ifndef DIAG_SINK_DEFAULT_BASE_NAME
    #define DIAG_SINK_DEFAULT_BASE_NAME "BenchmarkDiagnostics.out"
#endif
#ifndef DIAG_SINK_DEFAULT_MAX_SEGMENT_BYTES
    #define DIAG_SINK_DEFAULT_MAX_SEGMENT_BYTES 100000000ULL
#endif
#ifndef DIAG_SINK_DEFAULT_CHECK_INTERVAL_MS
    #define DIAG_SINK_DEFAULT_CHECK_INTERVAL_MS 5000
#endif
#ifndef DIAG_SINK_DEFAULT_CONTAINER
    #define DIAG_SINK_DEFAULT_CONTAINER "diagnostics"
#endif

// ===== cacheline =====
#ifndef DIAG_SINK_CACHELINE_SIZE
    #define DIAG_SINK_CACHELINE_SIZE 64
#endif
