#pragma once

#include "tessella/core/Log.h"
#include <cstdlib>

#ifdef _MSC_VER
    #define TESSELLA_DEBUG_BREAK() __debugbreak()
#else
    #define TESSELLA_DEBUG_BREAK() __builtin_trap()
#endif

namespace tessella {

// Extract just the filename from a path
inline const char* ExtractFilename(const char* path) {
    const char* file = path;
    while (*path) {
        if (*path == '/' || *path == '\\') {
            file = path + 1;
        }
        ++path;
    }
    return file;
}

} // namespace tessella

// Core assertions (debug builds only)
#if TESSELLA_DEBUG
    #define TESSELLA_CORE_ASSERT(condition, ...)                                   \
        do {                                                                        \
            if (!(condition)) {                                                     \
                TESSELLA_CORE_CRITICAL("Core assertion failed: {}", #condition);    \
                TESSELLA_CORE_CRITICAL("  File: {}:{}", ::tessella::ExtractFilename(__FILE__), __LINE__); \
                TESSELLA_CORE_CRITICAL("  " __VA_ARGS__);                           \
                TESSELLA_DEBUG_BREAK();                                             \
            }                                                                       \
        } while (false)
#else
    #define TESSELLA_CORE_ASSERT(condition, ...) ((void)0)
#endif
