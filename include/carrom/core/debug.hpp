#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable (CMake option CARROM_DEBUG)
#ifndef CARROM_ENABLE_DEBUG
#define CARROM_ENABLE_DEBUG 0
#endif

// Debug levels
#define CARROM_DEBUG_LEVEL_NONE 0
#define CARROM_DEBUG_LEVEL_BASIC 1
#define CARROM_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef CARROM_CURRENT_DEBUG_LEVEL
#define CARROM_CURRENT_DEBUG_LEVEL CARROM_DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define CARROM_DEBUG_MSG(level, x) do { \
    if (CARROM_ENABLE_DEBUG && (level) <= CARROM_CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)
