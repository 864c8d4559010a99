/**
 * @file trace.h
 * @brief Debug trace output for field internals
 *
 * Enable with SECPFIELD_DEBUG_FIELD (CMake option of the same name).
 * Release builds compile the trace statements away.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef SECPFIELD_INTERNAL_TRACE_H
#define SECPFIELD_INTERNAL_TRACE_H

#ifdef SECPFIELD_DEBUG_FIELD
#include <iostream>
#define SECPFIELD_FIELD_TRACE(expr) \
    do { std::cerr << "[secpfield] " << expr << std::endl; } while (0)
#else
#define SECPFIELD_FIELD_TRACE(expr) do { } while (0)
#endif

#endif // SECPFIELD_INTERNAL_TRACE_H
