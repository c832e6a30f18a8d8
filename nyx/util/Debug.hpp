/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef NYX_UTIL_DEBUG_HPP
#define NYX_UTIL_DEBUG_HPP

#define DEBUG_LEVEL 1

#define NYX_DebugLevel(level, ...)  \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        NYX_DebugLog(__VA_ARGS__);  \
    }                               \
}

namespace nyx {

/**
 * Writes a timestamped line to stderr, in DEBUG builds only.
 * Stdout stays free for program output.
 */
void NYX_DebugLog(const char *format, ...);

} // namespace nyx

#endif
