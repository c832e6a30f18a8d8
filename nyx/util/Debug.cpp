/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>

namespace nyx {

void NYX_DebugLog(const char *format, ...)
{
#ifdef DEBUG
    time_t t = time(nullptr);
    struct tm utc;
    gmtime_r(&t, &utc);

    char date[32];
    strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &utc);

    // One buffered write per line, so threads don't interleave:
    char line[512];
    int size = snprintf(line, sizeof(line), "%s NYX_Log: ", date);
    va_list args;
    va_start(args, format);
    vsnprintf(line + size, sizeof(line) - size - 1, format, args);
    va_end(args);

    fprintf(stderr, "%s\n", line);
#else
    (void)format;
#endif
}

} // namespace nyx
