#pragma once

#include <cstdarg>
#include <cstdio>

#ifdef ARDUINO
#include <Arduino.h>
#endif

/**
 * Serial logging for the portable core. Host builds (unit tests) have no
 * Serial port, so nothing is printed there.
 */
inline void pranaLog(const char* format, ...) {
#ifdef ARDUINO
    char buffer[256];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    Serial.print(buffer);
#else
    (void)format;
#endif
}
