/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef NYX_UTIL_STATUS_HPP
#define NYX_UTIL_STATUS_HPP

#include <stddef.h>
#include <ostream>
#include <string>

namespace nyx {

/**
 * Error codes reported by the library.
 */
typedef enum eNYX_CC
{
    /** The call completed successfully */
    NYX_CC_Ok = 0,
    /** Generic failure, such as bad command usage */
    NYX_CC_Error = 1,
    /** Invalid TOTP parameters (zero step or zero digits) */
    NYX_CC_ConfigError = 2,
    /** A value does not fit the native integer width */
    NYX_CC_Overflow = 3,
    /** The HMAC primitive failed */
    NYX_CC_CryptoError = 4,
    /** Malformed key, number or other text input */
    NYX_CC_ParseError = 5,
    /** An operating-system call failed */
    NYX_CC_SysError = 6
} tNYX_CC;

/**
 * Describes the results of calling a library function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tNYX_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tNYX_CC value()             const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == NYX_CC_Ok; }

    /**
     * Writes the status to the debug log if it represents an error.
     * Returns the status unchanged, so calls can be chained.
     */
    const Status &log() const;

private:
    // Error information:
    tNYX_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define NYX_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define NYX_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

} // namespace nyx

#endif
