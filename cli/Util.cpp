/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Util.hpp"
#include "../nyx/crypto/Encoding.hpp"
#include <openssl/crypto.h>
#include <errno.h>
#include <stdlib.h>
#include <time.h>
#include <limits>

using namespace nyx;

Status
parseNumber(uint64_t &result, const char *text, uint64_t max)
{
    if (!text || '0' > *text || *text > '9')
        return NYX_ERROR(NYX_CC_ParseError,
            "Expected a number, got '" + std::string(text ? text : "") + "'");

    char *end = nullptr;
    errno = 0;
    unsigned long long value = strtoull(text, &end, 10);
    if (*end)
        return NYX_ERROR(NYX_CC_ParseError,
            "Expected a number, got '" + std::string(text) + "'");
    if (ERANGE == errno || max < value)
        return NYX_ERROR(NYX_CC_Overflow,
            std::string(text) + " is larger than " + std::to_string(max));

    result = value;
    return Status();
}

Status
parseTime(uint64_t &result, const char *text)
{
    if (text)
        return parseNumber(result, text, std::numeric_limits<uint64_t>::max());

    time_t now = time(nullptr);
    if (now < 0)
        return NYX_ERROR(NYX_CC_SysError, "Cannot read the system clock");
    result = now;
    return Status();
}

SecretKey::~SecretKey()
{
    wipe();
}

Status
SecretKey::decode(const std::string &base32)
{
    wipe();
    if (!base32Decode(key_, base32))
        return NYX_ERROR(NYX_CC_ParseError, "The key is not valid base32");
    return Status();
}

void
SecretKey::wipe()
{
    if (!key_.empty())
        OPENSSL_cleanse(key_.data(), key_.size());
    key_.clear();
}
