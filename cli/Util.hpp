/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Utilities and helpers shared between commands.
 */

#ifndef CLI_UTIL_HPP
#define CLI_UTIL_HPP

#include "../nyx/util/Data.hpp"
#include "../nyx/util/Status.hpp"

/**
 * Parses a non-negative decimal number, rejecting any trailing junk.
 */
nyx::Status
parseNumber(uint64_t &result, const char *text, uint64_t max);

/**
 * Parses a Unix time, or reads the system clock if `text` is null.
 */
nyx::Status
parseTime(uint64_t &result, const char *text);

/**
 * A shared secret decoded from base32.
 * The decoded bytes are wiped when replaced or destroyed.
 */
class SecretKey
{
public:
    ~SecretKey();
    SecretKey() {}
    SecretKey(const SecretKey &) = delete;
    SecretKey &operator=(const SecretKey &) = delete;

    /**
     * Wipes any current key, then decodes the new one.
     * On failure the key is left empty.
     */
    nyx::Status
    decode(const std::string &base32);

    nyx::DataSlice
    data() const { return key_; }

private:
    void
    wipe();

    nyx::DataChunk key_;
};

#endif
