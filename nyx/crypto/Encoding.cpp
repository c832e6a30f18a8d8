/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <algorithm>

namespace nyx {

/**
 * Maps a base32 character to its 5-bit value, or -1 if it isn't one.
 */
static int
base32Value(char c)
{
    if ('A' <= c && c <= 'Z')
        return c - 'A';
    if ('a' <= c && c <= 'z')
        return c - 'a';
    if ('2' <= c && c <= '7')
        return 26 + c - '2';
    return -1;
}

bool
base32Decode(DataChunk &result, const std::string &in)
{
    // Padding fills the final quantum out to 8 characters:
    if (in.size() % 8)
        return false;

    auto padding = std::find(in.begin(), in.end(), '=');
    if (!std::all_of(padding, in.end(), [](char c){ return '=' == c; }))
        return false;
    auto pad = in.end() - padding;
    if (2 == pad || 5 == pad || 7 <= pad)
        return false;

    DataChunk out;
    out.reserve(5 * (in.size() / 8));

    uint32_t buffer = 0; // Pending bits, in the low end
    unsigned bits = 0;
    for (auto i = in.begin(); i != padding; ++i)
    {
        int value = base32Value(*i);
        if (value < 0)
            return false;

        buffer = (buffer << 5) | value;
        bits += 5;
        if (8 <= bits)
        {
            bits -= 8;
            out.push_back(static_cast<uint8_t>(buffer >> bits));
        }
    }

    result = std::move(out);
    return true;
}

} // namespace nyx
