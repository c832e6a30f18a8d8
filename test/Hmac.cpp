/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../nyx/crypto/Hmac.hpp"
#include <catch.hpp>

static std::string
hex(nyx::DataSlice data)
{
    const char digits[] = "0123456789abcdef";
    std::string out;
    for (auto c: data)
    {
        out += digits[c >> 4];
        out += digits[c & 0xf];
    }
    return out;
}

TEST_CASE("RFC 2202 HMAC-SHA1 test vectors", "[crypto][hmac]")
{
    nyx::DataArray<nyx::SHA1_LENGTH> result;

    nyx::DataChunk key1(20, 0x0b);
    std::string data1 = "Hi There";
    REQUIRE(nyx::hmacSha1(result, key1, data1));
    REQUIRE(hex(result) == "b617318655057264e28bc0b6fb378c8ef146be00");

    std::string key2 = "Jefe";
    std::string data2 = "what do ya want for nothing?";
    REQUIRE(nyx::hmacSha1(result, key2, data2));
    REQUIRE(hex(result) == "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");

    nyx::DataChunk key3(20, 0xaa);
    nyx::DataChunk data3(50, 0xdd);
    REQUIRE(nyx::hmacSha1(result, key3, data3));
    REQUIRE(hex(result) == "125d7342b9ac11cd91a39af48aa17b4f63f175d3");
}

TEST_CASE("HMAC-SHA1 accepts an empty key", "[crypto][hmac]")
{
    nyx::DataArray<nyx::SHA1_LENGTH> result;
    nyx::DataChunk empty;
    REQUIRE(nyx::hmacSha1(result, empty, empty));
    REQUIRE(hex(result) == "fbdb1d1b18aa6c08324b7d64b71fb76370690e1d");
}
