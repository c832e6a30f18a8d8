/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../cli/Util.hpp"
#include <catch.hpp>
#include <limits>

TEST_CASE("Number arguments", "[cli][util]")
{
    uint64_t value = 0;
    REQUIRE(parseNumber(value, "0", 10));
    REQUIRE(value == 0);
    REQUIRE(parseNumber(value, "255", 255));
    REQUIRE(value == 255);
    REQUIRE(parseNumber(value, "18446744073709551615",
        std::numeric_limits<uint64_t>::max()));
    REQUIRE(value == std::numeric_limits<uint64_t>::max());
}

TEST_CASE("Bad number arguments", "[cli][util]")
{
    uint64_t value = 42;

    // Signs, junk and empty strings:
    const char *junk[] = {"-1", "+1", " 1", "1x", "12 ", "", "x"};
    for (auto text: junk)
    {
        auto s = parseNumber(value, text, 1000);
        REQUIRE_FALSE(s);
        REQUIRE(s.value() == nyx::NYX_CC_ParseError);
    }
    REQUIRE_FALSE(parseNumber(value, nullptr, 1000));

    // Too large for the target or for 64 bits:
    auto s = parseNumber(value, "256", 255);
    REQUIRE(s.value() == nyx::NYX_CC_Overflow);
    s = parseNumber(value, "18446744073709551616",
        std::numeric_limits<uint64_t>::max());
    REQUIRE(s.value() == nyx::NYX_CC_Overflow);

    // Failures leave the old value alone:
    REQUIRE(value == 42);
}

TEST_CASE("Time arguments", "[cli][util]")
{
    uint64_t now = 0;
    REQUIRE(parseTime(now, "59"));
    REQUIRE(now == 59);

    // No argument means the system clock (2020 or later):
    REQUIRE(parseTime(now, nullptr));
    REQUIRE(1577836800 <= now);

    REQUIRE_FALSE(parseTime(now, "yesterday"));
}

TEST_CASE("Secret keys", "[cli][util]")
{
    SecretKey key;
    REQUIRE(key.data().empty());

    REQUIRE(key.decode("MZXW6YTBOI======"));
    REQUIRE(nyx::toString(key.data()) == "foobar");

    // A new key replaces the old one:
    REQUIRE(key.decode("MZXW6==="));
    REQUIRE(nyx::toString(key.data()) == "foo");

    // A bad key still wipes the old one:
    auto s = key.decode("MZXW6YT");
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == nyx::NYX_CC_ParseError);
    REQUIRE(key.data().empty());

    s = key.decode("M1======");
    REQUIRE_FALSE(s);
    REQUIRE(key.data().empty());
}
