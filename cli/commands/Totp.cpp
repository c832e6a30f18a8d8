/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include <iostream>
#include <limits>

using namespace nyx;

Status
totpGenerateCommand(const TotpConfig &config, int argc, char *argv[])
{
    if (argc < 1 || 2 < argc)
        return NYX_ERROR(NYX_CC_Error, "usage: ... totp-generate <key> [time]");

    SecretKey key;
    NYX_CHECK(key.decode(argv[0]));
    uint64_t now;
    NYX_CHECK(parseTime(now, 2 == argc ? argv[1] : nullptr));

    uint32_t code;
    NYX_CHECK(totpGenerate(code, config, key.data(), now));
    std::cout << otpFormat(code, config.digits()) << std::endl;

    return Status();
}

Status
totpVerifyCommand(const TotpConfig &config, int argc, char *argv[])
{
    if (argc < 2 || 3 < argc)
        return NYX_ERROR(NYX_CC_Error, "usage: ... totp-verify <key> <code> [time]");

    SecretKey key;
    NYX_CHECK(key.decode(argv[0]));
    uint64_t token;
    NYX_CHECK(parseNumber(token, argv[1], UINT32_MAX));
    uint64_t now;
    NYX_CHECK(parseTime(now, 3 == argc ? argv[2] : nullptr));

    bool valid;
    NYX_CHECK(totpVerify(valid, config, key.data(), now,
        static_cast<uint32_t>(token)));
    if (!valid)
    {
        std::cout << "invalid" << std::endl;
        return NYX_ERROR(NYX_CC_Error, "The code does not match");
    }
    std::cout << "valid" << std::endl;

    return Status();
}

Status
hotpGenerateCommand(const TotpConfig &config, int argc, char *argv[])
{
    if (argc != 2)
        return NYX_ERROR(NYX_CC_Error, "usage: ... hotp-generate <key> <counter>");

    SecretKey key;
    NYX_CHECK(key.decode(argv[0]));
    uint64_t counter;
    NYX_CHECK(parseNumber(counter, argv[1],
        std::numeric_limits<uint64_t>::max()));

    uint32_t code;
    NYX_CHECK(hotpGenerate(code, key.data(), counter, config.digits()));
    std::cout << otpFormat(code, config.digits()) << std::endl;

    return Status();
}
