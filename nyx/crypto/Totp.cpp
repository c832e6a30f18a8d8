/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Totp.hpp"
#include "Hmac.hpp"
#include "../util/Debug.hpp"
#include <openssl/crypto.h>
#include <limits>
#include <sstream>

namespace nyx {

// Powers of ten up to the largest that fits in 32 bits:
static const uint32_t digitsModulus[] =
{
    1,
    10,
    100,
    1000,
    10000,
    100000,
    1000000,
    10000000,
    100000000,
    1000000000
};
constexpr unsigned maxDigits = 9;

static Status
digitsCheck(unsigned digits)
{
    if (!digits)
        return NYX_ERROR(NYX_CC_ConfigError, "Codes need at least one digit");
    if (maxDigits < digits)
        return NYX_ERROR(NYX_CC_Overflow, "10^" + std::to_string(digits) +
            " does not fit in 32 bits");
    return Status();
}

Status
totpConfigure(TotpConfig &result, unsigned digits, uint8_t skew, uint64_t step)
{
    NYX_CHECK(digitsCheck(digits).log());
    if (!step)
        return NYX_ERROR(NYX_CC_ConfigError, "The time step cannot be zero").log();

    result = TotpConfig(digits, skew, step);
    return Status();
}

Status
hotpGenerate(uint32_t &result, DataSlice key, uint64_t counter,
    unsigned digits)
{
    NYX_CHECK(digitsCheck(digits));

    // Do HMAC_SHA1(key, counter):
    DataArray<SHA1_LENGTH> hmac;
    DataArray<8> cb =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};
    NYX_CHECK(hmacSha1(hmac, key, cb));

    // The low nibble of the last byte picks a 4-byte window:
    unsigned offset = hmac[SHA1_LENGTH - 1] & 0xf;
    if (hmac.size() < offset + 4)
        return NYX_ERROR(NYX_CC_CryptoError, "Truncation offset out of range");

    uint32_t p =
        static_cast<uint32_t>(hmac[offset]) << 24 |
        static_cast<uint32_t>(hmac[offset + 1]) << 16 |
        static_cast<uint32_t>(hmac[offset + 2]) << 8 |
        static_cast<uint32_t>(hmac[offset + 3]);
    p &= 0x7fffffff;

    result = p % digitsModulus[digits];
    return Status();
}

Status
totpGenerate(uint32_t &result, DataSlice key, uint64_t time)
{
    return totpGenerate(result, TotpConfig(), key, time);
}

Status
totpGenerate(uint32_t &result, const TotpConfig &config, DataSlice key,
    uint64_t time)
{
    return hotpGenerate(result, key, time / config.step(), config.digits());
}

Status
totpVerify(bool &result, DataSlice key, uint64_t time, uint32_t token)
{
    return totpVerify(result, TotpConfig(), key, time, token);
}

Status
totpVerify(bool &result, const TotpConfig &config, DataSlice key,
    uint64_t time, uint32_t token)
{
    const uint64_t counter = time / config.step();
    const uint64_t skew = config.skew();
    if (std::numeric_limits<uint64_t>::max() - skew < counter)
        return NYX_ERROR(NYX_CC_Overflow,
            "Verification window runs past the last time step");

    // Clamp the window at the epoch rather than wrapping around:
    uint64_t first = 0;
    if (skew <= counter)
        first = counter - skew;
    else
        NYX_DebugLevel(1, "TOTP window clamped at the epoch, %u steps short",
            static_cast<unsigned>(skew - counter));
    const uint64_t last = counter + skew;

    for (uint64_t i = first; ; ++i)
    {
        uint32_t code;
        NYX_CHECK(hotpGenerate(code, key, i, config.digits()));
        if (!CRYPTO_memcmp(&code, &token, sizeof(code)))
        {
            result = true;
            return Status();
        }

        if (last == i)
            break;
    }

    result = false;
    return Status();
}

std::string
otpFormat(uint32_t code, unsigned digits)
{
    std::stringstream ss;
    ss.width(digits);
    ss.fill('0');
    ss << code;
    auto s = ss.str();
    s.erase(0, s.size() - digits);
    return s;
}

} // namespace nyx
