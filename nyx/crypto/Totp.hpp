/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Time-based one-time passwords, as defined by rfc6238.
 */

#ifndef NYX_CRYPTO_TOTP_HPP
#define NYX_CRYPTO_TOTP_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace nyx {

class TotpConfig;

/**
 * Builds a TOTP configuration with non-default parameters.
 * A zero step or zero digits is a NYX_CC_ConfigError,
 * and more than 9 digits is a NYX_CC_Overflow.
 */
Status
totpConfigure(TotpConfig &result, unsigned digits, uint8_t skew, uint64_t step);

/**
 * The parameters shared by a TOTP prover and verifier.
 * Instances are immutable, and can only be created valid.
 */
class TotpConfig
{
public:
    /**
     * The usual authenticator-app settings:
     * 6 digits, a skew of 1 step, and 30-second steps.
     */
    TotpConfig():
        digits_(6), skew_(1), step_(30)
    {}

    // Read accessors:
    unsigned digits()   const { return digits_; }
    uint8_t skew()      const { return skew_; }
    uint64_t step()     const { return step_; }

private:
    friend Status
    totpConfigure(TotpConfig &result, unsigned digits, uint8_t skew, uint64_t step);

    TotpConfig(unsigned digits, uint8_t skew, uint64_t step):
        digits_(digits), skew_(skew), step_(step)
    {}

    unsigned digits_;
    uint8_t skew_;
    uint64_t step_;
};

/**
 * Produces a counter-based password (rfc4226).
 * The result is an unpadded number below 10^digits.
 */
Status
hotpGenerate(uint32_t &result, DataSlice key, uint64_t counter,
    unsigned digits);

/**
 * Produces the time-based password for the given Unix time,
 * using the default configuration.
 */
Status
totpGenerate(uint32_t &result, DataSlice key, uint64_t time);

Status
totpGenerate(uint32_t &result, const TotpConfig &config, DataSlice key,
    uint64_t time);

/**
 * Checks a password against the time steps within the configured skew
 * of the given Unix time, using the default configuration.
 * A window reaching back before the epoch starts at counter zero.
 */
Status
totpVerify(bool &result, DataSlice key, uint64_t time, uint32_t token);

Status
totpVerify(bool &result, const TotpConfig &config, DataSlice key,
    uint64_t time, uint32_t token);

/**
 * Formats a password as a fixed-width decimal number,
 * with leading zeros.
 */
std::string
otpFormat(uint32_t code, unsigned digits);

} // namespace nyx

#endif
