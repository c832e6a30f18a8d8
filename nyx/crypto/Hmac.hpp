/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef NYX_CRYPTO_HMAC_HPP
#define NYX_CRYPTO_HMAC_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace nyx {

constexpr size_t SHA1_LENGTH = 20;

/**
 * Computes HMAC-SHA1 (rfc2104) over the message.
 * Any key length is acceptable, including zero.
 */
Status
hmacSha1(DataArray<SHA1_LENGTH> &result, DataSlice key, DataSlice message);

} // namespace nyx

#endif
