/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Hmac.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <limits>

namespace nyx {

Status
hmacSha1(DataArray<SHA1_LENGTH> &result, DataSlice key, DataSlice message)
{
    // OpenSSL wants non-null pointers, even for empty buffers:
    static const uint8_t empty[1] = {0};
    const uint8_t *keyData = key.empty() ? empty : key.data();
    const uint8_t *messageData = message.empty() ? empty : message.data();

    if (static_cast<size_t>(std::numeric_limits<int>::max()) < key.size())
        return NYX_ERROR(NYX_CC_CryptoError, "HMAC key too long");

    unsigned size = 0;
    if (!HMAC(EVP_sha1(), keyData, static_cast<int>(key.size()),
        messageData, message.size(), result.data(), &size))
        return NYX_ERROR(NYX_CC_CryptoError, "HMAC-SHA1 failed");
    if (SHA1_LENGTH != size)
        return NYX_ERROR(NYX_CC_CryptoError, "Unexpected HMAC-SHA1 length");

    return Status();
}

} // namespace nyx
