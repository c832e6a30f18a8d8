/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef NYX_CRYPTO_ENCODING_HPP
#define NYX_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"

namespace nyx {

/**
 * Decodes a base-32 string as defined by rfc4648.
 * Returns false if the string is malformed.
 */
bool
base32Decode(DataChunk &result, const std::string &in);

} // namespace nyx

#endif
