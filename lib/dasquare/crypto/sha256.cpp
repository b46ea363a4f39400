/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "sha256.hpp"
#include "sodium.hpp"

namespace dasquare::crypto::sha256 {
    void digest(const hash_span_t &out, const buffer &in)
    {
        sodium::ensure_initialized();
        if (sodium::crypto_hash_sha256(out.data(), in.data(), in.size()) != 0) [[unlikely]]
            throw error("libsodium error: can't compute sha256!");
    }
}
