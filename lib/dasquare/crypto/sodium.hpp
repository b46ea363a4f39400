#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <dasquare/common/bytes.hpp>

namespace dasquare::crypto::sodium
{
    extern "C" {
#       include <sodium.h>
    }

    // every call into libsodium must be preceded by this one
    extern void ensure_initialized();
    // fills out from the libsodium CSPRNG
    extern void random_bytes(write_buffer out);
    extern uint8_vector random_bytes(size_t sz);
}
