/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "sodium.hpp"

namespace dasquare::crypto::sodium {
    void ensure_initialized()
    {
        struct sodium_initializer {
            explicit sodium_initializer()
            {
                if (sodium_init() == -1) [[unlikely]]
                    throw error("libsodium initialization failed!");
            }
        };
        static sodium_initializer init {};
    }

    void random_bytes(const write_buffer out)
    {
        ensure_initialized();
        randombytes_buf(out.data(), out.size());
    }

    uint8_vector random_bytes(const size_t sz)
    {
        uint8_vector res(sz);
        random_bytes(write_buffer { res.data(), res.size() });
        return res;
    }
}
