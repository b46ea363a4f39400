/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/test.hpp>
#include "sodium.hpp"

namespace {
    using namespace dasquare;
    using namespace dasquare::crypto;
}

suite dasquare_crypto_sodium_suite = [] {
    "dasquare::crypto::sodium"_test = [] {
        "random bytes"_test = [] {
            const auto a = sodium::random_bytes(32);
            const auto b = sodium::random_bytes(32);
            expect_equal(a.size(), 32ULL);
            expect(a != b);
            expect(sodium::random_bytes(0).empty());
            byte_array<16> buf {};
            sodium::random_bytes(write_buffer { buf.data(), buf.size() });
            expect(buf != byte_array<16> {});
        };
    };
};
