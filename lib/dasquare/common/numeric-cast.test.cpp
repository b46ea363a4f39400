/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "numeric-cast.hpp"

namespace {
    using namespace dasquare;
}

suite dasquare_common_numeric_cast_suite = [] {
    "dasquare::common::numeric_cast"_test = [] {
        expect_equal(uint32_t { 512 }, numeric_cast<uint32_t>(size_t { 512 }));
        expect_equal(uint8_t { 127 }, numeric_cast<uint8_t>(uint64_t { 127 }));
        expect_equal(int64_t { -1 }, numeric_cast<int64_t>(int8_t { -1 }));
        expect_equal(size_t { 16384 }, numeric_cast<size_t>(int64_t { 16384 }));
        expect(throws([&] { numeric_cast<uint8_t>(256); }));
        expect(throws([&] { numeric_cast<uint32_t>(uint64_t { 1 } << 32); }));
        expect(throws([&] { numeric_cast<size_t>(int64_t { -1 }); }));
        expect(throws([&] { numeric_cast<int8_t>(int64_t { -129 }); }));
    };
};
