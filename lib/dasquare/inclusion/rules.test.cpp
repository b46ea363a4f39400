/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/test.hpp>
#include <dasquare/share/errors.hpp>
#include "rules.hpp"

namespace {
    using namespace dasquare;
    using namespace dasquare::inclusion;

    static constexpr size_t threshold = 64;
}

suite dasquare_inclusion_rules_suite = [] {
    "dasquare::inclusion::rules"_test = [] {
        "blob shares used"_test = [] {
            struct test_case {
                size_t cursor;
                size_t expected;
                std::vector<size_t> lens;
                std::vector<uint32_t> indexes;
            };
            const std::vector<test_case> cases {
                { 2, 1, { 1 }, { 2 } },
                { 3, 6, { 3, 3 }, { 3, 6 } },
                { 0, 8, { 8 }, { 0 } },
                { 1, 6, { 3, 3 }, { 1, 4 } },
                { 3, 12, { 5, 7 }, { 3, 8 } },
                { 0, 20, { 5, 5, 5, 5 }, { 0, 5, 10, 15 } },
                { 0, 10, { 10 }, { 0 } },
                { 1, 20, { 10, 10 }, { 1, 11 } },
                { 0, 1000, { 1000 }, { 0 } },
                { 0, 129, { 129 }, { 0 } },
                { 1, 385, { 128, 128, 128 }, { 2, 130, 258 } },
                { 1024, 32, { 32 }, { 1024 } }
            };
            for (const auto &tc: cases) {
                const auto res = blob_shares_used_non_interactive_defaults(tc.cursor, threshold, tc.lens);
                expect_equal(tc.expected, res.shares_used, fmt::format("cursor {}", tc.cursor));
                expect(tc.indexes == res.indexes) << fmt::format("cursor {}", tc.cursor);
            }
        };
        "next share index"_test = [] {
            struct test_case {
                size_t cursor;
                size_t blob_len;
                size_t expected;
            };
            const std::vector<test_case> cases {
                { 0, 4, 0 },
                { 1, 2, 1 },
                { 3, 4, 3 },
                { 3, 5, 3 },
                { 1, 12, 1 },
                { 10291, 1, 10291 },
                { 11, 11, 11 },
                { 11, threshold, 11 },
                { 64, threshold + 1, 64 },
                { 65, threshold + 1, 66 },
                { 1, 16256, 128 },
                { 1, 8192, 128 },
                { 1, 4096, 64 },
                { 1, 8193, 128 }
            };
            for (const auto &tc: cases) {
                const auto idx = next_share_index(tc.cursor, tc.blob_len, threshold);
                expect_equal(tc.expected, idx, fmt::format("cursor {} len {}", tc.cursor, tc.blob_len));
                expect(idx >= tc.cursor);
                expect_equal(size_t { 0 }, idx % subtree_width(tc.blob_len, threshold));
            }
        };
        "two blobs in a square of size 8"_test = [] {
            // the first blob occupies shares [0, 3), the second one starts at the next multiple of its width
            const std::vector<size_t> lens { 3, 10 };
            const auto res = blob_shares_used_non_interactive_defaults(0, threshold, lens);
            expect_equal(size_t { 4 }, blob_min_square_size(lens[1]));
            expect_equal(size_t { 1 }, subtree_width(lens[1], threshold));
            expect_equal(uint32_t { 3 }, res.indexes.at(1));
            const std::vector<size_t> small_threshold_lens { 3, 10 };
            const auto res2 = blob_shares_used_non_interactive_defaults(0, 4, small_threshold_lens);
            expect_equal(size_t { 4 }, subtree_width(10, 4));
            expect_equal(uint32_t { 4 }, res2.indexes.at(1));
            expect_equal(size_t { 14 }, res2.shares_used);
        };
        "round up by multiple of"_test = [] {
            expect_equal(size_t { 2 }, round_up_by_multiple_of(1, 2));
            expect_equal(size_t { 2 }, round_up_by_multiple_of(2, 2));
            expect_equal(size_t { 0 }, round_up_by_multiple_of(0, 2));
            expect_equal(size_t { 6 }, round_up_by_multiple_of(5, 2));
            expect_equal(size_t { 16 }, round_up_by_multiple_of(8, 16));
            expect_equal(size_t { 33 }, round_up_by_multiple_of(33, 1));
            expect_equal(size_t { 32 }, round_up_by_multiple_of(32, 16));
            expect_equal(size_t { 48 }, round_up_by_multiple_of(33, 16));
            expect(throws<err_invalid_argument_t>([] { round_up_by_multiple_of(1, 0); }));
        };
        "powers of two"_test = [] {
            expect_equal(size_t { 1 }, round_up_power_of_two(0));
            expect_equal(size_t { 1 }, round_up_power_of_two(1));
            expect_equal(size_t { 2 }, round_up_power_of_two(2));
            expect_equal(size_t { 4 }, round_up_power_of_two(3));
            expect_equal(size_t { 128 }, round_up_power_of_two(127));
            expect_equal(size_t { 1 }, round_down_power_of_two(1));
            expect_equal(size_t { 2 }, round_down_power_of_two(3));
            expect_equal(size_t { 64 }, round_down_power_of_two(127));
            expect(throws<err_invalid_argument_t>([] { round_down_power_of_two(0); }));
            expect(is_power_of_two(64));
            expect(!is_power_of_two(0));
            expect(!is_power_of_two(6));
        };
        "blob min square size"_test = [] {
            expect_equal(size_t { 1 }, blob_min_square_size(0));
            expect_equal(size_t { 1 }, blob_min_square_size(1));
            expect_equal(size_t { 2 }, blob_min_square_size(2));
            expect_equal(size_t { 2 }, blob_min_square_size(4));
            expect_equal(size_t { 4 }, blob_min_square_size(5));
            expect_equal(size_t { 4 }, blob_min_square_size(16));
            expect_equal(size_t { 8 }, blob_min_square_size(17));
            expect_equal(size_t { 128 }, blob_min_square_size(16384));
        };
        "subtree width"_test = [] {
            expect(throws<err_invalid_argument_t>([] { subtree_width(1, 0); }));
            expect_equal(size_t { 1 }, subtree_width(0, threshold));
            expect_equal(size_t { 1 }, subtree_width(threshold, threshold));
            expect_equal(size_t { 2 }, subtree_width(threshold + 1, threshold));
            expect_equal(size_t { 128 }, subtree_width(16384, threshold));
            for (size_t t = 1; t <= 128; t *= 2) {
                for (size_t n = 0; n <= 4096; n += 7)
                    expect(subtree_width(n, t) <= blob_min_square_size(n)) << fmt::format("n {} t {}", n, t);
            }
        };
        "merkle mountain range"_test = [] {
            expect(std::vector<size_t> { 4, 4, 2, 1 } == merkle_mountain_range_sizes(11, 4));
            expect(std::vector<size_t> { 2, 1 } == merkle_mountain_range_sizes(3, 8));
            expect(merkle_mountain_range_sizes(0, 4).empty());
            expect(throws<err_invalid_argument_t>([] { merkle_mountain_range_sizes(3, 0); }));
        };
    };
};
