#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/*
 * Blob placement rules: a blob of n shares starts at a multiple of its subtree width,
 * so that its commitment can be proven with a bounded number of subtree roots
 * regardless of where in the square it lands.
 */
namespace dasquare::inclusion {
    struct shares_used_t {
        size_t shares_used = 0;
        std::vector<uint32_t> indexes {};
    };

    // the smallest power of two >= v, 1 for v <= 1
    extern size_t round_up_power_of_two(size_t v);
    // the largest power of two <= v, v must be positive
    extern size_t round_down_power_of_two(size_t v);
    // the smallest multiple of v >= cursor, v must be positive
    extern size_t round_up_by_multiple_of(size_t cursor, size_t v);
    // the smallest square width that can hold share_count shares
    extern size_t blob_min_square_size(size_t share_count);
    extern size_t subtree_width(size_t share_count, size_t subtree_root_threshold);
    extern size_t next_share_index(size_t cursor, size_t blob_share_len, size_t subtree_root_threshold);
    // places blobs one after another starting from cursor and returns the occupied span including the padding
    extern shares_used_t blob_shares_used_non_interactive_defaults(size_t cursor, size_t subtree_root_threshold, std::span<const size_t> blob_share_lens);
    // the subtree sizes a blob of total_size shares is split into for its commitment
    extern std::vector<size_t> merkle_mountain_range_sizes(size_t total_size, size_t max_tree_size);

    constexpr bool is_power_of_two(const size_t v) noexcept
    {
        return v != 0 && (v & (v - 1)) == 0;
    }
}
