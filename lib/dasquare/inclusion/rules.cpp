/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <bit>
#include <limits>
#include <dasquare/common/numeric-cast.hpp>
#include <dasquare/share/errors.hpp>
#include "rules.hpp"

namespace dasquare::inclusion {
    static size_t ceil_sqrt(const size_t v)
    {
        if (v == 0)
            return 0;
        size_t lo = 1;
        size_t hi = std::min(v, size_t { 1 } << 32);
        while (lo < hi) {
            const auto mid = lo + (hi - lo) / 2;
            if (mid * mid >= v)
                hi = mid;
            else
                lo = mid + 1;
        }
        return lo;
    }

    size_t round_up_power_of_two(const size_t v)
    {
        if (v <= 1)
            return 1;
        if (v > (size_t { 1 } << (std::numeric_limits<size_t>::digits - 1))) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("can not round up {}: the result overflows", v));
        return std::bit_ceil(v);
    }

    size_t round_down_power_of_two(const size_t v)
    {
        if (v == 0) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("input {} must be positive", v));
        return std::bit_floor(v);
    }

    size_t round_up_by_multiple_of(const size_t cursor, const size_t v)
    {
        if (v == 0) [[unlikely]]
            throw err_invalid_argument_t("v can not be 0");
        if (cursor % v == 0)
            return cursor;
        return (cursor / v + 1) * v;
    }

    size_t blob_min_square_size(const size_t share_count)
    {
        return round_up_power_of_two(ceil_sqrt(share_count));
    }

    size_t subtree_width(const size_t share_count, const size_t subtree_root_threshold)
    {
        if (subtree_root_threshold == 0) [[unlikely]]
            throw err_invalid_argument_t("the subtree root threshold can not be 0");
        auto s = share_count / subtree_root_threshold;
        if (share_count % subtree_root_threshold != 0)
            ++s;
        s = round_up_power_of_two(s);
        return std::min(s, blob_min_square_size(share_count));
    }

    size_t next_share_index(const size_t cursor, const size_t blob_share_len, const size_t subtree_root_threshold)
    {
        return round_up_by_multiple_of(cursor, subtree_width(blob_share_len, subtree_root_threshold));
    }

    shares_used_t blob_shares_used_non_interactive_defaults(const size_t cursor, const size_t subtree_root_threshold, const std::span<const size_t> blob_share_lens)
    {
        shares_used_t res {};
        res.indexes.reserve(blob_share_lens.size());
        auto pos = cursor;
        for (const auto len: blob_share_lens) {
            pos = next_share_index(pos, len, subtree_root_threshold);
            res.indexes.emplace_back(numeric_cast<uint32_t>(pos));
            pos += len;
        }
        res.shares_used = pos - cursor;
        return res;
    }

    std::vector<size_t> merkle_mountain_range_sizes(size_t total_size, const size_t max_tree_size)
    {
        if (max_tree_size == 0) [[unlikely]]
            throw err_invalid_argument_t("the maximum tree size can not be 0");
        std::vector<size_t> sizes {};
        while (total_size != 0) {
            const auto tree_size = total_size >= max_tree_size ? max_tree_size : round_down_power_of_two(total_size);
            sizes.emplace_back(tree_size);
            total_size -= tree_size;
        }
        return sizes;
    }
}
