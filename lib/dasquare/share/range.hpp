#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <span>
#include "share.hpp"

namespace dasquare::share {
    // [start, end) share indexes
    struct range_t {
        size_t start = 0;
        size_t end = 0;

        bool is_empty() const noexcept
        {
            return start == 0 && end == 0;
        }

        size_t size() const noexcept
        {
            return end - start;
        }

        void add(const size_t offset) noexcept
        {
            start += offset;
            end += offset;
        }

        bool operator==(const range_t &o) const noexcept =default;
    };

    // the range of shares of the given namespace, the shares must be sorted by namespace
    extern range_t get_share_range_for_namespace(std::span<const share_t> shares, const namespace_t &ns);
}

namespace fmt {
    template<>
    struct formatter<dasquare::share::range_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const dasquare::share::range_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "[{}, {})", v.start, v.end);
        }
    };
}
