/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <optional>
#include "range.hpp"

namespace dasquare::share {
    range_t get_share_range_for_namespace(const std::span<const share_t> shares, const namespace_t &ns)
    {
        if (shares.empty())
            return {};
        if (ns < shares.front().ns() || ns > shares.back().ns())
            return {};
        std::optional<size_t> start {};
        for (size_t i = 0; i < shares.size(); ++i) {
            const auto share_ns = shares[i].ns();
            if (share_ns > ns && start)
                return { *start, i };
            if (share_ns == ns && !start)
                start = i;
        }
        if (!start)
            return {};
        return { *start, shares.size() };
    }
}
