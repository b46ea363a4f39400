#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstddef>
#include <dasquare/inclusion/rules.hpp>

namespace dasquare::square {
    // Constants that are the same in all configurations
    struct config_base {
        static constexpr size_t square_size_upper_bound = 128;
        static constexpr size_t subtree_root_threshold = 64;
        // pay-for-blob wrappers are sized as if every blob started at this index
        static constexpr size_t worst_case_share_index = square_size_upper_bound * square_size_upper_bound;
        static_assert(worst_case_share_index == 16'384U);
    };

    struct config_prod: config_base {
        static constexpr size_t max_square_size = 64;
        static_assert(inclusion::is_power_of_two(max_square_size));
        static_assert(max_square_size <= square_size_upper_bound);
    };

    struct config_tiny: config_prod {
        static constexpr size_t max_square_size = 8;
        static_assert(inclusion::is_power_of_two(max_square_size));
    };
}
