#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstddef>
#include <cstdint>

namespace dasquare::share {
    // the number of bytes of the length delimiter of a unit of the given size
    extern size_t delim_len(uint64_t unit_len);

    /*
     * Mirrors the share arithmetic of compact_splitter_t without materializing any bytes.
     * For every prefix of writes size() equals the splitter's count().
     */
    struct compact_counter_t {
        // accounts for a unit of unit_len bytes and returns the number of newly used shares
        size_t add(size_t unit_len);
        // undoes the last add, a single step only
        void revert() noexcept;

        size_t size() const noexcept
        {
            return _shares;
        }

        // free bytes in the last used share
        size_t remainder() const noexcept
        {
            return _remainder;
        }
    private:
        size_t _shares = 0;
        size_t _remainder = 0;
        size_t _last_shares = 0;
        size_t _last_remainder = 0;
    };
}
