/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/codec/varint.hpp>
#include "constants.hpp"
#include "counter.hpp"

namespace dasquare::share {
    size_t delim_len(const uint64_t unit_len)
    {
        return codec::uvarint::size(unit_len);
    }

    size_t compact_counter_t::add(const size_t unit_len)
    {
        _last_shares = _shares;
        _last_remainder = _remainder;
        size_t data_len = unit_len + delim_len(unit_len);
        if (_shares == 0) {
            ++_shares;
            _remainder = first_compact_share_content_size;
        }
        if (data_len <= _remainder) {
            _remainder -= data_len;
            return _shares - _last_shares;
        }
        data_len -= _remainder;
        const auto new_shares = (data_len + continuation_compact_share_content_size - 1) / continuation_compact_share_content_size;
        _shares += new_shares;
        _remainder = new_shares * continuation_compact_share_content_size - data_len;
        return _shares - _last_shares;
    }

    void compact_counter_t::revert() noexcept
    {
        _shares = _last_shares;
        _remainder = _last_remainder;
    }
}
