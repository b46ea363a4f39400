#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "share.hpp"

namespace dasquare::share {
    // a sequence start share with a zero sequence length and a zero-filled payload
    extern share_t namespace_padding_share(const namespace_t &ns, uint8_t share_version);
    extern share_list namespace_padding_shares(const namespace_t &ns, uint8_t share_version, size_t count);
    // fills the gap between the pay-for-blob shares and the first blob
    extern share_t reserved_padding_share();
    extern share_list reserved_padding_shares(size_t count);
    // fills the square after the last blob
    extern share_t tail_padding_share();
    extern share_list tail_padding_shares(size_t count);
}
