#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <span>
#include "blob.hpp"
#include "sequence.hpp"

namespace dasquare::share {
    struct delimited_t {
        // the bytes following the delimiter
        buffer rest;
        uint64_t unit_len = 0;
    };

    extern delimited_t parse_delimiter(buffer raw_data);

    // the units of a compact share stream, the stream may start in the middle of a sequence
    extern std::vector<uint8_vector> parse_compact_shares(std::span<const share_t> shares);
    extern blob_list parse_sparse_shares(std::span<const share_t> shares);
    extern sequence_list parse_shares(std::span<const share_t> shares, bool ignore_padding);

    inline std::vector<uint8_vector> parse_txs(const std::span<const share_t> shares)
    {
        return parse_compact_shares(shares);
    }

    inline blob_list parse_blobs(const std::span<const share_t> shares)
    {
        return parse_sparse_shares(shares);
    }
}
