/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "errors.hpp"
#include "sequence.hpp"

namespace dasquare::share {
    static size_t shares_needed(const uint32_t sequence_len, const size_t first_content_size, const size_t continuation_content_size)
    {
        if (sequence_len == 0)
            return 0;
        if (sequence_len <= first_content_size)
            return 1;
        const size_t remaining = sequence_len - first_content_size;
        return 1 + (remaining + continuation_content_size - 1) / continuation_content_size;
    }

    size_t compact_shares_needed(const uint32_t sequence_len)
    {
        return shares_needed(sequence_len, first_compact_share_content_size, continuation_compact_share_content_size);
    }

    size_t sparse_shares_needed(const uint32_t sequence_len, const uint8_t share_version)
    {
        const auto first = layout_t::make(false, share_version, true);
        return shares_needed(sequence_len, first.content_size(), continuation_sparse_share_content_size);
    }

    uint32_t sequence_t::sequence_len() const
    {
        if (shares.empty()) [[unlikely]]
            throw err_invalid_sequence_length_t(fmt::format("invalid sequence length because share sequence of {} has no shares", ns));
        return shares.front().sequence_len();
    }

    uint8_vector sequence_t::raw_data() const
    {
        const auto seq_len = sequence_len();
        uint8_vector data {};
        for (const auto &s: shares)
            data << s.raw_data();
        if (seq_len > data.size()) [[unlikely]]
            throw err_sequence_length_t(fmt::format("sequence length {} is greater than the number of bytes in the sequence {}", seq_len, data.size()));
        data.resize(seq_len);
        return data;
    }

    void sequence_t::validate_sequence_len() const
    {
        if (shares.empty()) [[unlikely]]
            throw err_invalid_sequence_length_t(fmt::format("invalid sequence length because share sequence of {} has no shares", ns));
        if (is_padding())
            return;
        const auto &first = shares.front();
        const auto needed = first.is_compact()
            ? compact_shares_needed(first.sequence_len())
            : sparse_shares_needed(first.sequence_len(), first.version());
        if (shares.size() != needed) [[unlikely]]
            throw err_invalid_sequence_length_t(fmt::format("share sequence of {} has {} shares but needed {} shares", ns, shares.size(), needed));
    }

    bool sequence_t::is_padding() const
    {
        return shares.size() == 1 && shares.front().is_padding();
    }
}
