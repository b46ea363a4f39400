#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "share.hpp"

namespace dasquare::share {
    extern size_t compact_shares_needed(uint32_t sequence_len);
    // versions with a signer have less space in their first share
    extern size_t sparse_shares_needed(uint32_t sequence_len, uint8_t share_version=share_version_zero);

    // Consecutive shares of one namespace carrying one logical unit.
    struct sequence_t {
        namespace_t ns;
        share_list shares {};

        uint32_t sequence_len() const;
        // the payload of all shares truncated to the declared length
        uint8_vector raw_data() const;
        // throws err_invalid_sequence_length_t unless the declared length matches the number of shares
        void validate_sequence_len() const;
        bool is_padding() const;

        bool operator==(const sequence_t &o) const noexcept =default;
    };

    using sequence_list = std::vector<sequence_t>;
}
