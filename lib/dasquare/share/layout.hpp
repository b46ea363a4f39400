#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "constants.hpp"

namespace dasquare::share {
    /*
     * Byte offsets of the fields of a share:
     * namespace | info | sequence length (first) | reserved (compact) | signer (first, v1 and v2) | fibre blob version (first, v2) | payload
     * The layout depends only on three flags and is computed once per share or builder.
     */
    struct layout_t {
        static constexpr size_t info_offset = namespace_size;
        static constexpr size_t sequence_len_offset = info_offset + share_info_bytes;

        bool compact = false;
        bool first = false;
        uint8_t version = 0;
        size_t reserved_offset = 0;
        size_t prefix_size = 0;
        size_t signer_offset = 0;
        size_t fibre_blob_version_offset = 0;
        size_t payload_offset = 0;

        static constexpr layout_t make(const bool compact, const uint8_t version, const bool first) noexcept
        {
            layout_t l {};
            l.compact = compact;
            l.first = first;
            l.version = version;
            l.reserved_offset = sequence_len_offset + (first ? sequence_len_bytes : 0);
            l.prefix_size = l.reserved_offset + (compact ? share_reserved_bytes : 0);
            l.signer_offset = l.prefix_size;
            l.fibre_blob_version_offset = l.signer_offset + (l.has_signer() ? signer_size : 0);
            l.payload_offset = l.fibre_blob_version_offset + (l.has_fibre_blob_version() ? fibre_blob_version_size : 0);
            return l;
        }

        constexpr bool has_signer() const noexcept
        {
            return first && requires_signer(version);
        }

        constexpr bool has_fibre_blob_version() const noexcept
        {
            return first && version == share_version_two;
        }

        constexpr size_t content_size() const noexcept
        {
            return share_size - payload_offset;
        }
    };

    static_assert(layout_t::make(true, share_version_zero, true).content_size() == first_compact_share_content_size);
    static_assert(layout_t::make(true, share_version_zero, false).content_size() == continuation_compact_share_content_size);
    static_assert(layout_t::make(false, share_version_zero, true).content_size() == first_sparse_share_content_size);
    static_assert(layout_t::make(false, share_version_one, true).content_size() == first_sparse_share_content_size_with_signer);
    static_assert(layout_t::make(false, share_version_one, false).content_size() == continuation_sparse_share_content_size);
    static_assert(layout_t::make(false, share_version_two, true).content_size() >= fibre_commitment_size);
}
