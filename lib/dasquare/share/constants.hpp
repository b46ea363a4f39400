#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <cstddef>
#include <cstdint>

namespace dasquare::share {
    static constexpr size_t share_size = 512;

    static constexpr size_t namespace_version_size = 1;
    static constexpr size_t namespace_id_size = 28;
    static constexpr size_t namespace_size = namespace_version_size + namespace_id_size;
    static constexpr size_t namespace_version_zero_prefix_size = 18;
    static constexpr size_t namespace_version_zero_id_size = namespace_id_size - namespace_version_zero_prefix_size;
    static constexpr uint8_t namespace_version_zero = 0;
    static constexpr uint8_t namespace_version_max = 0xFF;

    static constexpr size_t share_info_bytes = 1;
    static constexpr size_t sequence_len_bytes = 4;
    static constexpr size_t share_reserved_bytes = 4;
    static constexpr size_t signer_size = 20;
    static constexpr size_t fibre_blob_version_size = 4;
    static constexpr size_t fibre_commitment_size = 32;

    static constexpr uint8_t share_version_zero = 0;
    static constexpr uint8_t share_version_one = 1;
    static constexpr uint8_t share_version_two = 2;
    static constexpr uint8_t default_share_version = share_version_zero;
    static constexpr uint8_t max_share_version = 127;
    static constexpr std::array<uint8_t, 3> supported_share_versions { share_version_zero, share_version_one, share_version_two };

    static constexpr size_t first_compact_share_content_size = share_size - namespace_size - share_info_bytes - sequence_len_bytes - share_reserved_bytes;
    static constexpr size_t continuation_compact_share_content_size = share_size - namespace_size - share_info_bytes - share_reserved_bytes;
    static constexpr size_t first_sparse_share_content_size = share_size - namespace_size - share_info_bytes - sequence_len_bytes;
    static constexpr size_t first_sparse_share_content_size_with_signer = first_sparse_share_content_size - signer_size;
    static constexpr size_t continuation_sparse_share_content_size = share_size - namespace_size - share_info_bytes;

    static constexpr size_t min_square_size = 1;
    static constexpr size_t min_share_count = min_square_size * min_square_size;

    static_assert(first_compact_share_content_size == 474);
    static_assert(continuation_compact_share_content_size == 478);
    static_assert(first_sparse_share_content_size == 478);
    static_assert(first_sparse_share_content_size_with_signer == 458);
    static_assert(continuation_sparse_share_content_size == 482);

    constexpr bool is_supported_share_version(const uint8_t version) noexcept
    {
        for (const auto v: supported_share_versions) {
            if (v == version)
                return true;
        }
        return false;
    }

    constexpr bool requires_signer(const uint8_t share_version) noexcept
    {
        return share_version == share_version_one || share_version == share_version_two;
    }
}
