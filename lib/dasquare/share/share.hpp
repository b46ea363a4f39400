#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <span>
#include <vector>
#include <dasquare/common/bytes.hpp>
#include "info-byte.hpp"
#include "layout.hpp"
#include "namespace.hpp"

namespace dasquare::share {
    using reserved_bytes_t = byte_array<share_reserved_bytes>;

    // the offset of the first unit starting in a compact share, must be less than share_size
    extern reserved_bytes_t make_reserved_bytes(uint32_t byte_index);
    extern uint32_t parse_reserved_bytes(buffer bytes);

    // A fixed-size unit of square storage. All fields are slices of the underlying bytes.
    struct share_t {
        using bytes_t = byte_array<share_size>;

        // validates the size and the namespace
        explicit share_t(buffer bytes);

        namespace_t ns() const
        {
            return _ns;
        }

        info_byte_t info() const noexcept
        {
            return info_byte_t { _bytes[layout_t::info_offset] };
        }

        uint8_t version() const noexcept
        {
            return info().version();
        }

        bool is_sequence_start() const noexcept
        {
            return info().is_sequence_start();
        }

        bool is_compact() const noexcept
        {
            return _ns.is_compact();
        }

        layout_t layout() const noexcept
        {
            return layout_t::make(is_compact(), version(), is_sequence_start());
        }

        void check_version_supported() const;

        // zero for continuation shares
        uint32_t sequence_len() const;
        // empty unless this is the first share of a version that requires a signer
        buffer signer() const;
        // only available on the first share of a version two sequence
        uint32_t fibre_blob_version() const;
        // compact shares only: zero means that no unit starts in this share
        uint32_t reserved_offset() const;

        bool is_padding() const;
        bool is_namespace_padding() const;
        bool is_tail_padding() const noexcept;
        bool is_primary_reserved_padding() const noexcept;

        // the payload after all header fields
        buffer raw_data() const;
        // for compact shares the payload starting at the first unit that begins in this share,
        // empty when no unit begins here
        buffer raw_data_using_reserved() const;

        buffer bytes() const noexcept
        {
            return _bytes;
        }

        bool operator==(const share_t &o) const noexcept
        {
            return _bytes == o._bytes;
        }
    private:
        bytes_t _bytes;
        namespace_t _ns;
    };

    using share_list = std::vector<share_t>;

    extern share_list shares_from_bytes(std::span<const uint8_vector> bytes);
    extern std::vector<uint8_vector> shares_to_bytes(std::span<const share_t> shares);
}

namespace fmt {
    template<>
    struct formatter<dasquare::share::share_t>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const dasquare::share::share_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::span<const uint8_t>>::format(v.bytes(), ctx);
        }
    };
}
