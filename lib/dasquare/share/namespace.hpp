#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <compare>
#include <dasquare/common/bytes.hpp>
#include "constants.hpp"

namespace dasquare::share {
    // version byte followed by a 28-byte id, ordered byte-wise
    struct namespace_t {
        using bytes_t = std::array<uint8_t, namespace_size>;

        // validated constructors
        static namespace_t make(uint8_t version, buffer id);
        static namespace_t from_bytes(buffer bytes);
        // left-pads a sub-id of at most 10 bytes into a version-zero namespace
        static namespace_t make_v0(buffer sub_id);

        static constexpr namespace_t primary_reserved(const uint8_t last_byte) noexcept
        {
            bytes_t bytes {};
            bytes[0] = namespace_version_zero;
            bytes[namespace_size - 1] = last_byte;
            return namespace_t { bytes };
        }

        static constexpr namespace_t secondary_reserved(const uint8_t last_byte) noexcept
        {
            bytes_t bytes {};
            for (auto &b: bytes)
                b = 0xFF;
            bytes[0] = namespace_version_max;
            bytes[namespace_size - 1] = last_byte;
            return namespace_t { bytes };
        }

        constexpr namespace_t() noexcept =default;

        constexpr uint8_t version() const noexcept
        {
            return _bytes[0];
        }

        buffer id() const noexcept
        {
            return { _bytes.data() + namespace_version_size, namespace_id_size };
        }

        buffer bytes() const noexcept
        {
            return { _bytes.data(), _bytes.size() };
        }

        // checks the version and the id prefix
        void validate() const;
        // additionally rejects the parity and tail padding namespaces
        void validate_for_data() const;
        // additionally rejects reserved namespaces and non-zero namespace versions
        void validate_for_blob() const;

        constexpr bool is_primary_reserved() const noexcept;
        constexpr bool is_secondary_reserved() const noexcept;
        constexpr bool is_reserved() const noexcept;
        constexpr bool is_usable() const noexcept;
        constexpr bool is_parity_shares() const noexcept;
        constexpr bool is_tail_padding() const noexcept;
        constexpr bool is_primary_reserved_padding() const noexcept;
        constexpr bool is_tx() const noexcept;
        constexpr bool is_pay_for_blob() const noexcept;
        constexpr bool is_pay_for_fibre() const noexcept;
        // tx and pay-for-blob content is packed into compact shares
        constexpr bool is_compact() const noexcept;

        // big-endian addition over all 29 bytes; throws on overflow and underflow
        namespace_t add(int64_t val) const;

        constexpr std::strong_ordering operator<=>(const namespace_t &o) const noexcept =default;
        constexpr bool operator==(const namespace_t &o) const noexcept =default;
    private:
        bytes_t _bytes {};

        explicit constexpr namespace_t(const bytes_t &bytes) noexcept:
            _bytes { bytes }
        {
        }
    };

    inline constexpr namespace_t tx_namespace = namespace_t::primary_reserved(0x01);
    inline constexpr namespace_t intermediate_state_roots_namespace = namespace_t::primary_reserved(0x02);
    inline constexpr namespace_t pay_for_blob_namespace = namespace_t::primary_reserved(0x04);
    inline constexpr namespace_t pay_for_fibre_namespace = namespace_t::primary_reserved(0x05);
    inline constexpr namespace_t primary_reserved_padding_namespace = namespace_t::primary_reserved(0xFF);
    inline constexpr namespace_t max_primary_reserved_namespace = namespace_t::primary_reserved(0xFF);
    inline constexpr namespace_t min_secondary_reserved_namespace = namespace_t::secondary_reserved(0x00);
    inline constexpr namespace_t tail_padding_namespace = namespace_t::secondary_reserved(0xFE);
    inline constexpr namespace_t parity_shares_namespace = namespace_t::secondary_reserved(0xFF);

    constexpr bool namespace_t::is_primary_reserved() const noexcept
    {
        return *this <= max_primary_reserved_namespace;
    }

    constexpr bool namespace_t::is_secondary_reserved() const noexcept
    {
        return *this >= min_secondary_reserved_namespace;
    }

    constexpr bool namespace_t::is_reserved() const noexcept
    {
        return is_primary_reserved() || is_secondary_reserved();
    }

    constexpr bool namespace_t::is_usable() const noexcept
    {
        return !is_parity_shares() && !is_tail_padding();
    }

    constexpr bool namespace_t::is_parity_shares() const noexcept
    {
        return *this == parity_shares_namespace;
    }

    constexpr bool namespace_t::is_tail_padding() const noexcept
    {
        return *this == tail_padding_namespace;
    }

    constexpr bool namespace_t::is_primary_reserved_padding() const noexcept
    {
        return *this == primary_reserved_padding_namespace;
    }

    constexpr bool namespace_t::is_tx() const noexcept
    {
        return *this == tx_namespace;
    }

    constexpr bool namespace_t::is_pay_for_blob() const noexcept
    {
        return *this == pay_for_blob_namespace;
    }

    constexpr bool namespace_t::is_pay_for_fibre() const noexcept
    {
        return *this == pay_for_fibre_namespace;
    }

    constexpr bool namespace_t::is_compact() const noexcept
    {
        return is_tx() || is_pay_for_blob();
    }

    static_assert(tx_namespace < pay_for_blob_namespace);
    static_assert(pay_for_blob_namespace.is_primary_reserved());
    static_assert(tail_padding_namespace.is_secondary_reserved());
    static_assert(!parity_shares_namespace.is_usable());
}

namespace fmt {
    template<>
    struct formatter<dasquare::share::namespace_t>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const dasquare::share::namespace_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::span<const uint8_t>>::format(v.bytes(), ctx);
        }
    };
}
