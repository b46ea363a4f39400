#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdint>
#include <dasquare/common/bytes.hpp>

namespace dasquare::codec::uvarint {
    // little-endian base-128 groups with a continuation bit, the same format as protobuf varints
    static constexpr size_t max_size = 10;

    constexpr size_t size(uint64_t val) noexcept
    {
        size_t sz = 1;
        while (val >= 0x80) {
            val >>= 7;
            ++sz;
        }
        return sz;
    }

    inline void encode(uint8_vector &out, uint64_t val)
    {
        while (val >= 0x80) {
            out.emplace_back(static_cast<uint8_t>(val) | 0x80);
            val >>= 7;
        }
        out.emplace_back(static_cast<uint8_t>(val));
    }

    inline uint8_vector encode(const uint64_t val)
    {
        uint8_vector out {};
        out.reserve(size(val));
        encode(out, val);
        return out;
    }

    struct decoded_t {
        uint64_t value = 0;
        size_t size = 0;

        bool operator==(const decoded_t &o) const noexcept
        {
            return value == o.value && size == o.size;
        }
    };

    inline decoded_t decode(const buffer bytes)
    {
        uint64_t res = 0;
        unsigned shift = 0;
        for (size_t i = 0; i < bytes.size(); ++i) {
            const auto b = bytes[i];
            if (i == max_size - 1 && b > 1) [[unlikely]]
                throw error("uvarint: the value overflows 64 bits");
            res |= static_cast<uint64_t>(b & 0x7F) << shift;
            if (!(b & 0x80))
                return { res, i + 1 };
            shift += 7;
        }
        throw error(fmt::format("uvarint: the value is truncated after {} bytes", bytes.size()));
    }
}
