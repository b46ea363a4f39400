#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/format.hpp>
#include "constants.hpp"
#include "errors.hpp"

namespace dasquare::share {
    // bits 1-7: share version, bit 0: sequence start
    struct info_byte_t {
        static info_byte_t make(const uint8_t version, const bool is_sequence_start)
        {
            if (version > max_share_version) [[unlikely]]
                throw err_unsupported_share_version_t(fmt::format("version {} must be less than or equal to {}", version, max_share_version));
            return info_byte_t { static_cast<uint8_t>((version << 1) | (is_sequence_start ? 1 : 0)) };
        }

        explicit constexpr info_byte_t(const uint8_t raw) noexcept:
            _raw { raw }
        {
        }

        constexpr uint8_t version() const noexcept
        {
            return _raw >> 1;
        }

        constexpr bool is_sequence_start() const noexcept
        {
            return _raw & 1;
        }

        constexpr uint8_t raw() const noexcept
        {
            return _raw;
        }

        constexpr bool operator==(const info_byte_t &o) const noexcept =default;
    private:
        uint8_t _raw;
    };
}
