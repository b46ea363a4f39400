#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <optional>
#include <string_view>
#include <vector>
#include <dasquare/common/bytes.hpp>

namespace dasquare::tx {
    static constexpr std::string_view index_wrapper_type_id { "INDX" };

    // A pay-for-blob transaction annotated with the start share index of each of its blobs.
    struct index_wrapper_t {
        uint8_vector tx;
        std::vector<uint32_t> share_indexes;

        // nullopt unless the bytes are a well-formed index wrapper
        static std::optional<index_wrapper_t> try_decode(buffer bytes);

        uint8_vector marshal() const;
        // the exact size of marshal() without serializing
        size_t encoded_size() const;

        bool operator==(const index_wrapper_t &o) const noexcept =default;
    };
}
