#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <optional>
#include <string_view>
#include <dasquare/share/blob.hpp>

namespace dasquare::tx {
    static constexpr std::string_view blob_tx_type_id { "BLOB" };

    // A transaction with the blobs it pays for.
    struct blob_tx_t {
        uint8_vector tx;
        share::blob_list blobs;

        /*
         * Returns nullopt when the bytes are not a blob transaction.
         * Throws err_malformed_envelope_t when they claim to be one but carry no blobs or an invalid blob.
         */
        static std::optional<blob_tx_t> try_decode(buffer bytes);

        // requires at least one blob
        uint8_vector marshal() const;

        bool operator==(const blob_tx_t &o) const noexcept
        {
            return tx == o.tx && blobs == o.blobs;
        }
    };
}
