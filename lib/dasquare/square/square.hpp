#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <functional>
#include <span>
#include <dasquare/crypto/sha256.hpp>
#include <dasquare/share/compact-splitter.hpp>
#include <dasquare/share/sparse-splitter.hpp>

namespace dasquare::square {
    // The shares of a data square in row-major order.
    struct square_t {
        square_t() =default;

        explicit square_t(share::share_list shares):
            _shares { std::move(shares) }
        {
        }

        const share::share_list &shares() const noexcept
        {
            return _shares;
        }

        size_t share_count() const noexcept
        {
            return _shares.size();
        }

        // the width of the square
        size_t size() const;
        // the pay-for-blob wrappers, empty when there are none
        std::vector<uint8_vector> wrapped_pfbs() const;
        bool is_empty() const;
        uint8_vector to_bytes() const;
        crypto::sha256::hash_t hash() const;

        bool operator==(const square_t &o) const noexcept =default;
    private:
        share::share_list _shares {};
    };

    // the width of the smallest square with at least share_count shares
    extern size_t square_size(size_t share_count);
    // a single tail padding share
    extern square_t empty_square();
    /*
     * Lays out the plain transactions, the pay-for-blob wrappers, the reserved padding, the blobs and the tail padding.
     * Blobs start at non_reserved_start and the square has square_size * square_size shares.
     */
    extern square_t write_square(const share::compact_splitter_t &tx_writer, const share::compact_splitter_t &pfb_writer,
        const share::sparse_splitter_t &blob_writer, size_t non_reserved_start, size_t square_size);

    struct build_result_t {
        square_t square;
        // the transactions that made it into the square: plain ones first, then blob transactions
        std::vector<uint8_vector> txs;
    };

    // returns the blob sizes a pay-for-blob transaction pays for
    using pfb_decoder_t = std::function<std::vector<uint32_t>(buffer)>;

    // admits transactions in priority order skipping the ones that do not fit
    extern build_result_t build(std::span<const uint8_vector> txs, size_t max_square_size, size_t subtree_root_threshold);
    // all transactions must fit and blob transactions must follow all plain transactions
    extern square_t construct(std::span<const uint8_vector> txs, size_t max_square_size, size_t subtree_root_threshold);
    // recovers the transactions of a square, blob transactions are reassembled from the blobs they point at
    extern std::vector<uint8_vector> deconstruct(const square_t &sq, const pfb_decoder_t &decoder);
    // end-exclusive share ranges
    extern share::range_t tx_share_range(std::span<const uint8_vector> txs, size_t tx_index, size_t max_square_size, size_t subtree_root_threshold);
    extern share::range_t blob_share_range(std::span<const uint8_vector> txs, size_t tx_index, size_t blob_index, size_t max_square_size, size_t subtree_root_threshold);
}
