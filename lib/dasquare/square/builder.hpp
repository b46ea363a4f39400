#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <optional>
#include <span>
#include <dasquare/share/counter.hpp>
#include <dasquare/tx/blob-tx.hpp>
#include <dasquare/tx/index-wrapper.hpp>
#include "config.hpp"
#include "square.hpp"

namespace dasquare::square {
    struct element_t {
        share::blob_t blob;
        size_t pfb_index;
        size_t blob_index;
        size_t num_shares;
        // the worst-case alignment padding in front of the blob
        size_t max_padding;

        size_t max_share_offset() const noexcept
        {
            return num_shares + max_padding;
        }
    };

    struct export_t {
        square_t square;
        // plain transactions first, then blob transactions
        std::vector<share::range_t> tx_ranges;
    };

    /*
     * Admits transactions in priority order while keeping a worst-case estimate of the number of shares they need.
     * Admission is a counter update, the shares are materialized only by export_square.
     * Once exported, the builder is frozen.
     */
    struct builder_t {
        template<typename CFG=config_prod>
        static builder_t make()
        {
            return { CFG::max_square_size, CFG::subtree_root_threshold };
        }

        // blob transactions must follow all plain transactions and everything must fit
        static builder_t from_txs(std::span<const uint8_vector> txs, size_t max_square_size, size_t subtree_root_threshold);

        builder_t(size_t max_square_size, size_t subtree_root_threshold);

        // false when the transaction is empty or does not fit, the builder is unchanged then
        bool append_tx(buffer tx);
        // admits either all blobs of the transaction or none of them
        bool append_blob_tx(const tx::blob_tx_t &btx);
        void revert_last_tx();
        void revert_last_blob_tx();

        const export_t &export_square();

        share::range_t find_tx_share_range(size_t tx_index);
        // pfb_index is the index among all transactions, plain ones included
        size_t find_blob_starting_index(size_t pfb_index, size_t blob_index);
        size_t blob_share_length(size_t pfb_index, size_t blob_index) const;
        const tx::index_wrapper_t &get_wrapped_pfb(size_t tx_index);

        size_t current_size() const noexcept
        {
            return _current_size;
        }

        size_t max_square_size() const noexcept
        {
            return _max_square_size;
        }

        size_t subtree_root_threshold() const noexcept
        {
            return _subtree_root_threshold;
        }

        size_t num_txs() const noexcept
        {
            return _txs.size() + _pfbs.size();
        }

        size_t num_pfbs() const noexcept
        {
            return _pfbs.size();
        }

        bool is_empty() const noexcept
        {
            return _tx_counter.size() == 0 && _pfb_counter.size() == 0;
        }
    private:
        size_t _max_square_size;
        size_t _subtree_root_threshold;
        size_t _current_size = 0;
        std::vector<uint8_vector> _txs {};
        std::vector<tx::index_wrapper_t> _pfbs {};
        std::vector<element_t> _blobs {};
        share::compact_counter_t _tx_counter {};
        share::compact_counter_t _pfb_counter {};
        // counter states before the last successful append
        share::compact_counter_t _last_tx_counter {};
        share::compact_counter_t _last_pfb_counter {};
        size_t _last_tx_size_change = 0;
        size_t _last_blob_tx_size_change = 0;
        bool _tx_reverted = false;
        bool _blob_tx_reverted = false;
        std::optional<export_t> _exported {};

        bool _can_fit(size_t share_num) const noexcept;
        void _check_not_exported(std::string_view op) const;
        size_t _pfb_position(size_t pfb_index) const;
        std::vector<share::range_t> _tx_ranges() const;
    };
}
