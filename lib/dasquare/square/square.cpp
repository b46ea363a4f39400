/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/logger.hpp>
#include <dasquare/common/numeric-cast.hpp>
#include <dasquare/inclusion/rules.hpp>
#include <dasquare/share/errors.hpp>
#include <dasquare/share/padding.hpp>
#include <dasquare/share/parse.hpp>
#include <dasquare/share/range.hpp>
#include <dasquare/share/sequence.hpp>
#include <dasquare/tx/blob-tx.hpp>
#include <dasquare/tx/index-wrapper.hpp>
#include "builder.hpp"
#include "square.hpp"

namespace dasquare::square {
    size_t square_size(const size_t share_count)
    {
        return inclusion::blob_min_square_size(share_count);
    }

    size_t square_t::size() const
    {
        return square_size(_shares.size());
    }

    std::vector<uint8_vector> square_t::wrapped_pfbs() const
    {
        const auto r = share::get_share_range_for_namespace(_shares, share::pay_for_blob_namespace);
        if (r.is_empty())
            return {};
        return share::parse_txs(std::span { _shares }.subspan(r.start, r.size()));
    }

    bool square_t::is_empty() const
    {
        return *this == empty_square();
    }

    uint8_vector square_t::to_bytes() const
    {
        uint8_vector res {};
        res.reserve(_shares.size() * share::share_size);
        for (const auto &s: _shares)
            res << s.bytes();
        return res;
    }

    crypto::sha256::hash_t square_t::hash() const
    {
        return crypto::sha256::digest(to_bytes());
    }

    square_t empty_square()
    {
        return square_t { share::tail_padding_shares(1) };
    }

    square_t write_square(const share::compact_splitter_t &tx_writer, const share::compact_splitter_t &pfb_writer,
        const share::sparse_splitter_t &blob_writer, const size_t non_reserved_start, const size_t square_size)
    {
        const auto total_shares = square_size * square_size;
        const auto pfb_start = tx_writer.count();
        const auto padding_start = pfb_start + pfb_writer.count();
        if (non_reserved_start < padding_start) [[unlikely]]
            throw err_internal_t(fmt::format("the first blob index {} overlaps the pay-for-blob shares ending at {}", non_reserved_start, padding_start));
        const auto end_of_last_blob = non_reserved_start + blob_writer.count();
        if (total_shares < end_of_last_blob) [[unlikely]]
            throw err_internal_t(fmt::format("the blobs end at {} which exceeds a square of {} shares", end_of_last_blob, total_shares));

        share::share_list shares {};
        shares.reserve(total_shares);
        const auto append = [&](const share::share_list &src) {
            shares.insert(shares.end(), src.begin(), src.end());
        };
        append(tx_writer.export_shares());
        append(pfb_writer.export_shares());
        if (blob_writer.count() > 0) {
            append(share::reserved_padding_shares(non_reserved_start - padding_start));
            append(blob_writer.export_shares());
        }
        append(share::tail_padding_shares(total_shares - shares.size()));
        return square_t { std::move(shares) };
    }

    build_result_t build(const std::span<const uint8_vector> txs, const size_t max_square_size, const size_t subtree_root_threshold)
    {
        builder_t builder { max_square_size, subtree_root_threshold };
        std::vector<uint8_vector> normal_txs {};
        std::vector<uint8_vector> blob_txs {};
        for (const auto &tx: txs) {
            if (const auto btx = tx::blob_tx_t::try_decode(tx); btx) {
                if (builder.append_blob_tx(*btx))
                    blob_txs.emplace_back(tx);
            } else {
                if (builder.append_tx(tx))
                    normal_txs.emplace_back(tx);
            }
        }
        logger::debug("square build: admitted {} plain and {} blob transactions out of {}", normal_txs.size(), blob_txs.size(), txs.size());
        build_result_t res { builder.export_square().square, std::move(normal_txs) };
        res.txs.insert(res.txs.end(), std::make_move_iterator(blob_txs.begin()), std::make_move_iterator(blob_txs.end()));
        return res;
    }

    square_t construct(const std::span<const uint8_vector> txs, const size_t max_square_size, const size_t subtree_root_threshold)
    {
        auto builder = builder_t::from_txs(txs, max_square_size, subtree_root_threshold);
        return builder.export_square().square;
    }

    std::vector<uint8_vector> deconstruct(const square_t &sq, const pfb_decoder_t &decoder)
    {
        if (sq.is_empty())
            return {};
        const auto &shares = sq.shares();
        const auto tx_range = share::get_share_range_for_namespace(shares, share::tx_namespace);
        if (tx_range.start != 0) [[unlikely]]
            throw err_invalid_share_t(fmt::format("plain transactions must start at the first share but start at {}", tx_range.start));
        auto pfb_range = share::get_share_range_for_namespace(std::span { shares }.subspan(tx_range.end), share::pay_for_blob_namespace);
        auto txs = share::parse_txs(std::span { shares }.subspan(tx_range.start, tx_range.size()));
        if (pfb_range.is_empty())
            return txs;
        if (pfb_range.start != 0) [[unlikely]]
            throw err_invalid_share_t(fmt::format("pay-for-blob shares must follow the plain transactions but start {} shares later", pfb_range.start));
        pfb_range.add(tx_range.end);

        const auto wrapped = share::parse_txs(std::span { shares }.subspan(pfb_range.start, pfb_range.size()));
        txs.reserve(txs.size() + wrapped.size());
        for (const auto &wrapped_bytes: wrapped) {
            const auto wrapper = tx::index_wrapper_t::try_decode(wrapped_bytes);
            if (!wrapper) [[unlikely]]
                throw err_malformed_envelope_t("a pay-for-blob share contains a transaction that is not an index wrapper");
            if (wrapper->share_indexes.empty()) [[unlikely]]
                throw err_malformed_envelope_t("an index wrapper must point at least at one blob");
            const auto blob_sizes = decoder(wrapper->tx);
            if (blob_sizes.size() != wrapper->share_indexes.size()) [[unlikely]]
                throw err_malformed_envelope_t(fmt::format("the pay-for-blob transaction pays for {} blobs but the wrapper points at {}",
                    blob_sizes.size(), wrapper->share_indexes.size()));
            tx::blob_tx_t btx { wrapper->tx, {} };
            btx.blobs.reserve(blob_sizes.size());
            for (size_t i = 0; i < blob_sizes.size(); ++i) {
                const size_t start = wrapper->share_indexes[i];
                if (start >= shares.size()) [[unlikely]]
                    throw err_invalid_share_t(fmt::format("blob start index {} is outside of a square of {} shares", start, shares.size()));
                const auto version = shares[start].version();
                const auto seq_len = version == share::share_version_two ? numeric_cast<uint32_t>(share::fibre_commitment_size) : blob_sizes[i];
                const auto needed = share::sparse_shares_needed(seq_len, version);
                if (start + needed > shares.size()) [[unlikely]]
                    throw err_invalid_share_t(fmt::format("blob [{}, {}) is outside of a square of {} shares", start, start + needed, shares.size()));
                auto blobs = share::parse_blobs(std::span { shares }.subspan(start, needed));
                if (blobs.size() != 1) [[unlikely]]
                    throw err_invalid_share_t(fmt::format("expected exactly one blob at share {} but got {}", start, blobs.size()));
                btx.blobs.emplace_back(std::move(blobs.front()));
            }
            txs.emplace_back(btx.marshal());
        }
        return txs;
    }

    share::range_t tx_share_range(const std::span<const uint8_vector> txs, const size_t tx_index, const size_t max_square_size, const size_t subtree_root_threshold)
    {
        auto builder = builder_t::from_txs(txs, max_square_size, subtree_root_threshold);
        return builder.find_tx_share_range(tx_index);
    }

    share::range_t blob_share_range(const std::span<const uint8_vector> txs, const size_t tx_index, const size_t blob_index,
        const size_t max_square_size, const size_t subtree_root_threshold)
    {
        auto builder = builder_t::from_txs(txs, max_square_size, subtree_root_threshold);
        const auto start = builder.find_blob_starting_index(tx_index, blob_index);
        return { start, start + builder.blob_share_length(tx_index, blob_index) };
    }
}
