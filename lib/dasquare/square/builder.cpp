/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <dasquare/common/logger.hpp>
#include <dasquare/common/numeric-cast.hpp>
#include <dasquare/inclusion/rules.hpp>
#include <dasquare/share/errors.hpp>
#include "builder.hpp"

namespace dasquare::square {
    builder_t builder_t::from_txs(const std::span<const uint8_vector> txs, const size_t max_square_size, const size_t subtree_root_threshold)
    {
        builder_t builder { max_square_size, subtree_root_threshold };
        bool seen_blob_tx = false;
        for (size_t i = 0; i < txs.size(); ++i) {
            if (const auto btx = tx::blob_tx_t::try_decode(txs[i]); btx) {
                seen_blob_tx = true;
                if (!builder.append_blob_tx(*btx)) [[unlikely]]
                    throw err_invalid_argument_t(fmt::format("not enough space to append blob tx #{}", i));
            } else {
                if (txs[i].empty()) [[unlikely]]
                    throw err_invalid_argument_t(fmt::format("tx #{} is empty", i));
                if (seen_blob_tx) [[unlikely]]
                    throw err_invalid_argument_t(fmt::format("plain tx #{} follows a blob tx", i));
                if (!builder.append_tx(txs[i])) [[unlikely]]
                    throw err_invalid_argument_t(fmt::format("not enough space to append tx #{}", i));
            }
        }
        return builder;
    }

    builder_t::builder_t(const size_t max_square_size, const size_t subtree_root_threshold):
        _max_square_size { max_square_size },
        _subtree_root_threshold { subtree_root_threshold }
    {
        if (!inclusion::is_power_of_two(max_square_size)) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("max square size must be a positive power of two but got {}", max_square_size));
        if (max_square_size > config_base::square_size_upper_bound) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("max square size {} exceeds the upper bound of {}", max_square_size, config_base::square_size_upper_bound));
        if (subtree_root_threshold == 0) [[unlikely]]
            throw err_invalid_argument_t("subtree root threshold must be positive");
    }

    bool builder_t::append_tx(const buffer tx)
    {
        _check_not_exported("append a tx");
        if (tx.empty()) {
            logger::debug("square builder: refused an empty tx");
            return false;
        }
        const auto counter_before = _tx_counter;
        const auto diff = _tx_counter.add(tx.size());
        if (!_can_fit(diff)) {
            _tx_counter = counter_before;
            logger::debug("square builder: a tx of {} bytes needs {} more shares but only {} of {} are free",
                tx.size(), diff, _max_square_size * _max_square_size - _current_size, _max_square_size * _max_square_size);
            return false;
        }
        _txs.emplace_back(tx);
        _current_size += diff;
        _last_tx_size_change = diff;
        _last_tx_counter = counter_before;
        _tx_reverted = false;
        return true;
    }

    bool builder_t::append_blob_tx(const tx::blob_tx_t &btx)
    {
        _check_not_exported("append a blob tx");
        if (btx.blobs.empty()) [[unlikely]]
            throw err_invalid_argument_t("a blob tx must carry at least one blob");
        // the real share indexes are known only at export time, so the wrapper is sized for the worst case
        tx::index_wrapper_t iw { btx.tx, std::vector<uint32_t>(btx.blobs.size(), numeric_cast<uint32_t>(config_base::worst_case_share_index)) };
        const auto counter_before = _pfb_counter;
        const auto pfb_diff = _pfb_counter.add(iw.encoded_size());
        auto required = pfb_diff;
        std::vector<element_t> elements {};
        elements.reserve(btx.blobs.size());
        for (size_t i = 0; i < btx.blobs.size(); ++i) {
            const auto &blob = btx.blobs[i];
            const auto num_shares = blob.share_count();
            const auto max_padding = inclusion::subtree_width(num_shares, _subtree_root_threshold) - 1;
            elements.emplace_back(element_t { blob, _pfbs.size(), i, num_shares, max_padding });
            required += elements.back().max_share_offset();
        }
        if (!_can_fit(required)) {
            _pfb_counter = counter_before;
            logger::debug("square builder: a blob tx with {} blobs needs {} more shares but only {} of {} are free",
                btx.blobs.size(), required, _max_square_size * _max_square_size - _current_size, _max_square_size * _max_square_size);
            return false;
        }
        _blobs.insert(_blobs.end(), std::make_move_iterator(elements.begin()), std::make_move_iterator(elements.end()));
        _pfbs.emplace_back(std::move(iw));
        _current_size += required;
        _last_blob_tx_size_change = required;
        _last_pfb_counter = counter_before;
        _blob_tx_reverted = false;
        return true;
    }

    void builder_t::revert_last_tx()
    {
        _check_not_exported("revert a tx");
        if (_txs.empty()) [[unlikely]]
            throw error("no transactions to revert");
        if (_tx_reverted) [[unlikely]]
            throw error("the last transaction has already been reverted");
        _txs.pop_back();
        _current_size -= _last_tx_size_change;
        _tx_counter = _last_tx_counter;
        _tx_reverted = true;
    }

    void builder_t::revert_last_blob_tx()
    {
        _check_not_exported("revert a blob tx");
        if (_pfbs.empty()) [[unlikely]]
            throw error("no blob transactions to revert");
        if (_blob_tx_reverted) [[unlikely]]
            throw error("the last blob transaction has already been reverted");
        const auto last_pfb = _pfbs.size() - 1;
        std::erase_if(_blobs, [&](const auto &el) { return el.pfb_index == last_pfb; });
        _pfbs.pop_back();
        _current_size -= _last_blob_tx_size_change;
        _pfb_counter = _last_pfb_counter;
        _blob_tx_reverted = true;
    }

    const export_t &builder_t::export_square()
    {
        if (_exported)
            return *_exported;
        if (is_empty()) {
            _exported.emplace(export_t { empty_square(), {} });
            return *_exported;
        }
        const auto ss = inclusion::blob_min_square_size(_current_size);

        std::stable_sort(_blobs.begin(), _blobs.end(), [](const auto &a, const auto &b) {
            return a.blob.ns() < b.blob.ns();
        });

        share::compact_splitter_t tx_writer { share::tx_namespace, share::share_version_zero };
        for (const auto &tx: _txs)
            tx_writer.write_tx(tx);

        share::sparse_splitter_t blob_writer {};
        auto non_reserved_start = _tx_counter.size() + _pfb_counter.size();
        auto cursor = non_reserved_start;
        auto end_of_last_blob = non_reserved_start;
        for (size_t i = 0; i < _blobs.size(); ++i) {
            const auto &el = _blobs[i];
            cursor = inclusion::next_share_index(cursor, el.num_shares, _subtree_root_threshold);
            if (i == 0)
                non_reserved_start = cursor;
            const auto padding = cursor - end_of_last_blob;
            if (padding > el.max_padding) [[unlikely]]
                throw err_internal_t(fmt::format("blob #{} of pfb #{} needs {} padding shares which exceeds the worst case of {}",
                    el.blob_index, el.pfb_index, padding, el.max_padding));
            _pfbs.at(el.pfb_index).share_indexes.at(el.blob_index) = numeric_cast<uint32_t>(cursor);
            if (i > 0)
                blob_writer.write_namespace_padding_shares(padding);
            blob_writer.write(el.blob);
            cursor += el.num_shares;
            end_of_last_blob = cursor;
        }

        share::compact_splitter_t pfb_writer { share::pay_for_blob_namespace, share::share_version_zero };
        for (const auto &iw: _pfbs)
            pfb_writer.write_tx(iw.marshal());
        if (_pfb_counter.size() < pfb_writer.count()) [[unlikely]]
            throw err_internal_t(fmt::format("the pay-for-blob estimate of {} shares is below the actual {}", _pfb_counter.size(), pfb_writer.count()));

        auto sq = write_square(tx_writer, pfb_writer, blob_writer, non_reserved_start, ss);
        const auto &shares = sq.shares();
        for (size_t i = 1; i < shares.size(); ++i) {
            if (shares[i].ns() < shares[i - 1].ns()) [[unlikely]]
                throw err_internal_t(fmt::format("share #{} with namespace {} follows a share with namespace {}", i, shares[i].ns(), shares[i - 1].ns()));
        }
        logger::debug("square builder: exported a square of width {} with {} txs, {} pfbs and {} blobs (estimate: {} shares)",
            ss, _txs.size(), _pfbs.size(), _blobs.size(), _current_size);
        _exported.emplace(export_t { std::move(sq), _tx_ranges() });
        return *_exported;
    }

    share::range_t builder_t::find_tx_share_range(const size_t tx_index)
    {
        if (tx_index >= num_txs()) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("tx index {} is out of range of {} txs", tx_index, num_txs()));
        return export_square().tx_ranges.at(tx_index);
    }

    size_t builder_t::find_blob_starting_index(const size_t pfb_index, const size_t blob_index)
    {
        const auto pos = _pfb_position(pfb_index);
        const auto &iw = get_wrapped_pfb(pfb_index);
        if (blob_index >= iw.share_indexes.size()) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("blob index {} is out of range of {} blobs of pfb #{}", blob_index, iw.share_indexes.size(), pos));
        return iw.share_indexes[blob_index];
    }

    size_t builder_t::blob_share_length(const size_t pfb_index, const size_t blob_index) const
    {
        const auto pos = _pfb_position(pfb_index);
        const auto it = std::find_if(_blobs.begin(), _blobs.end(), [&](const auto &el) {
            return el.pfb_index == pos && el.blob_index == blob_index;
        });
        if (it == _blobs.end()) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("blob index {} is out of range for pfb #{}", blob_index, pos));
        return it->num_shares;
    }

    const tx::index_wrapper_t &builder_t::get_wrapped_pfb(const size_t tx_index)
    {
        const auto pos = _pfb_position(tx_index);
        export_square();
        return _pfbs[pos];
    }

    bool builder_t::_can_fit(const size_t share_num) const noexcept
    {
        return _current_size + share_num <= _max_square_size * _max_square_size;
    }

    void builder_t::_check_not_exported(const std::string_view op) const
    {
        if (_exported) [[unlikely]]
            throw err_internal_t(fmt::format("can not {} after the square has been exported", op));
    }

    size_t builder_t::_pfb_position(const size_t pfb_index) const
    {
        if (pfb_index < _txs.size()) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("tx index {} refers to a plain tx, pfbs start at {}", pfb_index, _txs.size()));
        const auto pos = pfb_index - _txs.size();
        if (pos >= _pfbs.size()) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("tx index {} is out of range of {} txs", pfb_index, num_txs()));
        return pos;
    }

    std::vector<share::range_t> builder_t::_tx_ranges() const
    {
        std::vector<share::range_t> res {};
        res.reserve(num_txs());
        share::compact_counter_t tx_counter {};
        share::compact_counter_t pfb_counter {};
        const auto next_range = [&](share::compact_counter_t &counter, const size_t unit_len) {
            const auto base = tx_counter.size() + pfb_counter.size();
            // a unit starts in the last used share unless that share is full
            const auto start = counter.remainder() == 0 ? base : base - 1;
            counter.add(unit_len);
            res.push_back(share::range_t { start, tx_counter.size() + pfb_counter.size() });
        };
        for (const auto &tx: _txs)
            next_range(tx_counter, tx.size());
        for (const auto &iw: _pfbs)
            next_range(pfb_counter, iw.encoded_size());
        return res;
    }
}
