/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/codec/varint.hpp>
#include <dasquare/common/numeric-cast.hpp>
#include "compact-splitter.hpp"
#include "errors.hpp"

namespace dasquare::share {
    uint8_vector marshal_delimited(const buffer unit)
    {
        uint8_vector res {};
        res.reserve(codec::uvarint::size(unit.size()) + unit.size());
        codec::uvarint::encode(res, unit.size());
        res << unit;
        return res;
    }

    compact_splitter_t::compact_splitter_t(const namespace_t &ns, const uint8_t share_version):
        _ns { ns },
        _share_version { share_version },
        _pending { ns, share_version, true }
    {
        if (!ns.is_compact()) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("namespace {} does not use compact shares", ns));
        if (share_version != share_version_zero) [[unlikely]]
            throw err_unsupported_share_version_t(fmt::format("unsupported share version for compact shares {}", share_version));
    }

    void compact_splitter_t::write_tx(const buffer tx)
    {
        // a zero length delimiter marks the start of padding
        if (tx.empty()) [[unlikely]]
            throw err_invalid_argument_t("compact units must not be empty");
        const auto raw_data = marshal_delimited(tx);
        const auto start = _shares.size();
        _write(raw_data);
        _ranges[crypto::sha256::digest(tx)] = range_t { start, count() };
    }

    const share_list &compact_splitter_t::export_shares() const
    {
        if (_exported)
            return *_exported;
        share_list shares = _shares;
        size_t padding = 0;
        if (!_pending.is_empty_share()) {
            auto last = _pending;
            padding = last.zero_pad_if_necessary();
            shares.emplace_back(last.build());
        }
        if (!shares.empty()) {
            const auto seq_len = first_compact_share_content_size
                + (shares.size() - 1) * continuation_compact_share_content_size - padding;
            builder_t first { _ns, _share_version, true };
            first.import_raw_share(shares.front().bytes());
            first.write_sequence_len(numeric_cast<uint32_t>(seq_len));
            shares.front() = first.build();
        }
        _exported.emplace(std::move(shares));
        return *_exported;
    }

    compact_splitter_t::range_map compact_splitter_t::share_ranges(const size_t offset) const
    {
        range_map res {};
        res.reserve(_ranges.size());
        for (const auto &[hash, r]: _ranges) {
            auto shifted = r;
            shifted.add(offset);
            res.emplace_hint(res.end(), hash, shifted);
        }
        return res;
    }

    void compact_splitter_t::_write(buffer raw_data)
    {
        _exported.reset();
        _pending.maybe_write_reserved_bytes();
        for (;;) {
            const auto left_over = _pending.add_data(raw_data);
            if (!left_over)
                break;
            _stack_pending();
            raw_data = *left_over;
        }
        if (_pending.available_bytes() == 0)
            _stack_pending();
    }

    void compact_splitter_t::_stack_pending()
    {
        _shares.emplace_back(_pending.build());
        _pending = builder_t { _ns, _share_version, false };
    }
}
