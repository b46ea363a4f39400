#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <optional>
#include <boost/container/flat_map.hpp>
#include <dasquare/crypto/sha256.hpp>
#include "builder.hpp"
#include "range.hpp"

namespace dasquare::share {
    // the length-delimited form of a unit: uvarint(len) followed by the unit bytes
    extern uint8_vector marshal_delimited(buffer unit);

    /*
     * Packs length-delimited units of a compact namespace into a sequence of shares.
     * Units may span share boundaries; the reserved bytes of every share point at the first unit
     * starting in it and the sequence length of the first share covers all written units.
     */
    struct compact_splitter_t {
        using range_map = boost::container::flat_map<crypto::sha256::hash_t, range_t>;

        compact_splitter_t(const namespace_t &ns, uint8_t share_version);

        // throws err_invalid_argument_t for an empty unit
        void write_tx(buffer tx);
        // does not modify the pending state, so repeated calls return the same shares
        const share_list &export_shares() const;
        // the shares each unit occupies keyed by the sha256 of the unit, shifted by offset
        range_map share_ranges(size_t offset) const;

        size_t count() const noexcept
        {
            return _shares.size() + (_pending.is_empty_share() ? 0 : 1);
        }

        bool is_empty() const noexcept
        {
            return _shares.empty() && _pending.is_empty_share();
        }
    private:
        namespace_t _ns;
        uint8_t _share_version;
        share_list _shares {};
        builder_t _pending;
        range_map _ranges {};
        mutable std::optional<share_list> _exported {};

        void _write(buffer raw_data);
        void _stack_pending();
    };
}
