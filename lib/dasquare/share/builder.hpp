#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <optional>
#include <boost/container/static_vector.hpp>
#include "share.hpp"

namespace dasquare::share {
    // Incrementally assembles the bytes of a single share.
    struct builder_t {
        builder_t(const namespace_t &ns, uint8_t share_version, bool is_first_share);

        // replaces the current contents, e.g., to patch an already built share
        builder_t &import_raw_share(buffer raw);

        // returns the unconsumed suffix or nullopt when everything fit
        std::optional<buffer> add_data(buffer data);
        void write_sequence_len(uint32_t sequence_len);
        // no-op unless this is the first share of a version that requires a signer
        void write_signer(buffer signer);
        // no-op unless this is the first share of a version two sequence
        void write_fibre_blob_version(uint32_t fibre_blob_version);
        void write_commitment(buffer commitment);
        // records the offset of the next unit unless an earlier unit already did
        void maybe_write_reserved_bytes();
        // returns the number of padding bytes added
        size_t zero_pad_if_necessary();
        void flip_sequence_start();

        bool is_empty_share() const noexcept
        {
            return _data.size() == _layout.prefix_size;
        }

        size_t available_bytes() const noexcept
        {
            return share_size - _data.size();
        }

        size_t size() const noexcept
        {
            return _data.size();
        }

        const layout_t &layout() const noexcept
        {
            return _layout;
        }

        share_t build() const;
    private:
        namespace_t _ns;
        uint8_t _share_version;
        bool _is_first_share;
        layout_t _layout;
        boost::container::static_vector<uint8_t, share_size> _data {};

        void _append(buffer bytes);
    };
}
