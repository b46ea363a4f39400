#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <vector>
#include <dasquare/common/bytes.hpp>
#include "share.hpp"

namespace dasquare::share {
    using signer_t = byte_array<signer_size>;
    using commitment_t = byte_array<fibre_commitment_size>;

    /*
     * A namespaced payload. Version 0 carries no signer, version 1 carries a 20-byte signer
     * and version 2 carries a signer and exactly 36 bytes of data: a big-endian fibre blob version
     * followed by a 32-byte commitment.
     */
    struct blob_t {
        static blob_t make_v0(const namespace_t &ns, uint8_vector data);
        static blob_t make_v1(const namespace_t &ns, uint8_vector data, buffer signer);
        static blob_t make_v2(const namespace_t &ns, uint32_t fibre_blob_version, buffer commitment, buffer signer);

        // an empty signer means no signer
        blob_t(const namespace_t &ns, uint8_vector data, uint8_t share_version, uint8_vector signer={});

        const namespace_t &ns() const noexcept
        {
            return _ns;
        }

        const uint8_vector &data() const noexcept
        {
            return _data;
        }

        uint8_t share_version() const noexcept
        {
            return _share_version;
        }

        const uint8_vector &signer() const noexcept
        {
            return _signer;
        }

        bool has_signer() const noexcept
        {
            return !_signer.empty();
        }

        uint32_t fibre_blob_version() const;
        commitment_t commitment() const;
        // the value written into the sequence length field of the first share
        uint32_t sequence_len() const;
        // the number of shares the blob occupies once split
        size_t share_count() const;

        share_list to_shares() const;

        bool operator==(const blob_t &o) const noexcept
        {
            return _ns == o._ns && _share_version == o._share_version && _data == o._data && _signer == o._signer;
        }
    private:
        namespace_t _ns;
        uint8_vector _data;
        uint8_t _share_version;
        uint8_vector _signer;
    };

    using blob_list = std::vector<blob_t>;

    // stable, so blobs of the same namespace keep their relative order
    extern void sort_blobs(blob_list &blobs);
}

namespace fmt {
    template<>
    struct formatter<dasquare::share::blob_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const dasquare::share::blob_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "blob(ns: {} version: {} size: {} signer: {})",
                v.ns(), v.share_version(), v.data().size(), v.signer());
        }
    };
}
