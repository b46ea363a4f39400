/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include "builder.hpp"
#include "errors.hpp"

namespace dasquare::share {
    builder_t::builder_t(const namespace_t &ns, const uint8_t share_version, const bool is_first_share):
        _ns { ns },
        _share_version { share_version },
        _is_first_share { is_first_share },
        _layout { layout_t::make(ns.is_compact(), share_version, is_first_share) }
    {
        const auto info = info_byte_t::make(share_version, is_first_share);
        _append(ns.bytes());
        _data.emplace_back(info.raw());
        // placeholders for the sequence length and the reserved bytes
        _data.resize(_layout.prefix_size, 0);
    }

    builder_t &builder_t::import_raw_share(const buffer raw)
    {
        if (raw.size() < _layout.prefix_size || raw.size() > share_size) [[unlikely]]
            throw err_invalid_share_t(fmt::format("can't import a raw share of {} bytes", raw.size()));
        _data.assign(raw.begin(), raw.end());
        return *this;
    }

    std::optional<buffer> builder_t::add_data(const buffer data)
    {
        const auto pending_left = available_bytes();
        if (data.size() <= pending_left) {
            _append(data);
            return {};
        }
        _append(data.subbuf(0, pending_left));
        return data.subbuf(pending_left);
    }

    void builder_t::write_sequence_len(const uint32_t sequence_len)
    {
        if (!_is_first_share) [[unlikely]]
            throw err_invalid_share_t("the sequence length can be written only into the first share");
        store_be32(write_buffer { _data.data() + layout_t::sequence_len_offset, sequence_len_bytes }, sequence_len);
    }

    void builder_t::write_signer(const buffer signer)
    {
        if (!_layout.has_signer())
            return;
        if (signer.size() != signer_size) [[unlikely]]
            throw err_invalid_blob_t(fmt::format("share version {} requires signer of size {} bytes but got {}", _share_version, signer_size, signer.size()));
        if (_data.size() != _layout.signer_offset) [[unlikely]]
            throw err_invalid_share_t("the signer must be written right after the share prefix");
        _append(signer);
    }

    void builder_t::write_fibre_blob_version(const uint32_t fibre_blob_version)
    {
        if (!_layout.has_fibre_blob_version())
            return;
        if (_data.size() != _layout.fibre_blob_version_offset) [[unlikely]]
            throw err_invalid_share_t("the fibre blob version must be written right after the signer");
        _append(be32(fibre_blob_version));
    }

    void builder_t::write_commitment(const buffer commitment)
    {
        if (!_layout.has_fibre_blob_version())
            return;
        if (commitment.size() != fibre_commitment_size) [[unlikely]]
            throw err_invalid_blob_t(fmt::format("a commitment must have {} bytes but got {}", fibre_commitment_size, commitment.size()));
        if (_data.size() != _layout.payload_offset) [[unlikely]]
            throw err_invalid_share_t("the commitment must be written right after the fibre blob version");
        _append(commitment);
    }

    void builder_t::maybe_write_reserved_bytes()
    {
        if (!_layout.compact) [[unlikely]]
            throw err_invalid_share_t(fmt::format("share of namespace {} is not a compact share", _ns));
        const auto reserved = write_buffer { _data.data() + _layout.reserved_offset, share_reserved_bytes };
        if (parse_reserved_bytes(reserved) != 0)
            return;
        const auto bytes = make_reserved_bytes(static_cast<uint32_t>(_data.size()));
        std::copy(bytes.begin(), bytes.end(), reserved.begin());
    }

    size_t builder_t::zero_pad_if_necessary()
    {
        const auto padding = available_bytes();
        _data.resize(share_size, 0);
        return padding;
    }

    void builder_t::flip_sequence_start()
    {
        _data[layout_t::info_offset] ^= 0x01;
    }

    share_t builder_t::build() const
    {
        if (_data.size() != share_size) [[unlikely]]
            throw err_invalid_share_t(fmt::format("share data must be {} bytes, got {}", share_size, _data.size()));
        return share_t { buffer { _data.data(), _data.size() } };
    }

    void builder_t::_append(const buffer bytes)
    {
        if (bytes.size() > available_bytes()) [[unlikely]]
            throw err_invalid_share_t(fmt::format("can't append {} bytes to a share with {} bytes available", bytes.size(), available_bytes()));
        _data.insert(_data.end(), bytes.begin(), bytes.end());
    }
}
