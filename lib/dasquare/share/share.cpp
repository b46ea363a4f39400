/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "errors.hpp"
#include "share.hpp"

namespace dasquare::share {
    reserved_bytes_t make_reserved_bytes(const uint32_t byte_index)
    {
        if (byte_index >= share_size) [[unlikely]]
            throw err_invalid_share_t(fmt::format("byte index {} must be less than share size {}", byte_index, share_size));
        return be32(byte_index);
    }

    uint32_t parse_reserved_bytes(const buffer bytes)
    {
        if (bytes.size() != share_reserved_bytes) [[unlikely]]
            throw err_invalid_share_t(fmt::format("reserved bytes must be of length {} but got {}", share_reserved_bytes, bytes.size()));
        const auto byte_index = load_be32(bytes);
        if (byte_index >= share_size) [[unlikely]]
            throw err_invalid_share_t(fmt::format("byte index {} must be less than share size {}", byte_index, share_size));
        return byte_index;
    }

    static share_t::bytes_t validated_share_bytes(const buffer bytes)
    {
        if (bytes.size() != share_size) [[unlikely]]
            throw err_invalid_share_t(fmt::format("share data must be {} bytes, got {}", share_size, bytes.size()));
        return share_t::bytes_t(bytes);
    }

    share_t::share_t(const buffer bytes):
        _bytes { validated_share_bytes(bytes) },
        _ns { namespace_t::from_bytes(bytes.subbuf(0, namespace_size)) }
    {
    }

    void share_t::check_version_supported() const
    {
        if (!is_supported_share_version(version())) [[unlikely]]
            throw err_unsupported_share_version_t(fmt::format("unsupported share version {}", version()));
    }

    uint32_t share_t::sequence_len() const
    {
        if (!is_sequence_start())
            return 0;
        return load_be32(bytes().subbuf(layout_t::sequence_len_offset, sequence_len_bytes));
    }

    buffer share_t::signer() const
    {
        const auto l = layout();
        if (!l.has_signer())
            return {};
        return bytes().subbuf(l.signer_offset, signer_size);
    }

    uint32_t share_t::fibre_blob_version() const
    {
        const auto l = layout();
        if (!l.has_fibre_blob_version()) [[unlikely]]
            throw err_invalid_share_t(fmt::format("the fibre blob version is only present in the first share of version {} sequences", share_version_two));
        return load_be32(bytes().subbuf(l.fibre_blob_version_offset, fibre_blob_version_size));
    }

    uint32_t share_t::reserved_offset() const
    {
        const auto l = layout();
        if (!l.compact) [[unlikely]]
            throw err_invalid_share_t(fmt::format("share of namespace {} is not a compact share", _ns));
        const auto offset = parse_reserved_bytes(bytes().subbuf(l.reserved_offset, share_reserved_bytes));
        if (offset != 0 && offset < l.payload_offset) [[unlikely]]
            throw err_invalid_share_t(fmt::format("reserved offset {} points inside of the share header of {} bytes", offset, l.payload_offset));
        return offset;
    }

    bool share_t::is_padding() const
    {
        return is_namespace_padding() || is_tail_padding() || is_primary_reserved_padding();
    }

    bool share_t::is_namespace_padding() const
    {
        return is_sequence_start() && sequence_len() == 0;
    }

    bool share_t::is_tail_padding() const noexcept
    {
        return _ns.is_tail_padding();
    }

    bool share_t::is_primary_reserved_padding() const noexcept
    {
        return _ns.is_primary_reserved_padding();
    }

    buffer share_t::raw_data() const
    {
        return bytes().subbuf(layout().payload_offset);
    }

    buffer share_t::raw_data_using_reserved() const
    {
        if (!is_compact())
            return raw_data();
        const auto offset = reserved_offset();
        if (offset == 0)
            return {};
        return bytes().subbuf(offset);
    }

    share_list shares_from_bytes(const std::span<const uint8_vector> bytes)
    {
        share_list shares {};
        shares.reserve(bytes.size());
        for (const auto &b: bytes)
            shares.emplace_back(b);
        return shares;
    }

    std::vector<uint8_vector> shares_to_bytes(const std::span<const share_t> shares)
    {
        std::vector<uint8_vector> res {};
        res.reserve(shares.size());
        for (const auto &s: shares)
            res.emplace_back(s.bytes());
        return res;
    }
}
