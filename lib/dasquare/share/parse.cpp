/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <dasquare/codec/varint.hpp>
#include "errors.hpp"
#include "parse.hpp"

namespace dasquare::share {
    delimited_t parse_delimiter(const buffer raw_data)
    {
        // trailing zero bytes of the last share decode as a zero-length unit
        byte_array<codec::uvarint::max_size> delim {};
        std::copy_n(raw_data.begin(), std::min(raw_data.size(), delim.size()), delim.begin());
        uint64_t unit_len = 0;
        try {
            unit_len = codec::uvarint::decode(delim).value;
        } catch (const error &ex) {
            throw err_invalid_share_t(fmt::format("malformed length delimiter of a compact unit: {}", ex.what()));
        }
        const auto delim_size = std::min(codec::uvarint::size(unit_len), raw_data.size());
        return { raw_data.subbuf(delim_size), unit_len };
    }

    static std::vector<uint8_vector> parse_raw_data(buffer raw_data)
    {
        std::vector<uint8_vector> units {};
        for (;;) {
            const auto [rest, unit_len] = parse_delimiter(raw_data);
            if (unit_len == 0 || unit_len > rest.size())
                return units;
            units.emplace_back(rest.subbuf(0, unit_len));
            raw_data = rest.subbuf(unit_len);
        }
    }

    std::vector<uint8_vector> parse_compact_shares(const std::span<const share_t> shares)
    {
        for (const auto &s: shares) {
            if (s.version() != share_version_zero) [[unlikely]]
                throw err_unsupported_share_version_t(fmt::format("unsupported share version for compact shares {}", s.version()));
        }
        uint8_vector raw_data {};
        bool anchored = false;
        for (const auto &s: shares) {
            if (anchored) {
                raw_data << s.raw_data();
            } else if (s.reserved_offset() != 0) {
                raw_data << s.raw_data_using_reserved();
                anchored = true;
            }
        }
        return parse_raw_data(raw_data);
    }

    namespace {
        struct open_sequence_t {
            namespace_t ns;
            uint8_t share_version;
            uint32_t sequence_len;
            uint8_vector signer;
            uint32_t fibre_blob_version = 0;
            uint8_vector data {};
        };
    }

    blob_list parse_sparse_shares(const std::span<const share_t> shares)
    {
        std::vector<open_sequence_t> sequences {};
        for (const auto &s: shares) {
            s.check_version_supported();
            if (s.is_padding())
                continue;
            if (s.is_sequence_start()) {
                auto &seq = sequences.emplace_back(open_sequence_t { s.ns(), s.version(), s.sequence_len(), uint8_vector(s.signer()) });
                if (s.version() == share_version_two)
                    seq.fibre_blob_version = s.fibre_blob_version();
                seq.data << s.raw_data();
                continue;
            }
            if (sequences.empty()) [[unlikely]]
                throw err_orphan_continuation_t(fmt::format("continuation share of {} without a sequence start share", s.ns()));
            auto &prev = sequences.back();
            if (s.ns() != prev.ns) [[unlikely]]
                throw err_continuation_namespace_mismatch_t(fmt::format("continuation share of {} has a different namespace than the previous share {}", s.ns(), prev.ns));
            prev.data << s.raw_data();
        }
        blob_list blobs {};
        blobs.reserve(sequences.size());
        for (auto &seq: sequences) {
            if (seq.sequence_len > seq.data.size()) [[unlikely]]
                throw err_sequence_length_t(fmt::format("sequence length {} is greater than the number of bytes in the sequence {}", seq.sequence_len, seq.data.size()));
            seq.data.resize(seq.sequence_len);
            if (seq.share_version == share_version_two) {
                blobs.emplace_back(blob_t::make_v2(seq.ns, seq.fibre_blob_version, seq.data, seq.signer));
            } else {
                blobs.emplace_back(seq.ns, std::move(seq.data), seq.share_version, std::move(seq.signer));
            }
        }
        return blobs;
    }

    sequence_list parse_shares(const std::span<const share_t> shares, const bool ignore_padding)
    {
        sequence_list sequences {};
        for (const auto &s: shares) {
            if (s.is_sequence_start()) {
                sequences.emplace_back(sequence_t { s.ns(), share_list { s } });
                continue;
            }
            if (sequences.empty()) [[unlikely]]
                throw err_orphan_continuation_t(fmt::format("continuation share of {} without a sequence start share", s.ns()));
            auto &cur = sequences.back();
            if (cur.ns != s.ns()) [[unlikely]]
                throw err_continuation_namespace_mismatch_t(fmt::format("share sequence of {} has inconsistent namespace with share of {}", cur.ns, s.ns()));
            cur.shares.emplace_back(s);
        }
        for (const auto &seq: sequences)
            seq.validate_sequence_len();
        if (ignore_padding)
            std::erase_if(sequences, [](const auto &seq) { return seq.is_padding(); });
        return sequences;
    }
}
