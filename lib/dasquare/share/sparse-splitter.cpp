/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "builder.hpp"
#include "errors.hpp"
#include "padding.hpp"
#include "sparse-splitter.hpp"

namespace dasquare::share {
    void sparse_splitter_t::write(const blob_t &blob)
    {
        if (!is_supported_share_version(blob.share_version())) [[unlikely]]
            throw err_unsupported_share_version_t(fmt::format("unsupported share version: {}", blob.share_version()));
        builder_t b { blob.ns(), blob.share_version(), true };
        b.write_sequence_len(blob.sequence_len());
        b.write_signer(blob.signer());
        if (blob.share_version() == share_version_two) {
            b.write_fibre_blob_version(blob.fibre_blob_version());
            b.write_commitment(blob.commitment());
            b.zero_pad_if_necessary();
            _shares.emplace_back(b.build());
            return;
        }
        buffer raw_data = blob.data();
        for (;;) {
            const auto left_over = b.add_data(raw_data);
            if (!left_over) {
                b.zero_pad_if_necessary();
                _shares.emplace_back(b.build());
                break;
            }
            _shares.emplace_back(b.build());
            b = builder_t { blob.ns(), blob.share_version(), false };
            raw_data = *left_over;
        }
    }

    void sparse_splitter_t::write_namespace_padding_shares(const size_t count)
    {
        if (count == 0)
            return;
        if (_shares.empty()) [[unlikely]]
            throw err_internal_t("can not write namespace padding shares for an empty sparse share splitter");
        const auto &last = _shares.back();
        const auto padding = namespace_padding_shares(last.ns(), last.version(), count);
        _shares.insert(_shares.end(), padding.begin(), padding.end());
    }
}
