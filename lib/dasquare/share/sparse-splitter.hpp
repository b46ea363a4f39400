#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "blob.hpp"

namespace dasquare::share {
    // Lays out blobs as sparse share sequences, each blob starting in a fresh share.
    struct sparse_splitter_t {
        void write(const blob_t &blob);
        // appends count padding shares with the namespace and the version of the last share
        void write_namespace_padding_shares(size_t count);

        const share_list &export_shares() const noexcept
        {
            return _shares;
        }

        size_t count() const noexcept
        {
            return _shares.size();
        }
    private:
        share_list _shares {};
    };
}
