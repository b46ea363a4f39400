/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include "builder.hpp"
#include "padding.hpp"

namespace dasquare::share {
    share_t namespace_padding_share(const namespace_t &ns, const uint8_t share_version)
    {
        ns.validate();
        builder_t b { ns, share_version, true };
        b.write_sequence_len(0);
        b.zero_pad_if_necessary();
        return b.build();
    }

    share_list namespace_padding_shares(const namespace_t &ns, const uint8_t share_version, const size_t count)
    {
        share_list shares {};
        if (count == 0)
            return shares;
        shares.reserve(count);
        const auto s = namespace_padding_share(ns, share_version);
        for (size_t i = 0; i < count; ++i)
            shares.emplace_back(s);
        return shares;
    }

    share_t reserved_padding_share()
    {
        return namespace_padding_share(primary_reserved_padding_namespace, share_version_zero);
    }

    share_list reserved_padding_shares(const size_t count)
    {
        return namespace_padding_shares(primary_reserved_padding_namespace, share_version_zero, count);
    }

    share_t tail_padding_share()
    {
        return namespace_padding_share(tail_padding_namespace, share_version_zero);
    }

    share_list tail_padding_shares(const size_t count)
    {
        return namespace_padding_shares(tail_padding_namespace, share_version_zero, count);
    }
}
