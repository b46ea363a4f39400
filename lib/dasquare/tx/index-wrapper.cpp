/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/error.hpp>
#include <dasquare/common/format.hpp>
#include <dasquare/common/numeric-cast.hpp>
#include <dasquare/tx/envelope.pb.h>
#include "index-wrapper.hpp"

namespace dasquare::tx {
    static proto::IndexWrapper to_proto(const index_wrapper_t &w)
    {
        proto::IndexWrapper msg {};
        msg.set_tx(std::string { w.tx.str() });
        msg.mutable_share_indexes()->Add(w.share_indexes.begin(), w.share_indexes.end());
        msg.set_type_id(std::string { index_wrapper_type_id });
        return msg;
    }

    std::optional<index_wrapper_t> index_wrapper_t::try_decode(const buffer bytes)
    {
        proto::IndexWrapper msg {};
        if (!msg.ParseFromArray(bytes.data(), numeric_cast<int>(bytes.size())))
            return {};
        if (msg.type_id() != index_wrapper_type_id)
            return {};
        return index_wrapper_t {
            uint8_vector(buffer { msg.tx() }),
            std::vector<uint32_t>(msg.share_indexes().begin(), msg.share_indexes().end())
        };
    }

    uint8_vector index_wrapper_t::marshal() const
    {
        const auto msg = to_proto(*this);
        uint8_vector res(msg.ByteSizeLong());
        if (!msg.SerializeToArray(res.data(), numeric_cast<int>(res.size()))) [[unlikely]]
            throw error(fmt::format("failed to serialize an index wrapper with {} share indexes", share_indexes.size()));
        return res;
    }

    size_t index_wrapper_t::encoded_size() const
    {
        return to_proto(*this).ByteSizeLong();
    }
}
