/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/logger.hpp>
#include <dasquare/common/numeric-cast.hpp>
#include <dasquare/share/errors.hpp>
#include <dasquare/tx/envelope.pb.h>
#include "blob-tx.hpp"

namespace dasquare::tx {
    static std::string to_proto_bytes(const buffer bytes)
    {
        return std::string { static_cast<std::string_view>(bytes) };
    }

    static share::blob_t blob_from_proto(const proto::BlobProto &b)
    {
        if (b.namespace_version() > share::namespace_version_max) [[unlikely]]
            throw err_malformed_envelope_t(fmt::format("namespace version can not be greater than {}", share::namespace_version_max));
        if (b.share_version() > share::max_share_version) [[unlikely]]
            throw err_malformed_envelope_t(fmt::format("share version can not be greater than {}", share::max_share_version));
        try {
            const auto ns = share::namespace_t::make(static_cast<uint8_t>(b.namespace_version()), buffer { b.namespace_id() });
            return { ns, uint8_vector(buffer { b.data() }), static_cast<uint8_t>(b.share_version()), uint8_vector(buffer { b.signer() }) };
        } catch (const error &ex) {
            throw err_malformed_envelope_t(fmt::format("invalid blob in a blob transaction: {}", ex.what()));
        }
    }

    std::optional<blob_tx_t> blob_tx_t::try_decode(const buffer bytes)
    {
        proto::BlobTx msg {};
        if (!msg.ParseFromArray(bytes.data(), numeric_cast<int>(bytes.size()))) {
            logger::trace("a {}-byte transaction is not a valid protobuf message", bytes.size());
            return {};
        }
        if (msg.type_id() != blob_tx_type_id)
            return {};
        if (msg.blobs().empty()) [[unlikely]]
            throw err_malformed_envelope_t("a blob transaction must have at least one blob");
        blob_tx_t res { uint8_vector(buffer { msg.tx() }), {} };
        res.blobs.reserve(msg.blobs_size());
        for (const auto &b: msg.blobs())
            res.blobs.emplace_back(blob_from_proto(b));
        return res;
    }

    uint8_vector blob_tx_t::marshal() const
    {
        if (blobs.empty()) [[unlikely]]
            throw err_malformed_envelope_t("at least one blob must be provided");
        proto::BlobTx msg {};
        msg.set_tx(to_proto_bytes(tx));
        msg.set_type_id(std::string { blob_tx_type_id });
        for (const auto &b: blobs) {
            auto &pb = *msg.add_blobs();
            pb.set_namespace_id(to_proto_bytes(b.ns().id()));
            pb.set_namespace_version(b.ns().version());
            pb.set_share_version(b.share_version());
            pb.set_data(to_proto_bytes(b.data()));
            if (b.has_signer())
                pb.set_signer(to_proto_bytes(b.signer()));
        }
        uint8_vector res(msg.ByteSizeLong());
        if (!msg.SerializeToArray(res.data(), numeric_cast<int>(res.size()))) [[unlikely]]
            throw error(fmt::format("failed to serialize a blob transaction with {} blobs", blobs.size()));
        return res;
    }
}
