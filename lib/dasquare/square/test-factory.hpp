#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <span>
#include <dasquare/crypto/sodium.hpp>
#include <dasquare/share/errors.hpp>
#include <dasquare/tx/blob-tx.hpp>

// Transaction generators for the square tests
namespace dasquare::square::factory {
    // the opaque prefix of a mock pay-for-blob transaction
    static constexpr size_t mock_pfb_extra_bytes = 329;

    inline share::namespace_t default_namespace()
    {
        return share::namespace_t::make_v0(buffer { std::string_view { "test" } });
    }

    inline uint8_vector random_bytes(const size_t size)
    {
        return crypto::sodium::random_bytes(size);
    }

    inline std::vector<uint8_vector> generate_txs(const size_t size, const size_t num_txs)
    {
        std::vector<uint8_vector> txs {};
        txs.reserve(num_txs);
        for (size_t i = 0; i < num_txs; ++i)
            txs.emplace_back(random_bytes(size));
        return txs;
    }

    // random bytes followed by the big-endian sizes of the blobs paid for
    inline uint8_vector mock_pfb(const std::span<const uint32_t> blob_sizes)
    {
        if (blob_sizes.empty()) [[unlikely]]
            throw err_invalid_argument_t("a mock pfb must pay for at least one blob");
        auto res = random_bytes(mock_pfb_extra_bytes);
        for (const auto sz: blob_sizes)
            res << be32(sz);
        return res;
    }

    inline std::vector<uint32_t> decode_mock_pfb(const buffer pfb)
    {
        if (pfb.size() < mock_pfb_extra_bytes + sizeof(uint32_t)) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("a mock pfb must have at least {} bytes, got {}", mock_pfb_extra_bytes + sizeof(uint32_t), pfb.size()));
        const auto sizes = pfb.subbuf(mock_pfb_extra_bytes);
        std::vector<uint32_t> res {};
        res.reserve(sizes.size() / sizeof(uint32_t));
        for (size_t off = 0; off + sizeof(uint32_t) <= sizes.size(); off += sizeof(uint32_t))
            res.emplace_back(load_be32(sizes.subbuf(off, sizeof(uint32_t))));
        return res;
    }

    inline uint8_vector generate_blob_tx(const std::span<const share::namespace_t> namespaces, const std::span<const uint32_t> blob_sizes)
    {
        if (namespaces.size() != blob_sizes.size()) [[unlikely]]
            throw err_invalid_argument_t(fmt::format("got {} namespaces for {} blobs", namespaces.size(), blob_sizes.size()));
        tx::blob_tx_t btx { mock_pfb(blob_sizes), {} };
        btx.blobs.reserve(blob_sizes.size());
        for (size_t i = 0; i < blob_sizes.size(); ++i)
            btx.blobs.emplace_back(share::blob_t::make_v0(namespaces[i], random_bytes(blob_sizes[i])));
        return btx.marshal();
    }

    inline uint8_vector generate_blob_tx(const std::span<const uint32_t> blob_sizes)
    {
        const std::vector<share::namespace_t> namespaces(blob_sizes.size(), default_namespace());
        return generate_blob_tx(namespaces, blob_sizes);
    }

    inline std::vector<uint8_vector> generate_blob_txs(const size_t num_txs, const size_t blobs_per_pfb, const uint32_t blob_size)
    {
        const std::vector<uint32_t> sizes(blobs_per_pfb, blob_size);
        std::vector<uint8_vector> txs {};
        txs.reserve(num_txs);
        for (size_t i = 0; i < num_txs; ++i)
            txs.emplace_back(generate_blob_tx(sizes));
        return txs;
    }
}
