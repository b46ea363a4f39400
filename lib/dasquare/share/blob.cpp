/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <dasquare/common/numeric-cast.hpp>
#include "blob.hpp"
#include "errors.hpp"
#include "sequence.hpp"
#include "sparse-splitter.hpp"

namespace dasquare::share {
    blob_t blob_t::make_v0(const namespace_t &ns, uint8_vector data)
    {
        return { ns, std::move(data), share_version_zero };
    }

    blob_t blob_t::make_v1(const namespace_t &ns, uint8_vector data, const buffer signer)
    {
        return { ns, std::move(data), share_version_one, uint8_vector(signer) };
    }

    blob_t blob_t::make_v2(const namespace_t &ns, const uint32_t fibre_blob_version, const buffer commitment, const buffer signer)
    {
        if (commitment.size() != fibre_commitment_size) [[unlikely]]
            throw err_invalid_blob_t(fmt::format("commitment must be {} bytes, got {}", fibre_commitment_size, commitment.size()));
        uint8_vector data {};
        data.reserve(fibre_blob_version_size + fibre_commitment_size);
        data << be32(fibre_blob_version) << commitment;
        return { ns, std::move(data), share_version_two, uint8_vector(signer) };
    }

    blob_t::blob_t(const namespace_t &ns, uint8_vector data, const uint8_t share_version, uint8_vector signer):
        _ns { ns },
        _data { std::move(data) },
        _share_version { share_version },
        _signer { std::move(signer) }
    {
        if (_data.empty()) [[unlikely]]
            throw err_invalid_blob_t("data can not be empty");
        _ns.validate_for_blob();
        switch (_share_version) {
            case share_version_zero:
                if (!_signer.empty()) [[unlikely]]
                    throw err_invalid_blob_t("share version 0 does not support signer");
                break;
            case share_version_one:
                if (_signer.size() != signer_size) [[unlikely]]
                    throw err_invalid_blob_t(fmt::format("share version 1 requires signer of size {} bytes", signer_size));
                break;
            case share_version_two:
                if (_signer.size() != signer_size) [[unlikely]]
                    throw err_invalid_blob_t(fmt::format("share version 2 requires signer of size {} bytes", signer_size));
                if (_data.size() != fibre_blob_version_size + fibre_commitment_size) [[unlikely]]
                    throw err_invalid_blob_t(fmt::format("share version 2 requires data of size {} bytes (fibre_blob_version + commitment), got {}",
                        fibre_blob_version_size + fibre_commitment_size, _data.size()));
                break;
            [[unlikely]] default:
                throw err_unsupported_share_version_t(fmt::format("share version {} not supported. Please use 0, 1, or 2", _share_version));
        }
    }

    uint32_t blob_t::fibre_blob_version() const
    {
        if (_share_version != share_version_two) [[unlikely]]
            throw err_invalid_blob_t(fmt::format("fibre blob version is only available for share version 2, got version {}", _share_version));
        return load_be32(static_cast<buffer>(_data).subbuf(0, fibre_blob_version_size));
    }

    commitment_t blob_t::commitment() const
    {
        if (_share_version != share_version_two) [[unlikely]]
            throw err_invalid_blob_t(fmt::format("commitment is only available for share version 2, got version {}", _share_version));
        return commitment_t(static_cast<buffer>(_data).subbuf(fibre_blob_version_size));
    }

    uint32_t blob_t::sequence_len() const
    {
        if (_share_version == share_version_two)
            return fibre_commitment_size;
        return numeric_cast<uint32_t>(_data.size());
    }

    size_t blob_t::share_count() const
    {
        return sparse_shares_needed(sequence_len(), _share_version);
    }

    share_list blob_t::to_shares() const
    {
        sparse_splitter_t splitter {};
        splitter.write(*this);
        return splitter.export_shares();
    }

    void sort_blobs(blob_list &blobs)
    {
        std::stable_sort(blobs.begin(), blobs.end(), [](const auto &a, const auto &b) {
            return a.ns() < b.ns();
        });
    }
}
