/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/test.hpp>
#include "errors.hpp"
#include "sparse-splitter.hpp"

namespace {
    using namespace dasquare;
    using namespace dasquare::share;

    const namespace_t ns1 = namespace_t::make_v0(uint8_vector::from_hex("0102030405060708090A"));
    const uint8_vector signer = uint8_vector::from_hex("00112233445566778899AABBCCDDEEFF00112233");
}

suite dasquare_share_sparse_splitter_suite = [] {
    "dasquare::share::sparse_splitter"_test = [] {
        "v0"_test = [] {
            sparse_splitter_t s {};
            s.write(blob_t::make_v0(ns1, uint8_vector(1000)));
            expect_equal(size_t { 3 }, s.count());
            const auto &shares = s.export_shares();
            expect_equal(uint32_t { 1000 }, shares[0].sequence_len());
            expect(shares[0].signer().empty());
        };
        "v1"_test = [] {
            sparse_splitter_t s {};
            s.write(blob_t::make_v1(ns1, uint8_vector(first_sparse_share_content_size_with_signer + continuation_sparse_share_content_size), signer));
            expect_equal(size_t { 2 }, s.count());
            const auto &shares = s.export_shares();
            expect_equal(share_version_one, shares[0].version());
            expect_equal(signer, shares[0].signer());
            expect(shares[1].signer().empty());
            expect_equal(share_version_one, shares[1].version());
        };
        "v2"_test = [] {
            sparse_splitter_t s {};
            const auto commitment = commitment_t::from_hex("000102030405060708090A0B0C0D0E0F101112131415161718191A1B1C1D1E1F");
            s.write(blob_t::make_v2(ns1, 0x01020304, commitment, signer));
            expect_equal(size_t { 1 }, s.count());
            const auto &share = s.export_shares().at(0);
            expect_equal(uint32_t { fibre_commitment_size }, share.sequence_len());
            expect_equal(uint32_t { 0x01020304 }, share.fibre_blob_version());
            expect_equal(signer, share.signer());
            expect_equal(commitment, commitment_t(share.raw_data().subbuf(0, fibre_commitment_size)));
        };
        "namespace padding"_test = [] {
            sparse_splitter_t s {};
            expect(throws<err_internal_t>([&] { s.write_namespace_padding_shares(1); }));
            s.write_namespace_padding_shares(0);
            s.write(blob_t::make_v1(ns1, uint8_vector(10), signer));
            s.write_namespace_padding_shares(2);
            expect_equal(size_t { 3 }, s.count());
            const auto &shares = s.export_shares();
            for (size_t i = 1; i < shares.size(); ++i) {
                expect(shares[i].is_namespace_padding());
                expect_equal(ns1, shares[i].ns());
                expect_equal(share_version_one, shares[i].version());
            }
        };
    };
};
