/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/test.hpp>
#include <dasquare/share/errors.hpp>
#include <dasquare/share/padding.hpp>
#include "builder.hpp"
#include "square.hpp"
#include "test-factory.hpp"

namespace {
    using namespace dasquare;
    using namespace dasquare::square;

    const share::namespace_t ns1 = share::namespace_t::make_v0(uint8_vector::from_hex("01010101010101010101"));
    const share::namespace_t ns2 = share::namespace_t::make_v0(uint8_vector::from_hex("02020202020202020202"));

    std::vector<uint8_vector> concat(std::vector<uint8_vector> a, const std::vector<uint8_vector> &b)
    {
        a.insert(a.end(), b.begin(), b.end());
        return a;
    }
}

suite dasquare_square_square_suite = [] {
    "dasquare::square::square"_test = [] {
        "square size"_test = [] {
            expect_equal(square_size(0), 1ULL);
            expect_equal(square_size(1), 1ULL);
            expect_equal(square_size(2), 2ULL);
            expect_equal(square_size(4), 2ULL);
            expect_equal(square_size(5), 4ULL);
            expect_equal(square_size(16), 4ULL);
            expect_equal(square_size(17), 8ULL);
            expect_equal(square_size(4096), 64ULL);
        };
        "bytes and hash"_test = [] {
            const auto es = empty_square();
            expect(es.is_empty());
            expect_equal(es.size(), 1ULL);
            expect_equal(es.to_bytes().size(), share::share_size);
            expect(es.hash() == empty_square().hash());
            expect(es.wrapped_pfbs().empty());
            const square_t other { share::tail_padding_shares(4) };
            expect(!other.is_empty());
            expect_equal(other.size(), 2ULL);
            expect(other.hash() != es.hash());
        };
        "write square"_test = [] {
            share::compact_splitter_t tx_writer { share::tx_namespace, share::share_version_zero };
            tx_writer.write_tx(factory::random_bytes(100));
            share::compact_splitter_t pfb_writer { share::pay_for_blob_namespace, share::share_version_zero };
            share::sparse_splitter_t blob_writer {};
            blob_writer.write(share::blob_t::make_v0(ns1, factory::random_bytes(1000)));
            expect(throws<err_internal_t>([&] { write_square(tx_writer, pfb_writer, blob_writer, 0, 2); }));
            expect(throws<err_internal_t>([&] { write_square(tx_writer, pfb_writer, blob_writer, 2, 2); }));
            const auto sq = write_square(tx_writer, pfb_writer, blob_writer, 1, 2);
            const auto &shares = sq.shares();
            expect_equal(shares.size(), 4ULL);
            expect(shares[0].ns() == share::tx_namespace);
            for (size_t i = 1; i < 4; ++i)
                expect(shares[i].ns() == ns1);
        };
        "construct and deconstruct"_test = [] {
            const auto txs = concat(factory::generate_txs(100, 5), factory::generate_blob_txs(3, 2, 700));
            const auto sq = construct(txs, config_prod::max_square_size, config_prod::subtree_root_threshold);
            expect(!sq.is_empty());
            expect_equal(sq.wrapped_pfbs().size(), 3ULL);
            const auto recovered = deconstruct(sq, factory::decode_mock_pfb);
            expect_equal_items(recovered, txs);

            const auto res = build(txs, config_prod::max_square_size, config_prod::subtree_root_threshold);
            expect(res.square == sq);
            expect_equal_items(res.txs, txs);
        };
        "construct rejects"_test = [] {
            const auto plain = factory::generate_txs(100, 1);
            const auto blob_txs = factory::generate_blob_txs(1, 1, 100);
            expect(throws<err_invalid_argument_t>([&] {
                construct(concat(blob_txs, plain), config_tiny::max_square_size, config_tiny::subtree_root_threshold);
            }));
            const std::vector<uint32_t> big_size { 64 * 482 };
            const std::vector<uint8_vector> big { factory::generate_blob_tx(big_size) };
            expect(throws<err_invalid_argument_t>([&] {
                construct(big, config_tiny::max_square_size, config_tiny::subtree_root_threshold);
            }));
            const std::vector<uint8_vector> with_empty { plain[0], uint8_vector {} };
            expect(throws<err_invalid_argument_t>([&] {
                construct(with_empty, config_tiny::max_square_size, config_tiny::subtree_root_threshold);
            }));
            const auto built = build(with_empty, config_tiny::max_square_size, config_tiny::subtree_root_threshold);
            expect_equal_items(built.txs, plain);
            expect(construct({}, config_tiny::max_square_size, config_tiny::subtree_root_threshold) == empty_square());
        };
        "build skips what does not fit"_test = [] {
            const std::vector<uint32_t> big_size { 64 * 482 };
            const auto plain = factory::generate_txs(100, 2);
            const std::vector<uint8_vector> txs { factory::generate_blob_tx(big_size), plain[0], plain[1] };
            const auto res = build(txs, config_tiny::max_square_size, config_tiny::subtree_root_threshold);
            expect_equal_items(res.txs, plain);
            expect_equal(res.square.share_count(), 1ULL);
            expect(deconstruct(res.square, factory::decode_mock_pfb) == plain);
        };
        "share ranges"_test = [] {
            const std::vector<share::namespace_t> namespaces { ns1, ns2 };
            const std::vector<uint32_t> sizes { 1000, 1000 };
            const std::vector<uint8_vector> txs { factory::random_bytes(600), factory::generate_blob_tx(namespaces, sizes) };
            expect_equal(tx_share_range(txs, 0, 8, 2), share::range_t { 0, 2 });
            expect_equal(tx_share_range(txs, 1, 8, 2), share::range_t { 2, 3 });
            expect_equal(blob_share_range(txs, 1, 0, 8, 2), share::range_t { 4, 7 });
            expect_equal(blob_share_range(txs, 1, 1, 8, 2), share::range_t { 8, 11 });
            expect(throws<err_invalid_argument_t>([&] { blob_share_range(txs, 0, 0, 8, 2); }));
            expect(throws<err_invalid_argument_t>([&] { tx_share_range(txs, 2, 8, 2); }));
        };
        "deconstruct rejects"_test = [] {
            const auto txs = factory::generate_blob_txs(1, 2, 100);
            const auto sq = construct(txs, config_tiny::max_square_size, config_tiny::subtree_root_threshold);
            expect(throws<err_malformed_envelope_t>([&] {
                deconstruct(sq, [](buffer) { return std::vector<uint32_t> { 100 }; });
            }));
            expect(throws<err_invalid_argument_t>([&] {
                deconstruct(sq, [](buffer) -> std::vector<uint32_t> { throw err_invalid_argument_t("not a pfb"); });
            }));
            expect(deconstruct(empty_square(), factory::decode_mock_pfb).empty());
        };
        "mock pfb"_test = [] {
            const std::vector<uint32_t> sizes { 1, 500, 70000 };
            const auto pfb = factory::mock_pfb(sizes);
            expect_equal(pfb.size(), factory::mock_pfb_extra_bytes + 12);
            expect_equal_items(factory::decode_mock_pfb(pfb), sizes);
            expect(throws<err_invalid_argument_t>([&] { factory::decode_mock_pfb(factory::random_bytes(factory::mock_pfb_extra_bytes)); }));
        };
    };
};
