/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/test.hpp>
#include "compact-splitter.hpp"
#include "counter.hpp"
#include "errors.hpp"
#include "parse.hpp"

namespace {
    using namespace dasquare;
    using namespace dasquare::share;

    uint8_vector make_tx(const size_t size, const uint8_t fill='a')
    {
        uint8_vector tx(size);
        std::fill(tx.begin(), tx.end(), fill);
        return tx;
    }

    std::vector<uint8_vector> make_txs(const size_t count, const size_t size)
    {
        std::vector<uint8_vector> txs {};
        for (size_t i = 0; i < count; ++i)
            txs.emplace_back(make_tx(size, static_cast<uint8_t>(i)));
        return txs;
    }
}

suite dasquare_share_compact_splitter_suite = [] {
    "dasquare::share::compact_splitter"_test = [] {
        "empty"_test = [] {
            compact_splitter_t s { tx_namespace, share_version_zero };
            expect(s.is_empty());
            expect_equal(size_t { 0 }, s.count());
            expect(s.export_shares().empty());
        };
        "invalid arguments"_test = [] {
            expect(throws<err_invalid_namespace_t>([] { compact_splitter_t { pay_for_fibre_namespace, share_version_zero }; }));
            expect(throws<err_unsupported_share_version_t>([] { compact_splitter_t { tx_namespace, share_version_one }; }));
        };
        "empty units are rejected"_test = [] {
            compact_splitter_t s { tx_namespace, share_version_zero };
            s.write_tx(make_tx(5));
            expect(throws<err_invalid_argument_t>([&] { s.write_tx(buffer {}); }));
            s.write_tx(make_tx(5));
            expect_equal(size_t { 1 }, s.count());
            const auto parsed = parse_compact_shares(s.export_shares());
            expect_equal(size_t { 2 }, parsed.size());
        };
        "single full share"_test = [] {
            compact_splitter_t s { tx_namespace, share_version_zero };
            s.write_tx(make_tx(first_compact_share_content_size - 2));
            const auto &shares = s.export_shares();
            expect_equal(size_t { 1 }, shares.size());
            expect_equal(uint32_t { first_compact_share_content_size }, shares[0].sequence_len());
            expect_equal(uint32_t { 38 }, shares[0].reserved_offset());
        };
        "sequence length"_test = [] {
            compact_splitter_t s { pay_for_blob_namespace, share_version_zero };
            s.write_tx(make_tx(100));
            s.write_tx(make_tx(1000));
            const auto &shares = s.export_shares();
            expect_equal(size_t { 3 }, shares.size());
            expect_equal(uint32_t { 101 + 1002 }, shares[0].sequence_len());
            for (size_t i = 1; i < shares.size(); ++i) {
                expect(!shares[i].is_sequence_start());
                expect_equal(pay_for_blob_namespace, shares[i].ns());
            }
        };
        "reserved bytes"_test = [] {
            compact_splitter_t s { tx_namespace, share_version_zero };
            for (const auto &tx: make_txs(3, 300))
                s.write_tx(tx);
            const auto &shares = s.export_shares();
            expect_equal(size_t { 2 }, shares.size());
            expect_equal(uint32_t { 38 }, shares[0].reserved_offset());
            // the second unit spills over, so the third one is the first to start in share 1
            expect_equal(uint32_t { 34 + 130 }, shares[1].reserved_offset());
        };
        "export is idempotent"_test = [] {
            compact_splitter_t s { tx_namespace, share_version_zero };
            s.write_tx(make_tx(600));
            const auto first = s.export_shares();
            const auto second = s.export_shares();
            expect(first == second);
            expect_equal(size_t { 2 }, s.count());
            s.write_tx(make_tx(10));
            const auto third = s.export_shares();
            expect_equal(first.size(), third.size());
            expect_equal(uint32_t { 602 + 11 }, third[0].sequence_len());
            expect(first[0] != third[0]);
        };
        "share ranges"_test = [] {
            compact_splitter_t s { tx_namespace, share_version_zero };
            const auto tx1 = make_tx(first_compact_share_content_size - 2, 1);
            const auto tx2 = make_tx(100, 2);
            const auto tx3 = make_tx(1000, 3);
            s.write_tx(tx1);
            s.write_tx(tx2);
            s.write_tx(tx3);
            const auto ranges = s.share_ranges(0);
            expect_equal(size_t { 3 }, ranges.size());
            expect_equal(range_t { 0, 1 }, ranges.at(crypto::sha256::digest(tx1)));
            expect_equal(range_t { 1, 2 }, ranges.at(crypto::sha256::digest(tx2)));
            expect_equal(range_t { 1, 4 }, ranges.at(crypto::sha256::digest(tx3)));
            expect_equal(range_t { 6, 7 }, s.share_ranges(5).at(crypto::sha256::digest(tx2)));
        };
    };

    "dasquare::share::compact_counter"_test = [] {
        "matches the splitter"_test = [] {
            const std::vector<std::vector<uint8_vector>> cases {
                {},
                { make_tx(120) },
                { make_tx(first_compact_share_content_size - 2) },
                { make_tx(first_compact_share_content_size - 1) },
                { make_tx(first_compact_share_content_size) },
                { make_tx(first_compact_share_content_size + 1) },
                { make_tx(first_compact_share_content_size), make_tx(continuation_compact_share_content_size - 4) },
                make_txs(1000, 100),
                make_txs(100, 1000),
                make_txs(8931, 77)
            };
            for (const auto &txs: cases) {
                compact_splitter_t writer { pay_for_blob_namespace, share_version_zero };
                compact_counter_t counter {};
                size_t sum = 0;
                for (const auto &tx: txs) {
                    writer.write_tx(tx);
                    const auto diff = counter.add(tx.size());
                    expect_equal(writer.count() - sum, diff);
                    sum = writer.count();
                    expect_equal(sum, counter.size());
                }
                expect_equal(writer.export_shares().size(), counter.size());
            }
        };
        "revert"_test = [] {
            compact_counter_t counter {};
            expect_equal(size_t { 0 }, counter.size());
            counter.add(first_compact_share_content_size - 2);
            expect_equal(size_t { 0 }, counter.remainder());
            counter.add(1);
            expect_equal(size_t { 2 }, counter.size());
            expect_equal(continuation_compact_share_content_size - 2, counter.remainder());
            counter.revert();
            expect_equal(size_t { 1 }, counter.size());
            expect_equal(size_t { 0 }, counter.remainder());
        };
        "delimiter length"_test = [] {
            expect_equal(size_t { 1 }, delim_len(0));
            expect_equal(size_t { 1 }, delim_len(127));
            expect_equal(size_t { 2 }, delim_len(128));
            expect_equal(size_t { 3 }, delim_len(16384));
        };
    };
};
