/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/test.hpp>
#include "errors.hpp"
#include "namespace.hpp"

namespace {
    using namespace dasquare;
    using namespace dasquare::share;

    namespace_t user_ns(const std::string_view sub_id_hex="0102030405060708090A")
    {
        return namespace_t::make_v0(uint8_vector::from_hex(sub_id_hex));
    }
}

suite dasquare_share_namespace_suite = [] {
    "dasquare::share::namespace"_test = [] {
        "make_v0"_test = [] {
            const auto ns = namespace_t::make_v0(uint8_vector::from_hex("0102"));
            expect_equal(size_t { namespace_size }, ns.bytes().size());
            expect_equal(uint8_t { 0 }, ns.version());
            expect_equal(uint8_t { 0x01 }, ns.bytes()[27]);
            expect_equal(uint8_t { 0x02 }, ns.bytes()[28]);
            expect(throws<err_invalid_namespace_t>([] { namespace_t::make_v0(uint8_vector(11)); }));
        };
        "validation"_test = [] {
            expect(throws<err_invalid_namespace_t>([] { namespace_t::from_bytes(uint8_vector(28)); }));
            expect(throws<err_invalid_namespace_t>([] { namespace_t::make(1, uint8_vector(namespace_id_size)); }));
            uint8_vector id(namespace_id_size);
            id[0] = 1;
            expect(throws<err_invalid_namespace_t>([&] { namespace_t::make(namespace_version_zero, id); }));
            expect(nothrow([] { namespace_t::make(namespace_version_max, uint8_vector(namespace_id_size)); }));
        };
        "validate_for_blob"_test = [] {
            expect(nothrow([] { user_ns().validate_for_blob(); }));
            expect(throws<err_invalid_namespace_t>([] { namespace_t::make_v0(uint8_vector::from_hex("01")).validate_for_blob(); }));
            expect(throws<err_invalid_namespace_t>([] { namespace_t::make(namespace_version_max, uint8_vector(namespace_id_size)).validate_for_blob(); }));
            expect(throws<err_invalid_namespace_t>([] { tx_namespace.validate_for_blob(); }));
            expect(throws<err_invalid_namespace_t>([] { parity_shares_namespace.validate_for_blob(); }));
            expect(throws<err_invalid_namespace_t>([] { tail_padding_namespace.validate_for_data(); }));
            expect(nothrow([] { tx_namespace.validate_for_data(); }));
        };
        "reserved"_test = [] {
            expect(tx_namespace < intermediate_state_roots_namespace);
            expect(pay_for_blob_namespace < pay_for_fibre_namespace);
            expect(primary_reserved_padding_namespace < user_ns());
            expect(user_ns() < tail_padding_namespace);
            expect(user_ns("01") < user_ns("0100"));
            expect(namespace_t::make_v0(uint8_vector::from_hex("01")) == tx_namespace);
            expect(tail_padding_namespace < parity_shares_namespace);
            expect(tx_namespace.is_reserved());
            expect(!user_ns().is_reserved());
            expect(min_secondary_reserved_namespace.is_secondary_reserved());
            expect(!parity_shares_namespace.is_usable());
        };
        "compact"_test = [] {
            expect(tx_namespace.is_compact());
            expect(pay_for_blob_namespace.is_compact());
            expect(!pay_for_fibre_namespace.is_compact());
            expect(!primary_reserved_padding_namespace.is_compact());
            expect(!user_ns().is_compact());
        };
        "add"_test = [] {
            const auto ns = namespace_t::make_v0(uint8_vector::from_hex("01"));
            expect_equal(namespace_t::make_v0(uint8_vector::from_hex("02")), ns.add(1));
            expect_equal(namespace_t::make_v0(uint8_vector::from_hex("0100")), namespace_t::make_v0(uint8_vector::from_hex("FF")).add(1));
            expect_equal(namespace_t::make_v0(uint8_vector::from_hex("FF")), namespace_t::make_v0(uint8_vector::from_hex("0100")).add(-1));
            expect_equal(ns, ns.add(0));
            expect(throws<err_invalid_namespace_t>([] { parity_shares_namespace.add(1); }));
            expect(throws<err_invalid_namespace_t>([] { namespace_t::primary_reserved(0).add(-1); }));
        };
        "format"_test = [] {
            expect_equal(std::string { "0000000000000000000000000000000000000000000000000000000001" }, fmt::format("{}", tx_namespace));
        };
    };
};
