/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "error.hpp"

namespace {
    using namespace dasquare;
}

suite dasquare_common_error_suite = [] {
    "dasquare::common::error"_test = [] {
        "message"_test = [] {
            const error e { fmt::format("share {} is broken", 12) };
            expect_equal(std::string_view { "share 12 is broken" }, std::string_view { e.what() });
        };
        "nested"_test = [] {
            const std::runtime_error cause { "too short" };
            const error e { "parse failed", cause };
            const std::string_view msg { e.what() };
            expect(msg.starts_with("parse failed caused by ")) << msg;
            expect(msg.ends_with(": too short")) << msg;
        };
        "hierarchy"_test = [] {
            expect(throws<base_error>([] { throw error_sys("getrlimit"); }));
            expect(throws<std::exception>([] { throw error("x"); }));
        };
    };
};
