#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <source_location>
#include <span>
#include <vector>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "format.hpp"

namespace dasquare {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", t);
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename X, typename Y>
    bool expect_equal(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename X, typename Y>
    bool expect_equal(const X &x, const Y &y, const std::string_view name, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{}: {} != {}", name, x, y);
        return res;
    }

    // element-wise comparison reporting the first mismatch, the elements must be formattable
    template<typename T>
    bool expect_equal_items(const std::span<const T> x, const std::span<const T> y, const std::source_location &loc=std::source_location::current())
    {
        if (x.size() != y.size()) {
            expect(false, loc) << fmt::format("item counts differ: {} != {}", x.size(), y.size());
            return false;
        }
        for (size_t i = 0; i < x.size(); ++i) {
            if (!(x[i] == y[i])) {
                expect(false, loc) << fmt::format("item #{} differs: {} != {}", i, x[i], y[i]);
                return false;
            }
        }
        return true;
    }

    template<typename T>
    bool expect_equal_items(const std::vector<T> &x, const std::vector<T> &y, const std::source_location &loc=std::source_location::current())
    {
        return expect_equal_items(std::span<const T> { x }, std::span<const T> { y }, loc);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<dasquare::test_printer>> {};
