#pragma once
/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <dasquare/common/error.hpp>
#include <dasquare/common/format.hpp>

namespace dasquare {
    // malformed input
    struct err_invalid_share_t final: error {
        explicit err_invalid_share_t(const std::string_view msg): error { msg } {}
    };
    struct err_invalid_namespace_t final: error {
        explicit err_invalid_namespace_t(const std::string_view msg): error { msg } {}
    };
    struct err_unsupported_share_version_t final: error {
        explicit err_unsupported_share_version_t(const std::string_view msg): error { msg } {}
    };
    struct err_invalid_blob_t final: error {
        explicit err_invalid_blob_t(const std::string_view msg): error { msg } {}
    };
    struct err_malformed_envelope_t final: error {
        explicit err_malformed_envelope_t(const std::string_view msg): error { msg } {}
    };

    // structural inconsistency of a share sequence
    struct err_continuation_namespace_mismatch_t final: error {
        explicit err_continuation_namespace_mismatch_t(const std::string_view msg): error { msg } {}
    };
    struct err_orphan_continuation_t final: error {
        explicit err_orphan_continuation_t(const std::string_view msg): error { msg } {}
    };
    struct err_sequence_length_t final: error {
        explicit err_sequence_length_t(const std::string_view msg): error { msg } {}
    };
    struct err_invalid_sequence_length_t final: error {
        explicit err_invalid_sequence_length_t(const std::string_view msg): error { msg } {}
    };

    struct err_invalid_argument_t final: error {
        explicit err_invalid_argument_t(const std::string_view msg): error { msg } {}
    };
    // the packer and the parser disagree, or an object is used outside of its lifecycle
    struct err_internal_t final: error {
        explicit err_internal_t(const std::string_view msg): error { fmt::format("internal error: {}", msg) } {}
    };
}
