/* This file is part of DaSquare project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include "errors.hpp"
#include "namespace.hpp"

namespace dasquare::share {
    namespace_t namespace_t::make(const uint8_t version, const buffer id)
    {
        if (id.size() != namespace_id_size) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("unsupported namespace id length: id {} must be {} bytes but it was {} bytes", id, namespace_id_size, id.size()));
        bytes_t bytes;
        bytes[0] = version;
        std::copy(id.begin(), id.end(), bytes.begin() + namespace_version_size);
        namespace_t ns { bytes };
        ns.validate();
        return ns;
    }

    namespace_t namespace_t::from_bytes(const buffer bytes)
    {
        if (bytes.size() != namespace_size) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("invalid namespace length: {}. Must be {} bytes", bytes.size(), namespace_size));
        bytes_t data;
        std::copy(bytes.begin(), bytes.end(), data.begin());
        namespace_t ns { data };
        ns.validate();
        return ns;
    }

    namespace_t namespace_t::make_v0(const buffer sub_id)
    {
        if (sub_id.size() > namespace_version_zero_id_size) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("sub_id must be <= {} bytes, but it was {} bytes", namespace_version_zero_id_size, sub_id.size()));
        bytes_t bytes {};
        std::copy(sub_id.begin(), sub_id.end(), bytes.end() - sub_id.size());
        namespace_t ns { bytes };
        ns.validate();
        return ns;
    }

    void namespace_t::validate() const
    {
        if (version() != namespace_version_zero && version() != namespace_version_max) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("unsupported namespace version {}", version()));
        if (version() == namespace_version_zero) {
            const auto prefix = id().subbuf(0, namespace_version_zero_prefix_size);
            if (!std::all_of(prefix.begin(), prefix.end(), [](const uint8_t b) { return b == 0; })) [[unlikely]]
                throw err_invalid_namespace_t(fmt::format("unsupported namespace id with version {}. ID {} must start with {} leading zeros",
                    version(), id(), namespace_version_zero_prefix_size));
        }
    }

    void namespace_t::validate_for_data() const
    {
        validate();
        if (!is_usable()) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("invalid data namespace({}): parity and tail padding namespace are forbidden", *this));
    }

    void namespace_t::validate_for_blob() const
    {
        validate_for_data();
        if (is_reserved()) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("invalid data namespace({}): reserved data is forbidden", *this));
        if (version() != namespace_version_zero) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("blob namespace version {} is not supported", version()));
    }

    namespace_t namespace_t::add(const int64_t val) const
    {
        if (val == 0)
            return *this;
        const uint64_t magnitude = val > 0 ? static_cast<uint64_t>(val) : ~static_cast<uint64_t>(val) + 1;
        bytes_t operand {};
        store_be32(write_buffer { operand.data() + namespace_size - 8, 4 }, static_cast<uint32_t>(magnitude >> 32));
        store_be32(write_buffer { operand.data() + namespace_size - 4, 4 }, static_cast<uint32_t>(magnitude));
        bytes_t res;
        int carry = 0;
        for (size_t i = namespace_size; i > 0; --i) {
            const auto idx = i - 1;
            int sum = val > 0
                ? static_cast<int>(_bytes[idx]) + static_cast<int>(operand[idx]) + carry
                : static_cast<int>(_bytes[idx]) - static_cast<int>(operand[idx]) + carry;
            if (sum > 0xFF) {
                carry = 1;
                sum -= 0x100;
            } else if (sum < 0) {
                carry = -1;
                sum += 0x100;
            } else {
                carry = 0;
            }
            res[idx] = static_cast<uint8_t>(sum);
        }
        if (carry != 0) [[unlikely]]
            throw err_invalid_namespace_t(fmt::format("namespace overflow: {} + {}", *this, val));
        return namespace_t { res };
    }
}
