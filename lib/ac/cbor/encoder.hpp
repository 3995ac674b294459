/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_CBOR_ENCODER_HPP
#define ADA_COMPOSER_CBOR_ENCODER_HPP

#include <limits>
#include <ac/common/bytes.hpp>
#include <ac/cbor/types.hpp>

namespace ada_composer::cbor {
    // Produces definite-length CBOR items only
    struct encoder {
        encoder &array(const size_t sz)
        {
            _encode_uint_item(major_type::array, sz);
            return *this;
        }

        encoder &map(const size_t sz)
        {
            _encode_uint_item(major_type::map, sz);
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            _encode_uint_item(major_type::uint, val);
            return *this;
        }

        // the negative value must be already converted to the uint64_t representation
        encoder &nint(const uint64_t val)
        {
            _encode_uint_item(major_type::nint, val);
            return *this;
        }

        encoder &sint(const int64_t val)
        {
            if (val >= 0)
                return uint(static_cast<uint64_t>(val));
            return nint(static_cast<uint64_t>(-(val + 1)));
        }

        encoder &bytes(const buffer buf)
        {
            _encode_uint_item(major_type::bytes, buf.size());
            _encode_data(buf);
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            _encode_uint_item(major_type::text, sv.size());
            _encode_data(sv);
            return *this;
        }

        // appends an already encoded item
        encoder &raw_cbor(const buffer buf)
        {
            _encode_data(buf);
            return *this;
        }

        encoder &s_null()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_null));
            return *this;
        }

        encoder &s_bool(const bool val)
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(val ? special_val::s_true : special_val::s_false));
            return *this;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_data(const buffer buf)
        {
            _buf << buf;
        }

        void _encode_uint_item(const major_type typ, const uint64_t val)
        {
            if (val < 24) {
                _encode_item(typ, static_cast<uint8_t>(val));
            } else if (val <= std::numeric_limits<uint8_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::one_byte));
                _buf << static_cast<uint8_t>(val);
            } else if (val <= std::numeric_limits<uint16_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::two_bytes));
                _encode_data(buffer::from(host_to_net<uint16_t>(val)));
            } else if (val <= std::numeric_limits<uint32_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::four_bytes));
                _encode_data(buffer::from(host_to_net<uint32_t>(val)));
            } else {
                _encode_item(typ, static_cast<uint8_t>(special_val::eight_bytes));
                _encode_data(buffer::from(host_to_net<uint64_t>(val)));
            }
        }

        void _encode_item(const major_type typ, const uint8_t special)
        {
            _buf.emplace_back((static_cast<uint8_t>(typ) << 5) | (special & 0x1F));
        }
    };
}

#endif // !ADA_COMPOSER_CBOR_ENCODER_HPP
