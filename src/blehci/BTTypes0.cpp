/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <cstdio>

#include <jau/debug.hpp>
#include <jau/byte_util.hpp>

#include "BTTypes0.hpp"

using namespace blehci;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_PackErrc_ENUM(X) \
        X(PackErrc,SUCCESS) \
        X(PackErrc,BAD_OPCODE) \
        X(PackErrc,BAD_LENGTH) \
        X(PackErrc,BAD_BYTES) \
        X(PackErrc,INVALID_FIELDS)

std::string blehci::to_string(const PackErrc v) noexcept {
    switch(v) {
        CHAR_DECL_PackErrc_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown PackErrc "+std::to_string(number(v));
}

void PackError::expect_length(const jau::nsize_t expected, const jau::nsize_t got) {
    if( expected != got ) {
        throw PackError(PackErrc::BAD_LENGTH, "expected "+std::to_string(expected)+", got "+std::to_string(got), E_FILE_LINE,
                        static_cast<jau::snsize_t>(expected), static_cast<jau::snsize_t>(got));
    }
}

void PackError::atleast_length(const jau::nsize_t expected, const jau::nsize_t got) {
    if( got < expected ) {
        throw PackError(PackErrc::BAD_LENGTH, "expected at least "+std::to_string(expected)+", got "+std::to_string(got), E_FILE_LINE,
                        static_cast<jau::snsize_t>(expected), static_cast<jau::snsize_t>(got));
    }
}

PackError PackError::bad_index(const jau::nsize_t idx) noexcept {
    return PackError(PackErrc::BAD_BYTES, "invalid byte at index "+std::to_string(idx), E_FILE_LINE,
                     NONE, NONE, static_cast<jau::snsize_t>(idx));
}

RSSI::RSSI(const int8_t v) noexcept
: dbm(v)
{
    if( !is_valid(v) ) {
        ABORT("RSSI %d dBm not within [%d, %d]", v, MIN_RSSI_I8, MAX_RSSI_I8);
    }
}

RSSI RSSI::from(const int8_t v) {
    if( !is_valid(v) ) {
        throw ConversionError("RSSI "+std::to_string(v)+" dBm not within ["+
                              std::to_string(MIN_RSSI_I8)+", "+std::to_string(MAX_RSSI_I8)+"]", E_FILE_LINE);
    }
    return RSSI(v, unchecked_t());
}

std::optional<RSSI> RSSI::maybe_rssi(const int8_t v) {
    if( UNSUPPORTED_RSSI == v ) {
        return std::nullopt;
    }
    return from(v);
}

std::array<uint8_t, 2> CompanyID::to_bytes_le() const noexcept {
    std::array<uint8_t, 2> b;
    jau::put_uint16(b.data(), id, jau::lb_endian_t::little);
    return b;
}

std::array<uint8_t, 2> CompanyID::to_bytes_be() const noexcept {
    std::array<uint8_t, 2> b;
    jau::put_uint16(b.data(), id, jau::lb_endian_t::big);
    return b;
}

CompanyID CompanyID::from_bytes_le(const std::array<uint8_t, 2>& b) noexcept {
    return CompanyID( jau::get_uint16(b.data(), jau::lb_endian_t::little) );
}

CompanyID CompanyID::from_bytes_be(const std::array<uint8_t, 2>& b) noexcept {
    return CompanyID( jau::get_uint16(b.data(), jau::lb_endian_t::big) );
}

CompanyID CompanyID::unpack_from(const uint8_t* src, const jau::nsize_t len) {
    PackError::expect_length(byte_len(), len);
    return CompanyID( jau::get_uint16(src, jau::lb_endian_t::little) );
}
