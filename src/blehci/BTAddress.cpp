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
#include <cstdint>
#include <cstdio>

#include <jau/debug.hpp>
#include <jau/byte_util.hpp>

#include "BTAddress.hpp"

using namespace blehci;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_ADDRESSTYPE_ENUM(X) \
        X(AddressType,NON_RESOLVABLE_PRIVATE) \
        X(AddressType,RESOLVABLE_PRIVATE) \
        X(AddressType,RFU) \
        X(AddressType,STATIC_DEVICE)

std::string blehci::to_string(const AddressType type) noexcept {
    switch(type) {
        CHAR_DECL_ADDRESSTYPE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown AddressType "+jau::to_hexstring(number(type));
}

const BTAddress BTAddress::ZEROED;

BTAddress::BTAddress(const uint8_t * b_) noexcept {
    memcpy(b, b_, sizeof(b));
}

BTAddress::BTAddress(const std::string& str) {
    std::string errmsg;
    if( !scanBTAddress(str, *this, errmsg) ) {
        throw ConversionError(errmsg, E_FILE_LINE);
    }
}

static int hex_value(const char c) noexcept {
    if( '0' <= c && c <= '9' ) {
        return c - '0';
    } else if( 'a' <= c && c <= 'f' ) {
        return c - 'a' + 10;
    } else if( 'A' <= c && c <= 'F' ) {
        return c - 'A' + 10;
    }
    return -1;
}

bool BTAddress::scanBTAddress(const std::string& str, BTAddress& dest, std::string& errmsg) {
    const char * const s = str.c_str();
    const std::string::size_type len = str.size();
    std::string::size_type i = 0;
    jau::nsize_t octets = 0;
    uint8_t b_[byte_size] { 0 };

    if( 0 == len ) {
        errmsg = "BTAddress string is empty";
        return false;
    }
    while( i < len ) {
        // one or two hex digits
        std::string::size_type j = i;
        int v = 0;
        while( j < len && ':' != s[j] && '-' != s[j] ) {
            const int h = hex_value(s[j]);
            if( 0 > h ) {
                errmsg = "BTAddress string '"+str+"' contains non-hex character at position "+std::to_string(j);
                return false;
            }
            v = ( v << 4 ) | h;
            ++j;
        }
        const std::string::size_type digits = j - i;
        if( 0 == digits || 2 < digits ) {
            errmsg = "BTAddress string '"+str+"' contains octet with "+std::to_string(digits)+" digits at position "+std::to_string(i);
            return false;
        }
        if( byte_size <= octets ) {
            errmsg = "BTAddress string '"+str+"' has more than "+std::to_string(byte_size)+" octets";
            return false;
        }
        b_[octets++] = static_cast<uint8_t>(v);
        if( j < len ) {
            // skip delimiter, must be followed by another octet
            ++j;
            if( j == len ) {
                errmsg = "BTAddress string '"+str+"' ends with a delimiter";
                return false;
            }
        }
        i = j;
    }
    if( byte_size != octets ) {
        errmsg = "BTAddress string '"+str+"' has "+std::to_string(octets)+" octets, expected "+std::to_string(byte_size);
        return false;
    }
    memcpy(dest.b, b_, sizeof(dest.b));
    return true;
}

BTAddress BTAddress::from_u64(const uint64_t v) noexcept {
    BTAddress a;
    for(jau::nsize_t i=0; i<byte_size; ++i) {
        a.b[i] = static_cast<uint8_t>( ( v >> ( 8 * i ) ) & 0xff );
    }
    return a;
}

uint64_t BTAddress::to_u64() const noexcept {
    uint64_t v = 0;
    for(jau::nsize_t i=0; i<byte_size; ++i) {
        v |= static_cast<uint64_t>(b[i]) << ( 8 * i );
    }
    return v;
}

void BTAddress::pack_into(uint8_t * dest, const jau::nsize_t len) const {
    PackError::expect_length(byte_size, len);
    memcpy(dest, b, byte_size);
}

BTAddress BTAddress::unpack_from(const uint8_t * src, const jau::nsize_t len) {
    PackError::expect_length(byte_size, len);
    return BTAddress(src);
}

std::optional<PrivateAddressParts> BTAddress::private_address_parts() const noexcept {
    if( AddressType::RESOLVABLE_PRIVATE != address_type() ) {
        return std::nullopt;
    }
    const uint32_t hash  = static_cast<uint32_t>(b[0]) | ( static_cast<uint32_t>(b[1]) << 8 ) | ( static_cast<uint32_t>(b[2]) << 16 );
    const uint32_t prand = static_cast<uint32_t>(b[3]) | ( static_cast<uint32_t>(b[4]) << 8 ) | ( static_cast<uint32_t>(b[5]) << 16 );
    return PrivateAddressParts { hash, prand };
}

std::string BTAddress::toString() const noexcept {
    // str_len = 2 * len + ( len - 1 )
    const jau::nsize_t str_len = 2 * byte_size + ( byte_size - 1 );
    std::string str;
    str.reserve(str_len+1); // including EOS for snprintf
    str.resize(str_len);

    const int count = snprintf(&str[0], str.capacity(), "%2.2X:%2.2X:%2.2X:%2.2X:%2.2X:%2.2X",
                                b[0], b[1], b[2], b[3], b[4], b[5]);
    if( str_len != static_cast<jau::nsize_t>(count) ) {
        ABORT("BTAddress::toString: length mismatch %zu (%d) != %zu", (size_t)str_len, count, str.length());
    }
    return str;
}
