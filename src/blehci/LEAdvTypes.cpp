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

#include "LEAdvTypes.hpp"

using namespace blehci;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

// *************************************************
// *************************************************
// *************************************************

const AdvertisingInterval AdvertisingInterval::MIN(MIN_U16, unchecked_t());
const AdvertisingInterval AdvertisingInterval::MIN_NON_CONN(MIN_NON_CONN_U16, unchecked_t());
const AdvertisingInterval AdvertisingInterval::MAX(MAX_U16, unchecked_t());
const AdvertisingInterval AdvertisingInterval::DEFAULT(DEFAULT_U16, unchecked_t());

AdvertisingInterval::AdvertisingInterval(const uint16_t v) noexcept
: units(v)
{
    if( !is_valid(v) ) {
        ABORT("AdvertisingInterval %s not within [%s, %s]",
                jau::to_hexstring(v).c_str(), jau::to_hexstring(MIN_U16).c_str(), jau::to_hexstring(MAX_U16).c_str());
    }
}

AdvertisingInterval AdvertisingInterval::from(const uint16_t v) {
    if( !is_valid(v) ) {
        throw ConversionError("AdvertisingInterval "+jau::to_hexstring(v)+" not within ["+
                              jau::to_hexstring(MIN_U16)+", "+jau::to_hexstring(MAX_U16)+"]", E_FILE_LINE);
    }
    return AdvertisingInterval(v, unchecked_t());
}

AdvertisingInterval AdvertisingInterval::from(const std::chrono::milliseconds& d) {
    const auto ms = d.count();
    if( 0 > ms || static_cast<std::chrono::milliseconds::rep>(UINT32_MAX / 16) < ms ) {
        throw ConversionError("AdvertisingInterval "+std::to_string(ms)+" ms out of range", E_FILE_LINE);
    }
    const std::optional<AdvertisingInterval> res = from_milliseconds( static_cast<uint32_t>(ms) );
    if( !res.has_value() ) {
        throw ConversionError("AdvertisingInterval "+std::to_string(ms)+" ms out of range", E_FILE_LINE);
    }
    return *res;
}

std::optional<AdvertisingInterval> AdvertisingInterval::from_milliseconds(const uint32_t ms) noexcept {
    if( UINT32_MAX / 16 < ms ) {
        return std::nullopt;
    }
    const uint32_t v = ms * 16 / 10;
    if( MAX_U16 < v || !is_valid( static_cast<uint16_t>(v) ) ) {
        return std::nullopt;
    }
    return AdvertisingInterval( static_cast<uint16_t>(v), unchecked_t() );
}

std::string AdvertisingInterval::toString() const noexcept {
    return jau::to_hexstring(units)+" ("+std::to_string(as_microseconds()/1000)+"."+
           std::to_string( ( as_microseconds() % 1000 ) / 100 )+" ms)";
}

// *************************************************
// *************************************************
// *************************************************

#define CHAR_DECL_AdvertisingType_ENUM(X) \
        X(AdvertisingType,ADV_IND) \
        X(AdvertisingType,ADV_DIRECT_IND_HIGH_DUTY) \
        X(AdvertisingType,ADV_SCAN_IND) \
        X(AdvertisingType,ADV_NONCONN_IND) \
        X(AdvertisingType,ADV_DIRECT_IND_LOW_DUTY)

std::string blehci::to_string(const AdvertisingType v) noexcept {
    switch(v) {
        CHAR_DECL_AdvertisingType_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown AdvertisingType "+jau::to_hexstring(number(v));
}

AdvertisingType blehci::to_AdvertisingType(const uint8_t v) {
    if( v <= number(AdvertisingType::ADV_DIRECT_IND_LOW_DUTY) ) {
        return static_cast<AdvertisingType>(v);
    }
    throw ConversionError("Unknown AdvertisingType "+jau::to_hexstring(v), E_FILE_LINE);
}

#define CHAR_DECL_PeerAddressType_ENUM(X) \
        X(PeerAddressType,PUBLIC) \
        X(PeerAddressType,RANDOM)

std::string blehci::to_string(const PeerAddressType v) noexcept {
    switch(v) {
        CHAR_DECL_PeerAddressType_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown PeerAddressType "+jau::to_hexstring(number(v));
}

PeerAddressType blehci::to_PeerAddressType(const uint8_t v) {
    if( v <= number(PeerAddressType::RANDOM) ) {
        return static_cast<PeerAddressType>(v);
    }
    throw ConversionError("Unknown PeerAddressType "+jau::to_hexstring(v), E_FILE_LINE);
}

#define CHAR_DECL_OwnAddressType_ENUM(X) \
        X(OwnAddressType,PUBLIC_DEVICE) \
        X(OwnAddressType,RANDOM_DEVICE) \
        X(OwnAddressType,PRIVATE_OR_PUBLIC) \
        X(OwnAddressType,PRIVATE_OR_RANDOM)

std::string blehci::to_string(const OwnAddressType v) noexcept {
    switch(v) {
        CHAR_DECL_OwnAddressType_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown OwnAddressType "+jau::to_hexstring(number(v));
}

OwnAddressType blehci::to_OwnAddressType(const uint8_t v) {
    if( v <= number(OwnAddressType::PRIVATE_OR_RANDOM) ) {
        return static_cast<OwnAddressType>(v);
    }
    throw ConversionError("Unknown OwnAddressType "+jau::to_hexstring(v), E_FILE_LINE);
}

#define CHAR_DECL_FilterPolicy_ENUM(X) \
        X(FilterPolicy,ALL) \
        X(FilterPolicy,CONN_ALL_SCAN_WHITELIST) \
        X(FilterPolicy,SCAN_ALL_CONN_WHITELIST) \
        X(FilterPolicy,WHITELIST)

std::string blehci::to_string(const FilterPolicy v) noexcept {
    switch(v) {
        CHAR_DECL_FilterPolicy_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown FilterPolicy "+jau::to_hexstring(number(v));
}

FilterPolicy blehci::to_FilterPolicy(const uint8_t v) {
    if( v <= number(FilterPolicy::WHITELIST) ) {
        return static_cast<FilterPolicy>(v);
    }
    throw ConversionError("Unknown FilterPolicy "+jau::to_hexstring(v), E_FILE_LINE);
}

#define CHAR_DECL_Channels_ENUM(X) \
        X(Channels,CHANNEL_37) \
        X(Channels,CHANNEL_38) \
        X(Channels,CHANNEL_39)

std::string blehci::to_string(const Channels v) noexcept {
    switch(v) {
        CHAR_DECL_Channels_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown Channels "+jau::to_hexstring(number(v));
}

// *************************************************
// *************************************************
// *************************************************

const ChannelMap ChannelMap::ZEROED(0, unchecked_t());
const ChannelMap ChannelMap::ALL(ALL_U8, unchecked_t());

ChannelMap::ChannelMap(const uint8_t v) noexcept
: mask(v)
{
    if( ALL_U8 < v ) {
        ABORT("ChannelMap %s > %s", jau::to_hexstring(v).c_str(), jau::to_hexstring(ALL_U8).c_str());
    }
}

ChannelMap ChannelMap::from(const uint8_t v) {
    if( ALL_U8 < v ) {
        throw ConversionError("ChannelMap "+jau::to_hexstring(v)+" > "+jau::to_hexstring(ALL_U8), E_FILE_LINE);
    }
    return ChannelMap(v, unchecked_t());
}

std::string ChannelMap::toString() const noexcept {
    std::string out("[");
    bool comma = false;
    for(const Channels c : { Channels::CHANNEL_37, Channels::CHANNEL_38, Channels::CHANNEL_39 }) {
        if( get_channel(c) ) {
            if( comma ) { out.append(", "); }
            out.append(to_string(c)); comma = true;
        }
    }
    out.append("]");
    return out;
}

// *************************************************
// *************************************************
// *************************************************

const AdvertisingParameters AdvertisingParameters::DEFAULT;

AdvertisingParameters AdvertisingParameters::with_address(const BTAddress& address) const noexcept {
    AdvertisingParameters p(*this);
    p.peer_address = address;
    return p;
}

AdvertisingParameters AdvertisingParameters::with_interval(const AdvertisingInterval& min, const AdvertisingInterval& max) const noexcept {
    AdvertisingParameters p(*this);
    p.interval_min = min;
    p.interval_max = max;
    return p;
}

void AdvertisingParameters::pack_into(uint8_t * dest, const jau::nsize_t len) const {
    PackError::expect_length(BYTE_LEN, len);
    if( interval_max < interval_min ) {
        throw PackError(PackErrc::INVALID_FIELDS, "interval_min "+interval_min.toString()+" > interval_max "+interval_max.toString(), E_FILE_LINE);
    }
    jau::put_uint16(dest + 0, interval_min.value(), jau::lb_endian_t::little);
    jau::put_uint16(dest + 2, interval_max.value(), jau::lb_endian_t::little);
    dest[4] = number(advertising_type);
    dest[5] = number(own_address_type);
    dest[6] = number(peer_address_type);
    peer_address.pack_into(dest + 7, BTAddress::byte_size);
    dest[13] = channel_map.value();
    dest[14] = number(filter_policy);
}

AdvertisingParameters AdvertisingParameters::unpack_from(const uint8_t * src, const jau::nsize_t len) {
    PackError::expect_length(BYTE_LEN, len);
    AdvertisingParameters p;
    const uint16_t imin = jau::get_uint16(src + 0, jau::lb_endian_t::little);
    const uint16_t imax = jau::get_uint16(src + 2, jau::lb_endian_t::little);
    if( !AdvertisingInterval::is_valid(imin) ) {
        throw PackError::bad_index(0);
    }
    if( !AdvertisingInterval::is_valid(imax) ) {
        throw PackError::bad_index(2);
    }
    p.interval_min = AdvertisingInterval(imin);
    p.interval_max = AdvertisingInterval(imax);
    try {
        p.advertising_type = to_AdvertisingType(src[4]);
    } catch (const ConversionError&) {
        throw PackError::bad_index(4);
    }
    try {
        p.own_address_type = to_OwnAddressType(src[5]);
    } catch (const ConversionError&) {
        throw PackError::bad_index(5);
    }
    try {
        p.peer_address_type = to_PeerAddressType(src[6]);
    } catch (const ConversionError&) {
        throw PackError::bad_index(6);
    }
    p.peer_address = BTAddress::unpack_from(src + 7, BTAddress::byte_size);
    try {
        p.channel_map = ChannelMap::from(src[13]);
    } catch (const ConversionError&) {
        throw PackError::bad_index(13);
    }
    try {
        p.filter_policy = to_FilterPolicy(src[14]);
    } catch (const ConversionError&) {
        throw PackError::bad_index(14);
    }
    if( p.interval_max < p.interval_min ) {
        throw PackError(PackErrc::INVALID_FIELDS, "interval_min "+p.interval_min.toString()+" > interval_max "+p.interval_max.toString(), E_FILE_LINE);
    }
    return p;
}

std::string AdvertisingParameters::toString() const noexcept {
    return "AdvParams[interval["+interval_min.toString()+" .. "+interval_max.toString()+
           "], type "+to_string(advertising_type)+
           ", own "+to_string(own_address_type)+
           ", peer["+to_string(peer_address_type)+", "+peer_address.toString()+
           "], channels "+channel_map.toString()+
           ", filter "+to_string(filter_policy)+"]";
}

bool blehci::operator==(const AdvertisingParameters& lhs, const AdvertisingParameters& rhs) noexcept {
    return lhs.interval_min == rhs.interval_min &&
           lhs.interval_max == rhs.interval_max &&
           lhs.advertising_type == rhs.advertising_type &&
           lhs.own_address_type == rhs.own_address_type &&
           lhs.peer_address_type == rhs.peer_address_type &&
           lhs.peer_address == rhs.peer_address &&
           lhs.channel_map == rhs.channel_map &&
           lhs.filter_policy == rhs.filter_policy;
}
