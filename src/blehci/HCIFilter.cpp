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

#include <jau/byte_util.hpp>

#include "HCIFilter.hpp"
#include "HCITypes.hpp"

using namespace blehci;

void HCIFilter::put_type_mask(const uint32_t v) noexcept {
    jau::put_uint32(data + 0, v, jau::lb_endian_t::little);
}

void HCIFilter::put_event_mask(const uint64_t v) noexcept {
    jau::put_uint32(data + 4, static_cast<uint32_t>( v & 0xffffffffU ), jau::lb_endian_t::little);
    jau::put_uint32(data + 8, static_cast<uint32_t>( v >> 32 ), jau::lb_endian_t::little);
}

uint32_t HCIFilter::type_mask() const noexcept {
    return jau::get_uint32(data + 0, jau::lb_endian_t::little);
}

uint64_t HCIFilter::event_mask() const noexcept {
    return static_cast<uint64_t>( jau::get_uint32(data + 4, jau::lb_endian_t::little) ) |
           ( static_cast<uint64_t>( jau::get_uint32(data + 8, jau::lb_endian_t::little) ) << 32 );
}

uint16_t HCIFilter::opcode() const noexcept {
    return jau::get_uint16(data + 12, jau::lb_endian_t::little);
}

void HCIFilter::set_opcode(const uint16_t opc) noexcept {
    jau::put_uint16(data + 12, opc, jau::lb_endian_t::little);
}

HCIFilter HCIFilter::make_default() noexcept {
    HCIFilter f;
    f.set_ptype(number(HCIPacketType::COMMAND));
    f.set_ptype(number(HCIPacketType::EVENT));
    f.set_event(number(HCIEventType::CMD_COMPLETE));
    f.set_event(number(HCIEventType::CMD_STATUS));
    return f;
}

std::string HCIFilter::toString() const noexcept {
    return "HCIFilter[types "+jau::to_hexstring(type_mask())+
           ", events "+jau::to_hexstring(event_mask())+
           ", opcode "+jau::to_hexstring(opcode())+
           ", bytes "+jau::bytesHexString(data, 0, byte_size, true /* lsbFirst */)+"]";
}
