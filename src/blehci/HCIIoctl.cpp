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

#include <string>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "HCIIoctl.hpp"

using namespace blehci;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_HCIChannel_ENUM(X) \
        X(HCIChannel,RAW) \
        X(HCIChannel,USER) \
        X(HCIChannel,MONITOR) \
        X(HCIChannel,CONTROL) \
        X(HCIChannel,LOGGING)

std::string blehci::to_string(const HCIChannel v) noexcept {
    switch(v) {
        CHAR_DECL_HCIChannel_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown HCIChannel "+jau::to_hexstring(number(v));
}
