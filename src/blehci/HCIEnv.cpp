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

#include <cstdint>

#include <jau/environment.hpp>

#include "HCIEnv.hpp"

using namespace blehci;

HCIEnv::HCIEnv() noexcept
: exploding( jau::environment::getExplodingProperties("blehci.hci") | jau::environment::getExplodingProperties("blehci.debug") ),
  HCI_COMMAND_COMPLETE_REPLY_TIMEOUT( jau::environment::getInt32Property("blehci.hci.cmd.complete.timeout", 10000, 1500 /* min */, INT32_MAX /* max */) ),
  HCI_READ_PACKET_MAX_RETRY( jau::environment::getInt32Property("blehci.hci.read.max_retry", 64, 1 /* min */, 1024 /* max */) ),
  HCI_DEFAULT_CHANNEL( static_cast<HCIChannel>( jau::environment::getInt32Property("blehci.hci.channel", number(HCIChannel::USER),
                                                                                   number(HCIChannel::RAW) /* min */, number(HCIChannel::LOGGING) /* max */) ) ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("blehci.debug.hci.event", false) )
{
}
