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

#ifndef HCI_ENV_HPP_
#define HCI_ENV_HPP_

#include <cstdint>

#include <jau/environment.hpp>

#include "HCIIoctl.hpp"

namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * HCI Singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class HCIEnv : public jau::root_environment {
        private:
            HCIEnv() noexcept;

            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Timeout for HCI command complete replies in milliseconds, defaults to 10s, minimum 1.5s.
             * <p>
             * Environment variable is 'blehci.hci.cmd.complete.timeout'.
             * </p>
             */
            const int32_t HCI_COMMAND_COMPLETE_REPLY_TIMEOUT;

            /**
             * Maximum number of packets to read until matching a command's reply, defaults to 64.
             * Won't block as HCI_COMMAND_COMPLETE_REPLY_TIMEOUT will limit.
             * <p>
             * Environment variable is 'blehci.hci.read.max_retry'.
             * </p>
             */
            const int32_t HCI_READ_PACKET_MAX_RETRY;

            /**
             * Default HCIChannel used by HCIComm::open(), defaults to HCIChannel::USER.
             * <p>
             * Environment variable is 'blehci.hci.channel', range [0..4].
             * </p>
             */
            const HCIChannel HCI_DEFAULT_CHANNEL;

            /**
             * Debug all HCI packet communication
             * <p>
             * Environment variable is 'blehci.debug.hci.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static HCIEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static HCIEnv e;
                return e;
            }
    };

    /**@}*/

} // namespace blehci

#endif /* HCI_ENV_HPP_ */
