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

#ifndef ADVERTISER_HPP_
#define ADVERTISER_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include <future>
#include <system_error>

#include "LEAdvTypes.hpp"

namespace blehci {

    /** \addtogroup BLEHCIUserAPI
     *
     *  @{
     */

    /**
     * Operation set to control BLE legacy advertising,
     * independent of how the commands reach the controller.
     * <p>
     * Each operation completes once the controller replied or the transport failed.
     * An empty std::error_code denotes success, otherwise the error is of
     * - HCIStatusCodeCategory for a controller rejection or a missing reply,
     * - HCISocketErrorCategory or std::system_category() for a transport failure,
     * - PackErrcCategory for a packing failure.
     * </p>
     * <p>
     * Command and reply exchanges are not multiplexed,
     * implementations serialize them per transport.
     * </p>
     */
    class Advertiser {
        public:
            virtual ~Advertiser() noexcept = default;

            /** BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.9 LE Set Advertising Enable command */
            virtual std::future<std::error_code> set_advertising_enable(const bool enable) = 0;

            /** BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.5 LE Set Advertising Parameters command */
            virtual std::future<std::error_code> set_advertising_parameters(const AdvertisingParameters& params) = 0;

            /**
             * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.7 LE Set Advertising Data command
             * <p>
             * Data exceeding the 31 octet legacy payload is never truncated.
             * </p>
             */
            virtual std::future<std::error_code> set_advertising_data(std::vector<uint8_t> data) = 0;

            virtual std::string toString() const noexcept = 0;
    };

    /**@}*/

} // namespace blehci

#endif /* ADVERTISER_HPP_ */
