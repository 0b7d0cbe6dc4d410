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

#ifndef HCI_ADVERTISER_HPP_
#define HCI_ADVERTISER_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <future>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>

#include "Advertiser.hpp"
#include "HCIComm.hpp"
#include "HCIEnv.hpp"
#include "HCITypes.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module HCIAdvertiser:
 *
 * - BT Core Spec v5.2: Vol 4, Part E HCI: 7.8 LE Controller Commands, legacy advertising
 */
namespace blehci {

    /** \addtogroup BLEHCIUserAPI
     *
     *  @{
     */

    /**
     * Advertiser on top of a raw HCIComm, exclusively owned.
     * <p>
     * Each operation writes its HCICommand and reads events until the matching
     * HCICommandCompleteEvent or a failing HCICommandStatusEvent,
     * bounded by HCIEnv::HCI_COMMAND_COMPLETE_REPLY_TIMEOUT and HCIEnv::HCI_READ_PACKET_MAX_RETRY.
     * </p>
     * <p>
     * The asynchronous operations run via std::async,
     * the instance must outlive their returned futures.
     * </p>
     */
    class HCIAdvertiser : public Advertiser {
        private:
            const HCIEnv & env;
            std::unique_ptr<HCIComm> comm;
            std::recursive_mutex mtx_sendReply;
            jau::POctets rbuffer;

            std::error_code sendCommand(HCICommand &req) noexcept;
            std::unique_ptr<HCIEvent> getNextReply(HCICommand &req, int32_t & retryCount, const uint64_t t0, std::error_code& ec) noexcept;
            std::unique_ptr<HCIEvent> getNextCmdCompleteReply(HCICommand &req, HCICommandCompleteEvent **res, std::error_code& ec) noexcept;
            std::error_code processCommandComplete(HCICommand &req) noexcept;

        public:
            /** Maximum event packet size, header plus 255 parameter octets */
            static constexpr jau::nsize_t EVENT_MAX_SIZE = number(HCIConstSizeT::EVENT_HDR_SIZE) + 255;

            explicit HCIAdvertiser(std::unique_ptr<HCIComm> comm_) noexcept;

            HCIAdvertiser(const HCIAdvertiser&) = delete;
            void operator=(const HCIAdvertiser&) = delete;

            ~HCIAdvertiser() noexcept override = default;

            bool is_open() const noexcept { return nullptr != comm && comm->is_open(); }

            /** Synchronous set_advertising_enable() */
            std::error_code le_set_adv_enable(const bool enable) noexcept;

            /** Synchronous set_advertising_parameters() */
            std::error_code le_set_adv_param(const AdvertisingParameters& params) noexcept;

            /** Synchronous set_advertising_data(), PackErrc::BAD_LENGTH if `data_len` exceeds HCIConstU16::MAX_AD_LENGTH */
            std::error_code le_set_adv_data(const uint8_t* data, const jau::nsize_t data_len) noexcept;

            std::future<std::error_code> set_advertising_enable(const bool enable) override;

            std::future<std::error_code> set_advertising_parameters(const AdvertisingParameters& params) override;

            std::future<std::error_code> set_advertising_data(std::vector<uint8_t> data) override;

            std::string toString() const noexcept override;
    };

    /**@}*/

} // namespace blehci

#endif /* HCI_ADVERTISER_HPP_ */
