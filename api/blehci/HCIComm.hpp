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

#ifndef HCI_COMM_HPP_
#define HCI_COMM_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <memory>
#include <mutex>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/ordered_atomic.hpp>

#include "BTTypes0.hpp"
#include "HCIIoctl.hpp"
#include "HCIFilter.hpp"
#include "HCIErrors.hpp"
#include "HCIEnv.hpp"
#include "KernelTransport.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module HCIComm:
 *
 * - BT Core Spec v5.2: Vol 4, Part E Host Controller Interface (HCI)
 */
namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * Read/Write HCI communication channel, bound to one adapter.
     * <p>
     * An instance exclusively owns its socket descriptor,
     * which is closed via close() or destruction unless release()'d before.
     * </p>
     */
    class HCIComm {
        public:
            const AdapterID dev_id;
            const HCIChannel channel;

        private:
            std::shared_ptr<KernelTransport> kernel;
            std::recursive_mutex mtx_write;
            jau::relaxed_atomic_int socket_descriptor; // the hci socket

            HCIComm(std::shared_ptr<KernelTransport> kernel_, const AdapterID dev_id_, const HCIChannel channel_, const int fd) noexcept;

        public:
            /**
             * Opens a raw HCI socket, binds it to the given adapter and channel
             * and installs the HCIFilter::make_default() filter.
             * <p>
             * Returns the opened instance only if all three steps succeeded,
             * otherwise the descriptor is closed, `ec` set to the classified error
             * and nullptr returned.
             * </p>
             */
            static std::unique_ptr<HCIComm> open(const AdapterID dev_id, const HCIChannel channel, std::error_code& ec,
                                                 std::shared_ptr<KernelTransport> kernel = KernelTransport::get_linux()) noexcept;

            /** As open(AdapterID, HCIChannel, std::error_code&, std::shared_ptr<KernelTransport>) using HCIEnv::HCI_DEFAULT_CHANNEL. */
            static std::unique_ptr<HCIComm> open(const AdapterID dev_id, std::error_code& ec) noexcept {
                return open(dev_id, HCIEnv::get().HCI_DEFAULT_CHANNEL, ec);
            }

            HCIComm(const HCIComm&) = delete;
            void operator=(const HCIComm&) = delete;

            /**
             * Releases this instance after issuing {@link #close()}.
             */
            ~HCIComm() noexcept { close(); }

            bool is_open() const noexcept { return 0 <= socket_descriptor; }

            /** Closing the HCI channel, locking {@link #mutex_write()}. */
            void close() noexcept;

            /** Return this HCI socket descriptor. */
            inline int socket() const noexcept { return socket_descriptor; }

            /**
             * Transfers ownership of the socket descriptor to the caller,
             * leaving this instance closed without closing the descriptor.
             * @return the descriptor or -1 if not open
             */
            int release() noexcept;

            /** Return the KernelTransport used for all OS calls on this channel. */
            const std::shared_ptr<KernelTransport>& kernel_transport() const noexcept { return kernel; }

            /** Return the recursive write mutex for multithreading access. */
            inline std::recursive_mutex & mutex_write() noexcept { return mtx_write; }

            /**
             * Generic read w/ own timeout, w/o locking suitable for a unique reader.
             * @param timeoutMS if > 0, wait up to the given milliseconds for data, failing with ETIMEDOUT
             * @return number of bytes read or -1 with `ec` set
             */
            jau::snsize_t read(uint8_t* buffer, const jau::nsize_t capacity, const int32_t timeoutMS, std::error_code& ec) noexcept;

            /**
             * Generic write, locking {@link #mutex_write()}.
             * @return number of bytes written or -1 with `ec` set
             */
            jau::snsize_t write(const uint8_t* buffer, const jau::nsize_t size, std::error_code& ec) noexcept;

            std::string toString() const noexcept {
                return "HCIComm[dev_id "+std::to_string(dev_id)+", channel "+to_string(channel)+
                       ", dd "+std::to_string(socket_descriptor.load())+"]";
            }
    };

    /**@}*/

} // namespace blehci

#endif /* HCI_COMM_HPP_ */
