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

#ifndef KERNEL_TRANSPORT_HPP_
#define KERNEL_TRANSPORT_HPP_

#include <cstdint>
#include <memory>

#include <jau/basic_types.hpp>

#include "HCIIoctl.hpp"

namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * The narrow set of OS calls used by HCIComm, HCIManager and AsyncHCIComm.
     * <p>
     * All methods follow the POSIX convention,
     * returning a negative value on failure with `errno` set accordingly.
     * </p>
     * <p>
     * Implementations shall handle EINTR where applicable.
     * </p>
     */
    class KernelTransport {
        public:
            virtual ~KernelTransport() noexcept = default;

            /** Creates an unbound raw `AF_BLUETOOTH` / `BTPROTO_HCI` socket, close-on-exec. */
            virtual int open_socket() noexcept = 0;

            virtual int bind(const int fd, const sockaddr_hci& addr) noexcept = 0;

            virtual int setsockopt(const int fd, const int level, const int optname, const void* optval, const jau::nsize_t optlen) noexcept = 0;

            /** ioctl with an integer argument, e.g. HCIDEVUP with the adapter index. */
            virtual int ioctl(const int fd, const unsigned long request, const unsigned long arg) noexcept = 0;

            /** ioctl with a pointer argument, e.g. HCIGETDEVINFO with a hci_dev_info. */
            virtual int ioctl_ptr(const int fd, const unsigned long request, void* arg) noexcept = 0;

            virtual jau::snsize_t read(const int fd, uint8_t* buffer, const jau::nsize_t capacity) noexcept = 0;

            virtual jau::snsize_t write(const int fd, const uint8_t* buffer, const jau::nsize_t size) noexcept = 0;

            /**
             * Waits for `fd` being readable.
             * @return 1 if readable, 0 on timeout, negative on failure.
             */
            virtual int poll_in(const int fd, const int32_t timeoutMS) noexcept = 0;

            virtual int set_nonblocking(const int fd) noexcept = 0;

            virtual int close(const int fd) noexcept = 0;

            /** Returns the shared Linux system call implementation. */
            static std::shared_ptr<KernelTransport> get_linux() noexcept;
    };

    /**@}*/

} // namespace blehci

#endif /* KERNEL_TRANSPORT_HPP_ */
