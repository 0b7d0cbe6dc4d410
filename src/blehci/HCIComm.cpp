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
#include <memory>
#include <cstdint>
#include <cstdio>

// #define PERF_PRINT_ON 1
#include <jau/debug.hpp>

#include "HCIComm.hpp"

extern "C" {
    #include <errno.h>
}

namespace blehci {

std::unique_ptr<HCIComm> HCIComm::open(const AdapterID dev_id, const HCIChannel channel, std::error_code& ec,
                                       std::shared_ptr<KernelTransport> kernel) noexcept
{
    if( nullptr == kernel ) {
        ec = make_error_code(HCISocketError::IO);
        return nullptr;
    }

    // Create a loose HCI socket
    const int fd = classify_os_result(kernel->open_socket(), ec);
    if( 0 > fd ) {
        ERR_PRINT("HCIComm::open: socket failed: %s", ec.message().c_str());
        return nullptr;
    }

    // Bind socket to the HCI device
    sockaddr_hci addr;
    bzero(&addr, sizeof(addr));
    addr.hci_family = AF_BLUETOOTH;
    addr.hci_dev = dev_id;
    addr.hci_channel = number(channel);
    if( 0 > classify_os_result(kernel->bind(fd, addr), ec) ) {
        ERR_PRINT("HCIComm::open: bind dev_id %u, channel %s failed: %s",
                dev_id, to_string(channel).c_str(), ec.message().c_str());
        kernel->close(fd);
        return nullptr;
    }

    // Mandatory event filter, nothing is handed out without it
    const HCIFilter filter = HCIFilter::make_default();
    if( 0 > classify_os_result(kernel->setsockopt(fd, SOL_HCI, HCI_FILTER, filter.get_ptr(), filter.size()), ec) ) {
        ERR_PRINT("HCIComm::open: setsockopt %s failed: %s", filter.toString().c_str(), ec.message().c_str());
        kernel->close(fd);
        return nullptr;
    }
    DBG_PRINT("HCIComm::open: dev_id %u, channel %s, dd %d, %s",
            dev_id, to_string(channel).c_str(), fd, filter.toString().c_str());

    return std::unique_ptr<HCIComm>( new HCIComm(std::move(kernel), dev_id, channel, fd) );
}

HCIComm::HCIComm(std::shared_ptr<KernelTransport> kernel_, const AdapterID dev_id_, const HCIChannel channel_, const int fd) noexcept
: dev_id( dev_id_ ), channel( channel_ ),
  kernel( std::move(kernel_) ), socket_descriptor( fd )
{
}

void HCIComm::close() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    if( 0 > socket_descriptor ) {
        DBG_PRINT("HCIComm::close: Not opened: dd %d", socket_descriptor.load());
        return;
    }
    DBG_PRINT("HCIComm::close: Start: dd %d", socket_descriptor.load());
    PERF_TS_T0();
    if( 0 > kernel->close(socket_descriptor) ) {
        ERR_PRINT("HCIComm::close: close dd %d failed", socket_descriptor.load());
    }
    socket_descriptor = -1;
    PERF_TS_TD("HCIComm::close");
    DBG_PRINT("HCIComm::close: End: dd %d", socket_descriptor.load());
}

int HCIComm::release() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    const int fd = socket_descriptor;
    socket_descriptor = -1;
    return fd;
}

jau::snsize_t HCIComm::read(uint8_t* buffer, const jau::nsize_t capacity, const int32_t timeoutMS, std::error_code& ec) noexcept {
    ec.clear();
    const int fd = socket_descriptor;
    if( 0 > fd ) {
        ec = make_error_code(HCISocketError::NOT_CONNECTED);
        return -1;
    }
    if( 0 == capacity ) {
        return 0;
    }

    if( 0 < timeoutMS ) {
        const int n = classify_os_result(kernel->poll_in(fd, timeoutMS), ec);
        if( 0 > n ) {
            return -1;
        }
        if( 0 == n ) {
            ec = std::error_code(ETIMEDOUT, std::system_category());
            return -1;
        }
    }

    const jau::snsize_t len = kernel->read(fd, buffer, capacity);
    if( 0 > len ) {
        ec = classify_errno(errno);
        return -1;
    }
    return len;
}

jau::snsize_t HCIComm::write(const uint8_t* buffer, const jau::nsize_t size, std::error_code& ec) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    ec.clear();
    if( 0 > socket_descriptor ) {
        ec = make_error_code(HCISocketError::NOT_CONNECTED);
        return -1;
    }
    if( 0 == size ) {
        return 0;
    }

    const jau::snsize_t len = kernel->write(socket_descriptor, buffer, size);
    if( 0 > len ) {
        ec = classify_errno(errno);
        return -1;
    }
    return len;
}

} /* namespace blehci */
