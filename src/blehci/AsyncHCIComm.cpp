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

#include <jau/debug.hpp>

#include "AsyncHCIComm.hpp"
#include "HCIErrors.hpp"

extern "C" {
    #include <errno.h>
}

namespace blehci {

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_ReadStatus_ENUM(X) \
        X(ReadStatus,READY) \
        X(ReadStatus,PENDING) \
        X(ReadStatus,FAILED)

std::string AsyncHCIComm::to_string(const ReadStatus v) noexcept {
    switch(v) {
        CHAR_DECL_ReadStatus_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ReadStatus "+std::to_string(static_cast<int>(v));
}

std::unique_ptr<AsyncHCIComm> AsyncHCIComm::lift(std::unique_ptr<HCIComm> comm, Reactor& reactor, std::error_code& ec) noexcept {
    if( nullptr == comm || !comm->is_open() ) {
        ec = make_error_code(HCISocketError::NOT_CONNECTED);
        return nullptr;
    }
    const AdapterID dev_id = comm->dev_id;
    const HCIChannel channel = comm->channel;
    std::shared_ptr<KernelTransport> kernel = comm->kernel_transport();
    const int fd = comm->release();
    comm = nullptr;

    if( 0 > classify_os_result(kernel->set_nonblocking(fd), ec) ) {
        ERR_PRINT("AsyncHCIComm::lift: set_nonblocking dd %d failed: %s", fd, ec.message().c_str());
        kernel->close(fd);
        return nullptr;
    }
    std::unique_ptr<AsyncHCIComm> res( new AsyncHCIComm(reactor, kernel, dev_id, channel, fd) );
    std::weak_ptr<Anchor> weak_anchor = res->anchor;
    ec = reactor.watch(fd, [weak_anchor](int readable_fd) {
        std::shared_ptr<Anchor> a = weak_anchor.lock();
        if( nullptr == a ) {
            return;
        }
        const std::lock_guard<std::recursive_mutex> lock(a->mtx); // RAII-style acquire and relinquish via destructor
        if( nullptr != a->self ) {
            a->self->readable(readable_fd);
        }
    });
    if( ec ) {
        ERR_PRINT("AsyncHCIComm::lift: watch dd %d failed: %s", fd, ec.message().c_str());
        res->socket_descriptor = -1; // not watched, close only
        kernel->close(fd);
        return nullptr;
    }
    DBG_PRINT("AsyncHCIComm::lift: dev_id %u, dd %d", dev_id, fd);
    return res;
}

AsyncHCIComm::AsyncHCIComm(Reactor& reactor_, std::shared_ptr<KernelTransport> kernel_,
                           const AdapterID dev_id_, const HCIChannel channel_, const int fd) noexcept
: dev_id( dev_id_ ), channel( channel_ ),
  reactor( reactor_ ), kernel( std::move(kernel_) ), socket_descriptor( fd ),
  anchor( std::make_shared<Anchor>() )
{
    anchor->self = this;
}

AsyncHCIComm::~AsyncHCIComm() noexcept {
    {
        // waits for a notification being delivered on another thread
        const std::lock_guard<std::recursive_mutex> lock(anchor->mtx); // RAII-style acquire and relinquish via destructor
        anchor->self = nullptr;
    }
    if( 0 > socket_descriptor ) {
        return;
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_waker); // RAII-style acquire and relinquish via destructor
        waker = nullptr;
    }
    const std::error_code ec = reactor.unwatch(socket_descriptor);
    if( ec ) {
        WARN_PRINT("AsyncHCIComm: unwatch dd %d: %s", socket_descriptor, ec.message().c_str());
    }
    if( 0 > kernel->close(socket_descriptor) ) {
        ERR_PRINT("AsyncHCIComm: close dd %d failed", socket_descriptor);
    }
    socket_descriptor = -1;
}

void AsyncHCIComm::readable(const int fd) noexcept {
    waker_t w;
    {
        const std::lock_guard<std::mutex> lock(mtx_waker); // RAII-style acquire and relinquish via destructor
        w = std::move(waker);
        waker = nullptr;
    }
    DBG_PRINT("AsyncHCIComm::readable: dd %d, waker %d", fd, nullptr != w);
    if( nullptr != w ) {
        w();
    }
}

AsyncHCIComm::ReadResult AsyncHCIComm::read(uint8_t* buffer, const jau::nsize_t capacity, waker_t waker_) noexcept {
    if( 0 > socket_descriptor ) {
        return ReadResult { ReadStatus::FAILED, 0, make_error_code(HCISocketError::NOT_CONNECTED) };
    }
    if( 0 == capacity ) {
        return ReadResult { ReadStatus::READY, 0, std::error_code() };
    }
    const jau::snsize_t len = kernel->read(socket_descriptor, buffer, capacity);
    if( 0 <= len ) {
        return ReadResult { ReadStatus::READY, static_cast<jau::nsize_t>(len), std::error_code() };
    }
    const int err = errno;
    if( EAGAIN != err && EWOULDBLOCK != err ) {
        const std::error_code ec = classify_errno(err);
        ERR_PRINT("AsyncHCIComm::read: dd %d failed: %s", socket_descriptor, ec.message().c_str());
        return ReadResult { ReadStatus::FAILED, 0, ec };
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_waker); // RAII-style acquire and relinquish via destructor
        waker = std::move(waker_);
    }
    const std::error_code ec = reactor.arm(socket_descriptor);
    if( ec ) {
        const std::lock_guard<std::mutex> lock(mtx_waker); // RAII-style acquire and relinquish via destructor
        waker = nullptr;
        return ReadResult { ReadStatus::FAILED, 0, ec };
    }
    return ReadResult { ReadStatus::PENDING, 0, std::error_code() };
}

void AsyncHCIComm::cancel() noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_waker); // RAII-style acquire and relinquish via destructor
        waker = nullptr;
    }
    if( 0 <= socket_descriptor ) {
        const std::error_code ec = reactor.disarm(socket_descriptor);
        if( ec ) {
            WARN_PRINT("AsyncHCIComm::cancel: disarm dd %d: %s", socket_descriptor, ec.message().c_str());
        }
    }
}

jau::snsize_t AsyncHCIComm::write(const uint8_t* buffer, const jau::nsize_t size, std::error_code& ec) noexcept {
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
