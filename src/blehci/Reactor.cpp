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
#include <vector>

#include <jau/debug.hpp>

#include "Reactor.hpp"
#include "HCIErrors.hpp"

extern "C" {
    #include <unistd.h>
    #include <errno.h>
    #include <sys/epoll.h>
    #include <sys/eventfd.h>
}

namespace blehci {

static constexpr int MAX_EVENTS = 16;

Reactor::Reactor() noexcept
: epoll_fd( -1 ), wakeup_fd( -1 ), next_generation( 0 ), stop_requested( false )
{
    epoll_fd = classify_os_result(::epoll_create1(EPOLL_CLOEXEC), init_ec);
    if( 0 > epoll_fd ) {
        ERR_PRINT("Reactor: epoll_create1 failed: %s", init_ec.message().c_str());
        return;
    }
    wakeup_fd = classify_os_result(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK), init_ec);
    if( 0 > wakeup_fd ) {
        ERR_PRINT("Reactor: eventfd failed: %s", init_ec.message().c_str());
        return;
    }
    struct epoll_event ev;
    bzero(&ev, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.fd = wakeup_fd;
    if( 0 > classify_os_result(::epoll_ctl(epoll_fd, EPOLL_CTL_ADD, wakeup_fd, &ev), init_ec) ) {
        ERR_PRINT("Reactor: epoll_ctl wakeup failed: %s", init_ec.message().c_str());
        ::close(wakeup_fd);
        wakeup_fd = -1;
    }
}

Reactor::~Reactor() noexcept {
    if( 0 <= wakeup_fd ) {
        ::close(wakeup_fd);
    }
    if( 0 <= epoll_fd ) {
        ::close(epoll_fd);
    }
}

std::error_code Reactor::watch(const int fd, ready_callback_t cb) noexcept {
    if( !is_valid() ) {
        return make_error_code(HCISocketError::IO);
    }
    const std::lock_guard<std::mutex> lock(mtx_watch); // RAII-style acquire and relinquish via destructor
    struct epoll_event ev;
    bzero(&ev, sizeof(ev));
    ev.events = EPOLLONESHOT; // disarmed
    ev.data.fd = fd;
    std::error_code ec;
    if( 0 > classify_os_result(::epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &ev), ec) ) {
        DBG_PRINT("Reactor::watch: fd %d failed: %s", fd, ec.message().c_str());
        return ec;
    }
    watches[fd] = Watch { std::move(cb), ++next_generation, false, false };
    return ec;
}

std::error_code Reactor::modify(const int fd, const bool arm_) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_watch); // RAII-style acquire and relinquish via destructor
    auto it = watches.find(fd);
    if( watches.end() == it ) {
        return std::error_code(ENOENT, std::system_category());
    }
    struct epoll_event ev;
    bzero(&ev, sizeof(ev));
    ev.events = arm_ ? ( EPOLLIN | EPOLLONESHOT ) : EPOLLONESHOT;
    ev.data.fd = fd;
    std::error_code ec;
    if( 0 > classify_os_result(::epoll_ctl(epoll_fd, EPOLL_CTL_MOD, fd, &ev), ec) ) {
        ERR_PRINT("Reactor: epoll_ctl mod fd %d, arm %d failed: %s", fd, arm_, ec.message().c_str());
        return ec;
    }
    it->second.armed = arm_;
    if( !arm_ ) {
        it->second.pending = false;
    }
    return ec;
}

std::error_code Reactor::arm(const int fd) noexcept {
    return modify(fd, true);
}

std::error_code Reactor::disarm(const int fd) noexcept {
    return modify(fd, false);
}

std::error_code Reactor::unwatch(const int fd) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_watch); // RAII-style acquire and relinquish via destructor
    auto it = watches.find(fd);
    if( watches.end() == it ) {
        return std::error_code(ENOENT, std::system_category());
    }
    watches.erase(it);
    std::error_code ec;
    if( 0 > classify_os_result(::epoll_ctl(epoll_fd, EPOLL_CTL_DEL, fd, nullptr), ec) ) {
        ERR_PRINT("Reactor::unwatch: fd %d failed: %s", fd, ec.message().c_str());
    }
    return ec;
}

bool Reactor::is_watched(const int fd) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_watch); // RAII-style acquire and relinquish via destructor
    return watches.end() != watches.find(fd);
}

int Reactor::run_once(const int32_t timeoutMS, std::error_code& ec) noexcept {
    ec.clear();
    if( !is_valid() ) {
        ec = make_error_code(HCISocketError::IO);
        return -1;
    }
    struct epoll_event events[MAX_EVENTS];
    int n;
    while( ( n = ::epoll_wait(epoll_fd, events, MAX_EVENTS, timeoutMS) ) < 0 ) {
        if( EINTR == errno ) {
            continue;
        }
        classify_os_result(n, ec);
        ERR_PRINT("Reactor::run_once: epoll_wait failed: %s", ec.message().c_str());
        return -1;
    }

    std::vector<std::pair<int, uint64_t>> ready; // fd, generation
    {
        const std::lock_guard<std::mutex> lock(mtx_watch); // RAII-style acquire and relinquish via destructor
        for(int i=0; i<n; ++i) {
            const int fd = events[i].data.fd;
            if( wakeup_fd == fd ) {
                uint64_t v;
                if( 0 > ::read(wakeup_fd, &v, sizeof(v)) && EAGAIN != errno ) {
                    ERR_PRINT("Reactor::run_once: read wakeup failed");
                }
                continue;
            }
            auto it = watches.find(fd);
            if( watches.end() == it || !it->second.armed ) {
                continue; // unwatched or disarmed since
            }
            it->second.armed = false; // one-shot, kernel disabled it already
            it->second.pending = true;
            ready.emplace_back(fd, it->second.generation);
        }
    }
    int dispatched = 0;
    for(const auto & r : ready) {
        ready_callback_t cb;
        {
            const std::lock_guard<std::mutex> lock(mtx_watch); // RAII-style acquire and relinquish via destructor
            auto it = watches.find(r.first);
            if( watches.end() == it || it->second.generation != r.second || !it->second.pending ) {
                DBG_PRINT("Reactor::run_once: fd %d unwatched or disarmed within batch, skipped", r.first);
                continue;
            }
            it->second.pending = false;
            cb = it->second.cb;
        }
        if( cb ) {
            cb(r.first);
        }
        ++dispatched;
    }
    return dispatched;
}

std::error_code Reactor::run() noexcept {
    std::error_code ec;
    while( !stop_requested ) {
        if( 0 > run_once(-1, ec) ) {
            break;
        }
    }
    stop_requested = false;
    return ec;
}

void Reactor::stop() noexcept {
    stop_requested = true;
    if( 0 <= wakeup_fd ) {
        const uint64_t v = 1;
        if( 0 > ::write(wakeup_fd, &v, sizeof(v)) ) {
            ERR_PRINT("Reactor::stop: write wakeup failed");
        }
    }
}

} /* namespace blehci */
