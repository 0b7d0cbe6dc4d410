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
#include <cstdint>
#include <memory>


#include "KernelTransport.hpp"

extern "C" {
    #include <unistd.h>
    #include <fcntl.h>
    #include <errno.h>
    #include <sys/ioctl.h>
    #include <sys/socket.h>
    #include <poll.h>
}

namespace blehci {

class LinuxKernelTransport : public KernelTransport {
    public:
        int open_socket() noexcept override {
            return ::socket(AF_BLUETOOTH, SOCK_RAW | SOCK_CLOEXEC, BTPROTO_HCI);
        }

        int bind(const int fd, const sockaddr_hci& addr) noexcept override {
            static_assert( sizeof(struct sockaddr) > sizeof(sockaddr_hci), "Requirement sizeof(struct sockaddr) > sizeof(sockaddr_hci)" );
            sockaddr addr_holder; // sizeof(struct sockaddr) > sizeof(sockaddr_hci), silent valgrind.
            bzero(&addr_holder, sizeof(addr_holder));
            memcpy(&addr_holder, &addr, sizeof(sockaddr_hci));
            return ::bind(fd, &addr_holder, sizeof(sockaddr_hci));
        }

        int setsockopt(const int fd, const int level, const int optname, const void* optval, const jau::nsize_t optlen) noexcept override {
            return ::setsockopt(fd, level, optname, optval, static_cast<socklen_t>(optlen));
        }

        int ioctl(const int fd, const unsigned long request, const unsigned long arg) noexcept override {
            return ::ioctl(fd, request, arg);
        }

        int ioctl_ptr(const int fd, const unsigned long request, void* arg) noexcept override {
            return ::ioctl(fd, request, arg);
        }

        jau::snsize_t read(const int fd, uint8_t* buffer, const jau::nsize_t capacity) noexcept override {
            jau::snsize_t len;
            while( ( len = ::read(fd, buffer, capacity) ) < 0 ) {
                if( EINTR == errno ) {
                    continue;
                }
                break;
            }
            return len;
        }

        jau::snsize_t write(const int fd, const uint8_t* buffer, const jau::nsize_t size) noexcept override {
            jau::snsize_t len;
            while( ( len = ::write(fd, buffer, size) ) < 0 ) {
                if( EINTR == errno ) {
                    continue;
                }
                break;
            }
            return len;
        }

        int poll_in(const int fd, const int32_t timeoutMS) noexcept override {
            struct pollfd p;
            int n;

            p.fd = fd; p.events = POLLIN; p.revents = 0;
            while( ( n = ::poll(&p, 1, timeoutMS) ) < 0 ) {
                if( EINTR == errno ) {
                    continue;
                }
                break;
            }
            return n;
        }

        int set_nonblocking(const int fd) noexcept override {
            const int flags = ::fcntl(fd, F_GETFL, 0);
            if( 0 > flags ) {
                return flags;
            }
            return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }

        int close(const int fd) noexcept override {
            return ::close(fd);
        }
};

std::shared_ptr<KernelTransport> KernelTransport::get_linux() noexcept {
    static std::shared_ptr<KernelTransport> k = std::make_shared<LinuxKernelTransport>();
    return k;
}

} /* namespace blehci */
