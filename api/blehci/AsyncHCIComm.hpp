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

#ifndef ASYNC_HCI_COMM_HPP_
#define ASYNC_HCI_COMM_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <functional>
#include <system_error>

#include <jau/basic_types.hpp>

#include "BTTypes0.hpp"
#include "HCIComm.hpp"
#include "KernelTransport.hpp"
#include "Reactor.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module AsyncHCIComm:
 *
 * - HCIComm lifted onto a Reactor
 */
namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * Non-blocking read side of an opened HCIComm, driven by a Reactor.
     * <p>
     * A read either returns available bytes, suspends until the descriptor becomes readable
     * or fails. No buffering or packet framing is performed.
     * </p>
     * <p>
     * The instance exclusively owns the lifted descriptor, destruction unregisters and closes it.
     * The Reactor must outlive this instance.
     * </p>
     */
    class AsyncHCIComm {
        public:
            enum class ReadStatus : uint8_t {
                /** ReadResult::count bytes have been read, zero denotes end of stream */
                READY   = 0,
                /** Would block, the waker will be invoked once the descriptor is readable */
                PENDING = 1,
                /** Terminal failure, see ReadResult::ec */
                FAILED  = 2
            };
            static std::string to_string(const ReadStatus v) noexcept;

            struct ReadResult {
                ReadStatus status;
                jau::nsize_t count;
                std::error_code ec;
            };

            /** Resumes the suspended reader, invoked on the Reactor's loop thread. */
            typedef std::function<void()> waker_t;

            const AdapterID dev_id;
            const HCIChannel channel;

        private:
            /**
             * Weakly referenced by the Reactor callback, detached on destruction.
             * Its mutex is held while a notification is delivered to `self`.
             */
            struct Anchor {
                std::recursive_mutex mtx;
                AsyncHCIComm * self; // guarded by mtx
            };

            Reactor& reactor;
            std::shared_ptr<KernelTransport> kernel;
            int socket_descriptor;
            std::mutex mtx_waker;
            waker_t waker; // guarded by mtx_waker
            std::shared_ptr<Anchor> anchor;

            AsyncHCIComm(Reactor& reactor_, std::shared_ptr<KernelTransport> kernel_,
                         const AdapterID dev_id_, const HCIChannel channel_, const int fd) noexcept;

            void readable(const int fd) noexcept;

        public:
            /**
             * Takes over the descriptor of the given opened HCIComm,
             * switches it to non-blocking mode and registers it with the Reactor.
             * <p>
             * On failure the descriptor is closed, `ec` set and nullptr returned,
             * e.g. `EEXIST` if the descriptor is registered already.
             * </p>
             */
            static std::unique_ptr<AsyncHCIComm> lift(std::unique_ptr<HCIComm> comm, Reactor& reactor, std::error_code& ec) noexcept;

            AsyncHCIComm(const AsyncHCIComm&) = delete;
            void operator=(const AsyncHCIComm&) = delete;

            ~AsyncHCIComm() noexcept;

            inline int socket() const noexcept { return socket_descriptor; }

            /**
             * Attempts to read available bytes.
             * <p>
             * If no data is available, the given waker is retained, the descriptor armed
             * and ReadStatus::PENDING returned. A later read replaces a retained waker.
             * </p>
             */
            ReadResult read(uint8_t* buffer, const jau::nsize_t capacity, waker_t waker_) noexcept;

            /** Drops a retained waker and disarms the descriptor, nothing else is released. */
            void cancel() noexcept;

            /** Non-blocking write, `EAGAIN` is reported as such. */
            jau::snsize_t write(const uint8_t* buffer, const jau::nsize_t size, std::error_code& ec) noexcept;
    };

    /**@}*/

} // namespace blehci

#endif /* ASYNC_HCI_COMM_HPP_ */
