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

#ifndef REACTOR_HPP_
#define REACTOR_HPP_

#include <cstdint>
#include <string>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/ordered_atomic.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * Module Reactor:
 *
 * - Readiness notification for non-blocking descriptors
 */
namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * Single threaded cooperative readiness loop on top of epoll.
     * <p>
     * A watched descriptor is disarmed until arm() requests exactly one readiness notification,
     * delivered by run_once() or run() on the loop thread.
     * </p>
     * <p>
     * watch(), arm(), disarm(), unwatch() and stop() may be called from any thread,
     * including from within a callback.
     * </p>
     */
    class Reactor {
        public:
            /** Invoked on the loop thread with the readable descriptor. */
            typedef std::function<void(int /* fd */)> ready_callback_t;

        private:
            struct Watch {
                ready_callback_t cb;
                /** Registration instance, distinguishes a re-watched descriptor number */
                uint64_t generation;
                bool armed;
                /** Collected by run_once(), not yet dispatched */
                bool pending;
            };

            int epoll_fd;
            int wakeup_fd;
            std::error_code init_ec;
            std::mutex mtx_watch;
            std::unordered_map<int, Watch> watches; // guarded by mtx_watch
            uint64_t next_generation; // guarded by mtx_watch
            jau::sc_atomic_bool stop_requested;

            std::error_code modify(const int fd, const bool arm_) noexcept;

        public:
            /** Creates the epoll instance, check init_error() for its success. */
            Reactor() noexcept;

            Reactor(const Reactor&) = delete;
            void operator=(const Reactor&) = delete;

            ~Reactor() noexcept;

            bool is_valid() const noexcept { return 0 <= epoll_fd && 0 <= wakeup_fd; }

            const std::error_code& init_error() const noexcept { return init_ec; }

            /**
             * Registers the given descriptor in disarmed state.
             * <p>
             * Fails with the classified OS error, e.g. `EEXIST` if already registered.
             * </p>
             */
            std::error_code watch(const int fd, ready_callback_t cb) noexcept;

            /** Requests one readiness notification for the watched descriptor. */
            std::error_code arm(const int fd) noexcept;

            /** Drops a requested or collected but not yet dispatched readiness notification, if any. */
            std::error_code disarm(const int fd) noexcept;

            /** Unregisters the descriptor, a pending notification is not delivered. */
            std::error_code unwatch(const int fd) noexcept;

            bool is_watched(const int fd) noexcept;

            /**
             * Waits for readiness up to timeoutMS, -1 for infinite, and dispatches the callbacks.
             * <p>
             * Each callback is invoked without holding the internal lock.
             * A notification whose descriptor got unwatched or disarmed by an earlier callback
             * of the same batch is skipped.
             * </p>
             * @return number of dispatched callbacks or -1 with `ec` set
             */
            int run_once(const int32_t timeoutMS, std::error_code& ec) noexcept;

            /** Dispatches until stop(), returns the first failure of run_once(). */
            std::error_code run() noexcept;

            /** Lets run() return, waking up a blocked loop. */
            void stop() noexcept;
    };

    /**@}*/

} // namespace blehci

#endif /* REACTOR_HPP_ */
