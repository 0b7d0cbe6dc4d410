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

#ifndef HCI_MANAGER_HPP_
#define HCI_MANAGER_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <array>
#include <vector>
#include <memory>
#include <mutex>
#include <system_error>

#include <jau/basic_types.hpp>

#include "BTTypes0.hpp"
#include "BTAddress.hpp"
#include "HCIIoctl.hpp"
#include "HCIErrors.hpp"
#include "KernelTransport.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module HCIManager:
 *
 * - Adapter lifecycle control via the kernel's HCI device ioctls
 */
namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * Adapter traffic counters as maintained by the kernel.
     */
    struct HCIDeviceStats {
        uint32_t err_rx  = 0;
        uint32_t err_tx  = 0;
        uint32_t cmd_tx  = 0;
        uint32_t evt_rx  = 0;
        uint32_t acl_tx  = 0;
        uint32_t acl_rx  = 0;
        uint32_t sco_tx  = 0;
        uint32_t sco_rx  = 0;
        uint32_t byte_rx = 0;
        uint32_t byte_tx = 0;

        std::string toString() const noexcept;
    };

    /**
     * Adapter description as returned by HCIManager::get_device_info().
     */
    struct HCIDeviceInfo {
        AdapterID dev_id = 0;
        /** Kernel adapter name, e.g. `hci0` */
        std::string name;
        BTAddress address;
        uint32_t flags = 0;
        uint8_t type = 0;
        std::array<uint8_t, 8> features = { { 0 } };
        uint32_t pkt_type = 0;
        uint32_t link_policy = 0;
        uint32_t link_mode = 0;
        uint16_t acl_mtu = 0;
        uint16_t acl_pkts = 0;
        uint16_t sco_mtu = 0;
        uint16_t sco_pkts = 0;
        HCIDeviceStats stats;

        bool is_up() const noexcept { return 0 != ( flags & ( 1U << HCI_UP_BIT ) ); }

        std::string toString() const noexcept;
    };

    /**
     * Adapter control via one unbound raw HCI control socket.
     * <p>
     * Each operation holds the manager's mutex for the whole ioctl,
     * hence at most one ioctl is in flight per instance.
     * </p>
     * <p>
     * All operations return the error classified by classify_os_result(),
     * an empty std::error_code denotes success. Nothing is retried.
     * </p>
     */
    class HCIManager {
        private:
            std::shared_ptr<KernelTransport> kernel;
            std::mutex mtx_ctrl;
            int ctrl_fd; // guarded by mtx_ctrl
            std::error_code open_ec;

            std::error_code dev_ioctl(const unsigned long request, const AdapterID dev_id, const char* request_name) noexcept;

        public:
            /**
             * Opens the control socket.
             * <p>
             * Check is_open() or open_error() for its success.
             * </p>
             */
            explicit HCIManager(std::shared_ptr<KernelTransport> kernel_ = KernelTransport::get_linux()) noexcept;

            HCIManager(const HCIManager&) = delete;
            void operator=(const HCIManager&) = delete;

            ~HCIManager() noexcept { close(); }

            bool is_open() noexcept;

            /** Returns the error of opening the control socket, empty on success. */
            const std::error_code& open_error() const noexcept { return open_ec; }

            /** Closes the control socket, subsequent operations fail with HCISocketError::NOT_CONNECTED. */
            void close() noexcept;

            /** Bring the adapter up, HCIDEVUP. */
            std::error_code device_up(const AdapterID dev_id) noexcept;

            /** Bring the adapter down, HCIDEVDOWN. */
            std::error_code device_down(const AdapterID dev_id) noexcept;

            /** Reset the adapter, HCIDEVRESET. */
            std::error_code device_reset(const AdapterID dev_id) noexcept;

            /** Reset the adapter's HCIDeviceStats counters, HCIDEVRESTAT. */
            std::error_code device_reset_stats(const AdapterID dev_id) noexcept;

            /**
             * Retrieves the identifiers of all adapters known to the kernel, up to HCI_MAX_DEV.
             * @param res cleared and filled on success
             */
            std::error_code get_device_list(std::vector<AdapterID>& res) noexcept;

            /**
             * Retrieves the description of the given adapter.
             * @param res filled on success
             */
            std::error_code get_device_info(const AdapterID dev_id, HCIDeviceInfo& res) noexcept;
    };

    /**@}*/

} // namespace blehci

#endif /* HCI_MANAGER_HPP_ */
