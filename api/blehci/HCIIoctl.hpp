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

#ifndef HCI_IOCTL_HPP_
#define HCI_IOCTL_HPP_

#include <cstdint>
#include <string>

extern "C" {
    #include <sys/ioctl.h>
    #include <sys/socket.h>
}

/**
 * - - - - - - - - - - - - - - -
 *
 * HCIIoctl.hpp Module for the Linux kernel HCI socket ABI,
 * i.e. address family, socket options, device ioctl codes and structures
 * as defined by the kernel's `include/net/bluetooth/hci_sock.h`.
 */

#ifndef AF_BLUETOOTH
    #define AF_BLUETOOTH 31
#endif

#ifndef BTPROTO_HCI
    #define BTPROTO_HCI 1
#endif

#ifndef SOL_HCI
    #define SOL_HCI 0
#endif

#ifndef HCI_FILTER
    #define HCI_FILTER 2
#endif

/* HCI device ioctls, magic 'H' */
#ifndef HCIDEVUP
    #define HCIDEVUP        _IOW('H', 201, int)
    #define HCIDEVDOWN      _IOW('H', 202, int)
    #define HCIDEVRESET     _IOW('H', 203, int)
    #define HCIDEVRESTAT    _IOW('H', 204, int)

    #define HCIGETDEVLIST   _IOR('H', 210, int)
    #define HCIGETDEVINFO   _IOR('H', 211, int)
#endif

namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * HCI socket channel, see `hci_channel` in `sockaddr_hci`.
     */
    enum class HCIChannel : uint16_t {
        /** Raw access, shared with the kernel's own HCI use */
        RAW     = 0,
        /** Exclusive user channel, adapter must be down */
        USER    = 1,
        MONITOR = 2,
        CONTROL = 3,
        LOGGING = 4
    };
    constexpr uint16_t number(const HCIChannel rhs) noexcept {
        return static_cast<uint16_t>(rhs);
    }
    std::string to_string(const HCIChannel v) noexcept;

    /** Maximum number of adapters returned by HCIGETDEVLIST */
    constexpr uint16_t HCI_MAX_DEV = 16;

    /** Index of the HCI_UP bit within hci_dev_info::flags and hci_dev_req::dev_opt */
    constexpr uint32_t HCI_UP_BIT = 0;

    struct sockaddr_hci {
        sa_family_t hci_family;
        uint16_t    hci_dev;
        uint16_t    hci_channel;
    };

    struct hci_dev_stats {
        uint32_t err_rx;
        uint32_t err_tx;
        uint32_t cmd_tx;
        uint32_t evt_rx;
        uint32_t acl_tx;
        uint32_t acl_rx;
        uint32_t sco_tx;
        uint32_t sco_rx;
        uint32_t byte_rx;
        uint32_t byte_tx;
    };

    struct hci_dev_info {
        uint16_t dev_id;
        char     name[8];
        uint8_t  bdaddr[6];
        uint32_t flags;
        uint8_t  type;
        uint8_t  features[8];
        uint32_t pkt_type;
        uint32_t link_policy;
        uint32_t link_mode;
        uint16_t acl_mtu;
        uint16_t acl_pkts;
        uint16_t sco_mtu;
        uint16_t sco_pkts;
        hci_dev_stats stat;
    };

    struct hci_dev_req {
        uint16_t dev_id;
        uint32_t dev_opt;
    };

    /** `hci_dev_list_req` with its trailing array sized for HCI_MAX_DEV */
    struct hci_dev_list_req {
        uint16_t    dev_num;
        hci_dev_req dev_req[HCI_MAX_DEV];
    };

    /**@}*/

} // namespace blehci

#endif /* HCI_IOCTL_HPP_ */
