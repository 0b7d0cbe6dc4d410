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
#include <algorithm>

#include <jau/debug.hpp>

#include "HCIManager.hpp"

namespace blehci {

std::string HCIDeviceStats::toString() const noexcept {
    return "Stats[err[rx "+std::to_string(err_rx)+", tx "+std::to_string(err_tx)+
           "], cmd_tx "+std::to_string(cmd_tx)+", evt_rx "+std::to_string(evt_rx)+
           ", acl[rx "+std::to_string(acl_rx)+", tx "+std::to_string(acl_tx)+
           "], sco[rx "+std::to_string(sco_rx)+", tx "+std::to_string(sco_tx)+
           "], bytes[rx "+std::to_string(byte_rx)+", tx "+std::to_string(byte_tx)+"]]";
}

std::string HCIDeviceInfo::toString() const noexcept {
    return "DeviceInfo[dev_id "+std::to_string(dev_id)+", '"+name+"', "+address.toString()+
           ", flags "+jau::to_hexstring(flags)+(is_up() ? " (up)" : "")+
           ", type "+std::to_string(type)+
           ", features "+jau::bytesHexString(features.data(), 0, features.size(), true /* lsbFirst */)+
           ", acl[mtu "+std::to_string(acl_mtu)+", pkts "+std::to_string(acl_pkts)+
           "], sco[mtu "+std::to_string(sco_mtu)+", pkts "+std::to_string(sco_pkts)+
           "], "+stats.toString()+"]";
}

HCIManager::HCIManager(std::shared_ptr<KernelTransport> kernel_) noexcept
: kernel( std::move(kernel_) ), ctrl_fd( -1 )
{
    if( nullptr == kernel ) {
        open_ec = make_error_code(HCISocketError::IO);
        return;
    }
    ctrl_fd = classify_os_result(kernel->open_socket(), open_ec);
    if( 0 > ctrl_fd ) {
        ERR_PRINT("HCIManager: control socket failed: %s", open_ec.message().c_str());
        ctrl_fd = -1;
    } else {
        DBG_PRINT("HCIManager: control socket dd %d", ctrl_fd);
    }
}

bool HCIManager::is_open() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_ctrl); // RAII-style acquire and relinquish via destructor
    return 0 <= ctrl_fd;
}

void HCIManager::close() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_ctrl); // RAII-style acquire and relinquish via destructor
    if( 0 > ctrl_fd ) {
        return;
    }
    DBG_PRINT("HCIManager::close: dd %d", ctrl_fd);
    if( 0 > kernel->close(ctrl_fd) ) {
        ERR_PRINT("HCIManager::close: close dd %d failed", ctrl_fd);
    }
    ctrl_fd = -1;
}

std::error_code HCIManager::dev_ioctl(const unsigned long request, const AdapterID dev_id, const char* request_name) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_ctrl); // RAII-style acquire and relinquish via destructor
    if( 0 > ctrl_fd ) {
        return make_error_code(HCISocketError::NOT_CONNECTED);
    }
    std::error_code ec;
    if( 0 > classify_os_result(kernel->ioctl(ctrl_fd, request, dev_id), ec) ) {
        ERR_PRINT("HCIManager: ioctl %s dev_id %u failed: %s", request_name, dev_id, ec.message().c_str());
    } else {
        DBG_PRINT("HCIManager: ioctl %s dev_id %u", request_name, dev_id);
    }
    return ec;
}

std::error_code HCIManager::device_up(const AdapterID dev_id) noexcept {
    return dev_ioctl(HCIDEVUP, dev_id, "HCIDEVUP");
}

std::error_code HCIManager::device_down(const AdapterID dev_id) noexcept {
    return dev_ioctl(HCIDEVDOWN, dev_id, "HCIDEVDOWN");
}

std::error_code HCIManager::device_reset(const AdapterID dev_id) noexcept {
    return dev_ioctl(HCIDEVRESET, dev_id, "HCIDEVRESET");
}

std::error_code HCIManager::device_reset_stats(const AdapterID dev_id) noexcept {
    return dev_ioctl(HCIDEVRESTAT, dev_id, "HCIDEVRESTAT");
}

std::error_code HCIManager::get_device_list(std::vector<AdapterID>& res) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_ctrl); // RAII-style acquire and relinquish via destructor
    if( 0 > ctrl_fd ) {
        return make_error_code(HCISocketError::NOT_CONNECTED);
    }
    hci_dev_list_req dl;
    bzero(&dl, sizeof(dl));
    dl.dev_num = HCI_MAX_DEV;

    std::error_code ec;
    if( 0 > classify_os_result(kernel->ioctl_ptr(ctrl_fd, HCIGETDEVLIST, &dl), ec) ) {
        ERR_PRINT("HCIManager: ioctl HCIGETDEVLIST failed: %s", ec.message().c_str());
        return ec;
    }
    res.clear();
    const uint16_t count = std::min<uint16_t>(dl.dev_num, HCI_MAX_DEV);
    for(uint16_t i=0; i<count; ++i) {
        res.push_back(dl.dev_req[i].dev_id);
    }
    DBG_PRINT("HCIManager: ioctl HCIGETDEVLIST: %u adapter", count);
    return ec;
}

std::error_code HCIManager::get_device_info(const AdapterID dev_id, HCIDeviceInfo& res) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_ctrl); // RAII-style acquire and relinquish via destructor
    if( 0 > ctrl_fd ) {
        return make_error_code(HCISocketError::NOT_CONNECTED);
    }
    hci_dev_info di;
    bzero(&di, sizeof(di));
    di.dev_id = dev_id;

    std::error_code ec;
    if( 0 > classify_os_result(kernel->ioctl_ptr(ctrl_fd, HCIGETDEVINFO, &di), ec) ) {
        ERR_PRINT("HCIManager: ioctl HCIGETDEVINFO dev_id %u failed: %s", dev_id, ec.message().c_str());
        return ec;
    }
    res.dev_id = di.dev_id;
    res.name = std::string(di.name, strnlen(di.name, sizeof(di.name)));
    res.address = BTAddress(di.bdaddr);
    res.flags = di.flags;
    res.type = di.type;
    memcpy(res.features.data(), di.features, sizeof(di.features));
    res.pkt_type = di.pkt_type;
    res.link_policy = di.link_policy;
    res.link_mode = di.link_mode;
    res.acl_mtu = di.acl_mtu;
    res.acl_pkts = di.acl_pkts;
    res.sco_mtu = di.sco_mtu;
    res.sco_pkts = di.sco_pkts;
    res.stats.err_rx = di.stat.err_rx;
    res.stats.err_tx = di.stat.err_tx;
    res.stats.cmd_tx = di.stat.cmd_tx;
    res.stats.evt_rx = di.stat.evt_rx;
    res.stats.acl_tx = di.stat.acl_tx;
    res.stats.acl_rx = di.stat.acl_rx;
    res.stats.sco_tx = di.stat.sco_tx;
    res.stats.sco_rx = di.stat.sco_rx;
    res.stats.byte_rx = di.stat.byte_rx;
    res.stats.byte_tx = di.stat.byte_tx;
    DBG_PRINT("HCIManager: ioctl HCIGETDEVINFO: %s", res.toString().c_str());
    return ec;
}

} /* namespace blehci */
