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
#include <vector>
#include <chrono>
#include <thread>
#include <algorithm>
#include <optional>
#include <cstdlib>

#include <blehci/BTAddress.hpp>
#include <blehci/LEAdvTypes.hpp>
#include <blehci/HCIManager.hpp>
#include <blehci/HCIComm.hpp>
#include <blehci/HCIAdvertiser.hpp>

extern "C" {
    #include <unistd.h>
}

using namespace blehci;

/** \file
 * This _hci_advertiser00_ C++ example starts legacy advertising
 * on a raw HCI channel, bypassing the kernel's Bluetooth management.
 *
 * ### hci_advertiser00 invocation examples:
 * Using `sudo` or the capabilities CAP_NET_RAW and CAP_NET_ADMIN.
 *
 * Advertise as 'blehci_adv' on adapter hci0 for 10 seconds via the exclusive user channel
 * ~~~
 * sudo ./hci_advertiser00 -dev_id 0 -name blehci_adv -duration 10
 * ~~~
 *
 * Same via the raw channel, leaving the adapter up
 * ~~~
 * sudo ./hci_advertiser00 -dev_id 0 -channel 0 -no_updown
 * ~~~
 */

static AdapterID dev_id = 0;
static bool use_updown = true;
static std::string adv_name = "blehci_adv";
static uint32_t adv_interval_ms = 100;
static int duration_sec = 10;

/** AD structures: flags, LE general discoverable and BR/EDR not supported, and complete local name */
static std::vector<uint8_t> make_adv_data(const std::string& name) {
    std::vector<uint8_t> ad = { 0x02, 0x01, 0x06 };
    const size_t name_len = std::min<size_t>(name.size(), number(HCIConstU16::MAX_AD_LENGTH) - ad.size() - 2);
    ad.push_back( static_cast<uint8_t>(1 + name_len) );
    ad.push_back( 0x09 );
    ad.insert(ad.end(), name.begin(), name.begin() + name_len);
    return ad;
}

static bool print_error(const char* what, const std::error_code& ec) {
    if( ec ) {
        fprintf(stderr, "%s: failed: %s (%s)\n", what, ec.message().c_str(), ec.category().name());
        return true;
    }
    fprintf(stderr, "%s: OK\n", what);
    return false;
}

static bool run() {
    HCIManager mngr;
    if( print_error("HCIManager", mngr.open_error()) ) {
        return false;
    }
    std::vector<AdapterID> adapters;
    if( !print_error("get_device_list", mngr.get_device_list(adapters)) ) {
        for(const AdapterID id : adapters) {
            HCIDeviceInfo info;
            if( !print_error("get_device_info", mngr.get_device_info(id, info)) ) {
                fprintf(stderr, "  %s\n", info.toString().c_str());
            }
        }
    }

    const HCIChannel channel = HCIEnv::get().HCI_DEFAULT_CHANNEL;
    if( use_updown && HCIChannel::USER == channel ) {
        // exclusive user channel requires the adapter being down
        if( print_error("device_down", mngr.device_down(dev_id)) ) {
            return false;
        }
    }

    std::error_code ec;
    std::unique_ptr<HCIComm> comm = HCIComm::open(dev_id, channel, ec);
    if( print_error("HCIComm::open", ec) ) {
        return false;
    }
    fprintf(stderr, "Opened %s\n", comm->toString().c_str());

    HCIAdvertiser adv(std::move(comm));

    const std::optional<AdvertisingInterval> interval = AdvertisingInterval::from_milliseconds(adv_interval_ms);
    if( !interval ) {
        fprintf(stderr, "Advertising interval %u ms not within [%s, %s]\n", adv_interval_ms,
                AdvertisingInterval::MIN.toString().c_str(), AdvertisingInterval::MAX.toString().c_str());
        return false;
    }
    AdvertisingParameters params = AdvertisingParameters::DEFAULT.with_interval(*interval, *interval);
    fprintf(stderr, "Parameter %s\n", params.toString().c_str());

    bool res = !print_error("set_advertising_parameters", adv.set_advertising_parameters(params).get()) &&
               !print_error("set_advertising_data", adv.set_advertising_data(make_adv_data(adv_name)).get()) &&
               !print_error("set_advertising_enable(true)", adv.set_advertising_enable(true).get());
    if( res ) {
        fprintf(stderr, "Advertising '%s' for %d seconds\n", adv_name.c_str(), duration_sec);
        std::this_thread::sleep_for(std::chrono::seconds(duration_sec));
        res = !print_error("set_advertising_enable(false)", adv.set_advertising_enable(false).get());
    }
    return res;
}

int main(int argc, char *argv[])
{
    for(int i=1; i<argc; i++) {
        if( !strcmp("-blehci_debug", argv[i]) && argc > (i+1) ) {
            setenv("blehci.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-blehci_hci", argv[i]) && argc > (i+1) ) {
            setenv("blehci.hci", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-dev_id", argv[i]) && argc > (i+1) ) {
            dev_id = static_cast<AdapterID>( atoi(argv[++i]) );
        } else if( !strcmp("-channel", argv[i]) && argc > (i+1) ) {
            setenv("blehci.hci.channel", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-no_updown", argv[i]) ) {
            use_updown = false;
        } else if( !strcmp("-name", argv[i]) && argc > (i+1) ) {
            adv_name = std::string(argv[++i]);
        } else if( !strcmp("-interval", argv[i]) && argc > (i+1) ) {
            adv_interval_ms = static_cast<uint32_t>( atoi(argv[++i]) );
        } else if( !strcmp("-duration", argv[i]) && argc > (i+1) ) {
            duration_sec = atoi(argv[++i]);
        }
    }
    fprintf(stderr, "pid %d\n", getpid());

    fprintf(stderr, "Run with '[-dev_id <adapter index>] [-channel 0|1] [-no_updown] "
                    "[-name <name>] [-interval <ms>] [-duration <seconds>] "
                    "[-blehci_debug true|false|hci.event] "
                    "[-blehci_hci cmd.complete.timeout=10000,read.max_retry=64,...] "
                    "\n");

    fprintf(stderr, "dev_id %u\n", dev_id);
    fprintf(stderr, "channel %s\n", to_string(HCIEnv::get().HCI_DEFAULT_CHANNEL).c_str());
    fprintf(stderr, "updown %d\n", use_updown);
    fprintf(stderr, "name %s\n", adv_name.c_str());
    fprintf(stderr, "interval %u ms\n", adv_interval_ms);
    fprintf(stderr, "duration %d s\n", duration_sec);

    fprintf(stderr, "****** TEST start\n");
    const bool res = run();
    fprintf(stderr, "****** TEST end: %s\n", res ? "OK" : "FAILED");
    return res ? 0 : 1;
}
