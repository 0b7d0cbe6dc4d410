#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <blehci/HCIManager.hpp>

#include "MockKernelTransport.hpp"

using namespace blehci;

TEST_CASE( "HCIManager Device Control Test 01", "[hci][manager]" ) {
    std::shared_ptr<MockKernelTransport> kernel = std::make_shared<MockKernelTransport>();
    HCIManager mngr(kernel);
    REQUIRE( !mngr.open_error() );
    REQUIRE( mngr.is_open() );

    REQUIRE( !mngr.device_up(2) );
    REQUIRE( !mngr.device_down(2) );
    REQUIRE( !mngr.device_reset(2) );
    REQUIRE( !mngr.device_reset_stats(2) );
    REQUIRE( 4 == kernel->ioctl_requests.size() );
    REQUIRE( HCIDEVUP     == kernel->ioctl_requests[0] );
    REQUIRE( HCIDEVDOWN   == kernel->ioctl_requests[1] );
    REQUIRE( HCIDEVRESET  == kernel->ioctl_requests[2] );
    REQUIRE( HCIDEVRESTAT == kernel->ioctl_requests[3] );
    for(unsigned long arg : kernel->ioctl_args) {
        REQUIRE( 2 == arg );
    }

    kernel->ioctl_errno = EPERM;
    REQUIRE( mngr.device_up(2) == HCISocketError::PERMISSION_DENIED );
    kernel->ioctl_errno = EBUSY;
    REQUIRE( mngr.device_down(2) == HCISocketError::BUSY );
    kernel->ioctl_errno = EALREADY;
    REQUIRE( mngr.device_up(2) == std::error_code(EALREADY, std::system_category()) );
    kernel->ioctl_errno = 0;

    mngr.close();
    REQUIRE( false == mngr.is_open() );
    REQUIRE( true == kernel->is_closed(100) );
    REQUIRE( mngr.device_up(2) == HCISocketError::NOT_CONNECTED );
    std::vector<AdapterID> list;
    REQUIRE( mngr.get_device_list(list) == HCISocketError::NOT_CONNECTED );
}

TEST_CASE( "HCIManager Device Query Test 02", "[hci][manager]" ) {
    std::shared_ptr<MockKernelTransport> kernel = std::make_shared<MockKernelTransport>();
    kernel->dev_list = { 0, 1, 5 };
    kernel->dev_info.dev_id = 1;
    memcpy(kernel->dev_info.name, "hci1", 5);
    const uint8_t addr[] = { 0x00, 0x10, 0xA0, 0x22, 0x10, 0xC0 };
    memcpy(kernel->dev_info.bdaddr, addr, sizeof(addr));
    kernel->dev_info.flags = 1U << HCI_UP_BIT;
    kernel->dev_info.type = 0x10;
    kernel->dev_info.features[0] = 0xbf;
    kernel->dev_info.acl_mtu = 1021;
    kernel->dev_info.acl_pkts = 8;
    kernel->dev_info.sco_mtu = 64;
    kernel->dev_info.sco_pkts = 1;
    kernel->dev_info.stat.err_rx = 1;
    kernel->dev_info.stat.cmd_tx = 42;
    kernel->dev_info.stat.byte_tx = 1234;

    HCIManager mngr(kernel);
    {
        std::vector<AdapterID> list;
        REQUIRE( !mngr.get_device_list(list) );
        REQUIRE( std::vector<AdapterID>{ 0, 1, 5 } == list );
    }
    {
        HCIDeviceInfo info;
        REQUIRE( !mngr.get_device_info(1, info) );
        REQUIRE( 1 == info.dev_id );
        REQUIRE( "hci1" == info.name );
        REQUIRE( BTAddress(addr) == info.address );
        REQUIRE( info.is_up() );
        REQUIRE( 0x10 == info.type );
        REQUIRE( 0xbf == info.features[0] );
        REQUIRE( 1021 == info.acl_mtu );
        REQUIRE( 8 == info.acl_pkts );
        REQUIRE( 64 == info.sco_mtu );
        REQUIRE( 1 == info.sco_pkts );
        REQUIRE( 1 == info.stats.err_rx );
        REQUIRE( 42 == info.stats.cmd_tx );
        REQUIRE( 1234 == info.stats.byte_tx );
        printf("%s\n", info.toString().c_str());
    }
    {
        HCIDeviceInfo info;
        REQUIRE( mngr.get_device_info(3, info) == std::error_code(ENODEV, std::system_category()) );
    }
}

TEST_CASE( "HCIManager Exclusivity Test 03", "[hci][manager][concurrency]" ) {
    std::shared_ptr<MockKernelTransport> kernel = std::make_shared<MockKernelTransport>();
    kernel->ioctl_delay = std::chrono::milliseconds(2);
    HCIManager mngr(kernel);

    const int thread_count = 8;
    const int loops = 10;
    std::vector<std::thread> threads;
    for(int t=0; t<thread_count; ++t) {
        threads.emplace_back([&mngr, t]() {
            for(int i=0; i<loops; ++i) {
                std::error_code ec = ( 0 == ( t + i ) % 2 ) ? mngr.device_up(0) : mngr.device_down(0);
                (void)ec;
            }
        });
    }
    for(std::thread& t : threads) {
        t.join();
    }
    REQUIRE( 1 == kernel->ioctl_max_in_flight.load() );
    REQUIRE( 0 == kernel->ioctl_in_flight.load() );
    REQUIRE( 2 * thread_count * loops == kernel->ioctl_trace.size() );
    for(size_t i=0; i<kernel->ioctl_trace.size(); i+=2) {
        REQUIRE( "enter" == kernel->ioctl_trace[i] );
        REQUIRE( "exit" == kernel->ioctl_trace[i+1] );
    }
}
