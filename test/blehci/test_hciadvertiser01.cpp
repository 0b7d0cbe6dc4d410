#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <blehci/HCIAdvertiser.hpp>

#include "MockKernelTransport.hpp"

using namespace blehci;

// shortest reply timeout, before HCIEnv is instantiated
static const int env_setup = ::setenv("blehci.hci.cmd.complete.timeout", "1500", 1);

typedef std::vector<uint8_t> packet_t;

/**
 * Simulated controller on the peer end of a socketpair:
 * reads one command and answers with the scripted reply packets.
 */
class ControllerPeer {
    public:
        const int fd;
        packet_t received;
        std::thread thread;

        ControllerPeer(const int fd_, std::vector<packet_t> replies)
        : fd(fd_)
        {
            thread = std::thread([this, r = std::move(replies)]() {
                uint8_t buf[300];
                const ssize_t n = ::read(fd, buf, sizeof(buf));
                if( 0 < n ) {
                    received.assign(buf, buf+n);
                }
                for(const packet_t& p : r) {
                    if( 0 > ::write(fd, p.data(), p.size()) ) {
                        break;
                    }
                }
            });
        }
        void join() { thread.join(); }
};

struct AdvertiserFixture {
    int fds[2];
    std::shared_ptr<MockKernelTransport> kernel;
    std::unique_ptr<HCIAdvertiser> adv;

    AdvertiserFixture() {
        REQUIRE( 0 == env_setup );
        REQUIRE( make_socketpair(fds) );
        kernel = std::make_shared<MockKernelTransport>();
        kernel->provided_fd = fds[0];
        std::error_code ec;
        std::unique_ptr<HCIComm> comm = HCIComm::open(0, HCIChannel::USER, ec, kernel);
        REQUIRE( nullptr != comm );
        adv = std::unique_ptr<HCIAdvertiser>( new HCIAdvertiser(std::move(comm)) );
        REQUIRE( adv->is_open() );
    }
    ~AdvertiserFixture() {
        adv = nullptr;
        ::close(fds[1]);
    }
    bool peer_has_data() {
        uint8_t buf[300];
        return 0 < ::recv(fds[1], buf, sizeof(buf), MSG_DONTWAIT);
    }
};

TEST_CASE( "HCIAdvertiser Enable Test 01", "[hci][advertiser]" ) {
    AdvertiserFixture f;
    {
        ControllerPeer peer(f.fds[1], { { 0x04, 0x0e, 0x04, 0x01, 0x0a, 0x20, 0x00 } });
        REQUIRE( !f.adv->set_advertising_enable(true).get() );
        peer.join();
        REQUIRE( packet_t{ 0x01, 0x0a, 0x20, 0x01, 0x01 } == peer.received );
    }
    {
        ControllerPeer peer(f.fds[1], { { 0x04, 0x0e, 0x04, 0x01, 0x0a, 0x20, 0x00 } });
        REQUIRE( !f.adv->set_advertising_enable(false).get() );
        peer.join();
        REQUIRE( packet_t{ 0x01, 0x0a, 0x20, 0x01, 0x00 } == peer.received );
    }
}

TEST_CASE( "HCIAdvertiser Parameter Test 02", "[hci][advertiser]" ) {
    AdvertiserFixture f;
    const AdvertisingParameters params = AdvertisingParameters::DEFAULT.with_interval(
            AdvertisingInterval::from_milliseconds(100).value(), AdvertisingInterval::from_milliseconds(200).value());

    // pending status, an unrelated completion to be dropped, then the matching completion
    ControllerPeer peer(f.fds[1], { { 0x04, 0x0f, 0x04, 0x00, 0x01, 0x06, 0x20 },
                                    { 0x04, 0x0e, 0x04, 0x01, 0x0a, 0x20, 0x0c },
                                    { 0x04, 0x0e, 0x04, 0x01, 0x06, 0x20, 0x00 } });
    REQUIRE( !f.adv->set_advertising_parameters(params).get() );
    peer.join();
    const packet_t exp { 0x01, 0x06, 0x20, 0x0f,
                         0xa0, 0x00, 0x40, 0x01, 0x00, 0x00, 0x00,
                         0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                         0x07, 0x00 };
    REQUIRE( exp == peer.received );

    // inconsistent interval range is rejected before anything is written
    const AdvertisingParameters bad = AdvertisingParameters::DEFAULT.with_interval(
            AdvertisingInterval::from_milliseconds(200).value(), AdvertisingInterval::from_milliseconds(100).value());
    REQUIRE( f.adv->set_advertising_parameters(bad).get() == PackErrc::INVALID_FIELDS );
    REQUIRE( false == f.peer_has_data() );
}

TEST_CASE( "HCIAdvertiser Data Test 03", "[hci][advertiser]" ) {
    AdvertiserFixture f;
    {
        const packet_t data { 0x02, 0x01, 0x06 };
        ControllerPeer peer(f.fds[1], { { 0x04, 0x0e, 0x04, 0x01, 0x08, 0x20, 0x00 } });
        REQUIRE( !f.adv->set_advertising_data(data).get() );
        peer.join();
        REQUIRE( 4 + 1 + 31 == peer.received.size() );
        REQUIRE( packet_t{ 0x01, 0x08, 0x20, 0x20, 0x03, 0x02, 0x01, 0x06 } == packet_t(peer.received.begin(), peer.received.begin()+8) );
        for(size_t i=8; i<peer.received.size(); ++i) {
            REQUIRE( 0 == peer.received[i] );
        }
    }
    {
        // oversized data is rejected before anything is written
        const packet_t data(32, 0x01);
        const std::error_code ec = f.adv->set_advertising_data(data).get();
        REQUIRE( ec == PackErrc::BAD_LENGTH );
        REQUIRE( false == f.peer_has_data() );
    }
}

TEST_CASE( "HCIAdvertiser Status Test 04", "[hci][advertiser]" ) {
    AdvertiserFixture f;
    {
        // failure via command status
        ControllerPeer peer(f.fds[1], { { 0x04, 0x0f, 0x04, 0x0c, 0x01, 0x0a, 0x20 } });
        const std::error_code ec = f.adv->set_advertising_enable(true).get();
        peer.join();
        REQUIRE( ec == HCIStatusCode::COMMAND_DISALLOWED );
        REQUIRE( std::string("HCI") == ec.category().name() );
    }
    {
        // failure via command complete return status
        ControllerPeer peer(f.fds[1], { { 0x04, 0x0e, 0x04, 0x01, 0x0a, 0x20, 0x0c } });
        const std::error_code ec = f.adv->le_set_adv_enable(true);
        peer.join();
        REQUIRE( ec == HCIStatusCode::COMMAND_DISALLOWED );
    }
    {
        // no reply at all
        ControllerPeer peer(f.fds[1], { });
        const uint64_t t0 = jau::getCurrentMilliseconds();
        const std::error_code ec = f.adv->le_set_adv_enable(true);
        const uint64_t td = jau::getCurrentMilliseconds() - t0;
        peer.join();
        REQUIRE( ec == HCIStatusCode::INTERNAL_TIMEOUT );
        REQUIRE( 1500 <= td );
        printf("timeout after %" PRIu64 " ms\n", td);
    }
}

TEST_CASE( "HCIAdvertiser Closed Test 05", "[hci][advertiser]" ) {
    HCIAdvertiser adv(nullptr);
    REQUIRE( false == adv.is_open() );
    REQUIRE( adv.le_set_adv_enable(true) == HCISocketError::NOT_CONNECTED );
    REQUIRE( adv.set_advertising_parameters(AdvertisingParameters::DEFAULT).get() == HCISocketError::NOT_CONNECTED );
}
