#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <memory>
#include <thread>
#include <chrono>

#include <catch2/catch_test_macros.hpp>

#include <blehci/AsyncHCIComm.hpp>
#include <blehci/Reactor.hpp>

#include "MockKernelTransport.hpp"

using namespace blehci;

static std::unique_ptr<HCIComm> open_comm(std::shared_ptr<MockKernelTransport> kernel) {
    std::error_code ec;
    std::unique_ptr<HCIComm> comm = HCIComm::open(0, HCIChannel::USER, ec, kernel);
    REQUIRE( !ec );
    REQUIRE( nullptr != comm );
    return comm;
}

TEST_CASE( "AsyncHCIComm Read Test 01", "[hci][async]" ) {
    Reactor reactor;
    REQUIRE( reactor.is_valid() );
    REQUIRE( !reactor.init_error() );

    int fds[2];
    REQUIRE( make_socketpair(fds) );
    std::shared_ptr<MockKernelTransport> kernel = std::make_shared<MockKernelTransport>();
    kernel->provided_fd = fds[0];

    std::error_code ec;
    std::unique_ptr<AsyncHCIComm> async = AsyncHCIComm::lift(open_comm(kernel), reactor, ec);
    REQUIRE( !ec );
    REQUIRE( nullptr != async );
    REQUIRE( fds[0] == async->socket() );
    REQUIRE( reactor.is_watched(fds[0]) );

    uint8_t buf[64];
    int wake_count = 0;
    {
        // nothing to read yet
        AsyncHCIComm::ReadResult r = async->read(buf, sizeof(buf), [&wake_count]() { ++wake_count; });
        REQUIRE( AsyncHCIComm::ReadStatus::PENDING == r.status );
        REQUIRE( !r.ec );

        REQUIRE( 0 == reactor.run_once(20, ec) );
        REQUIRE( !ec );
        REQUIRE( 0 == wake_count );
    }
    const uint8_t in[] = { 0x04, 0x0e, 0x04, 0x01, 0x0a, 0x20, 0x00 };
    {
        REQUIRE( 7 == ::write(fds[1], in, sizeof(in)) );
        REQUIRE( 1 == reactor.run_once(1000, ec) );
        REQUIRE( !ec );
        REQUIRE( 1 == wake_count );

        // waker fires once per pending read
        REQUIRE( 0 == reactor.run_once(20, ec) );
        REQUIRE( 1 == wake_count );

        AsyncHCIComm::ReadResult r = async->read(buf, sizeof(buf), [&wake_count]() { ++wake_count; });
        REQUIRE( AsyncHCIComm::ReadStatus::READY == r.status );
        REQUIRE( 7 == r.count );
        REQUIRE( 0 == memcmp(in, buf, sizeof(in)) );
    }
    {
        // data available before the reactor runs: read completes immediately
        REQUIRE( 7 == ::write(fds[1], in, sizeof(in)) );
        AsyncHCIComm::ReadResult r = async->read(buf, sizeof(buf), [&wake_count]() { ++wake_count; });
        REQUIRE( AsyncHCIComm::ReadStatus::READY == r.status );
        REQUIRE( 7 == r.count );
        REQUIRE( 1 == wake_count );
    }
    {
        const uint8_t out[] = { 0x01, 0x0a, 0x20, 0x01, 0x00 };
        REQUIRE( 5 == async->write(out, sizeof(out), ec) );
        REQUIRE( !ec );
        REQUIRE( 5 == ::read(fds[1], buf, sizeof(buf)) );
        REQUIRE( 0 == memcmp(out, buf, sizeof(out)) );
    }
    async = nullptr;
    REQUIRE( false == reactor.is_watched(fds[0]) );
    REQUIRE( kernel->is_closed(fds[0]) );
    ::close(fds[1]);
}

TEST_CASE( "AsyncHCIComm Cancel Test 02", "[hci][async]" ) {
    Reactor reactor;
    int fds[2];
    REQUIRE( make_socketpair(fds) );
    std::shared_ptr<MockKernelTransport> kernel = std::make_shared<MockKernelTransport>();
    kernel->provided_fd = fds[0];

    std::error_code ec;
    std::unique_ptr<AsyncHCIComm> async = AsyncHCIComm::lift(open_comm(kernel), reactor, ec);
    REQUIRE( nullptr != async );

    uint8_t buf[16];
    int wake_count = 0;
    AsyncHCIComm::ReadResult r = async->read(buf, sizeof(buf), [&wake_count]() { ++wake_count; });
    REQUIRE( AsyncHCIComm::ReadStatus::PENDING == r.status );
    async->cancel();

    const uint8_t in[] = { 0x04, 0x0f, 0x04, 0x00, 0x01, 0x06, 0x20 };
    REQUIRE( 7 == ::write(fds[1], in, sizeof(in)) );
    REQUIRE( 0 == reactor.run_once(50, ec) );
    REQUIRE( 0 == wake_count );

    r = async->read(buf, sizeof(buf), nullptr);
    REQUIRE( AsyncHCIComm::ReadStatus::READY == r.status );
    REQUIRE( 7 == r.count );

    async = nullptr;
    ::close(fds[1]);
}

TEST_CASE( "AsyncHCIComm Registration Test 03", "[hci][async]" ) {
    Reactor reactor;
    std::error_code ec;
    {
        std::unique_ptr<AsyncHCIComm> async = AsyncHCIComm::lift(nullptr, reactor, ec);
        REQUIRE( nullptr == async );
        REQUIRE( ec == HCISocketError::NOT_CONNECTED );
    }
    {
        std::shared_ptr<MockKernelTransport> kernel = std::make_shared<MockKernelTransport>();
        std::unique_ptr<HCIComm> comm = open_comm(kernel);
        comm->close();
        std::unique_ptr<AsyncHCIComm> async = AsyncHCIComm::lift(std::move(comm), reactor, ec);
        REQUIRE( nullptr == async );
        REQUIRE( ec == HCISocketError::NOT_CONNECTED );
    }
    {
        int fds[2];
        REQUIRE( make_socketpair(fds) );
        std::shared_ptr<MockKernelTransport> kernel = std::make_shared<MockKernelTransport>();
        kernel->provided_fd = fds[0];
        std::unique_ptr<AsyncHCIComm> async = AsyncHCIComm::lift(open_comm(kernel), reactor, ec);
        REQUIRE( nullptr != async );

        // one registration per descriptor
        ec = reactor.watch(fds[0], [](int) { });
        REQUIRE( ec == std::error_code(EEXIST, std::system_category()) );
        REQUIRE( reactor.is_watched(fds[0]) );

        REQUIRE( reactor.arm(fds[1]) == std::error_code(ENOENT, std::system_category()) );
        REQUIRE( reactor.unwatch(fds[1]) == std::error_code(ENOENT, std::system_category()) );

        async = nullptr;
        ::close(fds[1]);
    }
}

TEST_CASE( "Reactor Run Stop Test 04", "[hci][async][reactor]" ) {
    Reactor reactor;
    std::error_code ec;
    std::thread runner([&reactor, &ec]() { ec = reactor.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    reactor.stop();
    runner.join();
    REQUIRE( !ec );
}

TEST_CASE( "Reactor Batch Unwatch Test 05", "[hci][async][reactor]" ) {
    Reactor reactor;
    std::error_code ec;
    int a[2], b[2];
    REQUIRE( make_socketpair(a) );
    REQUIRE( make_socketpair(b) );
    const uint8_t in[] = { 0x04 };

    {
        // whichever callback runs first unwatches the other descriptor
        int calls_a = 0, calls_b = 0;
        REQUIRE( !reactor.watch(a[0], [&](int) { ++calls_a; (void)reactor.unwatch(b[0]); }) );
        REQUIRE( !reactor.watch(b[0], [&](int) { ++calls_b; (void)reactor.unwatch(a[0]); }) );
        REQUIRE( !reactor.arm(a[0]) );
        REQUIRE( !reactor.arm(b[0]) );
        REQUIRE( 1 == ::write(a[1], in, sizeof(in)) );
        REQUIRE( 1 == ::write(b[1], in, sizeof(in)) );

        REQUIRE( 1 == reactor.run_once(1000, ec) );
        REQUIRE( !ec );
        REQUIRE( 1 == calls_a + calls_b );
        REQUIRE( 1 == reactor.is_watched(a[0]) + reactor.is_watched(b[0]) );
        (void)reactor.unwatch(a[0]);
        (void)reactor.unwatch(b[0]);
    }
    {
        // disarming within the batch drops the collected notification
        int calls_a = 0, calls_b = 0;
        REQUIRE( !reactor.watch(a[0], [&](int) { ++calls_a; (void)reactor.disarm(b[0]); }) );
        REQUIRE( !reactor.watch(b[0], [&](int) { ++calls_b; (void)reactor.disarm(a[0]); }) );
        REQUIRE( !reactor.arm(a[0]) );
        REQUIRE( !reactor.arm(b[0]) );

        REQUIRE( 1 == reactor.run_once(1000, ec) );
        REQUIRE( 1 == calls_a + calls_b );
        (void)reactor.unwatch(a[0]);
        (void)reactor.unwatch(b[0]);
    }
    {
        // re-watching the same descriptor number within the batch does not inherit the notification
        int calls_a = 0, calls_b = 0, calls_renewed = 0;
        auto renew = [&](const int other) {
            (void)reactor.unwatch(other);
            REQUIRE( !reactor.watch(other, [&](int) { ++calls_renewed; }) );
        };
        REQUIRE( !reactor.watch(a[0], [&](int) { ++calls_a; renew(b[0]); }) );
        REQUIRE( !reactor.watch(b[0], [&](int) { ++calls_b; renew(a[0]); }) );
        REQUIRE( !reactor.arm(a[0]) );
        REQUIRE( !reactor.arm(b[0]) );

        REQUIRE( 1 == reactor.run_once(1000, ec) );
        REQUIRE( 1 == calls_a + calls_b );
        REQUIRE( 0 == calls_renewed );
        (void)reactor.unwatch(a[0]);
        (void)reactor.unwatch(b[0]);
    }
    ::close(a[0]); ::close(a[1]);
    ::close(b[0]); ::close(b[1]);
}

TEST_CASE( "AsyncHCIComm Destruction Within Batch Test 06", "[hci][async]" ) {
    Reactor reactor;
    std::error_code ec;
    int a[2], b[2];
    REQUIRE( make_socketpair(a) );
    REQUIRE( make_socketpair(b) );
    std::shared_ptr<MockKernelTransport> kernel_a = std::make_shared<MockKernelTransport>();
    std::shared_ptr<MockKernelTransport> kernel_b = std::make_shared<MockKernelTransport>();
    kernel_a->provided_fd = a[0];
    kernel_b->provided_fd = b[0];

    std::unique_ptr<AsyncHCIComm> async_a = AsyncHCIComm::lift(open_comm(kernel_a), reactor, ec);
    REQUIRE( nullptr != async_a );
    std::unique_ptr<AsyncHCIComm> async_b = AsyncHCIComm::lift(open_comm(kernel_b), reactor, ec);
    REQUIRE( nullptr != async_b );

    uint8_t buf[16];
    int wake_a = 0, wake_b = 0;
    // each waker destroys the other adapter, its pending notification must not be delivered
    REQUIRE( AsyncHCIComm::ReadStatus::PENDING == async_a->read(buf, sizeof(buf), [&]() { ++wake_a; async_b = nullptr; }).status );
    REQUIRE( AsyncHCIComm::ReadStatus::PENDING == async_b->read(buf, sizeof(buf), [&]() { ++wake_b; async_a = nullptr; }).status );

    const uint8_t in[] = { 0x04, 0x0e, 0x04, 0x01, 0x0a, 0x20, 0x00 };
    REQUIRE( 7 == ::write(a[1], in, sizeof(in)) );
    REQUIRE( 7 == ::write(b[1], in, sizeof(in)) );

    REQUIRE( 1 == reactor.run_once(1000, ec) );
    REQUIRE( !ec );
    REQUIRE( 1 == wake_a + wake_b );
    REQUIRE( ( nullptr == async_a ) != ( nullptr == async_b ) );
    if( nullptr == async_a ) {
        REQUIRE( kernel_a->is_closed(a[0]) );
        REQUIRE( false == reactor.is_watched(a[0]) );
    } else {
        REQUIRE( kernel_b->is_closed(b[0]) );
        REQUIRE( false == reactor.is_watched(b[0]) );
    }
    REQUIRE( 0 == reactor.run_once(20, ec) );

    async_a = nullptr;
    async_b = nullptr;
    ::close(a[1]);
    ::close(b[1]);
}

TEST_CASE( "AsyncHCIComm Self Destruction Test 07", "[hci][async]" ) {
    Reactor reactor;
    std::error_code ec;
    int fds[2];
    REQUIRE( make_socketpair(fds) );
    std::shared_ptr<MockKernelTransport> kernel = std::make_shared<MockKernelTransport>();
    kernel->provided_fd = fds[0];

    std::unique_ptr<AsyncHCIComm> async = AsyncHCIComm::lift(open_comm(kernel), reactor, ec);
    REQUIRE( nullptr != async );

    uint8_t buf[16];
    int wake_count = 0;
    REQUIRE( AsyncHCIComm::ReadStatus::PENDING == async->read(buf, sizeof(buf), [&]() { ++wake_count; async = nullptr; }).status );

    const uint8_t in[] = { 0x04 };
    REQUIRE( 1 == ::write(fds[1], in, sizeof(in)) );
    REQUIRE( 1 == reactor.run_once(1000, ec) );
    REQUIRE( 1 == wake_count );
    REQUIRE( nullptr == async );
    REQUIRE( kernel->is_closed(fds[0]) );
    REQUIRE( false == reactor.is_watched(fds[0]) );
    ::close(fds[1]);
}
