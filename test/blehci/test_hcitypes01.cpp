#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <memory>

#include <catch2/catch_test_macros.hpp>

#include <jau/basic_types.hpp>
#include <blehci/HCIFilter.hpp>
#include <blehci/HCIErrors.hpp>
#include <blehci/HCIIoctl.hpp>
#include <blehci/HCITypes.hpp>

extern "C" {
    #include <errno.h>
}

using namespace blehci;

TEST_CASE( "HCIFilter Layout Test 01", "[hci][filter]" ) {
    {
        // packet types Command=1 and Event=4, events CommandComplete=0 and CommandStatus=2
        HCIFilter f;
        f.set_ptype(1);
        f.set_ptype(4);
        f.set_event(0);
        f.set_event(2);
        const uint8_t* b = f.get_ptr();
        REQUIRE( 14 == f.size() );
        REQUIRE( ( (1U<<1) | (1U<<4) ) == jau::get_uint32(b+0, jau::lb_endian_t::little) );
        REQUIRE( ( (1U<<0) | (1U<<2) ) == jau::get_uint32(b+4, jau::lb_endian_t::little) );
        REQUIRE( 0x12 == b[0] );
        REQUIRE( 0x05 == b[4] );
        for(int i=8; i<14; ++i) {
            REQUIRE( 0 == b[i] );
        }
        REQUIRE( true == f.test_ptype(4) );
        REQUIRE( false == f.test_ptype(2) );
        f.clear_ptype(4);
        REQUIRE( false == f.test_ptype(4) );
        REQUIRE( 0x02 == b[0] );
    }
    {
        const HCIFilter f = HCIFilter::make_default();
        const uint8_t* b = f.get_ptr();
        const uint8_t exp[] = { 0x12, 0x00, 0x00, 0x00,   // COMMAND, EVENT
                                0x00, 0xC0, 0x00, 0x00,   // CMD_COMPLETE 0x0e, CMD_STATUS 0x0f
                                0x00, 0x00, 0x00, 0x00,
                                0x00, 0x00 };
        REQUIRE( 0 == memcmp(exp, b, sizeof(exp)) );
        REQUIRE( true == f.test_event(number(HCIEventType::CMD_COMPLETE)) );
        REQUIRE( false == f.test_event(number(HCIEventType::LE_META)) );
        printf("%s\n", f.toString().c_str());
    }
    {
        HCIFilter f;
        f.set_ptype(HCIFilter::VENDOR_PKT); // maps to bit 0
        REQUIRE( 0x01 == f.type_mask() );
        f.set_event(32+3); // high event mask
        REQUIRE( 0x08 == f.get_ptr()[8] );
        f.set_opcode(0x200a);
        REQUIRE( 0x0a == f.get_ptr()[12] );
        REQUIRE( 0x20 == f.get_ptr()[13] );
        REQUIRE( f.test_opcode(0x200a) );
        f.clear_opcode();
        REQUIRE( 0 == f.opcode() );
    }
}

TEST_CASE( "OS Error Mapping Test 02", "[hci][error]" ) {
    std::error_code ec;

    errno = EPERM;
    REQUIRE( -1 == classify_os_result(-1, ec) );
    REQUIRE( ec == HCISocketError::PERMISSION_DENIED );

    errno = EACCES;
    classify_os_result(-1, ec);
    REQUIRE( ec == HCISocketError::PERMISSION_DENIED );

    errno = EBUSY;
    classify_os_result(-1, ec);
    REQUIRE( ec == HCISocketError::BUSY );

    errno = ENODEV;
    classify_os_result(-1, ec);
    REQUIRE( ec == std::error_code(ENODEV, std::system_category()) );

    errno = EBUSY; // ignored for non-negative results
    REQUIRE( 0 == classify_os_result(0, ec) );
    REQUIRE( !ec );
    REQUIRE( 42 == classify_os_result(42, ec) );
    REQUIRE( !ec );

    REQUIRE( std::string("HCISocket") == make_error_code(HCISocketError::BUSY).category().name() );
    REQUIRE( "HCISocket::NOT_CONNECTED" == make_error_code(HCISocketError::NOT_CONNECTED).message() );
}

TEST_CASE( "HCI Command Test 03", "[hci][command]" ) {
    {
        HCILESetAdvEnableCmd cmd(true);
        const uint8_t exp[] = { 0x01, 0x0a, 0x20, 0x01, 0x01 };
        REQUIRE( sizeof(exp) == cmd.getTotalSize() );
        REQUIRE( 0 == memcmp(exp, cmd.getPDU().get_ptr(), sizeof(exp)) );
        REQUIRE( HCIOpcode::LE_SET_ADV_ENABLE == cmd.getOpcode() );
        REQUIRE( true == cmd.isEnable() );

        const HCILESetAdvEnableCmd cmd2(cmd.getPDU().get_ptr(), cmd.getTotalSize());
        REQUIRE( true == cmd2.isEnable() );
        REQUIRE_THROWS_AS( HCILESetAdvParamCmd(cmd.getPDU().get_ptr(), cmd.getTotalSize()), jau::IndexOutOfBoundsError );
    }
    {
        HCILESetAdvParamCmd cmd(AdvertisingParameters::DEFAULT);
        REQUIRE( 4 + 15 == cmd.getTotalSize() );
        const uint8_t exp_hdr[] = { 0x01, 0x06, 0x20, 0x0f };
        REQUIRE( 0 == memcmp(exp_hdr, cmd.getPDU().get_ptr(), sizeof(exp_hdr)) );
        REQUIRE( AdvertisingParameters::DEFAULT == cmd.getParameters() );
    }
    {
        const uint8_t ad[] = { 0x02, 0x01, 0x06, 0x03, 0x09, 'a', 'b' };
        HCILESetAdvDataCmd cmd(ad, sizeof(ad));
        REQUIRE( 4 + 32 == cmd.getTotalSize() );
        REQUIRE( 0x20 == cmd.getPDU().get_uint8(3) );
        REQUIRE( sizeof(ad) == cmd.getDataSize() );
        REQUIRE( 0 == memcmp(ad, cmd.getData(), sizeof(ad)) );
        for(jau::nsize_t i=sizeof(ad); i<31; ++i) {
            REQUIRE( 0 == cmd.getData()[i] );
        }
    }
    {
        uint8_t ad[32] { 0 };
        REQUIRE_NOTHROW( HCILESetAdvDataCmd(ad, 31) );
        REQUIRE_NOTHROW( HCILESetAdvDataCmd(ad, 0) );
        try {
            HCILESetAdvDataCmd cmd(ad, 32);
            REQUIRE( false );
        } catch (const PackError& e) {
            REQUIRE( PackErrc::BAD_LENGTH == e.kind );
            REQUIRE( 31 == e.expected );
            REQUIRE( 32 == e.got );
        }
    }
}

TEST_CASE( "HCI Event Test 04", "[hci][event]" ) {
    {
        const uint8_t cc[] = { 0x04, 0x0e, 0x04, 0x01, 0x0a, 0x20, 0x00 };
        std::unique_ptr<HCIEvent> ev = HCIEvent::getSpecialized(cc, sizeof(cc));
        REQUIRE( nullptr != ev );
        REQUIRE( ev->isEvent(HCIEventType::CMD_COMPLETE) );
        const HCICommandCompleteEvent* ev_cc = static_cast<const HCICommandCompleteEvent*>(ev.get());
        REQUIRE( HCIOpcode::LE_SET_ADV_ENABLE == ev_cc->getOpcode() );
        REQUIRE( 1 == ev_cc->getNumCommandPackets() );
        REQUIRE( HCIStatusCode::SUCCESS == ev_cc->getReturnStatus() );
        REQUIRE( ev->validate(HCILESetAdvEnableCmd(false)) );
        REQUIRE( !ev->validate(HCILESetAdvDataCmd(nullptr, 0)) );
        printf("%s\n", ev->toString().c_str());

        const HCICommandCompleteEvent ev2(HCIOpcode::LE_SET_ADV_ENABLE, 1, cc+6, 1);
        REQUIRE( ev2.getTotalSize() == sizeof(cc) );
        REQUIRE( 0 == memcmp(cc, ev2.getPDU().get_ptr(), sizeof(cc)) );
    }
    {
        const uint8_t cs[] = { 0x04, 0x0f, 0x04, 0x0c, 0x01, 0x06, 0x20 };
        std::unique_ptr<HCIEvent> ev = HCIEvent::getSpecialized(cs, sizeof(cs));
        REQUIRE( nullptr != ev );
        REQUIRE( ev->isEvent(HCIEventType::CMD_STATUS) );
        const HCICommandStatusEvent* ev_cs = static_cast<const HCICommandStatusEvent*>(ev.get());
        REQUIRE( HCIStatusCode::COMMAND_DISALLOWED == ev_cs->getStatus() );
        REQUIRE( HCIOpcode::LE_SET_ADV_PARAM == ev_cs->getOpcode() );

        const HCICommandStatusEvent ev2(HCIOpcode::LE_SET_ADV_PARAM, 1, HCIStatusCode::COMMAND_DISALLOWED);
        REQUIRE( 0 == memcmp(cs, ev2.getPDU().get_ptr(), sizeof(cs)) );
    }
    {
        // truncated, not an event and unknown event code
        const uint8_t trunc[] = { 0x04, 0x0e, 0x04, 0x01, 0x0a };
        REQUIRE( nullptr == HCIEvent::getSpecialized(trunc, sizeof(trunc)) );
        REQUIRE( nullptr == HCIEvent::getSpecialized(trunc, 2) );
        const uint8_t acl[] = { 0x02, 0x00, 0x00, 0x00, 0x00 };
        REQUIRE( nullptr == HCIEvent::getSpecialized(acl, sizeof(acl)) );
        const uint8_t unknown[] = { 0x04, 0xfe, 0x00 };
        REQUIRE( nullptr == HCIEvent::getSpecialized(unknown, sizeof(unknown)) );
    }
    {
        const std::error_code ec = make_error_code(HCIStatusCode::COMMAND_DISALLOWED);
        REQUIRE( ec );
        REQUIRE( 0x0C == ec.value() );
        REQUIRE( std::string("HCI") == ec.category().name() );
        REQUIRE( "HCI::COMMAND_DISALLOWED" == ec.message() );
        REQUIRE( HCIPacketType::EVENT == to_HCIPacketType(0x04) );
        REQUIRE_THROWS_AS( to_HCIPacketType(0x07), ConversionError );
        REQUIRE( HCIEventType::CMD_STATUS == to_HCIEventType(0x0f) );
    }
}

TEST_CASE( "HCI Enum Names Test 05", "[hci][enum]" ) {
    REQUIRE( "INVALID" == to_string(HCIEventType::INVALID) );
    REQUIRE( "CMD_COMPLETE" == to_string(HCIEventType::CMD_COMPLETE) );
    REQUIRE( "CMD_STATUS" == to_string(HCIEventType::CMD_STATUS) );
    REQUIRE( HCIEventType::INVALID == to_HCIEventType(0x00) );
    REQUIRE( HCIEventType::CMD_STATUS == to_HCIEventType(0x0f) );

    REQUIRE( "RAW" == to_string(HCIChannel::RAW) );
    REQUIRE( "USER" == to_string(HCIChannel::USER) );
    REQUIRE( "LOGGING" == to_string(HCIChannel::LOGGING) );

    // ENODEV has no dedicated value
    REQUIRE( "PERMISSION_DENIED" == to_string(HCISocketError::PERMISSION_DENIED) );
    REQUIRE( "NOT_CONNECTED" == to_string(HCISocketError::NOT_CONNECTED) );
    REQUIRE( "Unknown HCISocketError 2" == to_string(static_cast<HCISocketError>(2)) );
    REQUIRE( classify_errno(ENODEV).category() == std::system_category() );
}
