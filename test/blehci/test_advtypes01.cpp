#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>
#include <chrono>

#include <catch2/catch_test_macros.hpp>

#include <jau/basic_types.hpp>
#include <blehci/LEAdvTypes.hpp>

using namespace blehci;

static void test_bad_index(uint8_t buf[], const jau::nsize_t idx, const uint8_t value, const jau::snsize_t exp_index) {
    uint8_t b[AdvertisingParameters::BYTE_LEN];
    memcpy(b, buf, sizeof(b));
    b[idx] = value;
    try {
        AdvertisingParameters::unpack_from(b, sizeof(b));
        REQUIRE( false );
    } catch (const PackError& e) {
        printf("Expected: %s\n", e.what());
        REQUIRE( PackErrc::BAD_BYTES == e.kind );
        REQUIRE( exp_index == e.index );
    }
}

TEST_CASE( "AdvertisingInterval Test 01", "[datatype][advertising]" ) {
    REQUIRE( 0x0800 == AdvertisingInterval().value() );
    REQUIRE( AdvertisingInterval::DEFAULT == AdvertisingInterval() );

    for(uint32_t v=AdvertisingInterval::MIN_U16; v<=AdvertisingInterval::MAX_U16; ++v) {
        const AdvertisingInterval i = AdvertisingInterval::from( static_cast<uint16_t>(v) );
        REQUIRE( v == i.value() );
        REQUIRE( i == AdvertisingInterval::from( i.value() ) );
    }
    REQUIRE_THROWS_AS( AdvertisingInterval::from(0x001F), ConversionError );
    REQUIRE_THROWS_AS( AdvertisingInterval::from(0x4001), ConversionError );
    REQUIRE_THROWS_AS( AdvertisingInterval::from(0x0000), ConversionError );
    REQUIRE_THROWS_AS( AdvertisingInterval::from(0xFFFF), ConversionError );

    // 0.625 ms units
    REQUIRE( 0x00A0 == AdvertisingInterval::from( std::chrono::milliseconds(100) ).value() );
    REQUIRE( 0x0020 == AdvertisingInterval::from( std::chrono::milliseconds(20) ).value() );
    REQUIRE( 100000 == AdvertisingInterval::from( std::chrono::milliseconds(100) ).as_microseconds() );
    REQUIRE( std::chrono::microseconds(1280000) == AdvertisingInterval::DEFAULT.as_duration() );
    REQUIRE_THROWS_AS( AdvertisingInterval::from( std::chrono::milliseconds(19) ), ConversionError );
    REQUIRE_THROWS_AS( AdvertisingInterval::from( std::chrono::milliseconds(10241) ), ConversionError );
    REQUIRE_THROWS_AS( AdvertisingInterval::from( std::chrono::milliseconds(-1) ), ConversionError );
    REQUIRE( false == AdvertisingInterval::from_milliseconds(10).has_value() );
    REQUIRE( AdvertisingInterval::MAX == *AdvertisingInterval::from_milliseconds(10240) );

    REQUIRE( AdvertisingInterval::MIN < AdvertisingInterval::MIN_NON_CONN );
    REQUIRE( AdvertisingInterval::MIN_NON_CONN <= AdvertisingInterval::DEFAULT );
}

TEST_CASE( "Advertising Enum Test 02", "[datatype][advertising]" ) {
    REQUIRE( AdvertisingType::ADV_DIRECT_IND_LOW_DUTY == to_AdvertisingType(0x04) );
    REQUIRE( AdvertisingType::ADV_IND == to_AdvertisingType(number(AdvertisingType::ADV_IND)) );
    REQUIRE_THROWS_AS( to_AdvertisingType(0x05), ConversionError );

    REQUIRE( PeerAddressType::RANDOM == to_PeerAddressType(0x01) );
    REQUIRE_THROWS_AS( to_PeerAddressType(0x02), ConversionError );

    REQUIRE( OwnAddressType::PRIVATE_OR_RANDOM == to_OwnAddressType(0x03) );
    REQUIRE_THROWS_AS( to_OwnAddressType(0x04), ConversionError );

    REQUIRE( FilterPolicy::WHITELIST == to_FilterPolicy(0x03) );
    REQUIRE_THROWS_AS( to_FilterPolicy(0x04), ConversionError );

    REQUIRE( "ADV_NONCONN_IND" == to_string(AdvertisingType::ADV_NONCONN_IND) );
    REQUIRE( "CHANNEL_38" == to_string(Channels::CHANNEL_38) );
}

TEST_CASE( "ChannelMap Test 03", "[datatype][advertising]" ) {
    ChannelMap m;
    REQUIRE( ChannelMap::ALL == m );
    REQUIRE( 0x07 == m.value() );

    m.disable_channel(Channels::CHANNEL_38);
    REQUIRE( 0x05 == m.value() );
    REQUIRE( true  == m.get_channel(Channels::CHANNEL_37) );
    REQUIRE( false == m.get_channel(Channels::CHANNEL_38) );
    REQUIRE( true  == m.get_channel(Channels::CHANNEL_39) );

    m.disable_channel(Channels::CHANNEL_37);
    m.disable_channel(Channels::CHANNEL_39);
    REQUIRE( ChannelMap::ZEROED == m );
    m.enable_channel(Channels::CHANNEL_39);
    REQUIRE( 0x04 == m.value() );

    for(uint8_t v=0; v<=ChannelMap::ALL_U8; ++v) {
        REQUIRE( v == ChannelMap::from(v).value() );
    }
    REQUIRE_THROWS_AS( ChannelMap::from(0x08), ConversionError );
    REQUIRE_THROWS_AS( ChannelMap::from(0xFF), ConversionError );
}

TEST_CASE( "AdvertisingParameters Test 04", "[datatype][advertising]" ) {
    REQUIRE( 15 == AdvertisingParameters::BYTE_LEN );
    REQUIRE( 2+2+1+1+1+6+1+1 == AdvertisingParameters::BYTE_LEN );

    uint8_t buf[AdvertisingParameters::BYTE_LEN];
    {
        AdvertisingParameters::DEFAULT.pack_into(buf, sizeof(buf));
        const uint8_t exp[] = { 0x00, 0x08, 0x00, 0x08, 0x00, 0x00, 0x00,
                                0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x07, 0x00 };
        REQUIRE( 0 == memcmp(exp, buf, sizeof(exp)) );
        REQUIRE( AdvertisingParameters::DEFAULT == AdvertisingParameters::unpack_from(buf, sizeof(buf)) );
    }
    {
        AdvertisingParameters p = AdvertisingParameters::DEFAULT
                .with_interval(AdvertisingInterval::from(0x0100), AdvertisingInterval::from(0x0200))
                .with_address(BTAddress("C0:10:22:A0:10:00"));
        p.advertising_type = AdvertisingType::ADV_NONCONN_IND;
        p.own_address_type = OwnAddressType::RANDOM_DEVICE;
        p.peer_address_type = PeerAddressType::RANDOM;
        p.channel_map = ChannelMap::from(0x05);
        p.filter_policy = FilterPolicy::SCAN_ALL_CONN_WHITELIST;
        REQUIRE( p != AdvertisingParameters::DEFAULT );

        p.pack_into(buf, sizeof(buf));
        const uint8_t exp[] = { 0x00, 0x01, 0x00, 0x02, 0x03, 0x01, 0x01,
                                0xC0, 0x10, 0x22, 0xA0, 0x10, 0x00, 0x05, 0x02 };
        REQUIRE( 0 == memcmp(exp, buf, sizeof(exp)) );
        REQUIRE( p == AdvertisingParameters::unpack_from(buf, sizeof(buf)) );
        printf("%s\n", p.toString().c_str());
    }
    {
        AdvertisingParameters::DEFAULT.pack_into(buf, sizeof(buf));
        REQUIRE_THROWS_AS( AdvertisingParameters::unpack_from(buf, sizeof(buf)-1), PackError );
        REQUIRE_THROWS_AS( AdvertisingParameters::DEFAULT.pack_into(buf, sizeof(buf)-1), PackError );

        test_bad_index(buf, 1, 0x41, 0);  // interval_min 0x4100
        test_bad_index(buf, 3, 0x00, 2);  // interval_max 0x0000
        test_bad_index(buf, 4, 0x05, 4);
        test_bad_index(buf, 5, 0x04, 5);
        test_bad_index(buf, 6, 0x02, 6);
        test_bad_index(buf, 13, 0x08, 13);
        test_bad_index(buf, 14, 0x04, 14);
    }
    {
        // interval_min > interval_max is rejected by both directions
        AdvertisingParameters p = AdvertisingParameters::DEFAULT
                .with_interval(AdvertisingInterval::from(0x0200), AdvertisingInterval::from(0x0100));
        uint8_t pbuf[AdvertisingParameters::BYTE_LEN];
        memset(pbuf, 0xAA, sizeof(pbuf));
        try {
            p.pack_into(pbuf, sizeof(pbuf));
            REQUIRE( false );
        } catch (const PackError& e) {
            REQUIRE( PackErrc::INVALID_FIELDS == e.kind );
        }
        for(uint8_t b : pbuf) {
            REQUIRE( 0xAA == b );
        }

        AdvertisingParameters::DEFAULT.pack_into(buf, sizeof(buf));
        buf[0] = 0x00; buf[1] = 0x02; // interval_min 0x0200
        buf[2] = 0x00; buf[3] = 0x01; // interval_max 0x0100
        try {
            AdvertisingParameters::unpack_from(buf, sizeof(buf));
            REQUIRE( false );
        } catch (const PackError& e) {
            REQUIRE( PackErrc::INVALID_FIELDS == e.kind );
        }
    }
}
