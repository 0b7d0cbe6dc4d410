#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#include <catch2/catch_test_macros.hpp>

#include <jau/basic_types.hpp>
#include <blehci/BTAddress.hpp>

using namespace blehci;

static void test_scan(const std::string& str, const bool expected_result) {
    std::string errmsg;
    BTAddress addr;
    const bool res = BTAddress::scanBTAddress(str, addr, errmsg);
    if( res ) {
        printf("BTAddress: '%s' -> '%s'\n", str.c_str(), addr.toString().c_str());
    } else {
        printf("BTAddress: '%s' -> Error '%s'\n", str.c_str(), errmsg.c_str());
    }
    REQUIRE( expected_result == res );
}

static BTAddress make_with_top_bits(const uint8_t top2) {
    const uint8_t b[] = { 0x01, 0x02, 0x03, 0x04, 0x05, static_cast<uint8_t>( ( top2 << 6 ) | 0x06 ) };
    return BTAddress(b);
}

TEST_CASE( "BTAddress Parse Test 01", "[datatype][btaddress]" ) {
    const uint8_t exp[] = { 0x00, 0x11, 0x22, 0x33, 0x44, 0x55 };
    {
        const BTAddress a("00:11:22:33:44:55");
        REQUIRE( 0 == memcmp(exp, a.b, sizeof(exp)) );
        REQUIRE( "00:11:22:33:44:55" == a.toString() );
    }
    {
        const BTAddress a("00-11-22-33-44-55");
        REQUIRE( 0 == memcmp(exp, a.b, sizeof(exp)) );
        REQUIRE( BTAddress("00:11:22:33:44:55") == a );
    }
    {
        // single digit octets and lower case
        const BTAddress a("0:1:2:3:a:bc");
        const uint8_t exp2[] = { 0x00, 0x01, 0x02, 0x03, 0x0a, 0xbc };
        REQUIRE( 0 == memcmp(exp2, a.b, sizeof(exp2)) );
    }
    test_scan("C0:10:22:A0:10:00", true);
    test_scan("00:11:22:33:44", false);
    test_scan("00:11:22:33:44:55:66", false);
    test_scan("00:11:22:33:44:5G", false);
    test_scan("00:11:22:33:44:555", false);
    test_scan("00:11:22:33:44:55:", false);
    test_scan("00::22:33:44:55", false);
    test_scan("", false);

    REQUIRE_THROWS_AS( BTAddress("00:11:22:33:44"), ConversionError );
    REQUIRE_THROWS_AS( BTAddress("zz:11:22:33:44:55"), ConversionError );
}

TEST_CASE( "BTAddress Classification Test 02", "[datatype][btaddress]" ) {
    REQUIRE( AddressType::NON_RESOLVABLE_PRIVATE == make_with_top_bits(0b00).address_type() );
    REQUIRE( AddressType::RESOLVABLE_PRIVATE     == make_with_top_bits(0b01).address_type() );
    REQUIRE( AddressType::STATIC_DEVICE          == make_with_top_bits(0b11).address_type() );
    REQUIRE( AddressType::RFU                    == make_with_top_bits(0b10).address_type() );

    REQUIRE( false == make_with_top_bits(0b00).private_address_parts().has_value() );
    REQUIRE( false == make_with_top_bits(0b11).private_address_parts().has_value() );
    REQUIRE( false == make_with_top_bits(0b10).private_address_parts().has_value() );

    const BTAddress rpa = make_with_top_bits(0b01);
    const std::optional<PrivateAddressParts> parts = rpa.private_address_parts();
    REQUIRE( true == parts.has_value() );
    REQUIRE( 0x030201U == parts->hash );
    REQUIRE( 0x460504U == parts->prand );
}

TEST_CASE( "BTAddress Pack Test 03", "[datatype][btaddress]" ) {
    const BTAddress a("C0:10:22:A0:10:00");
    {
        const BTAddress b = BTAddress::from_u64( a.to_u64() );
        REQUIRE( a == b );
        REQUIRE( 0x0010A02210C0ULL == a.to_u64() );
    }
    {
        uint8_t buf[BTAddress::byte_size];
        a.pack_into(buf, sizeof(buf));
        REQUIRE( 0 == memcmp(a.b, buf, sizeof(buf)) );
        REQUIRE( a == BTAddress::unpack_from(buf, sizeof(buf)) );
    }
    {
        uint8_t buf[BTAddress::byte_size+1] { 0 };
        try {
            BTAddress::unpack_from(buf, 5);
            REQUIRE( false );
        } catch (const PackError& e) {
            REQUIRE( PackErrc::BAD_LENGTH == e.kind );
            REQUIRE( 6 == e.expected );
            REQUIRE( 5 == e.got );
        }
        REQUIRE_THROWS_AS( a.pack_into(buf, sizeof(buf)), PackError );
    }
    REQUIRE( BTAddress::ZEROED == BTAddress() );
    REQUIRE( BTAddress::ZEROED != a );
    REQUIRE( std::hash<BTAddress>()(a) == a.hash_code() );
}
