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

#ifndef BT_ADDRESS_HPP_
#define BT_ADDRESS_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <functional>
#include <optional>

#include <jau/basic_types.hpp>

#include "BTTypes0.hpp"

namespace blehci {

    /** \addtogroup BLEHCIUserAPI
     *
     *  @{
     */

    /**
     * BT Core Spec v5.2:  Vol 6 LE, Part B Link Layer Specification: 1.3.2 Random device Address
     * <p>
     * Table 1.2, address bits [47:46], i.e. the two most significant bits of the last octet.
     * </p>
     */
    enum class AddressType : uint8_t {
        /** Non-resolvable private random device address 0b00 */
        NON_RESOLVABLE_PRIVATE = 0x00,
        /** Resolvable private random device address 0b01, 24 bits hash and 24 bits prand. */
        RESOLVABLE_PRIVATE     = 0x01,
        /** Reserved for future use 0b10 */
        RFU                    = 0x02,
        /** Static device address 0b11. Not changing between power-cycles. */
        STATIC_DEVICE          = 0x03
    };
    constexpr uint8_t number(const AddressType rhs) noexcept { return static_cast<uint8_t>(rhs); }
    std::string to_string(const AddressType type) noexcept;

    /**
     * Hash and prand of a resolvable private address, see BTAddress::private_address_parts().
     */
    struct PrivateAddressParts {
        /** 24 bit hash, octets [0..2] little endian */
        uint32_t hash;
        /** 24 bit prand, octets [3..5] little endian, including the address type bits */
        uint32_t prand;
    };

    /**
     * A 6 octet Bluetooth device address, stored in wire order.
     * <p>
     * The string representation lists the octets in storage order,
     * i.e. `"00:11:22:33:44:55"` denotes `b = { 0x00, 0x11, 0x22, 0x33, 0x44, 0x55 }`.
     * </p>
     */
    struct BTAddress {
        static constexpr jau::nsize_t byte_size = 6;

        /** Zeroed address `00:00:00:00:00:00` */
        static const BTAddress ZEROED;

        uint8_t b[byte_size]; // == sizeof(BTAddress)

        constexpr BTAddress() noexcept : b{0} {}

        /** Copies 6 octets from `b_`. */
        explicit BTAddress(const uint8_t * b_) noexcept;

        /**
         * Parses the colon or hyphen delimited hex string,
         * throws ConversionError unless exactly 6 hex octets are given.
         */
        explicit BTAddress(const std::string& str);

        BTAddress(const BTAddress &o) noexcept = default;
        BTAddress(BTAddress &&o) noexcept = default;
        BTAddress& operator=(const BTAddress &o) noexcept = default;
        BTAddress& operator=(BTAddress &&o) noexcept = default;

        /**
         * Fills given BTAddress instance via given string representation.
         * <p>
         * Accepts octets of one or two hex digits, delimited by either ':' or '-'.
         * </p>
         * @param str a string of exactly 6 hex octets
         * @param dest BTAddress to set its value
         * @param errmsg error parsing message if returning false
         * @return true if successful, otherwise false
         */
        static bool scanBTAddress(const std::string& str, BTAddress& dest, std::string& errmsg);

        /** Lower 6 octets of `v` in little endian order. */
        static BTAddress from_u64(const uint64_t v) noexcept;

        /** Inverse of from_u64(). */
        uint64_t to_u64() const noexcept;

        /** Writes the 6 octets into `dest`, throws PackError if `len != byte_size`. */
        void pack_into(uint8_t * dest, const jau::nsize_t len) const;

        /** Reads 6 octets from `src`, throws PackError if `len != byte_size`. */
        static BTAddress unpack_from(const uint8_t * src, const jau::nsize_t len);

        AddressType address_type() const noexcept {
            return static_cast<AddressType>( ( b[5] >> 6 ) & 0x03 );
        }

        /**
         * Returns hash and prand if address_type() is AddressType::RESOLVABLE_PRIVATE,
         * otherwise std::nullopt.
         */
        std::optional<PrivateAddressParts> private_address_parts() const noexcept;

        std::size_t hash_code() const noexcept {
            // 31 * x == (x << 5) - x
            std::size_t h = b[0];
            h = ( ( h << 5 ) - h ) + b[1];
            h = ( ( h << 5 ) - h ) + b[2];
            h = ( ( h << 5 ) - h ) + b[3];
            h = ( ( h << 5 ) - h ) + b[4];
            h = ( ( h << 5 ) - h ) + b[5];
            return h;
        }

        std::string toString() const noexcept;
    };

    inline std::string to_string(const BTAddress& a) noexcept { return a.toString(); }

    inline bool operator==(const BTAddress& lhs, const BTAddress& rhs) noexcept {
        if( &lhs == &rhs ) {
            return true;
        }
        return 0 == memcmp(lhs.b, rhs.b, sizeof(lhs.b));
    }

    inline bool operator!=(const BTAddress& lhs, const BTAddress& rhs) noexcept
    { return !(lhs == rhs); }

    inline bool operator<(const BTAddress& lhs, const BTAddress& rhs) noexcept
    { return memcmp(lhs.b, rhs.b, sizeof(lhs.b)) < 0; }

    /**@}*/

} // namespace blehci

// injecting specialization of std::hash to namespace std of our types above
namespace std
{
    template<> struct hash<blehci::BTAddress> {
        std::size_t operator()(blehci::BTAddress const& a) const noexcept {
            return a.hash_code();
        }
    };
}

#endif /* BT_ADDRESS_HPP_ */
