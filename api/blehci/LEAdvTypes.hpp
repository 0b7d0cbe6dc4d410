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

#ifndef LE_ADV_TYPES_HPP_
#define LE_ADV_TYPES_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <chrono>
#include <optional>

#include <jau/basic_types.hpp>

#include "BTTypes0.hpp"
#include "BTAddress.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * LEAdvTypes.hpp Module for LE advertising parameter types:
 *
 * - BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.5 LE Set Advertising Parameters command
 */
namespace blehci {

    /** \addtogroup BLEHCIUserAPI
     *
     *  @{
     */

    /**
     * Advertising interval in units of 0.625 ms, range [MIN_U16, MAX_U16].
     */
    class AdvertisingInterval {
        public:
            static constexpr jau::nsize_t BYTE_LEN = 2;
            /** 20 ms */
            static constexpr uint16_t MIN_U16 = 0x0020;
            /** 100 ms, minimum for non-connectable advertising on BT 4.x controllers */
            static constexpr uint16_t MIN_NON_CONN_U16 = 0x00A0;
            /** 10.24 s */
            static constexpr uint16_t MAX_U16 = 0x4000;
            /** 1.28 s */
            static constexpr uint16_t DEFAULT_U16 = 0x0800;

            static const AdvertisingInterval MIN;
            static const AdvertisingInterval MIN_NON_CONN;
            static const AdvertisingInterval MAX;
            static const AdvertisingInterval DEFAULT;

        private:
            uint16_t units;

            struct unchecked_t {};
            constexpr AdvertisingInterval(const uint16_t v, unchecked_t) noexcept : units(v) {}

        public:
            constexpr static bool is_valid(const uint16_t v) noexcept {
                return MIN_U16 <= v && v <= MAX_U16;
            }

            constexpr AdvertisingInterval() noexcept : units(DEFAULT_U16) {}

            /** Strict constructor for trusted values, aborts the process if `v` is out of range. */
            explicit AdvertisingInterval(const uint16_t v) noexcept;

            /** Throws ConversionError if `v` is out of range. */
            static AdvertisingInterval from(const uint16_t v);

            /** Throws ConversionError if the resulting interval is out of range. */
            static AdvertisingInterval from(const std::chrono::milliseconds& d);

            /** Returns `ms * 1.6` units if within range, otherwise std::nullopt. */
            static std::optional<AdvertisingInterval> from_milliseconds(const uint32_t ms) noexcept;

            constexpr uint16_t value() const noexcept { return units; }

            constexpr uint32_t as_microseconds() const noexcept { return static_cast<uint32_t>(units) * 625; }

            std::chrono::microseconds as_duration() const noexcept { return std::chrono::microseconds(as_microseconds()); }

            constexpr bool operator==(const AdvertisingInterval& rhs) const noexcept { return units == rhs.units; }
            constexpr bool operator!=(const AdvertisingInterval& rhs) const noexcept { return units != rhs.units; }
            constexpr bool operator<(const AdvertisingInterval& rhs) const noexcept { return units < rhs.units; }
            constexpr bool operator<=(const AdvertisingInterval& rhs) const noexcept { return units <= rhs.units; }

            std::string toString() const noexcept;
    };

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.5 LE Set Advertising Parameters command: Advertising_Type
     */
    enum class AdvertisingType : uint8_t {
        /** Connectable and scannable undirected advertising, default */
        ADV_IND                  = 0x00,
        /** Connectable high duty cycle directed advertising */
        ADV_DIRECT_IND_HIGH_DUTY = 0x01,
        /** Scannable undirected advertising */
        ADV_SCAN_IND             = 0x02,
        /**
         * Non connectable undirected advertising.
         * <p>
         * BT 4.x controllers reject an interval below AdvertisingInterval::MIN_NON_CONN_U16.
         * </p>
         */
        ADV_NONCONN_IND          = 0x03,
        /** Connectable low duty cycle directed advertising */
        ADV_DIRECT_IND_LOW_DUTY  = 0x04
    };
    constexpr uint8_t number(const AdvertisingType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Throws ConversionError for an unknown code. */
    AdvertisingType to_AdvertisingType(const uint8_t v);
    std::string to_string(const AdvertisingType v) noexcept;

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.5 LE Set Advertising Parameters command: Peer_Address_Type
     */
    enum class PeerAddressType : uint8_t {
        PUBLIC = 0x00,
        RANDOM = 0x01
    };
    constexpr uint8_t number(const PeerAddressType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Throws ConversionError for an unknown code. */
    PeerAddressType to_PeerAddressType(const uint8_t v);
    std::string to_string(const PeerAddressType v) noexcept;

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.5 LE Set Advertising Parameters command: Own_Address_Type
     */
    enum class OwnAddressType : uint8_t {
        PUBLIC_DEVICE     = 0x00,
        RANDOM_DEVICE     = 0x01,
        /** Controller generated resolvable private address, falling back to the public address */
        PRIVATE_OR_PUBLIC = 0x02,
        /** Controller generated resolvable private address, falling back to the random address */
        PRIVATE_OR_RANDOM = 0x03
    };
    constexpr uint8_t number(const OwnAddressType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Throws ConversionError for an unknown code. */
    OwnAddressType to_OwnAddressType(const uint8_t v);
    std::string to_string(const OwnAddressType v) noexcept;

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.5 LE Set Advertising Parameters command: Advertising_Filter_Policy
     */
    enum class FilterPolicy : uint8_t {
        /** Process scan and connection requests from all devices */
        ALL                     = 0x00,
        /** Connection requests from all, scan requests only from white listed devices */
        CONN_ALL_SCAN_WHITELIST = 0x01,
        /** Scan requests from all, connection requests only from white listed devices */
        SCAN_ALL_CONN_WHITELIST = 0x02,
        /** Scan and connection requests only from white listed devices */
        WHITELIST               = 0x03
    };
    constexpr uint8_t number(const FilterPolicy rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Throws ConversionError for an unknown code. */
    FilterPolicy to_FilterPolicy(const uint8_t v);
    std::string to_string(const FilterPolicy v) noexcept;

    /**
     * Primary advertising channel, value is its bit index within ChannelMap.
     */
    enum class Channels : uint8_t {
        CHANNEL_37 = 0,
        CHANNEL_38 = 1,
        CHANNEL_39 = 2
    };
    constexpr uint8_t number(const Channels rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const Channels v) noexcept;

    /**
     * Bitmask of enabled primary advertising Channels, at most ALL_U8.
     */
    class ChannelMap {
        public:
            static constexpr uint8_t ALL_U8 = 0x07;

            static const ChannelMap ZEROED;
            static const ChannelMap ALL;

        private:
            uint8_t mask;

            struct unchecked_t {};
            constexpr ChannelMap(const uint8_t v, unchecked_t) noexcept : mask(v) {}

        public:
            /** All channels enabled */
            constexpr ChannelMap() noexcept : mask(ALL_U8) {}

            /** Strict constructor for trusted values, aborts the process if `v > ALL_U8`. */
            explicit ChannelMap(const uint8_t v) noexcept;

            /** Throws ConversionError if `v > ALL_U8`. */
            static ChannelMap from(const uint8_t v);

            void enable_channel(const Channels c) noexcept { mask |= static_cast<uint8_t>( 1U << number(c) ); }
            void disable_channel(const Channels c) noexcept { mask &= static_cast<uint8_t>( ~( 1U << number(c) ) ); }
            constexpr bool get_channel(const Channels c) const noexcept { return 0 != ( mask & ( 1U << number(c) ) ); }

            constexpr uint8_t value() const noexcept { return mask; }

            constexpr bool operator==(const ChannelMap& rhs) const noexcept { return mask == rhs.mask; }
            constexpr bool operator!=(const ChannelMap& rhs) const noexcept { return mask != rhs.mask; }

            std::string toString() const noexcept;
    };

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.5 LE Set Advertising Parameters command
     * <pre>
     *  uint16_t interval_min
     *  uint16_t interval_max
     *  uint8_t  advertising_type
     *  uint8_t  own_address_type
     *  uint8_t  peer_address_type
     *  uint8_t  peer_address[6]
     *  uint8_t  channel_map
     *  uint8_t  filter_policy
     * </pre>
     * All multi-octet fields are little endian.
     */
    struct AdvertisingParameters {
        static constexpr jau::nsize_t BYTE_LEN = 2 + 2 + 1 + 1 + 1 + BTAddress::byte_size + 1 + 1;

        /** All field defaults, peer address being BTAddress::ZEROED */
        static const AdvertisingParameters DEFAULT;

        AdvertisingInterval interval_min;
        AdvertisingInterval interval_max;
        AdvertisingType advertising_type = AdvertisingType::ADV_IND;
        OwnAddressType own_address_type = OwnAddressType::PUBLIC_DEVICE;
        PeerAddressType peer_address_type = PeerAddressType::PUBLIC;
        BTAddress peer_address;
        ChannelMap channel_map;
        FilterPolicy filter_policy = FilterPolicy::ALL;

        /** Returns a copy with peer_address replaced. */
        AdvertisingParameters with_address(const BTAddress& address) const noexcept;

        /** Returns a copy with interval_min and interval_max replaced. */
        AdvertisingParameters with_interval(const AdvertisingInterval& min, const AdvertisingInterval& max) const noexcept;

        /**
         * Writes BYTE_LEN octets into `dest`.
         * <p>
         * Throws PackError with PackErrc::BAD_LENGTH if `len != BYTE_LEN`
         * and PackErrc::INVALID_FIELDS if `interval_min > interval_max`, leaving `dest` untouched.
         * </p>
         */
        void pack_into(uint8_t * dest, const jau::nsize_t len) const;

        /**
         * Reads BYTE_LEN octets from `src`.
         * <p>
         * Throws PackError with PackErrc::BAD_LENGTH if `len != BYTE_LEN`,
         * PackErrc::BAD_BYTES with the offending index for an invalid field
         * and PackErrc::INVALID_FIELDS if `interval_min > interval_max`.
         * </p>
         */
        static AdvertisingParameters unpack_from(const uint8_t * src, const jau::nsize_t len);

        std::string toString() const noexcept;
    };

    bool operator==(const AdvertisingParameters& lhs, const AdvertisingParameters& rhs) noexcept;

    inline bool operator!=(const AdvertisingParameters& lhs, const AdvertisingParameters& rhs) noexcept
    { return !(lhs == rhs); }

    /**@}*/

} // namespace blehci

#endif /* LE_ADV_TYPES_HPP_ */
