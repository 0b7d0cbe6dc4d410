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

#ifndef BT_TYPES0_HPP_
#define BT_TYPES0_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <array>
#include <optional>
#include <system_error>

#include <jau/basic_types.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * BTTypes0.hpp Module for wire primitives and their error taxonomy:
 *
 * - BT Core Spec v5.2: Vol 4, Part E Host Controller Interface (HCI): 7.8 LE Controller Commands
 */
namespace blehci {

    /** \addtogroup BLEHCIUserAPI
     *
     *  @{
     */

    class BTException : public jau::RuntimeException {
        protected:
            BTException(std::string type, std::string const& m, const char* file, int line) noexcept
            : RuntimeException(std::move(type), m, file, line) {}

        public:
            BTException(std::string const& m, const char* file, int line) noexcept
            : RuntimeException("BTException", m, file, line) {}
    };

    /**
     * Value from an untrusted representation is outside the domain of the target type.
     */
    class ConversionError : public BTException {
        public:
            ConversionError(std::string const& m, const char* file, int line) noexcept
            : BTException("ConversionError", m, file, line) {}
    };

    /**
     * Error codes of PackError, usable as std::error_code via PackErrcCategory.
     */
    enum class PackErrc : int {
        SUCCESS        = 0,
        /** Unexpected opcode or discriminator */
        BAD_OPCODE     = 1,
        /** Buffer length mismatch, see PackError::expected and PackError::got */
        BAD_LENGTH     = 2,
        /** Invalid byte content, see PackError::index if known */
        BAD_BYTES      = 3,
        /** Individually valid fields being inconsistent with each other */
        INVALID_FIELDS = 4
    };
    constexpr int number(const PackErrc rhs) noexcept {
        return static_cast<int>(rhs);
    }
    std::string to_string(const PackErrc v) noexcept;

    class PackErrcCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "Pack"; }
            std::string message(int condition) const override {
                return "Pack::"+to_string( static_cast<PackErrc>(condition) );
            }
            static PackErrcCategory& get() {
                static PackErrcCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( PackErrc e ) noexcept {
        return std::error_code( number(e), PackErrcCategory::get() );
    }

    /**
     * Malformed byte buffer while packing or unpacking a wire structure.
     * <p>
     * Decoders never read beyond the length they validated beforehand.
     * </p>
     */
    class PackError : public BTException {
        public:
            /** Marker for an unknown `expected`, `got` or `index` value. */
            static constexpr jau::snsize_t NONE = -1;

            const PackErrc kind;
            const jau::snsize_t expected;
            const jau::snsize_t got;
            const jau::snsize_t index;

            PackError(const PackErrc kind_, std::string const& m, const char* file, int line,
                      const jau::snsize_t expected_=NONE, const jau::snsize_t got_=NONE, const jau::snsize_t index_=NONE) noexcept
            : BTException("PackError", to_string(kind_)+": "+m, file, line),
              kind(kind_), expected(expected_), got(got_), index(index_) {}

            std::error_code error_code() const noexcept { return make_error_code(kind); }

            /** Throws PackErrc::BAD_LENGTH unless `got == expected`. */
            static void expect_length(const jau::nsize_t expected, const jau::nsize_t got);

            /** Throws PackErrc::BAD_LENGTH unless `got >= expected`. */
            static void atleast_length(const jau::nsize_t expected, const jau::nsize_t got);

            /** Returns a PackErrc::BAD_BYTES error for the offending byte `idx`, for the caller to throw. */
            static PackError bad_index(const jau::nsize_t idx) noexcept;
    };

    /**
     * Adapter identifier as used by the kernel, e.g. `0` for `hci0`.
     */
    typedef uint16_t AdapterID;

    /**
     * Received Signal Strength Indicator in dBm.
     * <p>
     * Valid range is [MIN_RSSI_I8, MAX_RSSI_I8],
     * UNSUPPORTED_RSSI denotes an absent reading.
     * </p>
     */
    class RSSI {
        public:
            static constexpr int8_t MIN_RSSI_I8 = -127;
            static constexpr int8_t MAX_RSSI_I8 = 20;
            static constexpr int8_t UNSUPPORTED_RSSI = 127;

        private:
            int8_t dbm;

            struct unchecked_t {};
            constexpr RSSI(const int8_t v, unchecked_t) noexcept : dbm(v) {}

        public:
            constexpr static bool is_valid(const int8_t v) noexcept {
                return MIN_RSSI_I8 <= v && v <= MAX_RSSI_I8;
            }

            /** Zero dBm */
            constexpr RSSI() noexcept : dbm(0) {}

            /**
             * Strict constructor for trusted values,
             * aborts the process if `v` is outside [MIN_RSSI_I8, MAX_RSSI_I8].
             */
            explicit RSSI(const int8_t v) noexcept;

            /** Throws ConversionError if `v` is outside [MIN_RSSI_I8, MAX_RSSI_I8]. */
            static RSSI from(const int8_t v);

            /** Interprets the raw octet as two's complement, then as from(int8_t). */
            static RSSI from_u8(const uint8_t v) { return from( static_cast<int8_t>(v) ); }

            /**
             * Returns std::nullopt for UNSUPPORTED_RSSI,
             * otherwise as from(int8_t), throwing ConversionError for out of range values.
             */
            static std::optional<RSSI> maybe_rssi(const int8_t v);

            constexpr int8_t value() const noexcept { return dbm; }

            constexpr bool operator==(const RSSI& rhs) const noexcept { return dbm == rhs.dbm; }
            constexpr bool operator!=(const RSSI& rhs) const noexcept { return dbm != rhs.dbm; }

            std::string toString() const noexcept { return std::to_string(dbm)+" dBm"; }
    };

    /**
     * Power level in milli dBm, no range restriction.
     */
    class MilliDBM {
        private:
            int32_t mdbm;

        public:
            constexpr MilliDBM() noexcept : mdbm(0) {}
            constexpr explicit MilliDBM(const int32_t v) noexcept : mdbm(v) {}

            constexpr static MilliDBM from_rssi(const RSSI& rssi) noexcept { return MilliDBM( static_cast<int32_t>(rssi.value()) * 1000 ); }

            constexpr int32_t value() const noexcept { return mdbm; }

            constexpr bool operator==(const MilliDBM& rhs) const noexcept { return mdbm == rhs.mdbm; }
            constexpr bool operator!=(const MilliDBM& rhs) const noexcept { return mdbm != rhs.mdbm; }

            std::string toString() const noexcept { return std::to_string(mdbm)+" mdBm"; }
    };

    /**
     * Bluetooth SIG assigned company identifier, 2 octets on the wire.
     */
    class CompanyID {
        private:
            uint16_t id;

        public:
            static constexpr jau::nsize_t byte_len() noexcept { return 2; }

            constexpr CompanyID() noexcept : id(0) {}
            constexpr explicit CompanyID(const uint16_t v) noexcept : id(v) {}

            constexpr uint16_t value() const noexcept { return id; }

            std::array<uint8_t, 2> to_bytes_le() const noexcept;
            std::array<uint8_t, 2> to_bytes_be() const noexcept;
            static CompanyID from_bytes_le(const std::array<uint8_t, 2>& b) noexcept;
            static CompanyID from_bytes_be(const std::array<uint8_t, 2>& b) noexcept;

            /** Reads the little endian wire form, throws PackError if `len != byte_len()`. */
            static CompanyID unpack_from(const uint8_t* src, const jau::nsize_t len);

            constexpr bool operator==(const CompanyID& rhs) const noexcept { return id == rhs.id; }
            constexpr bool operator!=(const CompanyID& rhs) const noexcept { return id != rhs.id; }

            std::string toString() const noexcept { return jau::to_hexstring(id); }
    };

    /**@}*/

} // namespace blehci

// injecting specialization of std::is_error_code_enum
namespace std {
    template <>
        struct is_error_code_enum<blehci::PackErrc> : true_type {};
}

#endif /* BT_TYPES0_HPP_ */
