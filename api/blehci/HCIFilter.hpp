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

#ifndef HCI_FILTER_HPP_
#define HCI_FILTER_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/basic_types.hpp>

namespace blehci {

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    /**
     * Kernel HCI socket filter, installed via `setsockopt(SOL_HCI, HCI_FILTER)`.
     * <pre>
     *  [ 0.. 4) uint32_t type_mask, little endian
     *  [ 4.. 8) uint32_t event_mask[0], little endian
     *  [ 8..12) uint32_t event_mask[1], little endian
     *  [12..14) uint16_t opcode, little endian
     * </pre>
     */
    class HCIFilter {
        public:
            static constexpr jau::nsize_t byte_size = 14;

            static constexpr int FLT_TYPE_BITS  = 31;
            static constexpr int FLT_EVENT_BITS = 63;
            static constexpr int VENDOR_PKT     = 0xff;

        private:
            uint8_t data[byte_size];

            void put_type_mask(const uint32_t v) noexcept;
            void put_event_mask(const uint64_t v) noexcept;

            static constexpr int type_bit(const int t) noexcept {
                return ( VENDOR_PKT == t ) ? 0 : ( t & FLT_TYPE_BITS );
            }

        public:
            /** Cleared filter, i.e. passing nothing */
            HCIFilter() noexcept { clear(); }

            /**
             * Returns the filter installed by HCIComm::open():
             * packet types HCIPacketType::COMMAND and HCIPacketType::EVENT,
             * events HCIEventType::CMD_COMPLETE and HCIEventType::CMD_STATUS.
             */
            static HCIFilter make_default() noexcept;

            void clear() noexcept { bzero(data, sizeof(data)); }

            uint32_t type_mask() const noexcept;
            uint64_t event_mask() const noexcept;
            uint16_t opcode() const noexcept;

            void set_ptype(const int t) noexcept { put_type_mask( type_mask() | ( 1U << type_bit(t) ) ); }
            void clear_ptype(const int t) noexcept { put_type_mask( type_mask() & ~( 1U << type_bit(t) ) ); }
            bool test_ptype(const int t) const noexcept { return 0 != ( type_mask() & ( 1U << type_bit(t) ) ); }
            void all_ptypes() noexcept { put_type_mask( 0xffffffffU ); }

            void set_event(const int e) noexcept { put_event_mask( event_mask() | ( uint64_t(1) << ( e & FLT_EVENT_BITS ) ) ); }
            void clear_event(const int e) noexcept { put_event_mask( event_mask() & ~( uint64_t(1) << ( e & FLT_EVENT_BITS ) ) ); }
            bool test_event(const int e) const noexcept { return 0 != ( event_mask() & ( uint64_t(1) << ( e & FLT_EVENT_BITS ) ) ); }
            void all_events() noexcept { put_event_mask( 0xffffffffffffffffULL ); }

            void set_opcode(const uint16_t opc) noexcept;
            void clear_opcode() noexcept { set_opcode(0); }
            bool test_opcode(const uint16_t opc) const noexcept { return opc == opcode(); }

            const uint8_t* get_ptr() const noexcept { return data; }
            constexpr jau::nsize_t size() const noexcept { return byte_size; }

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace blehci

#endif /* HCI_FILTER_HPP_ */
