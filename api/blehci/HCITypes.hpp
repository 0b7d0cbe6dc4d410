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

#ifndef HCI_TYPES_HPP_
#define HCI_TYPES_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <memory>
#include <vector>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>

#include "BTTypes0.hpp"
#include "LEAdvTypes.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * HCITypes.hpp Module for HCIPacket Types, HCIStatusCode etc:
 *
 * - BT Core Spec v5.2: Vol 4, Part E Host Controller Interface (HCI): 7 HCI commands and events
 *
 */
namespace blehci {

    /** \addtogroup BLEHCIUserAPI
     *
     *  @{
     */

    class HCIException : public jau::RuntimeException {
        protected:
            HCIException(std::string type, std::string const& m, const char* file, int line) noexcept
            : RuntimeException(std::move(type), m, file, line) {}

        public:
            HCIException(std::string const& m, const char* file, int line) noexcept
            : RuntimeException("HCIException", m, file, line) {}
    };

    class HCIPacketException : public HCIException {
        public:
            HCIPacketException(std::string const& m, const char* file, int line) noexcept
            : HCIException("HCIPacketException", m, file, line) {}
    };
    class HCIOpcodeException : public HCIException {
        public:
            HCIOpcodeException(std::string const& m, const char* file, int line) noexcept
            : HCIException("HCIOpcodeException", m, file, line) {}
    };

    enum class HCIConstU16 : uint16_t {
        /** Legacy advertising data payload length */
        MAX_AD_LENGTH          =  31
    };
    constexpr uint16_t number(const HCIConstU16 rhs) noexcept {
        return static_cast<uint16_t>(rhs);
    }

    /**
     * BT Core Spec v5.2: Vol 1, Part F Controller Error Codes: 1.3 List of Error Codes
     * <p>
     * Values beyond 0xfc are used locally, never sent by a controller.
     * </p>
     */
    enum class HCIStatusCode : uint8_t {
        SUCCESS                                            = 0x00,
        UNKNOWN_COMMAND                                    = 0x01,
        UNKNOWN_CONNECTION_IDENTIFIER                      = 0x02,
        HARDWARE_FAILURE                                   = 0x03,
        PAGE_TIMEOUT                                       = 0x04,
        AUTHENTICATION_FAILURE                             = 0x05,
        PIN_OR_KEY_MISSING                                 = 0x06,
        MEMORY_CAPACITY_EXCEEDED                           = 0x07,
        CONNECTION_TIMEOUT                                 = 0x08,
        CONNECTION_LIMIT_EXCEEDED                          = 0x09,
        SYNC_DEVICE_CONNECTION_LIMIT_EXCEEDED              = 0x0A,
        CONNECTION_ALREADY_EXISTS                          = 0x0B,
        COMMAND_DISALLOWED                                 = 0x0C,
        CONNECTION_REJECTED_LIMITED_RESOURCES              = 0x0D,
        CONNECTION_REJECTED_SECURITY                       = 0x0E,
        CONNECTION_REJECTED_UNACCEPTABLE_BD_ADDR           = 0x0F,
        CONNECTION_ACCEPT_TIMEOUT_EXCEEDED                 = 0x10,
        UNSUPPORTED_FEATURE_OR_PARAM_VALUE                 = 0x11,
        INVALID_HCI_COMMAND_PARAMETERS                     = 0x12,
        REMOTE_USER_TERMINATED_CONNECTION                  = 0x13,
        REMOTE_DEVICE_TERMINATED_CONNECTION_LOW_RESOURCES  = 0x14,
        REMOTE_DEVICE_TERMINATED_CONNECTION_POWER_OFF      = 0x15,
        CONNECTION_TERMINATED_BY_LOCAL_HOST                = 0x16,
        REPEATED_ATTEMPTS                                  = 0x17,
        PAIRING_NOT_ALLOWED                                = 0x18,
        UNKNOWN_LMP_PDU                                    = 0x19,
        UNSUPPORTED_REMOTE_OR_LMP_FEATURE                  = 0x1A,
        SCO_OFFSET_REJECTED                                = 0x1B,
        SCO_INTERVAL_REJECTED                              = 0x1C,
        SCO_AIR_MODE_REJECTED                              = 0x1D,
        INVALID_LMP_OR_LL_PARAMETERS                       = 0x1E,
        UNSPECIFIED_ERROR                                  = 0x1F,
        UNSUPPORTED_LMP_OR_LL_PARAMETER_VALUE              = 0x20,
        ROLE_CHANGE_NOT_ALLOWED                            = 0x21,
        LMP_OR_LL_RESPONSE_TIMEOUT                         = 0x22,
        LMP_OR_LL_COLLISION                                = 0x23,
        LMP_PDU_NOT_ALLOWED                                = 0x24,
        ENCRYPTION_MODE_NOT_ACCEPTED                       = 0x25,
        LINK_KEY_CANNOT_BE_CHANGED                         = 0x26,
        REQUESTED_QOS_NOT_SUPPORTED                        = 0x27,
        INSTANT_PASSED                                     = 0x28,
        PAIRING_WITH_UNIT_KEY_NOT_SUPPORTED                = 0x29,
        DIFFERENT_TRANSACTION_COLLISION                    = 0x2A,
        QOS_UNACCEPTABLE_PARAMETER                         = 0x2C,
        QOS_REJECTED                                       = 0x2D,
        CHANNEL_ASSESSMENT_NOT_SUPPORTED                   = 0x2E,
        INSUFFICIENT_SECURITY                              = 0x2F,
        PARAMETER_OUT_OF_RANGE                             = 0x30,
        ROLE_SWITCH_PENDING                                = 0x32,
        RESERVED_SLOT_VIOLATION                            = 0x34,
        ROLE_SWITCH_FAILED                                 = 0x35,
        EIR_TOO_LARGE                                      = 0x36,
        SIMPLE_PAIRING_NOT_SUPPORTED_BY_HOST               = 0x37,
        HOST_BUSY_PAIRING                                  = 0x38,
        CONNECTION_REJECTED_NO_SUITABLE_CHANNEL            = 0x39,
        CONTROLLER_BUSY                                    = 0x3A,
        UNACCEPTABLE_CONNECTION_PARAM                      = 0x3B,
        ADVERTISING_TIMEOUT                                = 0x3C,
        CONNECTION_TERMINATED_MIC_FAILURE                  = 0x3D,
        CONNECTION_EST_FAILED_OR_SYNC_TIMEOUT              = 0x3E,
        MAX_CONNECTION_FAILED                              = 0x3F,
        COARSE_CLOCK_ADJ_REJECTED                          = 0x40,
        TYPE0_SUBMAP_NOT_DEFINED                           = 0x41,
        UNKNOWN_ADVERTISING_IDENTIFIER                     = 0x42,
        LIMIT_REACHED                                      = 0x43,
        OPERATION_CANCELLED_BY_HOST                        = 0x44,
        PACKET_TOO_LONG                                    = 0x45,

        /** No reply within HCIEnv::HCI_COMMAND_COMPLETE_REPLY_TIMEOUT */
        INTERNAL_TIMEOUT                                   = 0xFD,
        INTERNAL_FAILURE                                   = 0xFE,
        UNKNOWN                                            = 0xFF
    };
    constexpr uint8_t number(const HCIStatusCode rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const HCIStatusCode ec) noexcept;

    class HCIStatusCodeCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "HCI"; }
            std::string message(int condition) const override {
                return "HCI::"+to_string( static_cast<HCIStatusCode>(condition) );
            }
            static HCIStatusCodeCategory& get() {
                static HCIStatusCodeCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( HCIStatusCode e ) noexcept {
      return std::error_code( number(e), HCIStatusCodeCategory::get() );
    }

    /**@}*/

    /** \addtogroup BLEHCISystemAPI
     *
     *  @{
     */

    enum class HCIConstSizeT : jau::nsize_t {
        /** HCIPacketType::COMMAND header size including HCIPacketType */
        COMMAND_HDR_SIZE  = 1+3,
        /** HCIPacketType::EVENT header size including HCIPacketType */
        EVENT_HDR_SIZE    = 1+2,
        /** Total packet size, guaranteed to be handled by adapter. */
        PACKET_MAX_SIZE   = 255
    };
    constexpr jau::nsize_t number(const HCIConstSizeT rhs) noexcept {
        return static_cast<jau::nsize_t>(rhs);
    }

    enum class HCIPacketType : uint8_t {
        COMMAND = 0x01,
        ACLDATA = 0x02,
        SCODATA = 0x03,
        EVENT   = 0x04,
        DIAG    = 0xf0,
        VENDOR  = 0xff
    };
    constexpr uint8_t number(const HCIPacketType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Throws ConversionError for an unknown packet type. */
    HCIPacketType to_HCIPacketType(const uint8_t v);
    std::string to_string(const HCIPacketType op) noexcept;

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.7 Events
     */
    enum class HCIEventType : uint8_t {
        INVALID                        = 0x00,
        INQUIRY_COMPLETE               = 0x01,
        INQUIRY_RESULT                 = 0x02,
        CONN_COMPLETE                  = 0x03,
        CONN_REQUEST                   = 0x04,
        DISCONN_COMPLETE               = 0x05,
        AUTH_COMPLETE                  = 0x06,
        REMOTE_NAME                    = 0x07,
        ENCRYPT_CHANGE                 = 0x08,
        CHANGE_LINK_KEY_COMPLETE       = 0x09,
        REMOTE_FEATURES                = 0x0B,
        REMOTE_VERSION                 = 0x0C,
        QOS_SETUP_COMPLETE             = 0x0D,
        CMD_COMPLETE                   = 0x0E,
        CMD_STATUS                     = 0x0F,
        HARDWARE_ERROR                 = 0x10,
        ROLE_CHANGE                    = 0x12,
        NUM_COMP_PKTS                  = 0x13,
        MODE_CHANGE                    = 0x14,
        PIN_CODE_REQ                   = 0x16,
        LINK_KEY_REQ                   = 0x17,
        LINK_KEY_NOTIFY                = 0x18,
        CLOCK_OFFSET                   = 0x1C,
        PKT_TYPE_CHANGE                = 0x1D,
        ENCRYPT_KEY_REFRESH_COMPLETE   = 0x30,
        IO_CAPABILITY_REQUEST          = 0x31,
        IO_CAPABILITY_RESPONSE         = 0x32,
        LE_META                        = 0x3E,
        DISCONN_PHY_LINK_COMPLETE      = 0x42,
        DISCONN_LOGICAL_LINK_COMPLETE  = 0x46,
        AMP_Receiver_Report            = 0x4B
    };
    constexpr uint8_t number(const HCIEventType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Throws ConversionError for a code not listed in HCIEventType. */
    HCIEventType to_HCIEventType(const uint8_t v);
    std::string to_string(const HCIEventType op) noexcept;

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.3 Controller & Baseband commands
     * <p>
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8 LE Controller commands
     * </p>
     */
    enum class HCIOpcode : uint16_t {
        SPECIAL                     = 0x0000,
        RESET                       = 0x0C03,
        LE_SET_RANDOM_ADDR          = 0x2005,
        LE_SET_ADV_PARAM            = 0x2006,
        LE_READ_ADV_TX_POWER        = 0x2007,
        LE_SET_ADV_DATA             = 0x2008,
        LE_SET_SCAN_RSP_DATA        = 0x2009,
        LE_SET_ADV_ENABLE           = 0x200a
    };
    constexpr uint16_t number(const HCIOpcode rhs) noexcept {
        return static_cast<uint16_t>(rhs);
    }
    std::string to_string(const HCIOpcode op) noexcept;

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 5.4 Exchange of HCI-specific information
     *
     * HCIPacket:
     * - uint8_t packet_type
     */
    class HCIPacket
    {
        protected:
            jau::POctets pdu;

            static void checkPacketType(const HCIPacketType type);

            virtual std::string nameString() const noexcept { return "HCIPacket"; }

            virtual std::string baseString() const noexcept { return ""; }

            virtual std::string valueString() const noexcept { return ""; }

        public:
            HCIPacket(const HCIPacketType type, const jau::nsize_t total_packet_size)
            : pdu(total_packet_size, jau::lb_endian_t::little)
            {
                if( 0 == total_packet_size ) {
                    throw jau::IndexOutOfBoundsError(1, total_packet_size, E_FILE_LINE);
                }
                pdu.put_uint8_nc(0, number(type));
            }

            /** Persistent memory, w/ ownership ..*/
            HCIPacket(const uint8_t *packet_data, const jau::nsize_t total_packet_size)
            : pdu(packet_data, total_packet_size, jau::lb_endian_t::little)
            {
                if( 0 == total_packet_size ) {
                    throw jau::IndexOutOfBoundsError(1, total_packet_size, E_FILE_LINE);
                }
                checkPacketType(getPacketType());
            }

            virtual ~HCIPacket() noexcept = default;

            jau::nsize_t getTotalSize() const noexcept { return pdu.size(); }

            /** Return the underlying octets read only */
            const jau::TROOctets & getPDU() const noexcept { return pdu; }

            HCIPacketType getPacketType() const noexcept { return static_cast<HCIPacketType>(pdu.get_uint8_nc(0)); }

            std::string toString() const noexcept {
                return nameString()+"["+baseString()+", "+valueString()+"]";
            }
    };
    inline std::string to_string(const HCIPacket& p) noexcept { return p.toString(); }

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 5.4.1 HCI Command packet
     *
     * HCIPacket:
     * - uint8_t packet_type
     * - HCICommand:
     *   - uint16_t command_type
     *   - uint8_t packet_len (total = 4 + packet_len)
     */
    class HCICommand : public HCIPacket
    {
        protected:
            static void checkOpcode(const HCIOpcode has, const HCIOpcode min, const HCIOpcode max);
            static void checkOpcode(const HCIOpcode has, const HCIOpcode exp);

            std::string nameString() const noexcept override { return "HCICommand"; }

            std::string baseString() const noexcept override {
                return "opcode="+jau::to_hexstring(number(getOpcode()))+" "+to_string(getOpcode());
            }
            std::string valueString() const noexcept override;

        public:
            /** Persistent memory, w/ ownership ..*/
            HCICommand(const uint8_t* buffer, const jau::nsize_t buffer_len, const jau::nsize_t exp_param_size);

            /** Enabling manual construction of command without given value. */
            HCICommand(const HCIOpcode opc, const jau::nsize_t param_size);

            /** Enabling manual construction of command with given value.  */
            HCICommand(const HCIOpcode opc, const uint8_t* param, const jau::nsize_t param_size)
            : HCICommand(opc, param_size)
            {
                if( param_size > 0 ) {
                    memcpy(pdu.get_wptr_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE)), param, param_size);
                }
            }

            ~HCICommand() noexcept override = default;

            HCIOpcode getOpcode() const noexcept { return static_cast<HCIOpcode>( pdu.get_uint16_nc(1) ); }
            jau::nsize_t getParamSize() const noexcept { return pdu.get_uint8_nc(3); }
            const uint8_t* getParam() const noexcept { return pdu.get_ptr_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE)); }
    };

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.5 LE Set Advertising Parameters command
     *
     * HCICommand parameter: AdvertisingParameters, AdvertisingParameters::BYTE_LEN octets
     */
    class HCILESetAdvParamCmd : public HCICommand
    {
        protected:
            std::string nameString() const noexcept override { return "HCILESetAdvParamCmd"; }

        public:
            HCILESetAdvParamCmd(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : HCICommand(buffer, buffer_len, AdvertisingParameters::BYTE_LEN)
            {
                checkOpcode(getOpcode(), HCIOpcode::LE_SET_ADV_PARAM);
            }

            explicit HCILESetAdvParamCmd(const AdvertisingParameters& params)
            : HCICommand(HCIOpcode::LE_SET_ADV_PARAM, AdvertisingParameters::BYTE_LEN)
            {
                params.pack_into(pdu.get_wptr_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE)), AdvertisingParameters::BYTE_LEN);
            }

            /** Throws PackError for malformed parameter octets. */
            AdvertisingParameters getParameters() const {
                return AdvertisingParameters::unpack_from(getParam(), AdvertisingParameters::BYTE_LEN);
            }
    };

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.7 LE Set Advertising Data command
     *
     * HCICommand parameter:
     * - uint8_t data_len
     * - uint8_t data[31], zero padded
     */
    class HCILESetAdvDataCmd : public HCICommand
    {
        protected:
            std::string nameString() const noexcept override { return "HCILESetAdvDataCmd"; }

        public:
            static constexpr jau::nsize_t PARAM_SIZE = 1 + number(HCIConstU16::MAX_AD_LENGTH);

            /** Throws PackError if `data_len` exceeds HCIConstU16::MAX_AD_LENGTH. */
            HCILESetAdvDataCmd(const uint8_t* data, const jau::nsize_t data_len);

            jau::nsize_t getDataSize() const noexcept { return pdu.get_uint8_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE)); }
            const uint8_t* getData() const noexcept { return pdu.get_ptr_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE)+1); }
    };

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.8.9 LE Set Advertising Enable command
     *
     * HCICommand parameter:
     * - uint8_t enable
     */
    class HCILESetAdvEnableCmd : public HCICommand
    {
        protected:
            std::string nameString() const noexcept override { return "HCILESetAdvEnableCmd"; }

        public:
            HCILESetAdvEnableCmd(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : HCICommand(buffer, buffer_len, 1)
            {
                checkOpcode(getOpcode(), HCIOpcode::LE_SET_ADV_ENABLE);
            }

            explicit HCILESetAdvEnableCmd(const bool enable)
            : HCICommand(HCIOpcode::LE_SET_ADV_ENABLE, 1)
            {
                pdu.put_uint8_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE), enable ? 0x01 : 0x00);
            }

            bool isEnable() const noexcept { return 0 != pdu.get_uint8_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE)); }
    };

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 5.4.4 HCI Event packet
     *
     * HCIPacket:
     * - uint8_t packet_type
     * - HCIEvent:
     *   - uint8_t event_type
     *   - uint8_t packet_len (total = 3 + packet_len)
     */
    class HCIEvent : public HCIPacket
    {
        protected:
            uint64_t ts_creation;

            static void checkEventType(const HCIEventType has, const HCIEventType min, const HCIEventType max);
            static void checkEventType(const HCIEventType has, const HCIEventType exp);

            std::string nameString() const noexcept override { return "HCIEvent"; }

            std::string baseString() const noexcept override {
                return "event="+jau::to_hexstring(number(getEventType()))+" "+to_string(getEventType());
            }
            std::string valueString() const noexcept override;

        public:
            /**
             * Return a newly created specialized instance pointer to base class.
             * <p>
             * Returns nullptr if the buffer doesn't hold a complete and valid event packet.
             * </p>
             */
            static std::unique_ptr<HCIEvent> getSpecialized(const uint8_t * buffer, jau::nsize_t const buffer_size) noexcept;

            /** Persistent memory, w/ ownership ..*/
            HCIEvent(const uint8_t* buffer, const jau::nsize_t buffer_len, const jau::nsize_t exp_param_size);

            /** Enabling manual construction of event without given value.  */
            HCIEvent(const HCIEventType evt, const jau::nsize_t param_size=0);

            /** Enabling manual construction of event with given value.  */
            HCIEvent(const HCIEventType evt, const uint8_t* param, const jau::nsize_t param_size)
            : HCIEvent(evt, param_size)
            {
                if( param_size > 0 ) {
                    memcpy(pdu.get_wptr_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)), param, param_size);
                }
            }

            ~HCIEvent() noexcept override = default;

            uint64_t getTimestamp() const noexcept { return ts_creation; }

            HCIEventType getEventType() const noexcept { return static_cast<HCIEventType>( pdu.get_uint8_nc(1) ); }
            bool isEvent(HCIEventType t) const noexcept { return t == getEventType(); }

            jau::nsize_t getParamSize() const noexcept { return pdu.get_uint8_nc(2); }
            const uint8_t* getParam() const noexcept { return pdu.get_ptr_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)); }

            virtual bool validate(const HCICommand & cmd) const noexcept { (void)cmd; return true; }
    };

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.7.14 Command Complete event
     *
     * HCIEvent parameter:
     * - uint8_t ncmd
     * - uint16_t opcode
     * - uint8_t return_param[], first octet being the HCIStatusCode for the commands used here
     */
    class HCICommandCompleteEvent : public HCIEvent
    {
        protected:
            std::string nameString() const noexcept override { return "HCICmdCompleteEvent"; }

            std::string baseString() const noexcept override {
                return HCIEvent::baseString()+", opcode="+jau::to_hexstring(number(getOpcode()))+
                        " "+to_string(getOpcode())+
                        ", ncmd "+std::to_string(getNumCommandPackets());
            }

        public:
            HCICommandCompleteEvent(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : HCIEvent(buffer, buffer_len, 3)
            {
                checkEventType(getEventType(), HCIEventType::CMD_COMPLETE);
            }

            /** Enabling manual construction, e.g. for a local controller model. */
            HCICommandCompleteEvent(const HCIOpcode opc, const uint8_t ncmd, const uint8_t* ret_param, const jau::nsize_t ret_param_size);

            /**
             * The Number of HCI Command packets which are allowed to be sent to the Controller from the Host.
             * <p>
             * Range: 0 to 255
             * </p>
             */
            uint8_t getNumCommandPackets() const noexcept { return pdu.get_uint8_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+0); }

            /**
             * The associated command
             */
            HCIOpcode getOpcode() const noexcept { return static_cast<HCIOpcode>( pdu.get_uint16_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+1) ); }

            jau::nsize_t getReturnParamSize() const noexcept { return getParamSize() - 3; }
            const uint8_t* getReturnParam() const noexcept { return pdu.get_ptr_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+3); }

            /**
             * Returns the first return parameter as HCIStatusCode,
             * or HCIStatusCode::UNKNOWN if no return parameter is present.
             */
            HCIStatusCode getReturnStatus() const noexcept {
                return 0 < getReturnParamSize() ? static_cast<HCIStatusCode>( *getReturnParam() ) : HCIStatusCode::UNKNOWN;
            }

            bool validate(const HCICommand & cmd) const noexcept override {
                return cmd.getOpcode() == getOpcode();
            }
    };

    /**
     * BT Core Spec v5.2: Vol 4, Part E HCI: 7.7.15 Command Status event
     *
     * HCIEvent parameter:
     * - uint8_t status
     * - uint8_t ncmd
     * - uint16_t opcode
     */
    class HCICommandStatusEvent : public HCIEvent
    {
        protected:
            std::string nameString() const noexcept override { return "HCICmdStatusEvent"; }

            std::string baseString() const noexcept override {
                return HCIEvent::baseString()+", opcode="+jau::to_hexstring(number(getOpcode()))+
                        " "+to_string(getOpcode())+
                        ", ncmd "+std::to_string(getNumCommandPackets())+
                        ", status "+jau::to_hexstring(number(getStatus()))+" "+to_string(getStatus());
            }

        public:
            HCICommandStatusEvent(const uint8_t* buffer, const jau::nsize_t buffer_len)
            : HCIEvent(buffer, buffer_len, 4)
            {
                checkEventType(getEventType(), HCIEventType::CMD_STATUS);
            }

            /** Enabling manual construction, e.g. for a local controller model. */
            HCICommandStatusEvent(const HCIOpcode opc, const uint8_t ncmd, const HCIStatusCode status);

            HCIStatusCode getStatus() const noexcept { return static_cast<HCIStatusCode>( pdu.get_uint8_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)) ); }

            uint8_t getNumCommandPackets() const noexcept { return pdu.get_uint8_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+1); }

            HCIOpcode getOpcode() const noexcept { return static_cast<HCIOpcode>( pdu.get_uint16_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+1+1) ); }

            bool validate(const HCICommand & cmd) const noexcept override {
                return cmd.getOpcode() == getOpcode();
            }
    };

    /**@}*/

} // namespace blehci

// injecting specialization of std::is_error_code_enum
namespace std {
    template <>
        struct is_error_code_enum<blehci::HCIStatusCode> : true_type {};
}

#endif /* HCI_TYPES_HPP_ */
