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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <cstdio>

#include <jau/debug.hpp>

#include "HCITypes.hpp"

namespace blehci {

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_HCIStatusCode_ENUM(X) \
        X(HCIStatusCode,SUCCESS) \
        X(HCIStatusCode,UNKNOWN_COMMAND) \
        X(HCIStatusCode,UNKNOWN_CONNECTION_IDENTIFIER) \
        X(HCIStatusCode,HARDWARE_FAILURE) \
        X(HCIStatusCode,PAGE_TIMEOUT) \
        X(HCIStatusCode,AUTHENTICATION_FAILURE) \
        X(HCIStatusCode,PIN_OR_KEY_MISSING) \
        X(HCIStatusCode,MEMORY_CAPACITY_EXCEEDED) \
        X(HCIStatusCode,CONNECTION_TIMEOUT) \
        X(HCIStatusCode,CONNECTION_LIMIT_EXCEEDED) \
        X(HCIStatusCode,SYNC_DEVICE_CONNECTION_LIMIT_EXCEEDED) \
        X(HCIStatusCode,CONNECTION_ALREADY_EXISTS) \
        X(HCIStatusCode,COMMAND_DISALLOWED) \
        X(HCIStatusCode,CONNECTION_REJECTED_LIMITED_RESOURCES) \
        X(HCIStatusCode,CONNECTION_REJECTED_SECURITY) \
        X(HCIStatusCode,CONNECTION_REJECTED_UNACCEPTABLE_BD_ADDR) \
        X(HCIStatusCode,CONNECTION_ACCEPT_TIMEOUT_EXCEEDED) \
        X(HCIStatusCode,UNSUPPORTED_FEATURE_OR_PARAM_VALUE) \
        X(HCIStatusCode,INVALID_HCI_COMMAND_PARAMETERS) \
        X(HCIStatusCode,REMOTE_USER_TERMINATED_CONNECTION) \
        X(HCIStatusCode,REMOTE_DEVICE_TERMINATED_CONNECTION_LOW_RESOURCES) \
        X(HCIStatusCode,REMOTE_DEVICE_TERMINATED_CONNECTION_POWER_OFF) \
        X(HCIStatusCode,CONNECTION_TERMINATED_BY_LOCAL_HOST) \
        X(HCIStatusCode,REPEATED_ATTEMPTS) \
        X(HCIStatusCode,PAIRING_NOT_ALLOWED) \
        X(HCIStatusCode,UNKNOWN_LMP_PDU) \
        X(HCIStatusCode,UNSUPPORTED_REMOTE_OR_LMP_FEATURE) \
        X(HCIStatusCode,SCO_OFFSET_REJECTED) \
        X(HCIStatusCode,SCO_INTERVAL_REJECTED) \
        X(HCIStatusCode,SCO_AIR_MODE_REJECTED) \
        X(HCIStatusCode,INVALID_LMP_OR_LL_PARAMETERS) \
        X(HCIStatusCode,UNSPECIFIED_ERROR) \
        X(HCIStatusCode,UNSUPPORTED_LMP_OR_LL_PARAMETER_VALUE) \
        X(HCIStatusCode,ROLE_CHANGE_NOT_ALLOWED) \
        X(HCIStatusCode,LMP_OR_LL_RESPONSE_TIMEOUT) \
        X(HCIStatusCode,LMP_OR_LL_COLLISION) \
        X(HCIStatusCode,LMP_PDU_NOT_ALLOWED) \
        X(HCIStatusCode,ENCRYPTION_MODE_NOT_ACCEPTED) \
        X(HCIStatusCode,LINK_KEY_CANNOT_BE_CHANGED) \
        X(HCIStatusCode,REQUESTED_QOS_NOT_SUPPORTED) \
        X(HCIStatusCode,INSTANT_PASSED) \
        X(HCIStatusCode,PAIRING_WITH_UNIT_KEY_NOT_SUPPORTED) \
        X(HCIStatusCode,DIFFERENT_TRANSACTION_COLLISION) \
        X(HCIStatusCode,QOS_UNACCEPTABLE_PARAMETER) \
        X(HCIStatusCode,QOS_REJECTED) \
        X(HCIStatusCode,CHANNEL_ASSESSMENT_NOT_SUPPORTED) \
        X(HCIStatusCode,INSUFFICIENT_SECURITY) \
        X(HCIStatusCode,PARAMETER_OUT_OF_RANGE) \
        X(HCIStatusCode,ROLE_SWITCH_PENDING) \
        X(HCIStatusCode,RESERVED_SLOT_VIOLATION) \
        X(HCIStatusCode,ROLE_SWITCH_FAILED) \
        X(HCIStatusCode,EIR_TOO_LARGE) \
        X(HCIStatusCode,SIMPLE_PAIRING_NOT_SUPPORTED_BY_HOST) \
        X(HCIStatusCode,HOST_BUSY_PAIRING) \
        X(HCIStatusCode,CONNECTION_REJECTED_NO_SUITABLE_CHANNEL) \
        X(HCIStatusCode,CONTROLLER_BUSY) \
        X(HCIStatusCode,UNACCEPTABLE_CONNECTION_PARAM) \
        X(HCIStatusCode,ADVERTISING_TIMEOUT) \
        X(HCIStatusCode,CONNECTION_TERMINATED_MIC_FAILURE) \
        X(HCIStatusCode,CONNECTION_EST_FAILED_OR_SYNC_TIMEOUT) \
        X(HCIStatusCode,MAX_CONNECTION_FAILED) \
        X(HCIStatusCode,COARSE_CLOCK_ADJ_REJECTED) \
        X(HCIStatusCode,TYPE0_SUBMAP_NOT_DEFINED) \
        X(HCIStatusCode,UNKNOWN_ADVERTISING_IDENTIFIER) \
        X(HCIStatusCode,LIMIT_REACHED) \
        X(HCIStatusCode,OPERATION_CANCELLED_BY_HOST) \
        X(HCIStatusCode,PACKET_TOO_LONG) \
        X(HCIStatusCode,INTERNAL_TIMEOUT) \
        X(HCIStatusCode,INTERNAL_FAILURE) \
        X(HCIStatusCode,UNKNOWN)

std::string to_string(const HCIStatusCode ec) noexcept {
    switch(ec) {
        CHAR_DECL_HCIStatusCode_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown HCIStatusCode "+jau::to_hexstring(number(ec));
}

#define CHAR_DECL_HCIPacketType_ENUM(X) \
        X(HCIPacketType,COMMAND) \
        X(HCIPacketType,ACLDATA) \
        X(HCIPacketType,SCODATA) \
        X(HCIPacketType,EVENT) \
        X(HCIPacketType,DIAG) \
        X(HCIPacketType,VENDOR)

#define CASE2_TO_ENUM(U,V) case number(U::V): return U::V;

std::string to_string(const HCIPacketType op) noexcept {
    switch(op) {
        CHAR_DECL_HCIPacketType_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown HCIPacketType "+jau::to_hexstring(number(op));
}

HCIPacketType to_HCIPacketType(const uint8_t v) {
    switch(v) {
        CHAR_DECL_HCIPacketType_ENUM(CASE2_TO_ENUM)
        default: ; // fall through intended
    }
    throw ConversionError("Unknown HCIPacketType "+jau::to_hexstring(v), E_FILE_LINE);
}

#define CHAR_DECL_HCIEventType_ENUM(X) \
        X(HCIEventType,INVALID) \
        X(HCIEventType,INQUIRY_COMPLETE) \
        X(HCIEventType,INQUIRY_RESULT) \
        X(HCIEventType,CONN_COMPLETE) \
        X(HCIEventType,CONN_REQUEST) \
        X(HCIEventType,DISCONN_COMPLETE) \
        X(HCIEventType,AUTH_COMPLETE) \
        X(HCIEventType,REMOTE_NAME) \
        X(HCIEventType,ENCRYPT_CHANGE) \
        X(HCIEventType,CHANGE_LINK_KEY_COMPLETE) \
        X(HCIEventType,REMOTE_FEATURES) \
        X(HCIEventType,REMOTE_VERSION) \
        X(HCIEventType,QOS_SETUP_COMPLETE) \
        X(HCIEventType,CMD_COMPLETE) \
        X(HCIEventType,CMD_STATUS) \
        X(HCIEventType,HARDWARE_ERROR) \
        X(HCIEventType,ROLE_CHANGE) \
        X(HCIEventType,NUM_COMP_PKTS) \
        X(HCIEventType,MODE_CHANGE) \
        X(HCIEventType,PIN_CODE_REQ) \
        X(HCIEventType,LINK_KEY_REQ) \
        X(HCIEventType,LINK_KEY_NOTIFY) \
        X(HCIEventType,CLOCK_OFFSET) \
        X(HCIEventType,PKT_TYPE_CHANGE) \
        X(HCIEventType,ENCRYPT_KEY_REFRESH_COMPLETE) \
        X(HCIEventType,IO_CAPABILITY_REQUEST) \
        X(HCIEventType,IO_CAPABILITY_RESPONSE) \
        X(HCIEventType,LE_META) \
        X(HCIEventType,DISCONN_PHY_LINK_COMPLETE) \
        X(HCIEventType,DISCONN_LOGICAL_LINK_COMPLETE) \
        X(HCIEventType,AMP_Receiver_Report)

std::string to_string(const HCIEventType op) noexcept {
    switch(op) {
        CHAR_DECL_HCIEventType_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown HCIEventType "+jau::to_hexstring(number(op));
}

HCIEventType to_HCIEventType(const uint8_t v) {
    switch(v) {
        CHAR_DECL_HCIEventType_ENUM(CASE2_TO_ENUM)
        default: ; // fall through intended
    }
    throw ConversionError("Unknown HCIEventType "+jau::to_hexstring(v), E_FILE_LINE);
}

#define CHAR_DECL_HCIOpcode_ENUM(X) \
        X(HCIOpcode,SPECIAL) \
        X(HCIOpcode,RESET) \
        X(HCIOpcode,LE_SET_RANDOM_ADDR) \
        X(HCIOpcode,LE_SET_ADV_PARAM) \
        X(HCIOpcode,LE_READ_ADV_TX_POWER) \
        X(HCIOpcode,LE_SET_ADV_DATA) \
        X(HCIOpcode,LE_SET_SCAN_RSP_DATA) \
        X(HCIOpcode,LE_SET_ADV_ENABLE)

std::string to_string(const HCIOpcode op) noexcept {
    switch(op) {
        CHAR_DECL_HCIOpcode_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown HCIOpcode "+jau::to_hexstring(number(op));
}

// *************************************************
// *************************************************
// *************************************************

void HCIPacket::checkPacketType(const HCIPacketType type) {
    switch(type) {
        case HCIPacketType::COMMAND:
        case HCIPacketType::ACLDATA:
        case HCIPacketType::SCODATA:
        case HCIPacketType::EVENT:
        case HCIPacketType::DIAG:
        case HCIPacketType::VENDOR:
            return; // OK
        default:
            throw HCIPacketException("Unsupported packet type "+jau::to_hexstring(number(type)), E_FILE_LINE);
    }
}

void HCICommand::checkOpcode(const HCIOpcode has, const HCIOpcode min, const HCIOpcode max) {
    if( has < min || has > max ) {
        throw HCIOpcodeException("Has opcode "+jau::to_hexstring(number(has))+
                         ", not within range ["+jau::to_hexstring(number(min))+
                         ".."+jau::to_hexstring(number(max))+"]", E_FILE_LINE);
    }
}

void HCICommand::checkOpcode(const HCIOpcode has, const HCIOpcode exp) {
    if( has != exp ) {
        throw HCIOpcodeException("Has opcode "+jau::to_hexstring(number(has))+
                         ", not matching "+jau::to_hexstring(number(exp)), E_FILE_LINE);
    }
}

std::string HCICommand::valueString() const noexcept {
    const jau::nsize_t psz = getParamSize();
    const std::string ps = psz > 0 ? jau::bytesHexString(getParam(), 0, psz, true /* lsbFirst */) : "";
    return "param[size "+std::to_string(psz)+", data "+ps+"], tsz "+std::to_string(getTotalSize());
}

HCICommand::HCICommand(const uint8_t* buffer, const jau::nsize_t buffer_len, const jau::nsize_t exp_param_size)
: HCIPacket(buffer, buffer_len)
{
    pdu.check_range(0, number(HCIConstSizeT::COMMAND_HDR_SIZE), E_FILE_LINE);
    const jau::nsize_t paramSize = getParamSize();
    pdu.check_range(0, number(HCIConstSizeT::COMMAND_HDR_SIZE)+paramSize, E_FILE_LINE);
    if( exp_param_size > paramSize ) {
        throw jau::IndexOutOfBoundsError(exp_param_size, paramSize, E_FILE_LINE);
    }
    checkOpcode(getOpcode(), HCIOpcode::SPECIAL, HCIOpcode::LE_SET_ADV_ENABLE);
}

HCICommand::HCICommand(const HCIOpcode opc, const jau::nsize_t param_size)
: HCIPacket(HCIPacketType::COMMAND, number(HCIConstSizeT::COMMAND_HDR_SIZE)+param_size)
{
    checkOpcode(opc, HCIOpcode::SPECIAL, HCIOpcode::LE_SET_ADV_ENABLE);
    if( 255 < param_size ) {
        throw jau::IllegalArgumentError("HCICommand param size "+std::to_string(param_size)+" > 255", E_FILE_LINE);
    }

    pdu.put_uint16_nc(1, number(opc));
    pdu.put_uint8_nc(3, static_cast<uint8_t>(param_size));
}

HCILESetAdvDataCmd::HCILESetAdvDataCmd(const uint8_t* data, const jau::nsize_t data_len)
: HCICommand(HCIOpcode::LE_SET_ADV_DATA, PARAM_SIZE)
{
    if( data_len > number(HCIConstU16::MAX_AD_LENGTH) ) {
        throw PackError(PackErrc::BAD_LENGTH, "advertising data "+std::to_string(data_len)+" > "+
                        std::to_string(number(HCIConstU16::MAX_AD_LENGTH)), E_FILE_LINE,
                        static_cast<jau::snsize_t>(number(HCIConstU16::MAX_AD_LENGTH)), static_cast<jau::snsize_t>(data_len));
    }
    pdu.put_uint8_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE), static_cast<uint8_t>(data_len));
    if( data_len > 0 ) {
        memcpy(pdu.get_wptr_nc(number(HCIConstSizeT::COMMAND_HDR_SIZE)+1), data, data_len);
    }
}

// *************************************************
// *************************************************
// *************************************************

void HCIEvent::checkEventType(const HCIEventType has, const HCIEventType min, const HCIEventType max) {
    if( has < min || has > max ) {
        throw HCIOpcodeException("Has evcode "+jau::to_hexstring(number(has))+
                         ", not within range ["+jau::to_hexstring(number(min))+
                         ".."+jau::to_hexstring(number(max))+"]", E_FILE_LINE);
    }
}

void HCIEvent::checkEventType(const HCIEventType has, const HCIEventType exp) {
    if( has != exp ) {
        throw HCIOpcodeException("Has evcode "+jau::to_hexstring(number(has))+
                         ", not matching "+jau::to_hexstring(number(exp)), E_FILE_LINE);
    }
}

std::string HCIEvent::valueString() const noexcept {
    const jau::nsize_t d_sz = getParamSize();
    const std::string d_str = d_sz > 0 ? jau::bytesHexString(getParam(), 0, d_sz, true /* lsbFirst */) : "";
    return "data[size "+std::to_string(d_sz)+", data "+d_str+"], tsz "+std::to_string(getTotalSize());
}

HCIEvent::HCIEvent(const uint8_t* buffer, const jau::nsize_t buffer_len, const jau::nsize_t exp_param_size)
: HCIPacket(buffer, buffer_len), ts_creation(jau::getCurrentMilliseconds())
{
    pdu.check_range(0, number(HCIConstSizeT::EVENT_HDR_SIZE), E_FILE_LINE);
    const jau::nsize_t paramSize = getParamSize();
    pdu.check_range(0, number(HCIConstSizeT::EVENT_HDR_SIZE)+paramSize, E_FILE_LINE);
    if( exp_param_size > paramSize ) {
        throw jau::IndexOutOfBoundsError(exp_param_size, paramSize, E_FILE_LINE);
    }
    checkEventType(getEventType(), HCIEventType::INQUIRY_COMPLETE, HCIEventType::AMP_Receiver_Report);
}

HCIEvent::HCIEvent(const HCIEventType evt, const jau::nsize_t param_size)
: HCIPacket(HCIPacketType::EVENT, number(HCIConstSizeT::EVENT_HDR_SIZE)+param_size), ts_creation(jau::getCurrentMilliseconds())
{
    checkEventType(evt, HCIEventType::INQUIRY_COMPLETE, HCIEventType::AMP_Receiver_Report);
    if( 255 < param_size ) {
        throw jau::IllegalArgumentError("HCIEvent param size "+std::to_string(param_size)+" > 255", E_FILE_LINE);
    }
    pdu.put_uint8_nc(1, number(evt));
    pdu.put_uint8_nc(2, static_cast<uint8_t>(param_size));
}

std::unique_ptr<HCIEvent> HCIEvent::getSpecialized(const uint8_t * buffer, jau::nsize_t const buffer_size) noexcept {
    if( buffer_size < number(HCIConstSizeT::EVENT_HDR_SIZE) ) {
        WARN_PRINT("HCIEvent::getSpecialized: length %zu < EVENT_HDR_SIZE(%zu)",
                (size_t)buffer_size, (size_t)number(HCIConstSizeT::EVENT_HDR_SIZE));
        return nullptr;
    }
    const HCIPacketType pc = static_cast<HCIPacketType>( buffer[0] );
    if( HCIPacketType::EVENT != pc ) {
        return nullptr;
    }
    const jau::nsize_t paramSize = buffer[2];
    if( buffer_size < number(HCIConstSizeT::EVENT_HDR_SIZE) + paramSize ) {
        WARN_PRINT("HCIEvent::getSpecialized: length mismatch %zu < EVENT_HDR_SIZE(%zu) + %zu",
                (size_t)buffer_size, (size_t)number(HCIConstSizeT::EVENT_HDR_SIZE), (size_t)paramSize);
        return nullptr;
    }

    try {
        const HCIEventType ec = static_cast<HCIEventType>( buffer[1] );
        switch( ec ) {
            case HCIEventType::CMD_COMPLETE:
                return std::make_unique<HCICommandCompleteEvent>(buffer, buffer_size);
            case HCIEventType::CMD_STATUS:
                return std::make_unique<HCICommandStatusEvent>(buffer, buffer_size);
            default:
                return std::make_unique<HCIEvent>(buffer, buffer_size, 0);
        }
    } catch (const std::exception &e) {
        WARN_PRINT("HCIEvent::getSpecialized: dropping malformed event %s: %s",
                jau::bytesHexString(buffer, 0, buffer_size, true /* lsbFirst */).c_str(), e.what());
    }
    return nullptr;
}

HCICommandCompleteEvent::HCICommandCompleteEvent(const HCIOpcode opc, const uint8_t ncmd, const uint8_t* ret_param, const jau::nsize_t ret_param_size)
: HCIEvent(HCIEventType::CMD_COMPLETE, 3+ret_param_size)
{
    pdu.put_uint8_nc(number(HCIConstSizeT::EVENT_HDR_SIZE), ncmd);
    pdu.put_uint16_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+1, number(opc));
    if( ret_param_size > 0 ) {
        memcpy(pdu.get_wptr_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+3), ret_param, ret_param_size);
    }
}

HCICommandStatusEvent::HCICommandStatusEvent(const HCIOpcode opc, const uint8_t ncmd, const HCIStatusCode status)
: HCIEvent(HCIEventType::CMD_STATUS, 4)
{
    pdu.put_uint8_nc(number(HCIConstSizeT::EVENT_HDR_SIZE), number(status));
    pdu.put_uint8_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+1, ncmd);
    pdu.put_uint16_nc(number(HCIConstSizeT::EVENT_HDR_SIZE)+2, number(opc));
}

} /* namespace blehci */
