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
#include <cinttypes>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "HCIAdvertiser.hpp"
#include "HCIErrors.hpp"

extern "C" {
    #include <errno.h>
}

namespace blehci {

HCIAdvertiser::HCIAdvertiser(std::unique_ptr<HCIComm> comm_) noexcept
: env(HCIEnv::get()),
  comm(std::move(comm_)),
  rbuffer(EVENT_MAX_SIZE, jau::lb_endian_t::little)
{
}

std::string HCIAdvertiser::toString() const noexcept {
    return "HCIAdvertiser["+( nullptr != comm ? comm->toString() : std::string("nil") )+"]";
}

std::error_code HCIAdvertiser::sendCommand(HCICommand &req) noexcept {
    COND_PRINT(env.DEBUG_EVENT, "HCIAdvertiser-IO SENT %s", req.toString().c_str());

    std::error_code ec;
    if( nullptr == comm ) {
        return make_error_code(HCISocketError::NOT_CONNECTED);
    }
    const jau::TROOctets & pdu = req.getPDU();
    const jau::snsize_t len = comm->write( pdu.get_ptr(), pdu.size(), ec );
    if( 0 > len ) {
        ERR_PRINT("HCIComm write error %s, req %s - %s", ec.message().c_str(), req.toString().c_str(), toString().c_str());
        return ec;
    }
    if( static_cast<jau::nsize_t>(len) != pdu.size() ) {
        ERR_PRINT("HCIComm short write %zd/%zu, req %s - %s", (ssize_t)len, (size_t)pdu.size(), req.toString().c_str(), toString().c_str());
        return make_error_code(HCISocketError::IO);
    }
    return ec;
}

std::unique_ptr<HCIEvent> HCIAdvertiser::getNextReply(HCICommand &req, int32_t & retryCount, const uint64_t t0, std::error_code& ec) noexcept
{
    while( retryCount < env.HCI_READ_PACKET_MAX_RETRY ) {
        const uint64_t td = jau::getCurrentMilliseconds() - t0;
        if( td >= static_cast<uint64_t>(env.HCI_COMMAND_COMPLETE_REPLY_TIMEOUT) ) {
            ec = make_error_code(HCIStatusCode::INTERNAL_TIMEOUT);
            ERR_PRINT("nullptr result (timeout %d ms -> abort): req %s - %s",
                    env.HCI_COMMAND_COMPLETE_REPLY_TIMEOUT, req.toString().c_str(), toString().c_str());
            return nullptr;
        }
        const int32_t timeoutMS = env.HCI_COMMAND_COMPLETE_REPLY_TIMEOUT - static_cast<int32_t>(td);
        const jau::snsize_t len = comm->read(rbuffer.get_wptr(), rbuffer.size(), timeoutMS, ec);
        if( 0 > len ) {
            if( std::error_code(ETIMEDOUT, std::system_category()) == ec ) {
                ec = make_error_code(HCIStatusCode::INTERNAL_TIMEOUT);
                ERR_PRINT("nullptr result (timeout %d ms -> abort): req %s - %s",
                        env.HCI_COMMAND_COMPLETE_REPLY_TIMEOUT, req.toString().c_str(), toString().c_str());
            } else {
                ERR_PRINT("HCIComm read error %s, req %s - %s", ec.message().c_str(), req.toString().c_str(), toString().c_str());
            }
            return nullptr;
        }
        std::unique_ptr<HCIEvent> ev = HCIEvent::getSpecialized(rbuffer.get_ptr(), static_cast<jau::nsize_t>(len));
        if( nullptr == ev ) {
            retryCount++;
            COND_PRINT(env.DEBUG_EVENT, "HCIAdvertiser-IO RECV getNextReply: non-event (drop, retry %d): %s; req %s",
                       retryCount, jau::bytesHexString(rbuffer.get_ptr(), 0, static_cast<jau::nsize_t>(len), true /* lsbFirst */).c_str(),
                       req.toString().c_str());
        } else if( !ev->validate(req) ) {
            retryCount++;
            COND_PRINT(env.DEBUG_EVENT, "HCIAdvertiser-IO RECV getNextReply: res mismatch (drop, retry %d): res %s; req %s",
                       retryCount, ev->toString().c_str(), req.toString().c_str());
        } else {
            COND_PRINT(env.DEBUG_EVENT, "HCIAdvertiser-IO RECV getNextReply: res %s; req %s", ev->toString().c_str(), req.toString().c_str());
            return ev;
        }
    }
    ec = make_error_code(HCIStatusCode::INTERNAL_TIMEOUT);
    WARN_PRINT("retry limit %d reached: req %s - %s", env.HCI_READ_PACKET_MAX_RETRY, req.toString().c_str(), toString().c_str());
    return nullptr;
}

std::unique_ptr<HCIEvent> HCIAdvertiser::getNextCmdCompleteReply(HCICommand &req, HCICommandCompleteEvent **res, std::error_code& ec) noexcept {
    *res = nullptr;

    const uint64_t t0 = jau::getCurrentMilliseconds();
    int32_t retryCount = 0;
    std::unique_ptr<HCIEvent> ev = nullptr;

    while( retryCount < env.HCI_READ_PACKET_MAX_RETRY ) {
        ev = getNextReply(req, retryCount, t0, ec);
        if( nullptr == ev ) {
            break;  // timeout or transport failure, leave loop
        } else if( ev->isEvent(HCIEventType::CMD_COMPLETE) ) {
            // gotcha, leave loop
            *res = static_cast<HCICommandCompleteEvent*>(ev.get());
            break;
        } else if( ev->isEvent(HCIEventType::CMD_STATUS) ) {
            // pending command .. wait for result
            HCICommandStatusEvent * ev_cs = static_cast<HCICommandStatusEvent*>(ev.get());
            const HCIStatusCode status = ev_cs->getStatus();
            if( HCIStatusCode::SUCCESS != status ) {
                WARN_PRINT("CMD_STATUS 0x%2.2X (%s): res %s, req %s - %s",
                        number(status), to_string(status).c_str(),
                        ev_cs->toString().c_str(), req.toString().c_str(), toString().c_str());
                break; // error status, leave loop
            } else {
                DBG_PRINT("HCIAdvertiser::getNextCmdCompleteReply: CMD_STATUS 0x%2.2X (%s, retryCount %d): res %s, req %s",
                        number(status), to_string(status).c_str(), retryCount,
                        ev_cs->toString().c_str(), req.toString().c_str());
            }
            retryCount++;
            continue; // next packet
        } else {
            retryCount++;
            DBG_PRINT("HCIAdvertiser::getNextCmdCompleteReply: !(CMD_COMPLETE, CMD_STATUS) (drop, retry %d): res %s; req %s",
                       retryCount, ev->toString().c_str(), req.toString().c_str());
            continue; // next packet
        }
    }
    return ev;
}

std::error_code HCIAdvertiser::processCommandComplete(HCICommand &req) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_sendReply); // RAII-style acquire and relinquish via destructor

    if( nullptr == comm || !comm->is_open() ) {
        return make_error_code(HCISocketError::NOT_CONNECTED);
    }
    std::error_code ec = sendCommand(req);
    if( ec ) {
        return ec;
    }

    HCICommandCompleteEvent * ev_cc;
    std::unique_ptr<HCIEvent> ev = getNextCmdCompleteReply(req, &ev_cc, ec);
    if( nullptr == ev ) {
        WARN_PRINT("%s -> %s: %s, res nullptr, req %s - %s",
                to_string(req.getOpcode()).c_str(), to_string(HCIEventType::CMD_COMPLETE).c_str(),
                ec.message().c_str(), req.toString().c_str(), toString().c_str());
        return ec;
    } else if( nullptr == ev_cc ) {
        if( ev->isEvent(HCIEventType::CMD_STATUS) ) {
            const HCIStatusCode status = static_cast<HCICommandStatusEvent*>(ev.get())->getStatus();
            if( HCIStatusCode::SUCCESS != status ) {
                return make_error_code(status);
            }
        }
        return make_error_code(HCIStatusCode::INTERNAL_TIMEOUT); // retry limit reached w/o CMD_COMPLETE
    }
    const HCIStatusCode status = ev_cc->getReturnStatus();
    if( HCIStatusCode::SUCCESS != status ) {
        WARN_PRINT("%s -> %s: Status 0x%2.2X (%s), res %s, req %s - %s",
                to_string(req.getOpcode()).c_str(), to_string(HCIEventType::CMD_COMPLETE).c_str(),
                number(status), to_string(status).c_str(),
                ev_cc->toString().c_str(), req.toString().c_str(), toString().c_str());
        return make_error_code(status);
    }
    return std::error_code();
}

std::error_code HCIAdvertiser::le_set_adv_enable(const bool enable) noexcept {
    HCILESetAdvEnableCmd req0(enable);
    return processCommandComplete(req0);
}

std::error_code HCIAdvertiser::le_set_adv_param(const AdvertisingParameters& params) noexcept {
    try {
        HCILESetAdvParamCmd req0(params);
        return processCommandComplete(req0);
    } catch (const PackError &e) {
        WARN_PRINT("HCIAdvertiser::le_set_adv_param: %s", e.what());
        return e.error_code();
    }
}

std::error_code HCIAdvertiser::le_set_adv_data(const uint8_t* data, const jau::nsize_t data_len) noexcept {
    try {
        HCILESetAdvDataCmd req0(data, data_len);
        return processCommandComplete(req0);
    } catch (const PackError &e) {
        WARN_PRINT("HCIAdvertiser::le_set_adv_data: %s", e.what());
        return e.error_code();
    }
}

std::future<std::error_code> HCIAdvertiser::set_advertising_enable(const bool enable) {
    return std::async(std::launch::async, [this, enable]() {
        return le_set_adv_enable(enable);
    });
}

std::future<std::error_code> HCIAdvertiser::set_advertising_parameters(const AdvertisingParameters& params) {
    return std::async(std::launch::async, [this, params]() {
        return le_set_adv_param(params);
    });
}

std::future<std::error_code> HCIAdvertiser::set_advertising_data(std::vector<uint8_t> data) {
    return std::async(std::launch::async, [this, d = std::move(data)]() {
        return le_set_adv_data(d.data(), static_cast<jau::nsize_t>(d.size()));
    });
}

} /* namespace blehci */
