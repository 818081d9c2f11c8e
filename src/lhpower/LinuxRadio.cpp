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
#include <cerrno>
#include <string>
#include <memory>
#include <cstdint>
#include <cinttypes>

#include <jau/debug.hpp>

#include "LinuxRadio.hpp"
#include "LHAdReport.hpp"

using namespace lhpower;

// *************************************************
// *************************************************
// *************************************************

const jau::uuid16_t LinuxConnection::PRIMARY_SERVICE = jau::uuid16_t(0x2800);
const jau::uuid16_t LinuxConnection::CHARACTERISTIC = jau::uuid16_t(0x2803);

LinuxConnection::LinuxConnection(const uint16_t dev_id, const BDAddressAndType& localAddressAndType, const BDAddressAndType& remoteAddressAndType) noexcept
: env(LHEnv::get()),
  l2cap(dev_id, localAddressAndType, remoteAddressAndType, L2CAP_CID_ATT),
  rbuffer(512, 512, jau::lb_endian_t::little)
{ }

GattStatus LinuxConnection::toGattStatus(const AttErrorRsp & err) noexcept {
    switch( err.getErrorCode() ) {
        case AttErrorRsp::ErrorCode::ATTRIBUTE_NOT_FOUND:
            [[fallthrough]];
        case AttErrorRsp::ErrorCode::INVALID_HANDLE:
            return GattStatus::NOT_FOUND;
        default:
            return GattStatus::PROTOCOL_ERROR;
    }
}

bool LinuxConnection::send(const AttPDUMsg & msg) noexcept {
    COND_PRINT(env.DEBUG_ATT_DATA, "LinuxConnection::send: %s", msg.toString().c_str());
    const jau::snsize_t res = l2cap.write(msg.pdu.get_ptr(), msg.pdu.size());
    if( 0 > res ) {
        IRQ_PRINT("LinuxConnection::send: l2cap write error %s: %s; %s",
                  L2CAPComm::getRWExitCodeString(res).c_str(), msg.toString().c_str(), toString().c_str());
        return false;
    }
    if( static_cast<size_t>(res) != msg.pdu.size() ) {
        ERR_PRINT("LinuxConnection::send: l2cap write count error, %" PRIi32 " != %zu: %s; %s",
                  res, (size_t)msg.pdu.size(), msg.toString().c_str(), toString().c_str());
        return false;
    }
    return true;
}

std::unique_ptr<const AttPDUMsg> LinuxConnection::sendWithReply(const AttPDUMsg & msg, GattStatus & status) noexcept {
    if( !l2cap.is_open() ) {
        status = GattStatus::NOT_CONNECTED;
        return nullptr;
    }
    if( l2cap.hasIOError() ) {
        status = GattStatus::IO_ERROR; // channel unusable, reconnect required
        return nullptr;
    }
    if( !send(msg) ) {
        status = GattStatus::IO_ERROR;
        return nullptr;
    }
    const jau::fraction_timespec timeout_time = jau::getMonotonicTime() + jau::fraction_timespec(env.ATT_REPLY_TIMEOUT);

    while( true ) {
        if( timeout_time <= jau::getMonotonicTime() ) {
            replyTimeout(msg, status);
            return nullptr;
        }
        const jau::snsize_t len = l2cap.read(rbuffer.get_wptr(), rbuffer.size(), env.ATT_REPLY_TIMEOUT);
        if( 0 > len ) {
            if( L2CAPComm::number(L2CAPComm::RWExitCode::POLL_TIMEOUT) == len ) {
                replyTimeout(msg, status);
            } else if( !l2cap.is_open() ) {
                status = GattStatus::NOT_CONNECTED;
            } else {
                status = GattStatus::IO_ERROR;
            }
            return nullptr;
        }
        if( 0 == len ) {
            // remote closed the channel
            WORDY_PRINT("LinuxConnection::sendWithReply: Channel closed by remote: req %s; %s", msg.toString().c_str(), toString().c_str());
            status = GattStatus::IO_ERROR;
            return nullptr;
        }
        std::unique_ptr<const AttPDUMsg> rsp;
        try {
            rsp = AttPDUMsg::getSpecialized(rbuffer.get_ptr(), static_cast<jau::nsize_t>(len));
        } catch (const jau::RuntimeException & e) {
            WARN_PRINT("LinuxConnection::sendWithReply: Malformed reply to %s: %s; %s",
                       msg.toString().c_str(), e.what(), toString().c_str());
            status = GattStatus::PROTOCOL_ERROR;
            return nullptr;
        }
        COND_PRINT(env.DEBUG_ATT_DATA, "LinuxConnection::recv: %s", rsp->toString().c_str());

        switch( rsp->getOpcodeType() ) {
            case AttPDUMsg::OpcodeType::RESPONSE:
                status = GattStatus::SUCCESS;
                return rsp;
            case AttPDUMsg::OpcodeType::NOTIFICATION:
                break; // unsolicited, not subscribed
            case AttPDUMsg::OpcodeType::INDICATION: {
                const AttHandleValueCfm cfm;
                if( !send(cfm) ) {
                    status = GattStatus::IO_ERROR;
                    return nullptr;
                }
                break;
            }
            case AttPDUMsg::OpcodeType::REQUEST: {
                if( !replyPeerRequest(*rsp) ) {
                    status = GattStatus::IO_ERROR;
                    return nullptr;
                }
                break;
            }
            default:
                WARN_PRINT("LinuxConnection::sendWithReply: Ignored %s, waiting for reply to %s; %s",
                           rsp->toString().c_str(), msg.toString().c_str(), toString().c_str());
                break;
        }
    }
}

void LinuxConnection::replyTimeout(const AttPDUMsg & msg, GattStatus & status) noexcept {
    errno = ETIMEDOUT;
    WARN_PRINT("LinuxConnection::sendWithReply: Timeout %" PRIi64 " ms: req %s; %s",
               env.ATT_REPLY_TIMEOUT.to_ms(), msg.toString().c_str(), toString().c_str());
    // a late reply would be taken for the answer to the next request
    if( !l2cap.close() ) {
        WARN_PRINT("LinuxConnection::sendWithReply: close failed, ignored; %s", toString().c_str());
    }
    status = GattStatus::TIMEOUT;
}

bool LinuxConnection::replyPeerRequest(const AttPDUMsg & req) noexcept {
    if( AttPDUMsg::is_command(req.getOpcode()) ) {
        DBG_PRINT("LinuxConnection::recv: Ignored command %s; %s", req.toString().c_str(), toString().c_str());
        return true;
    }
    // we serve no attributes
    const AttErrorRsp rsp(AttErrorRsp::ErrorCode::UNSUPPORTED_REQUEST, req.getOpcode(), 0);
    WORDY_PRINT("LinuxConnection::recv: Unsupported %s -> %s; %s",
                req.toString().c_str(), rsp.toString().c_str(), toString().c_str());
    return send(rsp);
}

GattStatus LinuxConnection::discoverPrimaryService(const jau::uuid_t& uuid, LHGattService& res) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_request); // RAII-style acquire and relinquish via destructor
    /**
     * BT Core Spec v5.2: Vol 3, Part G GATT: 4.4.1 Discover All Primary Services
     *
     * This sub-procedure is complete when the ATT_ERROR_RSP is received
     * and the Error Code is set to Attribute Not Found or when the End Group Handle
     * in the Read by Type Group Response is 0xFFFF.
     */
    uint16_t startHandle = 0x0001;
    while( true ) {
        GattStatus status = GattStatus::SUCCESS;
        const AttReadByNTypeReq req(true /* group */, startHandle, 0xffff, PRIMARY_SERVICE);
        const std::unique_ptr<const AttPDUMsg> pdu = sendWithReply(req, status);
        if( nullptr == pdu ) {
            return status;
        }
        if( AttPDUMsg::Opcode::ERROR_RSP == pdu->getOpcode() ) {
            return toGattStatus( *static_cast<const AttErrorRsp*>( pdu.get() ) );
        }
        if( AttPDUMsg::Opcode::READ_BY_GROUP_TYPE_RSP != pdu->getOpcode() ) {
            WARN_PRINT("LinuxConnection::discoverPrimaryService: Unexpected reply %s; %s", pdu->toString().c_str(), toString().c_str());
            return GattStatus::PROTOCOL_ERROR;
        }
        const AttReadByGroupTypeRsp * p = static_cast<const AttReadByGroupTypeRsp*>(pdu.get());
        const jau::nsize_t count = p->getElementCount();
        uint16_t lastEndHandle = 0;
        try {
            for(jau::nsize_t i=0; i<count; i++) {
                const uint16_t endHandle = p->getElementEndHandle(i);
                if( p->getElementUUID(i)->equivalent(uuid) ) {
                    res.start_handle = p->getElementStartHandle(i);
                    res.end_handle = endHandle;
                    return GattStatus::SUCCESS;
                }
                lastEndHandle = endHandle;
            }
        } catch (const jau::RuntimeException & e) {
            WARN_PRINT("LinuxConnection::discoverPrimaryService: Malformed reply: %s; %s", e.what(), toString().c_str());
            return GattStatus::PROTOCOL_ERROR;
        }
        if( 0xffff == lastEndHandle || lastEndHandle < startHandle ) {
            return GattStatus::NOT_FOUND;
        }
        startHandle = lastEndHandle + 1;
    }
}

GattStatus LinuxConnection::discoverCharacteristic(const LHGattService& service, const jau::uuid_t& uuid, LHGattChar& res) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_request); // RAII-style acquire and relinquish via destructor
    /**
     * BT Core Spec v5.2: Vol 3, Part G GATT: 4.6.1 Discover All Characteristics of a Service
     *
     * This sub-procedure is complete when the ATT_ERROR_RSP is received
     * and the Error Code is set to Attribute Not Found
     * or the ATT_READ_BY_TYPE_RSP has an Attribute Handle that is equal to the Ending Handle of the request.
     */
    uint16_t startHandle = service.start_handle;
    while( startHandle <= service.end_handle ) {
        GattStatus status = GattStatus::SUCCESS;
        const AttReadByNTypeReq req(false /* group */, startHandle, service.end_handle, CHARACTERISTIC);
        const std::unique_ptr<const AttPDUMsg> pdu = sendWithReply(req, status);
        if( nullptr == pdu ) {
            return status;
        }
        if( AttPDUMsg::Opcode::ERROR_RSP == pdu->getOpcode() ) {
            return toGattStatus( *static_cast<const AttErrorRsp*>( pdu.get() ) );
        }
        if( AttPDUMsg::Opcode::READ_BY_TYPE_RSP != pdu->getOpcode() ) {
            WARN_PRINT("LinuxConnection::discoverCharacteristic: Unexpected reply %s; %s", pdu->toString().c_str(), toString().c_str());
            return GattStatus::PROTOCOL_ERROR;
        }
        const AttReadByTypeRsp * p = static_cast<const AttReadByTypeRsp*>(pdu.get());
        const jau::nsize_t count = p->getElementCount();
        uint16_t lastHandle = 0;
        try {
            for(jau::nsize_t i=0; i<count; i++) {
                const uint16_t handle = p->getElementHandle(i);
                if( p->getElementUUID(i)->equivalent(uuid) ) {
                    res.handle = handle;
                    res.properties = p->getElementProperties(i);
                    res.value_handle = p->getElementValueHandle(i);
                    return GattStatus::SUCCESS;
                }
                lastHandle = handle;
            }
        } catch (const jau::RuntimeException & e) {
            WARN_PRINT("LinuxConnection::discoverCharacteristic: Malformed reply: %s; %s", e.what(), toString().c_str());
            return GattStatus::PROTOCOL_ERROR;
        }
        if( lastHandle < startHandle || 0xffff == lastHandle ) {
            break;
        }
        startHandle = lastHandle + 1;
    }
    return GattStatus::NOT_FOUND;
}

GattStatus LinuxConnection::readValue(const LHGattChar& c, jau::POctets& res) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_request); // RAII-style acquire and relinquish via destructor
    GattStatus status = GattStatus::SUCCESS;
    const AttReadReq req(c.value_handle);
    const std::unique_ptr<const AttPDUMsg> pdu = sendWithReply(req, status);
    if( nullptr == pdu ) {
        return status;
    }
    if( AttPDUMsg::Opcode::ERROR_RSP == pdu->getOpcode() ) {
        const AttErrorRsp * err = static_cast<const AttErrorRsp*>( pdu.get() );
        WORDY_PRINT("LinuxConnection::readValue: %s; %s", err->toString().c_str(), toString().c_str());
        return toGattStatus( *err );
    }
    if( AttPDUMsg::Opcode::READ_RSP != pdu->getOpcode() ) {
        WARN_PRINT("LinuxConnection::readValue: Unexpected reply %s; %s", pdu->toString().c_str(), toString().c_str());
        return GattStatus::PROTOCOL_ERROR;
    }
    const AttReadRsp * p = static_cast<const AttReadRsp*>(pdu.get());
    const jau::nsize_t n = p->getPDUValueSize();
    if( 0 < n ) {
        const jau::nsize_t offset = res.size();
        if( res.capacity() < offset + n ) {
            res.recapacity( offset + n );
        }
        res.resize( offset + n );
        res.put_bytes_nc(offset, p->getValuePtr(), n);
    }
    return GattStatus::SUCCESS;
}

GattStatus LinuxConnection::writeValueNoResp(const LHGattChar& c, const jau::TROOctets& value) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_request); // RAII-style acquire and relinquish via destructor
    if( !l2cap.is_open() ) {
        return GattStatus::NOT_CONNECTED;
    }
    const AttWriteCmd cmd(c.value_handle, value);
    return send(cmd) ? GattStatus::SUCCESS : GattStatus::IO_ERROR;
}

bool LinuxConnection::disconnect() noexcept {
    return l2cap.close();
}

std::string LinuxConnection::toString() const noexcept {
    return "LinuxConnection["+l2cap.toString()+"]";
}

// *************************************************
// *************************************************
// *************************************************

#define HCIOPCODE_ENUM(X) \
        X(HCIOpcode, READ_BD_ADDR) \
        X(HCIOpcode, LE_SET_SCAN_PARAM) \
        X(HCIOpcode, LE_SET_SCAN_ENABLE)

#define CASE2_TO_STRING(U,V) case U::V: return #V;

std::string LinuxRadio::getHCIOpcodeString(const HCIOpcode op) noexcept {
    switch(op) {
        HCIOPCODE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown HCIOpcode";
}

LinuxRadio::LinuxRadio() noexcept
: env(LHEnv::get()), dev_id(static_cast<uint16_t>(env.HCI_DEV_ID)),
  comm(nullptr), localAddressAndType(BDAddressAndType::ANY_DEVICE),
  rbuffer(512, 512, jau::lb_endian_t::little)
{ }

LinuxRadio::~LinuxRadio() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_hci); // RAII-style acquire and relinquish via destructor
    comm = nullptr;
}

int LinuxRadio::sendCommand(const HCIOpcode op, const jau::TROOctets & param, jau::POctets * ret) noexcept {
    if( nullptr == comm || !comm->is_open() ) {
        ERR_PRINT("LinuxRadio::sendCommand: %s: Not open, hci%u", getHCIOpcodeString(op).c_str(), dev_id);
        return -1;
    }
    // HCI Command packet: type, opcode, param-length, param
    jau::POctets cmd(1+2+1+param.size(), jau::lb_endian_t::little);
    cmd.put_uint8_nc(0, HCI_COMMAND_PKT);
    cmd.put_uint16_nc(1, number(op));
    cmd.put_uint8_nc(3, static_cast<uint8_t>(param.size()));
    if( 0 < param.size() ) {
        cmd.put_bytes_nc(4, param.get_ptr(), param.size());
    }
    if( comm->write(cmd.get_ptr(), cmd.size()) != static_cast<jau::snsize_t>(cmd.size()) ) {
        ERR_PRINT("LinuxRadio::sendCommand: %s: Write failed, hci%u", getHCIOpcodeString(op).c_str(), dev_id);
        return -1;
    }
    const jau::fraction_timespec timeout_time = jau::getMonotonicTime() + jau::fraction_timespec(env.HCI_COMMAND_REPLY_TIMEOUT);

    while( jau::getMonotonicTime() < timeout_time ) {
        const jau::snsize_t len = comm->read(rbuffer.get_wptr(), rbuffer.size(), POLL_PERIOD);
        if( 0 > len ) {
            ERR_PRINT("LinuxRadio::sendCommand: %s: Read failed, hci%u", getHCIOpcodeString(op).c_str(), dev_id);
            return -1;
        }
        // HCI Event packet: type, event, param-length, param
        if( 3 > len || HCI_EVENT_PKT != rbuffer.get_uint8_nc(0) ) {
            continue;
        }
        const uint8_t evt = rbuffer.get_uint8_nc(1);
        const jau::nsize_t plen = rbuffer.get_uint8_nc(2);
        if( 3 + plen > static_cast<jau::nsize_t>(len) || 4 > plen ) {
            continue;
        }
        if( EVT_CMD_COMPLETE == evt ) {
            // ncmd, opcode, status, return param
            if( number(op) != rbuffer.get_uint16_nc(4) ) {
                continue;
            }
            const uint8_t status = rbuffer.get_uint8_nc(6);
            if( nullptr != ret ) {
                const jau::nsize_t n = plen - 4;
                if( ret->capacity() < n ) {
                    ret->recapacity(n);
                }
                ret->resize(n);
                if( 0 < n ) {
                    ret->put_bytes_nc(0, rbuffer.get_ptr() + 7, n);
                }
            }
            DBG_PRINT("LinuxRadio::sendCommand: %s: Complete, status 0x%2.2X, hci%u", getHCIOpcodeString(op).c_str(), status, dev_id);
            return status;
        } else if( EVT_CMD_STATUS == evt ) {
            // status, ncmd, opcode
            if( number(op) != rbuffer.get_uint16_nc(5) ) {
                continue;
            }
            const uint8_t status = rbuffer.get_uint8_nc(3);
            DBG_PRINT("LinuxRadio::sendCommand: %s: Status 0x%2.2X, hci%u", getHCIOpcodeString(op).c_str(), status, dev_id);
            return status;
        }
        // other events, e.g. pending advertising reports
    }
    WARN_PRINT("LinuxRadio::sendCommand: %s: Timeout %" PRIi64 " ms, hci%u",
               getHCIOpcodeString(op).c_str(), env.HCI_COMMAND_REPLY_TIMEOUT.to_ms(), dev_id);
    return -1;
}

bool LinuxRadio::enable() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_hci); // RAII-style acquire and relinquish via destructor
    if( nullptr != comm && comm->is_open() ) {
        return true;
    }
    comm = std::make_unique<HCIComm>(dev_id, HCI_CHANNEL_RAW);
    if( !comm->is_open() ) {
        ERR_PRINT("LinuxRadio::enable: Could not open HCI channel hci%u", dev_id);
        comm = nullptr;
        return false;
    }
    hci_ufilter filter;
    HCIComm::filter_clear(&filter);
    HCIComm::filter_set_ptype(HCI_EVENT_PKT, &filter);
    HCIComm::filter_set_event(EVT_CMD_COMPLETE, &filter);
    HCIComm::filter_set_event(EVT_CMD_STATUS, &filter);
    HCIComm::filter_set_event(EVT_LE_META, &filter);
    if( !comm->setFilter(filter) ) {
        comm = nullptr;
        return false;
    }
    const jau::POctets noParam(0, 0, jau::lb_endian_t::little);
    jau::POctets ret(6, 0, jau::lb_endian_t::little);
    const int status = sendCommand(HCIOpcode::READ_BD_ADDR, noParam, &ret);
    if( 0 != status || 6 > ret.size() ) {
        ERR_PRINT("LinuxRadio::enable: Read BD_ADDR failed, status %d, hci%u not powered?", status, dev_id);
        comm = nullptr;
        return false;
    }
    localAddressAndType = BDAddressAndType( jau::le_to_cpu( *((jau::EUI48 const *)ret.get_ptr()) ), BDAddressType::BDADDR_LE_PUBLIC );
    WORDY_PRINT("LinuxRadio::enable: %s", toStringImpl().c_str());
    return true;
}

std::unique_ptr<LHConnection> LinuxRadio::connect(const BDAddressAndType& addressAndType) noexcept {
    BDAddressAndType local;
    {
        const std::lock_guard<std::mutex> lock(mtx_hci); // RAII-style acquire and relinquish via destructor
        if( nullptr == comm ) {
            ERR_PRINT("LinuxRadio::connect: Not enabled, %s", addressAndType.toString().c_str());
            return nullptr;
        }
        local = localAddressAndType;
    }
    std::unique_ptr<LinuxConnection> conn = std::make_unique<LinuxConnection>(dev_id, local, addressAndType);
    if( !conn->open() ) {
        WARN_PRINT("LinuxRadio::connect: Failed %s", conn->toString().c_str());
        return nullptr;
    }
    DBG_PRINT("LinuxRadio::connect: %s", conn->toString().c_str());
    return conn;
}

bool LinuxRadio::setScanEnabled(const bool enable) noexcept {
    jau::POctets param(2, jau::lb_endian_t::little);
    param.put_uint8_nc(0, enable ? 0x01 : 0x00);
    param.put_uint8_nc(1, 0x00); // no duplicate filter, names may arrive with a later report
    const int status = sendCommand(HCIOpcode::LE_SET_SCAN_ENABLE, param, nullptr);
    if( 0 != status ) {
        DBG_PRINT("LinuxRadio::setScanEnabled(%d): status %d, hci%u", enable, status, dev_id);
        return false;
    }
    return true;
}

bool LinuxRadio::scan(const scan_callback_t& cb, const get_boolean_callback_t& shall_stop) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_hci); // RAII-style acquire and relinquish via destructor
    if( nullptr == comm || !comm->is_open() ) {
        ERR_PRINT("LinuxRadio::scan: Not enabled, hci%u", dev_id);
        return false;
    }
    if( setScanEnabled(false) ) {
        DBG_PRINT("LinuxRadio::scan: Stopped a running scan, hci%u", dev_id);
    }

    // active scan, interval 60 ms, window 30 ms, public own address, accept all
    jau::POctets param(7, jau::lb_endian_t::little);
    param.put_uint8_nc(0, 0x01);
    param.put_uint16_nc(1, 0x0060);
    param.put_uint16_nc(3, 0x0030);
    param.put_uint8_nc(5, 0x00);
    param.put_uint8_nc(6, 0x00);
    int status = sendCommand(HCIOpcode::LE_SET_SCAN_PARAM, param, nullptr);
    if( 0 != status ) {
        ERR_PRINT("LinuxRadio::scan: Set scan parameter failed, status %d, hci%u", status, dev_id);
        return false;
    }
    if( !setScanEnabled(true) ) {
        ERR_PRINT("LinuxRadio::scan: Enable scan failed, hci%u", dev_id);
        return false;
    }
    DBG_PRINT("LinuxRadio::scan: Started, hci%u", dev_id);

    bool res = true;
    while( !shall_stop(0) ) {
        const jau::snsize_t len = comm->read(rbuffer.get_wptr(), rbuffer.size(), POLL_PERIOD);
        if( 0 > len ) {
            ERR_PRINT("LinuxRadio::scan: Read failed, hci%u", dev_id);
            res = false;
            break;
        }
        // HCI Event packet: type, event, param-length, subevent, param
        if( 4 > len || HCI_EVENT_PKT != rbuffer.get_uint8_nc(0) || EVT_LE_META != rbuffer.get_uint8_nc(1) ) {
            continue;
        }
        const jau::nsize_t plen = rbuffer.get_uint8_nc(2);
        if( 3 + plen > static_cast<jau::nsize_t>(len) || 2 > plen || LE_ADVERTISING_REPORT != rbuffer.get_uint8_nc(3) ) {
            continue;
        }
        const jau::darray<LHAdvertisement> ads = LHAdReport::read_ad_reports(rbuffer.get_ptr() + 4, plen - 1);
        for(const LHAdvertisement& ad : ads) {
            cb(ad);
        }
    }
    if( !setScanEnabled(false) ) {
        WARN_PRINT("LinuxRadio::scan: Disable scan failed, hci%u", dev_id);
    }
    DBG_PRINT("LinuxRadio::scan: Stopped, res %d, hci%u", res, dev_id);
    return res;
}

std::string LinuxRadio::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_hci); // RAII-style acquire and relinquish via destructor
    return toStringImpl();
}

std::string LinuxRadio::toStringImpl() const noexcept {
    return "LinuxRadio[hci"+std::to_string(dev_id)+", "+localAddressAndType.toString()+
           ", open "+std::to_string(nullptr != comm && comm->is_open())+"]";
}
