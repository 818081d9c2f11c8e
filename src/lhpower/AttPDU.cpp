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

#include <jau/debug.hpp>

#include "AttPDU.hpp"

using namespace lhpower;

#define OPCODE_ENUM(X) \
        X(PDU_UNDEFINED) \
        X(ERROR_RSP) \
        X(EXCHANGE_MTU_REQ) \
        X(EXCHANGE_MTU_RSP) \
        X(FIND_INFORMATION_REQ) \
        X(FIND_BY_TYPE_VALUE_REQ) \
        X(READ_BY_TYPE_REQ) \
        X(READ_BY_TYPE_RSP) \
        X(READ_REQ) \
        X(READ_RSP) \
        X(READ_BLOB_REQ) \
        X(READ_MULTIPLE_REQ) \
        X(READ_BY_GROUP_TYPE_REQ) \
        X(READ_BY_GROUP_TYPE_RSP) \
        X(WRITE_REQ) \
        X(WRITE_RSP) \
        X(PREPARE_WRITE_REQ) \
        X(EXECUTE_WRITE_REQ) \
        X(HANDLE_VALUE_NTF) \
        X(HANDLE_VALUE_IND) \
        X(HANDLE_VALUE_CFM) \
        X(READ_MULTIPLE_VARIABLE_REQ) \
        X(WRITE_CMD) \
        X(SIGNED_WRITE_CMD)

#define CASE_TO_STRING(V) case Opcode::V: return #V;

std::string AttPDUMsg::getOpcodeString(const Opcode opc) noexcept {
    switch(opc) {
        OPCODE_ENUM(CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown Opcode";
}

std::string AttErrorRsp::getErrorCodeString(const ErrorCode errorCode) noexcept {
    switch(errorCode) {
        case ErrorCode::NO_ERROR: return "No Error";
        case ErrorCode::INVALID_HANDLE: return "Invalid Handle";
        case ErrorCode::NO_READ_PERM: return "Read Not Permitted";
        case ErrorCode::NO_WRITE_PERM: return "Write Not Permitted";
        case ErrorCode::INVALID_PDU: return "Invalid PDU";
        case ErrorCode::INSUFF_AUTHENTICATION: return "Insufficient Authentication";
        case ErrorCode::UNSUPPORTED_REQUEST: return "Request Not Supported";
        case ErrorCode::INVALID_OFFSET: return "Invalid Offset";
        case ErrorCode::INSUFF_AUTHORIZATION: return "Insufficient Authorization";
        case ErrorCode::PREPARE_QUEUE_FULL: return "Prepare Queue Full";
        case ErrorCode::ATTRIBUTE_NOT_FOUND: return "Attribute Not Found";
        case ErrorCode::ATTRIBUTE_NOT_LONG: return "Attribute Not Long";
        case ErrorCode::INSUFF_ENCRYPTION_KEY_SIZE: return "Insufficient Encryption Key Size";
        case ErrorCode::INVALID_ATTRIBUTE_VALUE_LEN: return "Invalid Attribute Value Length";
        case ErrorCode::UNLIKELY_ERROR: return "Unlikely Error";
        case ErrorCode::INSUFF_ENCRYPTION: return "Insufficient Encryption";
        case ErrorCode::UNSUPPORTED_GROUP_TYPE: return "Unsupported Group Type";
        case ErrorCode::INSUFFICIENT_RESOURCES: return "Insufficient Resources";
        default: ; // fall through intended
    }
    return "Error Reserved for future use";
}

std::unique_ptr<const AttPDUMsg> AttPDUMsg::getSpecialized(const uint8_t * buffer, jau::nsize_t const buffer_size) {
    if( 0 == buffer_size ) {
        throw AttValueException("Empty ATT PDU", E_FILE_LINE);
    }
    const Opcode opc = static_cast<Opcode>(*buffer);
    switch( opc ) {
        case Opcode::ERROR_RSP:                     return std::make_unique<AttErrorRsp>(buffer, buffer_size);
        case Opcode::READ_BY_TYPE_RSP:              return std::make_unique<AttReadByTypeRsp>(buffer, buffer_size);
        case Opcode::READ_RSP:                      return std::make_unique<AttReadRsp>(buffer, buffer_size);
        case Opcode::READ_BY_GROUP_TYPE_RSP:        return std::make_unique<AttReadByGroupTypeRsp>(buffer, buffer_size);
        default:                                    return std::make_unique<AttPDUMsg>(buffer, buffer_size);
    }
}

void AttPDUMsg::checkOpcode(const Opcode expected) const {
    const Opcode has = getOpcode();
    if( expected != has ) {
        throw AttOpcodeException("Has opcode "+jau::to_hexstring(number(has))+" "+getOpcodeString(has)+
                                 ", but expected "+jau::to_hexstring(number(expected))+" "+getOpcodeString(expected), E_FILE_LINE);
    }
}

std::string AttPDUMsg::valueString() const noexcept {
    return "size "+std::to_string(getPDUValueSize())+", data "
            +jau::bytesHexString(pdu.get_ptr(), getPDUValueOffset(), getPDUValueSize(), true /* lsbFirst */);
}

std::string AttPDUMsg::toString() const noexcept {
    return getName()+"[opcode "+jau::to_hexstring(number(getOpcode()))+" "+getOpcodeString(getOpcode())+
           ", size[total "+std::to_string(pdu.size())+"], "+valueString()+"]";
}

std::string AttErrorRsp::valueString() const noexcept {
    const Opcode opc = getCausingOpcode();
    const ErrorCode ec = getErrorCode();
    return "error "+jau::to_hexstring(number(ec)) + ": " + getErrorCodeString(ec)+
           ", cause(opc "+jau::to_hexstring(AttPDUMsg::number(opc))+": "+getOpcodeString(opc)+
           ", handle "+jau::to_hexstring(getCausingHandle())+")";
}

std::string AttReadByNTypeReq::valueString() const noexcept {
    return "handle ["+jau::to_hexstring(getStartHandle())+".."+jau::to_hexstring(getEndHandle())+
           "], uuid "+getNType()->toString();
}

void AttElementList::checkElementList(const jau::nsize_t minElementSize) const {
    checkMinSize();
    const jau::nsize_t esz = getElementSize();
    if( esz < minElementSize ) {
        throw AttValueException(getName()+": Element size "+std::to_string(esz)+
                " < min "+std::to_string(minElementSize), E_FILE_LINE);
    }
    if( 0 == getPDUValueSize() || getPDUValueSize() % esz != 0 ) {
        throw AttValueException(getName()+": Invalid packet size: pdu-value-size "+std::to_string(getPDUValueSize())+
                " not multiple of element-size "+std::to_string(esz), E_FILE_LINE);
    }
}

std::string AttReadByTypeRsp::valueString() const noexcept {
    std::string res = "elements[count "+std::to_string(getElementCount())+", size "+std::to_string(getElementSize())+": ";
    const jau::nsize_t count = getElementCount();
    for(jau::nsize_t i=0; i<count; i++) {
        if( 0 < i ) {
            res += ", ";
        }
        res += "[handle "+jau::to_hexstring(getElementHandle(i))+
               ", props "+jau::to_hexstring(getElementProperties(i))+
               ", value "+jau::to_hexstring(getElementValueHandle(i))+"]";
    }
    return res+"]";
}

std::string AttReadByGroupTypeRsp::valueString() const noexcept {
    std::string res = "elements[count "+std::to_string(getElementCount())+", size "+std::to_string(getElementSize())+": ";
    const jau::nsize_t count = getElementCount();
    for(jau::nsize_t i=0; i<count; i++) {
        if( 0 < i ) {
            res += ", ";
        }
        res += "[handle ["+jau::to_hexstring(getElementStartHandle(i))+".."+jau::to_hexstring(getElementEndHandle(i))+"]]";
    }
    return res+"]";
}
