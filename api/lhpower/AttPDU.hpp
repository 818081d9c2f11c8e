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

#ifndef LHPOWER_ATT_PDU_HPP_
#define LHPOWER_ATT_PDU_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <memory>
#include <algorithm>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * AttPDU.hpp Module for the ATT PDU subset of the GATT client procedures
 * used by LinuxConnection:
 *
 * - BT Core Spec v5.2: Vol 3, Part F Attribute Protocol (ATT)
 * - BT Core Spec v5.2: Vol 3, Part G Generic Attribute Protocol (GATT)
 */
namespace lhpower {

    class AttException : public jau::RuntimeException {
        protected:
            AttException(std::string const type, std::string const m, const char* file, int line) noexcept
            : RuntimeException(type, m, file, line) {}

        public:
            AttException(std::string const m, const char* file, int line) noexcept
            : RuntimeException("AttException", m, file, line) {}
    };

    class AttOpcodeException : public AttException {
        public:
            AttOpcodeException(std::string const m, const char* file, int line) noexcept
            : AttException("AttOpcodeException", m, file, line) {}
    };

    class AttValueException : public AttException {
        public:
            AttValueException(std::string const m, const char* file, int line) noexcept
            : AttException("AttValueException", m, file, line) {}
    };

    /**
     * ATT Protocol Data Unit with persistent memory, copying the PDU data.
     * <pre>
     * ATT PDU Format Vol 3, Part F 3.3.1
     *   uint8_t opcode
     *   uint8_t param[]
     * </pre>
     * All multi-octet fields are little endian.
     */
    class AttPDUMsg
    {
        public:
            /** ATT Opcode Summary Vol 3, Part F 3.4.8 */
            enum class Opcode : uint8_t {
                PDU_UNDEFINED               = 0x00, // our own pseudo opcode, indicating no ATT PDU message
                ERROR_RSP                   = 0x01,
                EXCHANGE_MTU_REQ            = 0x02,
                EXCHANGE_MTU_RSP            = 0x03,
                FIND_INFORMATION_REQ        = 0x04,
                FIND_BY_TYPE_VALUE_REQ      = 0x06,
                READ_BY_TYPE_REQ            = 0x08,
                READ_BY_TYPE_RSP            = 0x09,
                READ_REQ                    = 0x0A,
                READ_RSP                    = 0x0B,
                READ_BLOB_REQ               = 0x0C,
                READ_MULTIPLE_REQ           = 0x0E,
                READ_BY_GROUP_TYPE_REQ      = 0x10,
                READ_BY_GROUP_TYPE_RSP      = 0x11,
                WRITE_REQ                   = 0x12,
                WRITE_RSP                   = 0x13,
                PREPARE_WRITE_REQ           = 0x16,
                EXECUTE_WRITE_REQ           = 0x18,
                HANDLE_VALUE_NTF            = 0x1B,
                HANDLE_VALUE_IND            = 0x1D,
                HANDLE_VALUE_CFM            = 0x1E,
                READ_MULTIPLE_VARIABLE_REQ  = 0x20,
                WRITE_CMD                   = 0x52,
                SIGNED_WRITE_CMD            = 0xD2
            };
            static constexpr uint8_t number(const Opcode rhs) noexcept {
                return static_cast<uint8_t>(rhs);
            }

            /** Bit 6 of the opcode, set for commands which never receive a response. */
            static constexpr uint8_t OPCODE_COMMAND_FLAG = 0x40;

            static constexpr bool is_command(const Opcode rhs) noexcept {
                return 0 != ( number(rhs) & OPCODE_COMMAND_FLAG );
            }

            enum class OpcodeType : uint8_t {
                UNDEFINED     = 0,
                REQUEST       = 1,
                RESPONSE      = 2,
                NOTIFICATION  = 3,
                INDICATION    = 4
            };

            /** Classifies the given opcode, commands count as ::OpcodeType::REQUEST. */
            static constexpr OpcodeType get_type(const Opcode rhs) noexcept {
                switch(rhs) {
                    case Opcode::HANDLE_VALUE_NTF:
                        return OpcodeType::NOTIFICATION;

                    case Opcode::HANDLE_VALUE_IND:
                        return OpcodeType::INDICATION;

                    case Opcode::ERROR_RSP:
                        [[fallthrough]];
                    case Opcode::EXCHANGE_MTU_RSP:
                        [[fallthrough]];
                    case Opcode::READ_BY_TYPE_RSP:
                        [[fallthrough]];
                    case Opcode::READ_RSP:
                        [[fallthrough]];
                    case Opcode::READ_BY_GROUP_TYPE_RSP:
                        [[fallthrough]];
                    case Opcode::WRITE_RSP:
                        return OpcodeType::RESPONSE;

                    case Opcode::EXCHANGE_MTU_REQ:
                        [[fallthrough]];
                    case Opcode::FIND_INFORMATION_REQ:
                        [[fallthrough]];
                    case Opcode::FIND_BY_TYPE_VALUE_REQ:
                        [[fallthrough]];
                    case Opcode::READ_BY_TYPE_REQ:
                        [[fallthrough]];
                    case Opcode::READ_REQ:
                        [[fallthrough]];
                    case Opcode::READ_BLOB_REQ:
                        [[fallthrough]];
                    case Opcode::READ_MULTIPLE_REQ:
                        [[fallthrough]];
                    case Opcode::READ_BY_GROUP_TYPE_REQ:
                        [[fallthrough]];
                    case Opcode::WRITE_REQ:
                        [[fallthrough]];
                    case Opcode::PREPARE_WRITE_REQ:
                        [[fallthrough]];
                    case Opcode::EXECUTE_WRITE_REQ:
                        [[fallthrough]];
                    case Opcode::READ_MULTIPLE_VARIABLE_REQ:
                        [[fallthrough]];
                    case Opcode::WRITE_CMD:
                        [[fallthrough]];
                    case Opcode::SIGNED_WRITE_CMD:
                        return OpcodeType::REQUEST;

                    default:
                        return OpcodeType::UNDEFINED;
                }
            }

            static std::string getOpcodeString(const Opcode opc) noexcept;

            /**
             * Return a newly created specialized instance pointer to base class.
             * @throws AttException or jau::IndexOutOfBoundsException if the PDU is malformed
             */
            static std::unique_ptr<const AttPDUMsg> getSpecialized(const uint8_t * buffer, jau::nsize_t const buffer_size);

            /** Persistent memory, w/ ownership ..*/
            AttPDUMsg(const uint8_t* source, const jau::nsize_t size)
            : pdu(source, std::max<jau::nsize_t>(1, size), jau::lb_endian_t::little)
            { }

            /** Persistent memory, w/ ownership ..*/
            AttPDUMsg(const Opcode opc, const jau::nsize_t size)
            : pdu(std::max<jau::nsize_t>(1, size), jau::lb_endian_t::little)
            {
                pdu.put_uint8_nc(0, number(opc));
            }

            virtual ~AttPDUMsg() noexcept {}

            /** The actual PDU, opcode included */
            jau::POctets pdu;

            Opcode getOpcode() const noexcept { return static_cast<Opcode>(pdu.get_uint8_nc(0)); }

            OpcodeType getOpcodeType() const noexcept { return get_type(getOpcode()); }

            /** Offset of the variable PDU value within the PDU, i.e. past all fixed fields. */
            virtual jau::nsize_t getPDUValueOffset() const noexcept { return 1; }

            jau::nsize_t getPDUValueSize() const noexcept { return pdu.size() - getPDUValueOffset(); }

            virtual std::string getName() const noexcept { return "AttPDUMsg"; }

            std::string toString() const noexcept;

        protected:
            void checkOpcode(const Opcode expected) const;

            /** Validates the PDU holds at least all fixed fields, see getPDUValueOffset(). */
            void checkMinSize() const {
                pdu.check_range(0, getPDUValueOffset());
            }

            virtual std::string valueString() const noexcept;
    };

    /**
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.4.1.1 ATT_ERROR_RSP
     */
    class AttErrorRsp: public AttPDUMsg
    {
        public:
            enum class ErrorCode : uint8_t {
                NO_ERROR                    = 0x00,
                INVALID_HANDLE              = 0x01,
                NO_READ_PERM                = 0x02,
                NO_WRITE_PERM               = 0x03,
                INVALID_PDU                 = 0x04,
                INSUFF_AUTHENTICATION       = 0x05,
                UNSUPPORTED_REQUEST         = 0x06,
                INVALID_OFFSET              = 0x07,
                INSUFF_AUTHORIZATION        = 0x08,
                PREPARE_QUEUE_FULL          = 0x09,
                ATTRIBUTE_NOT_FOUND         = 0x0A,
                ATTRIBUTE_NOT_LONG          = 0x0B,
                INSUFF_ENCRYPTION_KEY_SIZE  = 0x0C,
                INVALID_ATTRIBUTE_VALUE_LEN = 0x0D,
                UNLIKELY_ERROR              = 0x0E,
                INSUFF_ENCRYPTION           = 0x0F,
                UNSUPPORTED_GROUP_TYPE      = 0x10,
                INSUFFICIENT_RESOURCES      = 0x11
            };
            static constexpr uint8_t number(const ErrorCode rhs) noexcept {
                return static_cast<uint8_t>(rhs);
            }
            static std::string getErrorCodeString(const ErrorCode errorCode) noexcept;

            AttErrorRsp(const uint8_t* source, const jau::nsize_t length) : AttPDUMsg(source, length) {
                checkOpcode(Opcode::ERROR_RSP);
                checkMinSize();
            }

            AttErrorRsp(const ErrorCode error_code, const Opcode cause_opc, const uint16_t cause_handle)
            : AttPDUMsg(Opcode::ERROR_RSP, 1+1+2+1)
            {
                pdu.put_uint8_nc(1, AttPDUMsg::number(cause_opc));
                pdu.put_uint16_nc(2, cause_handle);
                pdu.put_uint8_nc(4, number(error_code));
            }

            /** opcode + reqOpcodeCause + handleCause + errorCode */
            jau::nsize_t getPDUValueOffset() const noexcept override { return 1 + 1 + 2 + 1; }

            Opcode getCausingOpcode() const noexcept { return static_cast<Opcode>( pdu.get_uint8_nc(1) ); }

            uint16_t getCausingHandle() const noexcept { return pdu.get_uint16_nc(2); }

            ErrorCode getErrorCode() const noexcept { return static_cast<ErrorCode>(pdu.get_uint8_nc(4)); }

            std::string getName() const noexcept override { return "AttErrorRsp"; }

        protected:
            std::string valueString() const noexcept override;
    };

    /**
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.4.4.1 ATT_READ_BY_TYPE_REQ
     * and 3.4.4.9 ATT_READ_BY_GROUP_TYPE_REQ
     * <p>
     * Used for primary service discovery with group type 0x2800
     * and characteristic discovery with type 0x2803.
     * </p>
     */
    class AttReadByNTypeReq : public AttPDUMsg
    {
        public:
            AttReadByNTypeReq(const bool groupTypeReq, const uint16_t startHandle, const uint16_t endHandle, const jau::uuid_t & uuid)
            : AttPDUMsg(groupTypeReq ? Opcode::READ_BY_GROUP_TYPE_REQ : Opcode::READ_BY_TYPE_REQ, 1+2+2+uuid.getTypeSizeInt())
            {
                if( uuid.getTypeSize() != jau::uuid_t::TypeSize::UUID16_SZ && uuid.getTypeSize()!= jau::uuid_t::TypeSize::UUID128_SZ ) {
                    throw jau::IllegalArgumentException("Only UUID16 and UUID128 allowed: "+uuid.toString(), E_FILE_LINE);
                }
                pdu.put_uint16_nc(1, startHandle);
                pdu.put_uint16_nc(3, endHandle);
                pdu.put_uuid_nc(5, uuid);
            }

            /** opcode + handle-start + handle-end */
            jau::nsize_t getPDUValueOffset() const noexcept override { return 1 + 2 + 2; }

            uint16_t getStartHandle() const noexcept { return pdu.get_uint16_nc( 1 ); }

            uint16_t getEndHandle() const noexcept { return pdu.get_uint16_nc( 1 + 2 ); }

            std::string getName() const noexcept override { return "AttReadByNTypeReq"; }

            std::unique_ptr<const jau::uuid_t> getNType() const {
                return pdu.get_uuid( getPDUValueOffset(), jau::uuid_t::toTypeSize( getPDUValueSize() ) );
            }

        protected:
            std::string valueString() const noexcept override;
    };

    /**
     * List of equally sized elements, the size given by the first parameter octet.
     * <pre>
     *   uint8_t opcode
     *   uint8_t element_size
     *   uint8_t elements[element_size * n]
     * </pre>
     */
    class AttElementList : public AttPDUMsg
    {
        protected:
            AttElementList(const uint8_t* source, const jau::nsize_t length)
            : AttPDUMsg(source, length) {}

            /** Validates the element list, throws AttValueException if malformed. */
            void checkElementList(const jau::nsize_t minElementSize) const;

        public:
            /** opcode + element-size */
            jau::nsize_t getPDUValueOffset() const noexcept override { return 1 + 1; }

            jau::nsize_t getElementSize() const noexcept { return pdu.get_uint8_nc(1); }

            jau::nsize_t getElementCount() const noexcept {
                return 0 < getElementSize() ? getPDUValueSize() / getElementSize() : 0;
            }

            jau::nsize_t getElementPDUOffset(const jau::nsize_t elementIdx) const noexcept {
                return getPDUValueOffset() + elementIdx * getElementSize();
            }
    };

    /**
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.4.4.2 ATT_READ_BY_TYPE_RSP
     * <p>
     * Decodes each element as characteristic declaration,
     * BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.1 Characteristic Declaration Attribute Value
     * </p>
     * <pre>
     *  element := { uint16_t handle, uint8_t properties, uint16_t value_handle, uuid[2|16] }
     * </pre>
     */
    class AttReadByTypeRsp: public AttElementList
    {
        public:
            AttReadByTypeRsp(const uint8_t* source, const jau::nsize_t length)
            : AttElementList(source, length)
            {
                checkOpcode(Opcode::READ_BY_TYPE_RSP);
                checkElementList(2+1+2+2);
            }

            std::string getName() const noexcept override { return "AttReadByTypeRsp"; }

            uint16_t getElementHandle(const jau::nsize_t elementIdx) const {
                return pdu.get_uint16( getElementPDUOffset(elementIdx) );
            }

            uint8_t getElementProperties(const jau::nsize_t elementIdx) const {
                return pdu.get_uint8( getElementPDUOffset(elementIdx) + 2 );
            }

            uint16_t getElementValueHandle(const jau::nsize_t elementIdx) const {
                return pdu.get_uint16( getElementPDUOffset(elementIdx) + 2 + 1 );
            }

            std::unique_ptr<const jau::uuid_t> getElementUUID(const jau::nsize_t elementIdx) const {
                return pdu.get_uuid( getElementPDUOffset(elementIdx) + 2 + 1 + 2,
                                     jau::uuid_t::toTypeSize( getElementSize() - 2 - 1 - 2 ) );
            }

        protected:
            std::string valueString() const noexcept override;
    };

    /**
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.4.4.10 ATT_READ_BY_GROUP_TYPE_RSP
     * <pre>
     *  element := { uint16_t start_handle, uint16_t end_handle, uuid[2|16] }
     * </pre>
     */
    class AttReadByGroupTypeRsp : public AttElementList
    {
        public:
            AttReadByGroupTypeRsp(const uint8_t* source, const jau::nsize_t length)
            : AttElementList(source, length)
            {
                checkOpcode(Opcode::READ_BY_GROUP_TYPE_RSP);
                checkElementList(2+2+2);
            }

            std::string getName() const noexcept override { return "AttReadByGroupTypeRsp"; }

            uint16_t getElementStartHandle(const jau::nsize_t elementIdx) const {
                return pdu.get_uint16( getElementPDUOffset(elementIdx) );
            }

            uint16_t getElementEndHandle(const jau::nsize_t elementIdx) const {
                return pdu.get_uint16( getElementPDUOffset(elementIdx) + 2 );
            }

            std::unique_ptr<const jau::uuid_t> getElementUUID(const jau::nsize_t elementIdx) const {
                return pdu.get_uuid( getElementPDUOffset(elementIdx) + 2 + 2,
                                     jau::uuid_t::toTypeSize( getElementSize() - 2 - 2 ) );
            }

        protected:
            std::string valueString() const noexcept override;
    };

    /**
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.4.4.3 ATT_READ_REQ
     */
    class AttReadReq : public AttPDUMsg
    {
        public:
            AttReadReq(const uint16_t handle)
            : AttPDUMsg(Opcode::READ_REQ, 1+2)
            {
                pdu.put_uint16_nc(1, handle);
            }

            /** opcode + handle */
            jau::nsize_t getPDUValueOffset() const noexcept override { return 1 + 2; }

            uint16_t getHandle() const noexcept { return pdu.get_uint16_nc( 1 ); }

            std::string getName() const noexcept override { return "AttReadReq"; }

        protected:
            std::string valueString() const noexcept override {
                return "handle "+jau::to_hexstring(getHandle());
            }
    };

    /**
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.4.4.4 ATT_READ_RSP
     */
    class AttReadRsp : public AttPDUMsg
    {
        public:
            AttReadRsp(const uint8_t* source, const jau::nsize_t length)
            : AttPDUMsg(source, length)
            {
                checkOpcode(Opcode::READ_RSP);
            }

            std::string getName() const noexcept override { return "AttReadRsp"; }

            uint8_t const * getValuePtr() const noexcept { return pdu.get_ptr() + getPDUValueOffset(); }
    };

    /**
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.4.5.3 ATT_WRITE_CMD
     */
    class AttWriteCmd : public AttPDUMsg
    {
        public:
            AttWriteCmd(const uint16_t handle, const jau::TROOctets & value)
            : AttPDUMsg(Opcode::WRITE_CMD, 1+2+value.size())
            {
                pdu.put_uint16_nc(1, handle);
                if( 0 < value.size() ) {
                    pdu.put_bytes_nc(1+2, value.get_ptr(), value.size());
                }
            }

            /** opcode + handle */
            jau::nsize_t getPDUValueOffset() const noexcept override { return 1 + 2; }

            uint16_t getHandle() const noexcept { return pdu.get_uint16_nc( 1 ); }

            std::string getName() const noexcept override { return "AttWriteCmd"; }

        protected:
            std::string valueString() const noexcept override {
                return "handle "+jau::to_hexstring(getHandle())+", "+AttPDUMsg::valueString();
            }
    };

    /**
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.4.7.3 ATT_HANDLE_VALUE_CFM
     */
    class AttHandleValueCfm: public AttPDUMsg
    {
        public:
            AttHandleValueCfm()
            : AttPDUMsg(Opcode::HANDLE_VALUE_CFM, 1) {}

            std::string getName() const noexcept override { return "AttHandleValueCfm"; }
    };

} // namespace lhpower

#endif /* LHPOWER_ATT_PDU_HPP_ */
