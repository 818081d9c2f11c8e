#include <iostream>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/uuid.hpp>

#include <lhpower/LHConst.hpp>
#include <lhpower/AttPDU.hpp>

using namespace lhpower;

TEST_CASE( "ATT PDU Request Test 01", "[datatype][attpdu]" ) {
    {
        const jau::uuid16_t uuid16 = jau::uuid16_t(0x2800);
        const AttReadByNTypeReq req(true /* group */, 1, 0xffff, uuid16);

        REQUIRE( AttPDUMsg::Opcode::READ_BY_GROUP_TYPE_REQ == req.getOpcode() );
        REQUIRE( 1+2+2+2 == req.pdu.size() );
        std::unique_ptr<const jau::uuid_t> uuid16_2 = req.getNType();
        REQUIRE( uuid16_2->getTypeSizeInt() == 2 );
        REQUIRE( uuid16.toString() == uuid16_2->toString() );
        REQUIRE( req.getStartHandle() == 1 );
        REQUIRE( req.getEndHandle() == 0xffff );
        REQUIRE( 0x00 == req.pdu.get_uint8(5) ); // little endian 0x2800
        REQUIRE( 0x28 == req.pdu.get_uint8(6) );
    }
    {
        const jau::uuid128_t uuid128(POWER_CHAR_UUID);
        const AttReadByNTypeReq req(false /* group */, 0x0010, 0x0020, uuid128);

        REQUIRE( AttPDUMsg::Opcode::READ_BY_TYPE_REQ == req.getOpcode() );
        REQUIRE( 1+2+2+16 == req.pdu.size() );
        std::unique_ptr<const jau::uuid_t> uuid128_2 = req.getNType();
        REQUIRE( uuid128_2->getTypeSizeInt() == 16 );
        REQUIRE( true == uuid128.equivalent(*uuid128_2) );
        REQUIRE( req.getStartHandle() == 0x0010 );
        REQUIRE( req.getEndHandle() == 0x0020 );
    }
    {
        const AttReadReq req(0x0012);
        REQUIRE( AttPDUMsg::Opcode::READ_REQ == req.getOpcode() );
        REQUIRE( 3 == req.pdu.size() );
        REQUIRE( 0x12 == req.pdu.get_uint8(1) );
        REQUIRE( 0x00 == req.pdu.get_uint8(2) );
        REQUIRE( 0x0012 == req.getHandle() );
    }
    {
        const uint8_t cmd = POWER_CMD_ON;
        const AttWriteCmd req(0x0012, jau::TROOctets(&cmd, 1, jau::lb_endian_t::little));
        REQUIRE( AttPDUMsg::Opcode::WRITE_CMD == req.getOpcode() );
        REQUIRE( 4 == req.pdu.size() );
        REQUIRE( 0x0012 == req.getHandle() );
        REQUIRE( 1 == req.getPDUValueSize() );
        REQUIRE( POWER_CMD_ON == req.pdu.get_uint8(3) );
    }
    {
        const AttHandleValueCfm cfm;
        REQUIRE( 1 == cfm.pdu.size() );
        REQUIRE( 0x1E == cfm.pdu.get_uint8(0) );
    }
}

TEST_CASE( "ATT PDU Response Test 02", "[datatype][attpdu]" ) {
    const jau::uuid128_t service_uuid(POWER_SERVICE_UUID);
    const jau::uuid128_t char_uuid(POWER_CHAR_UUID);

    SECTION( "read by group type" ) {
        jau::POctets buf(1+1+2*(2+2+16), jau::lb_endian_t::little);
        buf.put_uint8_nc(0, AttPDUMsg::number(AttPDUMsg::Opcode::READ_BY_GROUP_TYPE_RSP));
        buf.put_uint8_nc(1, 2+2+16);
        buf.put_uint16_nc(2, 0x0010);
        buf.put_uint16_nc(4, 0x0020);
        buf.put_uuid_nc(6, service_uuid);
        buf.put_uint16_nc(22, 0x0021);
        buf.put_uint16_nc(24, 0x0030);
        buf.put_uuid_nc(26, char_uuid);

        std::unique_ptr<const AttPDUMsg> pdu = AttPDUMsg::getSpecialized(buf.get_ptr(), buf.size());
        REQUIRE( AttPDUMsg::Opcode::READ_BY_GROUP_TYPE_RSP == pdu->getOpcode() );
        const AttReadByGroupTypeRsp* rsp = dynamic_cast<const AttReadByGroupTypeRsp*>(pdu.get());
        REQUIRE( nullptr != rsp );
        REQUIRE( 2 == rsp->getElementCount() );
        REQUIRE( 0x0010 == rsp->getElementStartHandle(0) );
        REQUIRE( 0x0020 == rsp->getElementEndHandle(0) );
        REQUIRE( true == service_uuid.equivalent( *rsp->getElementUUID(0) ) );
        REQUIRE( 0x0021 == rsp->getElementStartHandle(1) );
        REQUIRE( 0x0030 == rsp->getElementEndHandle(1) );
        REQUIRE( false == service_uuid.equivalent( *rsp->getElementUUID(1) ) );
    }
    SECTION( "read by type" ) {
        jau::POctets buf(1+1+2+1+2+16, jau::lb_endian_t::little);
        buf.put_uint8_nc(0, AttPDUMsg::number(AttPDUMsg::Opcode::READ_BY_TYPE_RSP));
        buf.put_uint8_nc(1, 2+1+2+16);
        buf.put_uint16_nc(2, 0x0011);
        buf.put_uint8_nc(4, 0x0A);
        buf.put_uint16_nc(5, 0x0012);
        buf.put_uuid_nc(7, char_uuid);

        std::unique_ptr<const AttPDUMsg> pdu = AttPDUMsg::getSpecialized(buf.get_ptr(), buf.size());
        const AttReadByTypeRsp* rsp = dynamic_cast<const AttReadByTypeRsp*>(pdu.get());
        REQUIRE( nullptr != rsp );
        REQUIRE( 1 == rsp->getElementCount() );
        REQUIRE( 0x0011 == rsp->getElementHandle(0) );
        REQUIRE( 0x0A == rsp->getElementProperties(0) );
        REQUIRE( 0x0012 == rsp->getElementValueHandle(0) );
        REQUIRE( true == char_uuid.equivalent( *rsp->getElementUUID(0) ) );
    }
    SECTION( "read" ) {
        const uint8_t buf[] = { 0x0B, 0x01 };
        std::unique_ptr<const AttPDUMsg> pdu = AttPDUMsg::getSpecialized(buf, sizeof(buf));
        const AttReadRsp* rsp = dynamic_cast<const AttReadRsp*>(pdu.get());
        REQUIRE( nullptr != rsp );
        REQUIRE( 1 == rsp->getPDUValueSize() );
        REQUIRE( 0x01 == rsp->getValuePtr()[0] );
    }
    SECTION( "error" ) {
        const uint8_t buf[] = { 0x01, 0x10, 0x21, 0x00, 0x0A };
        std::unique_ptr<const AttPDUMsg> pdu = AttPDUMsg::getSpecialized(buf, sizeof(buf));
        const AttErrorRsp* rsp = dynamic_cast<const AttErrorRsp*>(pdu.get());
        REQUIRE( nullptr != rsp );
        REQUIRE( AttPDUMsg::Opcode::READ_BY_GROUP_TYPE_REQ == rsp->getCausingOpcode() );
        REQUIRE( 0x0021 == rsp->getCausingHandle() );
        REQUIRE( AttErrorRsp::ErrorCode::ATTRIBUTE_NOT_FOUND == rsp->getErrorCode() );

        const AttErrorRsp rsp2(AttErrorRsp::ErrorCode::INVALID_HANDLE, AttPDUMsg::Opcode::READ_REQ, 0x0012);
        REQUIRE( 5 == rsp2.pdu.size() );
        REQUIRE( 0x01 == rsp2.pdu.get_uint8(4) );
    }
    SECTION( "other" ) {
        const uint8_t buf[] = { 0x1B, 0x12, 0x00, 0x01 };
        std::unique_ptr<const AttPDUMsg> pdu = AttPDUMsg::getSpecialized(buf, sizeof(buf));
        REQUIRE( AttPDUMsg::Opcode::HANDLE_VALUE_NTF == pdu->getOpcode() );
        REQUIRE( 3 == pdu->getPDUValueSize() );
    }
}

TEST_CASE( "ATT PDU Malformed Test 03", "[datatype][attpdu]" ) {
    {
        REQUIRE_THROWS_AS( AttPDUMsg::getSpecialized(nullptr, 0), AttValueException );
    }
    {
        // truncated error response
        const uint8_t buf[] = { 0x01, 0x10, 0x21 };
        REQUIRE_THROWS( AttPDUMsg::getSpecialized(buf, sizeof(buf)) );
    }
    {
        // element size below minimum
        const uint8_t buf[] = { 0x11, 0x02, 0x01, 0x00 };
        REQUIRE_THROWS_AS( AttPDUMsg::getSpecialized(buf, sizeof(buf)), AttValueException );
    }
    {
        // value size not a multiple of element size
        const uint8_t buf[] = { 0x11, 0x06, 0x01, 0x00, 0x05, 0x00, 0x00, 0x18, 0x06 };
        REQUIRE_THROWS_AS( AttPDUMsg::getSpecialized(buf, sizeof(buf)), AttValueException );
    }
    {
        // no elements
        const uint8_t buf[] = { 0x09, 0x07 };
        REQUIRE_THROWS_AS( AttPDUMsg::getSpecialized(buf, sizeof(buf)), AttValueException );
    }
    {
        const uint8_t buf[] = { 0x0B };
        const AttReadRsp rsp(buf, sizeof(buf));
        REQUIRE( 0 == rsp.getPDUValueSize() );

        const uint8_t req[] = { 0x0A, 0x12, 0x00 };
        REQUIRE_THROWS_AS( AttReadRsp(req, sizeof(req)), AttOpcodeException );
    }
}

TEST_CASE( "ATT PDU Opcode Type Test 04", "[datatype][attpdu]" ) {
    REQUIRE( AttPDUMsg::OpcodeType::RESPONSE == AttPDUMsg::get_type(AttPDUMsg::Opcode::READ_RSP) );
    REQUIRE( AttPDUMsg::OpcodeType::RESPONSE == AttPDUMsg::get_type(AttPDUMsg::Opcode::ERROR_RSP) );
    REQUIRE( AttPDUMsg::OpcodeType::NOTIFICATION == AttPDUMsg::get_type(AttPDUMsg::Opcode::HANDLE_VALUE_NTF) );
    REQUIRE( AttPDUMsg::OpcodeType::INDICATION == AttPDUMsg::get_type(AttPDUMsg::Opcode::HANDLE_VALUE_IND) );
    REQUIRE( AttPDUMsg::OpcodeType::REQUEST == AttPDUMsg::get_type(AttPDUMsg::Opcode::EXCHANGE_MTU_REQ) );
    REQUIRE( AttPDUMsg::OpcodeType::REQUEST == AttPDUMsg::get_type(AttPDUMsg::Opcode::WRITE_CMD) );
    REQUIRE( AttPDUMsg::OpcodeType::UNDEFINED == AttPDUMsg::get_type(AttPDUMsg::Opcode::HANDLE_VALUE_CFM) );
    REQUIRE( AttPDUMsg::OpcodeType::UNDEFINED == AttPDUMsg::get_type(static_cast<AttPDUMsg::Opcode>(0x7f)) );

    REQUIRE( false == AttPDUMsg::is_command(AttPDUMsg::Opcode::EXCHANGE_MTU_REQ) );
    REQUIRE( true == AttPDUMsg::is_command(AttPDUMsg::Opcode::WRITE_CMD) );
    REQUIRE( true == AttPDUMsg::is_command(AttPDUMsg::Opcode::SIGNED_WRITE_CMD) );

    {
        // peer MTU exchange request is not taken for a reply
        const uint8_t buf[] = { 0x02, 0x00, 0x02 };
        std::unique_ptr<const AttPDUMsg> pdu = AttPDUMsg::getSpecialized(buf, sizeof(buf));
        REQUIRE( AttPDUMsg::OpcodeType::REQUEST == pdu->getOpcodeType() );
        REQUIRE( "EXCHANGE_MTU_REQ" == AttPDUMsg::getOpcodeString(pdu->getOpcode()) );

        const AttErrorRsp rsp(AttErrorRsp::ErrorCode::UNSUPPORTED_REQUEST, pdu->getOpcode(), 0);
        REQUIRE( AttPDUMsg::OpcodeType::RESPONSE == rsp.getOpcodeType() );
        REQUIRE( 5 == rsp.pdu.size() );
        REQUIRE( 0x01 == rsp.pdu.get_uint8(0) );
        REQUIRE( 0x02 == rsp.pdu.get_uint8(1) );
        REQUIRE( 0x0000 == rsp.pdu.get_uint16(2) );
        REQUIRE( 0x06 == rsp.pdu.get_uint8(4) );
    }
}
