#include <iostream>
#include <cinttypes>
#include <cstring>
#include <vector>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <lhpower/LHAdReport.hpp>

using namespace lhpower;

static void append_name(std::vector<uint8_t>& data, const uint8_t type, const std::string& name) {
    data.push_back( static_cast<uint8_t>(name.size() + 1) );
    data.push_back( type );
    data.insert(data.end(), name.begin(), name.end());
}

TEST_CASE( "AD Name Test 01", "[datatype][AD][EIR]" ) {
    {
        std::vector<uint8_t> data = { 0x02, 0x01, 0x06 }; // flags
        append_name(data, LHAdReport::AD_TYPE_NAME_SHORT, "LHB-0A1B");
        REQUIRE( "LHB-0A1B" == LHAdReport::read_name(data.data(), static_cast<uint8_t>(data.size())) );
    }
    {
        // complete name wins regardless of order
        std::vector<uint8_t> data;
        append_name(data, LHAdReport::AD_TYPE_NAME_COMPLETE, "LHB-0A1B2C3D");
        append_name(data, LHAdReport::AD_TYPE_NAME_SHORT, "LHB-0A1B");
        REQUIRE( "LHB-0A1B2C3D" == LHAdReport::read_name(data.data(), static_cast<uint8_t>(data.size())) );
    }
    {
        const std::vector<uint8_t> data = { 0x02, 0x01, 0x06, 0x03, 0x03, 0x0F, 0x18 };
        REQUIRE( "" == LHAdReport::read_name(data.data(), static_cast<uint8_t>(data.size())) );
    }
    {
        // zero length terminates the significant part
        std::vector<uint8_t> data = { 0x02, 0x01, 0x06, 0x00 };
        append_name(data, LHAdReport::AD_TYPE_NAME_COMPLETE, "LHB-0A1B2C3D");
        REQUIRE( "" == LHAdReport::read_name(data.data(), static_cast<uint8_t>(data.size())) );
    }
    {
        // truncated element is dropped
        std::vector<uint8_t> data;
        append_name(data, LHAdReport::AD_TYPE_NAME_COMPLETE, "LHB-0A1B2C3D");
        REQUIRE( "" == LHAdReport::read_name(data.data(), static_cast<uint8_t>(data.size()-1)) );
    }
    {
        std::vector<uint8_t> data;
        append_name(data, LHAdReport::AD_TYPE_NAME_COMPLETE, std::string(40, 'x'));
        REQUIRE( LHAdReport::MAX_NAME_LEN == LHAdReport::read_name(data.data(), static_cast<uint8_t>(data.size())).size() );
    }
}

static std::vector<uint8_t> make_reports() {
    std::vector<uint8_t> eir = { 0x02, 0x01, 0x06 };
    append_name(eir, LHAdReport::AD_TYPE_NAME_SHORT, "LHB-");
    append_name(eir, LHAdReport::AD_TYPE_NAME_COMPLETE, "LHB-0A1B2C3D");

    std::vector<uint8_t> data = { 0x02 /* num_reports */ };
    // report 0: random address C0:10:22:A0:10:00
    data.insert(data.end(), { 0x00, 0x01, 0x00, 0x10, 0xA0, 0x22, 0x10, 0xC0 });
    data.push_back( static_cast<uint8_t>(eir.size()) );
    data.insert(data.end(), eir.begin(), eir.end());
    data.push_back( 0xC4 ); // -60 dBm
    // report 1: scan response of public address 06:05:04:03:02:01 without data
    data.insert(data.end(), { 0x04, 0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x00, 0xB0 });
    return data;
}

TEST_CASE( "AD Report Test 02", "[datatype][AD][EIR]" ) {
    const std::vector<uint8_t> data = make_reports();
    {
        const jau::darray<LHAdvertisement> res = LHAdReport::read_ad_reports(data.data(), data.size());
        REQUIRE( 2 == res.size() );

        REQUIRE( jau::EUI48("C0:10:22:A0:10:00") == res[0].addressAndType.address );
        REQUIRE( BDAddressType::BDADDR_LE_RANDOM == res[0].addressAndType.type );
        REQUIRE( "LHB-0A1B2C3D" == res[0].name );
        REQUIRE( -60 == res[0].rssi );

        REQUIRE( jau::EUI48("06:05:04:03:02:01") == res[1].addressAndType.address );
        REQUIRE( BDAddressType::BDADDR_LE_PUBLIC == res[1].addressAndType.type );
        REQUIRE( "" == res[1].name );
        REQUIRE( -80 == res[1].rssi );
    }
    {
        // missing trailing rssi drops the last report only
        const jau::darray<LHAdvertisement> res = LHAdReport::read_ad_reports(data.data(), data.size()-1);
        REQUIRE( 1 == res.size() );
        REQUIRE( "LHB-0A1B2C3D" == res[0].name );
    }
    {
        // truncated within the first report's EIR
        const jau::darray<LHAdvertisement> res = LHAdReport::read_ad_reports(data.data(), 12);
        REQUIRE( 0 == res.size() );
    }
}

TEST_CASE( "AD Report Malformed Test 03", "[datatype][AD][EIR]" ) {
    {
        REQUIRE( 0 == LHAdReport::read_ad_reports(nullptr, 0).size() );
    }
    {
        const uint8_t data[] = { 0x00 };
        REQUIRE( 0 == LHAdReport::read_ad_reports(data, sizeof(data)).size() );
    }
    {
        const uint8_t data[] = { 0x1A, 0x00, 0x01 };
        REQUIRE( 0 == LHAdReport::read_ad_reports(data, sizeof(data)).size() );
    }
    {
        const uint8_t data[] = { 0x01, 0x00, 0x01, 0x00, 0x10 };
        REQUIRE( 0 == LHAdReport::read_ad_reports(data, sizeof(data)).size() );
    }
}
