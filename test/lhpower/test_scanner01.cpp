#include <iostream>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <lhpower/LHScanner.hpp>
#include <lhpower/LHTypes.hpp>

#include "MockRadio.hpp"

using namespace lhpower;

static const LHAdvertisement* find(const jau::darray<LHAdvertisement>& list, const std::string& address) {
    for(const LHAdvertisement& a : list) {
        if( a.addressAndType.address.toString() == address ) {
            return &a;
        }
    }
    return nullptr;
}

TEST_CASE( "Scanner Filter Test 01", "[lhpower][scanner]" ) {
    REQUIRE( true  == LHScanner::isStation( makeAdvertisement("C0:10:22:A0:10:00", "LHB-12345678") ) );
    REQUIRE( true  == LHScanner::isStation( makeAdvertisement("C0:10:22:A0:10:00", "LHB-") ) );
    REQUIRE( false == LHScanner::isStation( makeAdvertisement("C0:10:22:A0:10:00", "LHB") ) );
    REQUIRE( false == LHScanner::isStation( makeAdvertisement("C0:10:22:A0:10:00", "lhb-12345678") ) );
    REQUIRE( false == LHScanner::isStation( makeAdvertisement("C0:10:22:A0:10:00", "HTC BS 1234") ) );
    REQUIRE( false == LHScanner::isStation( makeAdvertisement("C0:10:22:A0:10:00", "") ) );
    REQUIRE( false == LHScanner::isStation( makeAdvertisement("C0:10:22:A0:10:00", " LHB-12345678") ) );
    REQUIRE( false == LHScanner::isStation( makeAdvertisement("00:00:00:00:00:00", "LHB-12345678") ) );
}

TEST_CASE( "Scanner Scan Test 02", "[lhpower][scanner]" ) {
    std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
    LHScanner scanner(radio);

    radio->setAdvertisements( {
        makeAdvertisement("C0:10:22:A0:10:00", "LHB-00000001"),
        makeAdvertisement("C0:10:22:A0:10:01", "Headset"),
        makeAdvertisement("C0:10:22:A0:10:02", "LHB-00000002"),
        makeAdvertisement("C0:10:22:A0:10:00", "LHB-0000000A"), // duplicate, last name wins
        makeAdvertisement("C0:10:22:A0:10:03", "")
    } );

    const uint64_t t0 = jau::getCurrentMilliseconds();
    const jau::darray<LHAdvertisement> res = scanner.scanForDuration(100_ms);
    const uint64_t td = jau::getCurrentMilliseconds() - t0;
    INFO_STR("scan duration "+std::to_string(td)+" ms");
    REQUIRE( 100 <= td );
    REQUIRE( 1 == radio->getScanCount() );

    REQUIRE( 2 == res.size() );
    const LHAdvertisement* a0 = find(res, "C0:10:22:A0:10:00");
    const LHAdvertisement* a2 = find(res, "C0:10:22:A0:10:02");
    REQUIRE( nullptr != a0 );
    REQUIRE( nullptr != a2 );
    REQUIRE( "LHB-0000000A" == a0->name );
    REQUIRE( "LHB-00000002" == a2->name );
    REQUIRE( nullptr == find(res, "C0:10:22:A0:10:01") );
}

TEST_CASE( "Scanner Error Test 03", "[lhpower][scanner]" ) {
    SECTION( "error without results" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        LHScanner scanner(radio);
        radio->setAdvertisements( { makeAdvertisement("C0:10:22:A0:10:01", "Headset") }, true /* error */ );
        REQUIRE_THROWS_AS( scanner.scanForDuration(100_ms), ScanException );
    }
    SECTION( "error after results" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        LHScanner scanner(radio);
        radio->setAdvertisements( { makeAdvertisement("C0:10:22:A0:10:00", "LHB-00000001") }, true /* error */ );
        const jau::darray<LHAdvertisement> res = scanner.scanForDuration(100_ms);
        REQUIRE( 1 == res.size() );
    }
    SECTION( "nothing found" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        LHScanner scanner(radio);
        const jau::darray<LHAdvertisement> res = scanner.scanForDuration(50_ms);
        REQUIRE( 0 == res.size() );
    }
}
