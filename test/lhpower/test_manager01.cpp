#include <iostream>
#include <cinttypes>
#include <cstring>
#include <thread>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <lhpower/LHStationManager.hpp>

#include "MockRadio.hpp"

using namespace lhpower;

static const std::string ADDR01 = "C0:10:22:A0:10:01";
static const std::string ADDR02 = "C0:10:22:A0:10:02";
static const std::string ADDR03 = "C0:10:22:A0:10:03";

static const StationInfo* find(const jau::darray<StationInfo>& list, const std::string& address) {
    for(const StationInfo& i : list) {
        if( i.address == address ) {
            return &i;
        }
    }
    return nullptr;
}

static std::shared_ptr<MockRadio> makeRadio() {
    std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
    radio->setAdvertisements( {
        makeAdvertisement(ADDR01, "LHB-00000001"),
        makeAdvertisement(ADDR02, "LHB-00000002"),
        makeAdvertisement("C0:10:22:A0:10:09", "Speaker")
    } );
    radio->script(ADDR01).value = { 0x01 };
    radio->script(ADDR02).value = { 0x00 };
    return radio;
}

TEST_CASE( "Manager Initialize Test 01", "[lhpower][manager]" ) {
    std::shared_ptr<MockRadio> radio = makeRadio();
    LHStationManager manager(radio, testTiming());
    manager.initialize();

    radio->setEnableResult(false);
    REQUIRE_THROWS_AS( manager.initialize(), ConnectionException );
}

TEST_CASE( "Manager Scan and Merge Test 02", "[lhpower][manager]" ) {
    std::shared_ptr<MockRadio> radio = makeRadio();
    LHStationManager manager(radio, testTiming());
    manager.initialize();

    REQUIRE( 0 == manager.snapshot().size() );
    REQUIRE( false == manager.isScanning() );

    const jau::darray<StationInfo> res1 = manager.scanAndMerge();
    REQUIRE( false == manager.isScanning() );
    REQUIRE( 2 == res1.size() );
    REQUIRE( 2 == manager.getStationCount() );
    {
        const StationInfo* s1 = find(res1, ADDR01);
        const StationInfo* s2 = find(res1, ADDR02);
        REQUIRE( nullptr != s1 );
        REQUIRE( nullptr != s2 );
        REQUIRE( "LHB-00000001" == s1->name );
        REQUIRE( "LHB-00000001" == s1->originalName );
        REQUIRE( PowerState::ON == s1->powerState );
        REQUIRE( PowerState::OFF == s2->powerState );
    }
    REQUIRE( 2 == manager.getSessionRegistry()->size() );

    // rescan: connected stations are kept and not refetched, new ones are added
    radio->setAdvertisements( {
        makeAdvertisement(ADDR01, "LHB-0000001A"),
        makeAdvertisement(ADDR03, "LHB-00000003")
    } );
    LHStationRef st1 = manager.getStation(ADDR01);
    const jau::darray<StationInfo> res2 = manager.scanAndMerge();
    REQUIRE( 3 == res2.size() );
    REQUIRE( st1 == manager.getStation(ADDR01) );
    REQUIRE( "LHB-0000001A" == find(res2, ADDR01)->originalName );
    REQUIRE( nullptr != find(res2, ADDR02) ); // not seen, still known
    REQUIRE( PowerState::OFF == find(res2, ADDR03)->powerState );
    REQUIRE( 1 == radio->get(ADDR01).connects );
    REQUIRE( 1 == radio->get(ADDR01).reads );

    manager.shutdown();
    REQUIRE( 0 == manager.getSessionRegistry()->size() );
    REQUIRE( 0 == radio->get(ADDR01).open );
    REQUIRE( 0 == radio->get(ADDR02).open );
    REQUIRE( 0 == radio->get(ADDR03).open );
    REQUIRE( 3 == manager.getStationCount() );

    // disconnected stations are refetched by the next scan
    manager.scanAndMerge();
    REQUIRE( 2 == radio->get(ADDR01).connects );
    REQUIRE( 1 == radio->get(ADDR02).connects );
    REQUIRE( PowerState::UNKNOWN == manager.getStation(ADDR02)->getPowerState() );
}

TEST_CASE( "Manager Scan Failure Test 03", "[lhpower][manager]" ) {
    SECTION( "fetch failure keeps the station" ) {
        std::shared_ptr<MockRadio> radio = makeRadio();
        radio->script(ADDR02).connect_failures = 1;
        LHStationManager manager(radio, testTiming());

        const jau::darray<StationInfo> res = manager.scanAndMerge();
        REQUIRE( 2 == res.size() );
        REQUIRE( PowerState::ON == find(res, ADDR01)->powerState );
        REQUIRE( PowerState::UNKNOWN == find(res, ADDR02)->powerState );
        REQUIRE( 1 == manager.getSessionRegistry()->size() );
    }
    SECTION( "scan error" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        radio->setAdvertisements( { }, true /* error */ );
        LHStationManager manager(radio, testTiming());
        REQUIRE_THROWS_AS( manager.scanAndMerge(), ScanException );
        REQUIRE( false == manager.isScanning() );
        REQUIRE( 0 == manager.getStationCount() );
    }
    SECTION( "fetch deadline" ) {
        std::shared_ptr<MockRadio> radio = makeRadio();
        radio->script(ADDR02).connect_delay = 3_s;
        LHStationManager manager(radio, testTiming());

        const uint64_t t0 = jau::getCurrentMilliseconds();
        const jau::darray<StationInfo> res = manager.scanAndMerge();
        const uint64_t td = jau::getCurrentMilliseconds() - t0;
        INFO_STR("scanAndMerge duration "+std::to_string(td)+" ms");
        REQUIRE( 2900 > td );
        REQUIRE( 2 == res.size() );
        REQUIRE( PowerState::ON == find(res, ADDR01)->powerState );
        REQUIRE( PowerState::UNKNOWN == find(res, ADDR02)->powerState );

        // late fetch still completes and updates its station
        jau::sleep_for(2_s);
        REQUIRE( PowerState::OFF == manager.getStation(ADDR02)->getPowerState() );
    }
}

TEST_CASE( "Manager Concurrent Scan Test 04", "[lhpower][manager][threads]" ) {
    std::shared_ptr<MockRadio> radio = makeRadio();
    LHStationManager manager(radio, testTiming());

    std::thread t1([&manager]() { manager.scanAndMerge(); });
    jau::sleep_for(50_ms); // within settle and scan window
    REQUIRE( true == manager.isScanning() );
    REQUIRE_THROWS_AS( manager.scanAndMerge(), AlreadyScanningException );
    t1.join();
    REQUIRE( false == manager.isScanning() );
    REQUIRE( 1 == radio->getScanCount() );
}

TEST_CASE( "Manager Status Test 05", "[lhpower][manager]" ) {
    std::shared_ptr<MockRadio> radio = makeRadio();
    LHStationManager manager(radio, testTiming());

    REQUIRE( 0 == manager.checkAllStatuses().size() );

    manager.scanAndMerge();
    radio->script(ADDR01).value = { 0x00 };
    manager.getStation(ADDR02)->disconnect();
    radio->script(ADDR02).value = { 0x01 };

    const jau::darray<StationInfo> res = manager.checkAllStatuses();
    REQUIRE( PowerState::OFF == find(res, ADDR01)->powerState );
    REQUIRE( PowerState::ON == find(res, ADDR02)->powerState );
    REQUIRE( 1 == radio->get(ADDR01).connects ); // read only
    REQUIRE( 2 == radio->get(ADDR02).connects ); // refetched
}

TEST_CASE( "Manager Power Test 06", "[lhpower][manager]" ) {
    std::shared_ptr<MockRadio> radio = makeRadio();
    LHStationManager manager(radio, testTiming());
    manager.scanAndMerge();

    manager.powerOffStation(ADDR01);
    REQUIRE( PowerState::OFF == manager.getStation(ADDR01)->getPowerState() );
    manager.powerOnStation(ADDR02);
    REQUIRE( PowerState::ON == manager.getStation(ADDR02)->getPowerState() );

    REQUIRE_THROWS_AS( manager.powerOnStation(ADDR03), NotFoundException );
    REQUIRE_THROWS_AS( manager.powerOffStation("unknown"), NotFoundException );

    manager.powerOffAll();
    for(const StationInfo& i : manager.snapshot()) {
        REQUIRE( PowerState::OFF == i.powerState );
    }
    manager.powerOnAll();
    for(const StationInfo& i : manager.snapshot()) {
        REQUIRE( PowerState::ON == i.powerState );
    }

    radio->script(ADDR02).write_failures = 2;
    try {
        manager.powerOffAll();
        REQUIRE_MSG( "AggregateException expected", false );
    } catch (AggregateException &e) {
        REQUIRE( 1 == e.errorCount() );
    }
    REQUIRE( PowerState::OFF == manager.getStation(ADDR01)->getPowerState() );
    REQUIRE( PowerState::UNKNOWN == manager.getStation(ADDR02)->getPowerState() );
}

TEST_CASE( "Manager Rename Test 07", "[lhpower][manager]" ) {
    std::shared_ptr<MockRadio> radio = makeRadio();
    LHStationManager manager(radio, testTiming());
    manager.scanAndMerge();

    manager.renameStation("LHB-00000001", "Left");
    REQUIRE( "Left" == manager.getDisplayName("LHB-00000001") );
    REQUIRE( "" == manager.getDisplayName("LHB-00000002") );
    {
        const jau::darray<StationInfo> res = manager.snapshot();
        REQUIRE( "Left" == find(res, ADDR01)->name );
        REQUIRE( "LHB-00000001" == find(res, ADDR01)->originalName );
        REQUIRE( "LHB-00000002" == find(res, ADDR02)->name );
    }
    manager.renameStation("LHB-00000001", "");
    REQUIRE( "LHB-00000001" == find(manager.snapshot(), ADDR01)->name );
}

TEST_CASE( "Manager Power All Aggregate Test 08", "[lhpower][manager]" ) {
    std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
    radio->setAdvertisements( {
        makeAdvertisement(ADDR01, "LHB-00000001"),
        makeAdvertisement(ADDR02, "LHB-00000002"),
        makeAdvertisement(ADDR03, "LHB-00000003")
    } );
    LHStationManager manager(radio, testTiming());
    manager.scanAndMerge();
    REQUIRE( 3 == manager.getStationCount() );

    radio->script(ADDR03).write_failures = 2;
    try {
        manager.powerOnAll();
        REQUIRE_MSG( "AggregateException expected", false );
    } catch (AggregateException &e) {
        REQUIRE( 1 == e.errorCount() );
        const std::string msg = e.message();
        INFO_STR(msg);
        REQUIRE( std::string::npos != msg.find("encountered 1 error(s) during PowerOnAllStations") );
    }
    REQUIRE( PowerState::ON == manager.getStation(ADDR01)->getPowerState() );
    REQUIRE( PowerState::ON == manager.getStation(ADDR02)->getPowerState() );
    REQUIRE( PowerState::UNKNOWN == manager.getStation(ADDR03)->getPowerState() );
}

TEST_CASE( "Manager Snapshot During Fetch Test 09", "[lhpower][manager][threads]" ) {
    std::shared_ptr<MockRadio> radio = makeRadio();
    radio->script(ADDR01).connect_delay = 400_ms;
    radio->script(ADDR02).connect_delay = 400_ms;
    LHStationManager manager(radio, testTiming());

    std::thread t1([&manager]() { manager.scanAndMerge(); });
    // settle 10ms + scan window 200ms, fetches take 400ms
    jau::sleep_for(350_ms);
    {
        const uint64_t t0 = jau::getCurrentMilliseconds();
        const jau::darray<StationInfo> res = manager.snapshot();
        const uint64_t td = jau::getCurrentMilliseconds() - t0;
        INFO_STR("snapshot duration "+std::to_string(td)+" ms");
        REQUIRE( 100 > td );
        REQUIRE( 2 == res.size() );
        REQUIRE( PowerState::UNKNOWN == find(res, ADDR01)->powerState );
        REQUIRE( PowerState::UNKNOWN == find(res, ADDR02)->powerState );
    }
    t1.join();
    {
        const jau::darray<StationInfo> res = manager.snapshot();
        REQUIRE( PowerState::ON == find(res, ADDR01)->powerState );
        REQUIRE( PowerState::OFF == find(res, ADDR02)->powerState );
    }
}

TEST_CASE( "Manager Status Recovery Test 10", "[lhpower][manager]" ) {
    std::shared_ptr<MockRadio> radio = makeRadio();
    LHStationManager manager(radio, testTiming());

    manager.scanAndMerge();
    REQUIRE( true == manager.getStation(ADDR01)->isConnected() );

    // failed read drops the session
    radio->script(ADDR01).read_failures = 1;
    const jau::darray<StationInfo> res1 = manager.checkAllStatuses();
    REQUIRE( PowerState::UNKNOWN == find(res1, ADDR01)->powerState );
    REQUIRE( PowerState::OFF == find(res1, ADDR02)->powerState );
    REQUIRE( false == manager.getStation(ADDR01)->isConnected() );
    REQUIRE( 1 == radio->get(ADDR01).disconnects );

    // next status check reconnects
    radio->script(ADDR01).value = { 0x00 };
    const jau::darray<StationInfo> res2 = manager.checkAllStatuses();
    REQUIRE( PowerState::OFF == find(res2, ADDR01)->powerState );
    REQUIRE( true == manager.getStation(ADDR01)->isConnected() );
    REQUIRE( 2 == radio->get(ADDR01).connects );
    REQUIRE( 1 == radio->get(ADDR02).connects );
}
