#include <iostream>
#include <cinttypes>
#include <cstring>
#include <thread>
#include <vector>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <lhpower/LHStation.hpp>
#include <lhpower/LHSessionRegistry.hpp>

#include "MockRadio.hpp"

using namespace lhpower;

static const std::string ADDR01 = "C0:10:22:A0:10:00";

static LHStationRef makeStation(const std::shared_ptr<MockRadio>& radio, const std::shared_ptr<LHSessionRegistry>& registry) {
    return LHStation::make_shared(radio, registry, testTiming(),
                                  BDAddressAndType(jau::EUI48(ADDR01), BDAddressType::BDADDR_LE_RANDOM), "LHB-0A1B2C3D");
}

TEST_CASE( "Station Fetch Test 01", "[lhpower][station]" ) {
    std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
    std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
    LHStationRef s = makeStation(radio, registry);

    REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
    REQUIRE( false == s->isConnected() );
    REQUIRE( 0 == s->getLastStateUpdate() );

    radio->script(ADDR01).value = { 0x01 };
    s->fetchInitialPowerState();
    REQUIRE( PowerState::ON == s->getPowerState() );
    REQUIRE( true == s->isConnected() );
    REQUIRE( true == s->hasConnection() );
    REQUIRE( true == s->hasControlChar() );
    REQUIRE( 0 < s->getLastStateUpdate() );
    REQUIRE( true == registry->contains(ADDR01) );

    radio->script(ADDR01).value = { 0x00 };
    s->readPowerState();
    REQUIRE( PowerState::OFF == s->getPowerState() );

    // any non-zero value means ON
    radio->script(ADDR01).value = { 0x05 };
    s->readPowerState();
    REQUIRE( PowerState::ON == s->getPowerState() );

    // a connected station is reused
    s->fetchInitialPowerState();
    const MockScript m = radio->get(ADDR01);
    REQUIRE( 1 == m.connects );
    REQUIRE( 1 == m.discoveries );
    REQUIRE( 1 == m.open );
}

TEST_CASE( "Station Read Errors Test 02", "[lhpower][station]" ) {
    std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
    std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
    LHStationRef s = makeStation(radio, registry);

    // not connected
    REQUIRE_THROWS_AS( s->readPowerState(), ReadException );
    REQUIRE( 0 == radio->get(ADDR01).reads );

    radio->script(ADDR01).value = { 0x01 };
    s->fetchInitialPowerState();
    REQUIRE( PowerState::ON == s->getPowerState() );

    // wrong byte count
    radio->script(ADDR01).value = { 0x01, 0x00 };
    REQUIRE_THROWS_AS( s->readPowerState(), ReadException );
    REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
    REQUIRE( true == s->isConnected() );

    radio->script(ADDR01).value = { };
    REQUIRE_THROWS_AS( s->readPowerState(), ReadException );
    REQUIRE( PowerState::UNKNOWN == s->getPowerState() );

    // transport error drops the session
    radio->script(ADDR01).value = { 0x00 };
    radio->script(ADDR01).read_failures = 1;
    REQUIRE_THROWS_AS( s->readPowerState(), ReadException );
    REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
    REQUIRE( false == s->isConnected() );
    REQUIRE( 0 == registry->size() );
    REQUIRE( 1 == radio->get(ADDR01).disconnects );
    REQUIRE( 0 == radio->get(ADDR01).open );

    REQUIRE_THROWS_AS( s->readPowerState(), ReadException );

    s->fetchInitialPowerState();
    REQUIRE( PowerState::OFF == s->getPowerState() );
    REQUIRE( true == s->isConnected() );
    REQUIRE( 2 == radio->get(ADDR01).connects );
}

TEST_CASE( "Station Connect and Discover Test 03", "[lhpower][station]" ) {
    SECTION( "connect failure" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        radio->script(ADDR01).connect_failures = 1;
        REQUIRE_THROWS_AS( s->connectAndDiscover(), ConnectionException );
        REQUIRE( false == s->isConnected() );
        REQUIRE( false == s->hasConnection() );
        REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
        REQUIRE( 0 == registry->size() );

        s->connectAndDiscover();
        REQUIRE( true == s->isConnected() );
        REQUIRE( 2 == radio->get(ADDR01).connects );
    }
    SECTION( "discovery succeeds on last attempt" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        radio->script(ADDR01).discovery_failures = 2;
        s->connectAndDiscover();
        REQUIRE( true == s->isConnected() );
        const MockScript m = radio->get(ADDR01);
        REQUIRE( 3 == m.discoveries );
        REQUIRE( 1 == m.connects );
    }
    SECTION( "discovery exhausted" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        radio->script(ADDR01).discovery_failures = 3;
        REQUIRE_THROWS_AS( s->connectAndDiscover(), DiscoveryException );
        REQUIRE( false == s->isConnected() );
        REQUIRE( false == s->hasConnection() );
        REQUIRE( false == s->hasControlChar() );
        REQUIRE( 0 == registry->size() );
        const MockScript m = radio->get(ADDR01);
        REQUIRE( 3 == m.discoveries );
        REQUIRE( 1 == m.disconnects );
        REQUIRE( 0 == m.open );
    }
    SECTION( "no power control service" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        radio->script(ADDR01).has_power_service = false;
        REQUIRE_THROWS_AS( s->fetchInitialPowerState(), DiscoveryException );
        REQUIRE( false == s->isConnected() );
        REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
    }
}

TEST_CASE( "Station Set Power Test 04", "[lhpower][station]" ) {
    SECTION( "write on connected station" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        s->fetchInitialPowerState();
        REQUIRE( PowerState::OFF == s->getPowerState() );

        s->powerOn();
        REQUIRE( PowerState::ON == s->getPowerState() );
        s->powerOff();
        REQUIRE( PowerState::OFF == s->getPowerState() );

        const MockScript m = radio->get(ADDR01);
        REQUIRE( 2 == m.writes );
        REQUIRE( 2 == m.written.size() );
        REQUIRE( POWER_CMD_ON == m.written[0] );
        REQUIRE( POWER_CMD_OFF == m.written[1] );
        REQUIRE( 1 == m.connects );
    }
    SECTION( "write connects when required" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        radio->script(ADDR01).connect_failures = 1;
        s->setPowerState(PowerState::ON);
        REQUIRE( PowerState::ON == s->getPowerState() );
        REQUIRE( true == s->isConnected() );
        REQUIRE( 2 == radio->get(ADDR01).connects );
    }
    SECTION( "write retried after reconnect" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        s->fetchInitialPowerState();
        radio->script(ADDR01).write_failures = 1;
        s->powerOn();
        REQUIRE( PowerState::ON == s->getPowerState() );
        const MockScript m = radio->get(ADDR01);
        REQUIRE( 2 == m.writes );
        REQUIRE( 2 == m.connects );
        REQUIRE( 1 == m.disconnects );
        REQUIRE( 1 == m.open );
    }
    SECTION( "write exhausted" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        s->fetchInitialPowerState();
        radio->script(ADDR01).write_failures = 2;
        REQUIRE_THROWS_AS( s->powerOn(), WriteException );
        REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
        REQUIRE( false == s->isConnected() );
        REQUIRE( 2 == radio->get(ADDR01).writes );
        REQUIRE( 0 == registry->size() );
    }
    SECTION( "connect exhausted" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        radio->script(ADDR01).connect_failures = 2;
        REQUIRE_THROWS_AS( s->powerOff(), WriteException );
        REQUIRE( 0 == radio->get(ADDR01).writes );
        REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
    }
    SECTION( "read back reconciles the state" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        s->fetchInitialPowerState();
        radio->script(ADDR01).write_updates_value = false;
        s->powerOn();
        // station ignored the command
        REQUIRE( PowerState::OFF == s->getPowerState() );
        REQUIRE( true == s->isConnected() );

        radio->script(ADDR01).write_updates_value = true;
        radio->script(ADDR01).read_failures = 1;
        s->powerOn(); // read back failure is not fatal
        REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
        REQUIRE( false == s->isConnected() );
        REQUIRE( POWER_CMD_ON == radio->get(ADDR01).written.back() );
    }
    SECTION( "unknown target" ) {
        std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
        std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
        LHStationRef s = makeStation(radio, registry);

        REQUIRE_THROWS_AS( s->setPowerState(PowerState::UNKNOWN), jau::IllegalArgumentException );
        REQUIRE( 0 == radio->get(ADDR01).connects );
    }
}

TEST_CASE( "Station Disconnect Test 05", "[lhpower][station]" ) {
    std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
    std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
    LHStationRef s = makeStation(radio, registry);

    // no-op while disconnected
    s->disconnect();
    REQUIRE( 0 == radio->get(ADDR01).disconnects );

    radio->script(ADDR01).value = { 0x01 };
    s->fetchInitialPowerState();
    REQUIRE( 1 == registry->size() );

    s->disconnect();
    REQUIRE( false == s->isConnected() );
    REQUIRE( PowerState::UNKNOWN == s->getPowerState() );
    REQUIRE( 0 == registry->size() );
    s->disconnect();
    REQUIRE( 1 == radio->get(ADDR01).disconnects );
    REQUIRE( 0 == radio->get(ADDR01).open );

    // reconnect after disconnect
    s->fetchInitialPowerState();
    REQUIRE( PowerState::ON == s->getPowerState() );
    REQUIRE( 2 == radio->get(ADDR01).connects );

    registry->disconnectAll();
    REQUIRE( false == s->isConnected() );
    REQUIRE( 0 == registry->size() );
}

TEST_CASE( "Station Concurrency Test 06", "[lhpower][station][threads]" ) {
    std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
    std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
    LHStationRef s = makeStation(radio, registry);

    radio->script(ADDR01).value = { 0x01 };
    radio->script(ADDR01).connect_delay = 50_ms;

    std::vector<std::thread> threads;
    for(int i=0; i<4; ++i) {
        threads.push_back( std::thread([s]() { s->fetchInitialPowerState(); }) );
    }
    // field getters do not wait for the running connect
    jau::sleep_for(10_ms);
    const uint64_t t0 = jau::getCurrentMilliseconds();
    (void)s->getPowerState();
    (void)s->isConnected();
    (void)s->toString();
    const uint64_t td = jau::getCurrentMilliseconds() - t0;
    INFO_STR("getter duration "+std::to_string(td)+" ms");
    REQUIRE( 40 > td );

    for(std::thread& t : threads) {
        t.join();
    }
    REQUIRE( PowerState::ON == s->getPowerState() );
    const MockScript m = radio->get(ADDR01);
    REQUIRE( 1 == m.connects );
    REQUIRE( 1 == m.open );
}

TEST_CASE( "Station Read Timeout Test 07", "[lhpower][station]" ) {
    std::shared_ptr<MockRadio> radio = std::make_shared<MockRadio>();
    std::shared_ptr<LHSessionRegistry> registry = std::make_shared<LHSessionRegistry>();
    LHStationRef s = makeStation(radio, registry);

    radio->script(ADDR01).value = { 0x00 };
    s->fetchInitialPowerState();
    REQUIRE( PowerState::OFF == s->getPowerState() );

    radio->script(ADDR01).read_failures = 1;
    radio->script(ADDR01).read_failure_status = GattStatus::TIMEOUT;
    REQUIRE_THROWS_AS( s->readPowerState(), ReadException );
    REQUIRE( false == s->isConnected() );
    REQUIRE( 0 == radio->get(ADDR01).open );

    // write runs on a fresh session, read back sees the written value
    s->powerOn();
    REQUIRE( PowerState::ON == s->getPowerState() );
    REQUIRE( true == s->isConnected() );
    REQUIRE( 2 == radio->get(ADDR01).connects );
    REQUIRE( 1 == radio->get(ADDR01).open );
}

TEST_CASE( "Station Power Command Test 08", "[datatype][station]" ) {
    REQUIRE( POWER_CMD_ON == to_command(PowerState::ON) );
    REQUIRE( POWER_CMD_OFF == to_command(PowerState::OFF) );
    REQUIRE( PowerState::OFF == to_PowerState(POWER_CMD_OFF) );
    REQUIRE( PowerState::ON == to_PowerState(POWER_CMD_ON) );
    REQUIRE( PowerState::ON == to_PowerState(0x02) );
}
