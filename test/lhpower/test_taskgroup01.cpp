#include <iostream>
#include <cinttypes>
#include <cstring>
#include <atomic>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/basic_types.hpp>
#include <jau/fraction_type.hpp>

#include <lhpower/LHTaskGroup.hpp>
#include <lhpower/LHTypes.hpp>

using namespace lhpower;
using namespace jau::fractions_i64_literals;

TEST_CASE( "TaskGroup Wait Test 01", "[lhpower][taskgroup][threads]" ) {
    std::atomic<int> done(0);
    LHTaskGroup group("test01");
    for(int i=0; i<8; ++i) {
        group.spawn("task"+std::to_string(i), [&done, i]() {
            jau::sleep_for( jau::fraction_i64(5*i, 1'000lu) );
            ++done;
        });
    }
    REQUIRE( true == group.waitFor(2_s) );
    REQUIRE( 8 == done );
    REQUIRE( 0 == group.pending() );
    REQUIRE( 0 == group.failed() );

    // empty group completes immediately
    LHTaskGroup empty("empty");
    REQUIRE( true == empty.waitFor(0_s) );
    empty.waitAll();
}

TEST_CASE( "TaskGroup Failure Test 02", "[lhpower][taskgroup][threads]" ) {
    LHTaskGroup group("test02");
    group.spawn("ok", []() { });
    group.spawn("lh", []() { throw WriteException("write failed", E_FILE_LINE); });
    group.spawn("std", []() { throw std::runtime_error("runtime"); });
    group.waitAll();
    REQUIRE( 0 == group.pending() );
    REQUIRE( 2 == group.failed() );
}

TEST_CASE( "TaskGroup Deadline Test 03", "[lhpower][taskgroup][threads]" ) {
    std::atomic<bool> finished(false);
    {
        LHTaskGroup group("test03");
        group.spawn("slow", [&finished]() {
            jau::sleep_for(300_ms);
            finished = true;
        });
        const uint64_t t0 = jau::getCurrentMilliseconds();
        REQUIRE( false == group.waitFor(50_ms) );
        const uint64_t td = jau::getCurrentMilliseconds() - t0;
        INFO_STR("wait duration "+std::to_string(td)+" ms");
        REQUIRE( 50 <= td );
        REQUIRE( 250 > td );
        REQUIRE( 1 == group.pending() );
        REQUIRE( false == finished );
    }
    // not cancelled, outlives its group
    jau::sleep_for(500_ms);
    REQUIRE( true == finished );
}
