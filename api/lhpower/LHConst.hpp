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

#ifndef LHPOWER_CONST_HPP_
#define LHPOWER_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>
#include <jau/fraction_type.hpp>

namespace lhpower {

    using namespace jau::fractions_i64_literals;

    /** Vendor power control service UUID of a Lighthouse base station. */
    inline constexpr const char * POWER_SERVICE_UUID = "00001523-1212-efde-1523-785feabcd124";

    /** Single byte power control characteristic UUID within ::POWER_SERVICE_UUID. */
    inline constexpr const char * POWER_CHAR_UUID = "00001525-1212-efde-1523-785feabcd124";

    /** Advertised local name prefix of a Lighthouse base station. */
    inline constexpr const char * STATION_NAME_PREFIX = "LHB-";

    /** Power control command byte turning the station off. */
    inline constexpr const uint8_t POWER_CMD_OFF = 0x00;

    /** Power control command byte turning the station on. */
    inline constexpr const uint8_t POWER_CMD_ON  = 0x01;

    /**
     * Pause between two discovery or power-set attempts.
     */
    inline constexpr const jau::fraction_i64 RETRY_BACKOFF = 500_ms;

    /**
     * Number of service and characteristic discovery attempts
     * on a connected station before giving up.
     */
    inline constexpr const int32_t DISCOVERY_ATTEMPTS = 3;

    /**
     * Number of attempts writing the power command,
     * each one (re)connecting if required.
     */
    inline constexpr const int32_t WRITE_ATTEMPTS = 2;

    /** Delay between a power command write and its reconciliation read. */
    inline constexpr const jau::fraction_i64 WRITE_SETTLE = 100_ms;

    /** Delay letting the adapter settle before a scan is started. */
    inline constexpr const jau::fraction_i64 SCAN_SETTLE = 1_s;

    /** Scan window used by LHStationManager::scanAndMerge(). */
    inline constexpr const jau::fraction_i64 SCAN_WINDOW = 5_s;

    /** Soft deadline waiting for initial power state fetches after a scan. */
    inline constexpr const jau::fraction_i64 FETCH_DEADLINE = 7_s;

    /** Soft deadline waiting for LHStationManager::checkAllStatuses(). */
    inline constexpr const jau::fraction_i64 STATUS_DEADLINE = 4_s;

    /**
     * Maximum time to wait for a thread shutdown,
     * e.g. the scan stop timer.
     */
    inline constexpr const jau::fraction_i64 THREAD_SHUTDOWN_TIMEOUT = 8_s;

} // namespace lhpower

#endif /* LHPOWER_CONST_HPP_ */
