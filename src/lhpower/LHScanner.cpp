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
#include <cinttypes>
#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <jau/debug.hpp>
#include <jau/simple_timer.hpp>

#include "LHScanner.hpp"
#include "LHConst.hpp"
#include "LHTypes.hpp"

using namespace lhpower;

bool LHScanner::isStation(const LHAdvertisement& adv) noexcept {
    static const std::string prefix(STATION_NAME_PREFIX);
    if( adv.name.size() < prefix.size() || 0 != adv.name.compare(0, prefix.size(), prefix) ) {
        return false;
    }
    return !adv.addressAndType.isNull();
}

jau::darray<LHAdvertisement> LHScanner::scanForDuration(const jau::fraction_i64& duration) {
    std::mutex mtx_found;
    std::unordered_map<std::string, LHAdvertisement> found;
    jau::sc_atomic_bool stop_scan(false);

    jau::simple_timer stop_timer("lhpower_scan_stop", THREAD_SHUTDOWN_TIMEOUT);
    const bool timer_started = stop_timer.start(duration, [&stop_scan, &duration](jau::simple_timer& timer) -> jau::fraction_i64 {
        (void)timer;
        DBG_PRINT("LHScanner::scanForDuration: %" PRIi64 " ms elapsed, stopping scan", duration.to_ms());
        stop_scan = true;
        return 0_s; // one shot
    });
    if( !timer_started ) {
        throw ScanException("Could not start scan stop timer on "+radio->toString(), E_FILE_LINE);
    }

    DBG_PRINT("LHScanner::scanForDuration: Start %" PRIi64 " ms on %s", duration.to_ms(), radio->toString().c_str());
    const bool scan_ok = radio->scan(
        [&mtx_found, &found](const LHAdvertisement& adv) {
            if( !isStation(adv) ) {
                return;
            }
            const std::string key = adv.addressAndType.address.toString();
            const std::lock_guard<std::mutex> lock(mtx_found); // RAII-style acquire and relinquish via destructor
            if( found.end() == found.find(key) ) {
                DBG_PRINT("LHScanner::scanForDuration: Discovered %s", adv.toString().c_str());
            }
            found[key] = adv;
        },
        [&stop_scan](int dummy) -> bool {
            (void)dummy;
            return stop_scan;
        });
    stop_timer.stop(); // in case scan returned early

    jau::darray<LHAdvertisement> res;
    {
        const std::lock_guard<std::mutex> lock(mtx_found); // RAII-style acquire and relinquish via destructor
        for(const auto& entry : found) {
            res.push_back(entry.second);
        }
    }
    if( !scan_ok ) {
        WARN_PRINT("LHScanner::scanForDuration: Scan ended with error, found %zu stations", (size_t)res.size());
        if( 0 == res.size() ) {
            throw ScanException("Scan failed with no results on "+radio->toString(), E_FILE_LINE);
        }
    } else {
        DBG_PRINT("LHScanner::scanForDuration: Finished, found %zu stations", (size_t)res.size());
    }
    return res;
}
