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
#include <cstdint>

#include <jau/debug.hpp>

#include "LHEnv.hpp"
#include "LHConst.hpp"

using namespace lhpower;

LHEnv::LHEnv() noexcept
: exploding( jau::environment::getExplodingProperties("lhpower") ),
  RETRY_BACKOFF( jau::environment::getFractionProperty("lhpower.retry.backoff", lhpower::RETRY_BACKOFF, 0_ms /* min */, 60_s /* max */) ),
  DISCOVERY_ATTEMPTS( jau::environment::getInt32Property("lhpower.discovery.attempts", lhpower::DISCOVERY_ATTEMPTS, 1 /* min */, 100 /* max */) ),
  WRITE_ATTEMPTS( jau::environment::getInt32Property("lhpower.write.attempts", lhpower::WRITE_ATTEMPTS, 1 /* min */, 100 /* max */) ),
  WRITE_SETTLE( jau::environment::getFractionProperty("lhpower.write.settle", lhpower::WRITE_SETTLE, 0_ms /* min */, 60_s /* max */) ),
  SCAN_SETTLE( jau::environment::getFractionProperty("lhpower.scan.settle", lhpower::SCAN_SETTLE, 0_ms /* min */, 60_s /* max */) ),
  SCAN_WINDOW( jau::environment::getFractionProperty("lhpower.scan.window", lhpower::SCAN_WINDOW, 500_ms /* min */, 365_d /* max */) ),
  FETCH_DEADLINE( jau::environment::getFractionProperty("lhpower.fetch.deadline", lhpower::FETCH_DEADLINE, 100_ms /* min */, 365_d /* max */) ),
  STATUS_DEADLINE( jau::environment::getFractionProperty("lhpower.status.deadline", lhpower::STATUS_DEADLINE, 100_ms /* min */, 365_d /* max */) ),
  HCI_DEV_ID( jau::environment::getInt32Property("lhpower.hci.dev", 0, 0 /* min */, UINT16_MAX /* max */) ),
  HCI_COMMAND_REPLY_TIMEOUT( jau::environment::getFractionProperty("lhpower.hci.cmd.timeout", 3_s, 1500_ms /* min */, 365_d /* max */) ),
  ATT_REPLY_TIMEOUT( jau::environment::getFractionProperty("lhpower.att.reply.timeout", 2500_ms, 500_ms /* min */, 365_d /* max */) ),
  DEBUG_ATT_DATA( jau::environment::getBooleanProperty("lhpower.debug.att.data", false) )
{
}

LHTiming LHTiming::fromEnv() noexcept {
    const LHEnv& env = LHEnv::get();
    return LHTiming { env.RETRY_BACKOFF, env.DISCOVERY_ATTEMPTS, env.WRITE_ATTEMPTS,
                      env.WRITE_SETTLE, env.SCAN_SETTLE, env.SCAN_WINDOW,
                      env.FETCH_DEADLINE, env.STATUS_DEADLINE };
}

std::string LHTiming::toString() const noexcept {
    return "Timing[backoff "+std::to_string(retry_backoff.to_ms())+" ms, attempts[discovery "+std::to_string(discovery_attempts)+
           ", write "+std::to_string(write_attempts)+"], write-settle "+std::to_string(write_settle.to_ms())+
           " ms, scan[settle "+std::to_string(scan_settle.to_ms())+" ms, window "+std::to_string(scan_window.to_ms())+
           " ms], deadline[fetch "+std::to_string(fetch_deadline.to_ms())+" ms, status "+std::to_string(status_deadline.to_ms())+" ms]]";
}
