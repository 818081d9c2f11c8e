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

#ifndef LHPOWER_ENV_HPP_
#define LHPOWER_ENV_HPP_

#include <cstdint>
#include <string>

#include <jau/environment.hpp>
#include <jau/fraction_type.hpp>

namespace lhpower {

    /**
     * lhpower Singleton runtime environment properties
     * <p>
     * All properties below are exploding, i.e. `lhpower.debug=true` et al.,
     * see jau::environment::getExplodingProperties().
     * </p>
     */
    class LHEnv : public jau::root_environment {
        private:
            LHEnv() noexcept;

            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Pause between two discovery or power-set attempts, defaults to ::RETRY_BACKOFF.
             * <p>
             * Environment variable is 'lhpower.retry.backoff'.
             * </p>
             */
            const jau::fraction_i64 RETRY_BACKOFF;

            /**
             * Service and characteristic discovery attempts, defaults to ::DISCOVERY_ATTEMPTS.
             * <p>
             * Environment variable is 'lhpower.discovery.attempts'.
             * </p>
             */
            const int32_t DISCOVERY_ATTEMPTS;

            /**
             * Power command write attempts, defaults to ::WRITE_ATTEMPTS.
             * <p>
             * Environment variable is 'lhpower.write.attempts'.
             * </p>
             */
            const int32_t WRITE_ATTEMPTS;

            /**
             * Delay between a power command write and its reconciliation read, defaults to ::WRITE_SETTLE.
             * <p>
             * Environment variable is 'lhpower.write.settle'.
             * </p>
             */
            const jau::fraction_i64 WRITE_SETTLE;

            /**
             * Pre-scan settle delay, defaults to ::SCAN_SETTLE.
             * <p>
             * Environment variable is 'lhpower.scan.settle'.
             * </p>
             */
            const jau::fraction_i64 SCAN_SETTLE;

            /**
             * Scan window, defaults to ::SCAN_WINDOW.
             * <p>
             * Environment variable is 'lhpower.scan.window'.
             * </p>
             */
            const jau::fraction_i64 SCAN_WINDOW;

            /**
             * Soft deadline for initial power state fetches post scan, defaults to ::FETCH_DEADLINE.
             * <p>
             * Environment variable is 'lhpower.fetch.deadline'.
             * </p>
             */
            const jau::fraction_i64 FETCH_DEADLINE;

            /**
             * Soft deadline for status checks, defaults to ::STATUS_DEADLINE.
             * <p>
             * Environment variable is 'lhpower.status.deadline'.
             * </p>
             */
            const jau::fraction_i64 STATUS_DEADLINE;

            /**
             * HCI adapter index used by LinuxRadio, defaults to 0.
             * <p>
             * Environment variable is 'lhpower.hci.dev'.
             * </p>
             */
            const int32_t HCI_DEV_ID;

            /**
             * Timeout waiting for an HCI command reply, defaults to 3s.
             * <p>
             * Environment variable is 'lhpower.hci.cmd.timeout'.
             * </p>
             */
            const jau::fraction_i64 HCI_COMMAND_REPLY_TIMEOUT;

            /**
             * Timeout waiting for an ATT request reply, defaults to 2500ms.
             * <p>
             * Environment variable is 'lhpower.att.reply.timeout'.
             * </p>
             */
            const jau::fraction_i64 ATT_REPLY_TIMEOUT;

            /**
             * Debug all ATT PDUs sent and received.
             * <p>
             * Environment variable is 'lhpower.debug.att.data'.
             * </p>
             */
            const bool DEBUG_ATT_DATA;

        public:
            static LHEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 */
                static LHEnv e;
                return e;
            }
    };

    /**
     * Protocol pacing used by LHStation and LHStationManager.
     *
     * Defaults stem from LHEnv, tests may pass their own shortened set.
     */
    struct LHTiming {
        jau::fraction_i64 retry_backoff;
        int32_t discovery_attempts;
        int32_t write_attempts;
        jau::fraction_i64 write_settle;
        jau::fraction_i64 scan_settle;
        jau::fraction_i64 scan_window;
        jau::fraction_i64 fetch_deadline;
        jau::fraction_i64 status_deadline;

        /** Returns the timing set as configured by LHEnv. */
        static LHTiming fromEnv() noexcept;

        std::string toString() const noexcept;
    };

} // namespace lhpower

#endif /* LHPOWER_ENV_HPP_ */
