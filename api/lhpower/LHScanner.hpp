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

#ifndef LHPOWER_SCANNER_HPP_
#define LHPOWER_SCANNER_HPP_

#include <string>
#include <memory>

#include <jau/darray.hpp>
#include <jau/fraction_type.hpp>

#include "LHRadio.hpp"

namespace lhpower {

    /**
     * Time bounded discovery pass collecting Lighthouse base stations.
     *
     * Independent of any LHStation session.
     */
    class LHScanner {
        private:
            const LHRadioRef radio;

        public:
            explicit LHScanner(const LHRadioRef& radio_) noexcept
            : radio(radio_) {}

            /**
             * Returns true if the advertisement names a base station,
             * i.e. its name starts with ::STATION_NAME_PREFIX and its address is not null.
             */
            static bool isStation(const LHAdvertisement& adv) noexcept;

            /**
             * Scans for exactly the given duration, stopped via a jau::simple_timer.
             *
             * Results are deduplicated by address, the last seen name wins.
             *
             * @param duration scan window
             * @return discovered stations in no particular order
             * @throws ScanException if the scan ended with a transport error without any station found.
             *         Stations found before a trailing error are still returned.
             */
            jau::darray<LHAdvertisement> scanForDuration(const jau::fraction_i64& duration);
    };

} // namespace lhpower

#endif /* LHPOWER_SCANNER_HPP_ */
