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

#ifndef LHPOWER_AD_REPORT_HPP_
#define LHPOWER_AD_REPORT_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>

#include "LHRadio.hpp"

namespace lhpower {

    /**
     * Decoder for HCI LE Advertising Report events and their EIR/AD payload.
     * <p>
     * Only the address, address type, local name and RSSI are kept,
     * all other AD structures are skipped.
     * </p>
     */
    class LHAdReport {
        public:
            /** Maximum name length taken from a single AD structure */
            static constexpr const jau::nsize_t MAX_NAME_LEN = 30;

            /** BT Core Spec Supplement Part A 1.2 Local Name AD types */
            static constexpr const uint8_t AD_TYPE_NAME_SHORT = 0x08;
            static constexpr const uint8_t AD_TYPE_NAME_COMPLETE = 0x09;

            /**
             * Returns the next AD structure offset, or zero at the end of the significant part,
             * or a negative value if the data is truncated.
             */
            static int next_data_elem(uint8_t *elem_len, uint8_t *elem_type, uint8_t const **elem_data,
                                      uint8_t const * data, int offset, int const size) noexcept;

            /**
             * Returns the local name contained in the given EIR/AD data.
             * <p>
             * The complete name wins over a shortened name, the result is empty if none is present.
             * </p>
             */
            static std::string read_name(uint8_t const * data, uint8_t const data_length) noexcept;

            /**
             * Decodes the LE Advertising Report event parameters following the subevent code,
             * BT Core Spec v5.2: Vol 4, Part E, 7.7.65.2 LE Advertising Report event.
             * <pre>
             *   uint8_t num_reports
             *   { uint8_t evt_type, uint8_t addr_type, uint8_t addr[6], uint8_t data_len, uint8_t data[data_len], int8_t rssi }[num_reports]
             * </pre>
             * Truncated reports are dropped, all complete reports ahead of them are returned.
             */
            static jau::darray<LHAdvertisement> read_ad_reports(uint8_t const * data, jau::nsize_t const data_length) noexcept;
    };

} // namespace lhpower

#endif /* LHPOWER_AD_REPORT_HPP_ */
