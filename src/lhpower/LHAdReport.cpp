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

#include "LHAdReport.hpp"

extern "C" {
    #include <errno.h>
}

using namespace lhpower;

int LHAdReport::next_data_elem(uint8_t *elem_len, uint8_t *elem_type, uint8_t const **elem_data,
                               uint8_t const * data, int offset, int const size) noexcept
{
    if (offset < size) {
        uint8_t len = data[offset]; // covers: type + data, less len field itself

        if (len == 0) {
            return 0; // end of significant part
        }

        if (len + offset + 1 > size) {
            return -ENOENT;
        }

        *elem_type = data[offset + 1];
        *elem_data = data + offset + 2; // net data ptr
        *elem_len = len - 1; // less type -> net data length

        return offset + 1 + len; // next ad_struct offset: + len + type + data
    }
    return -ENOENT;
}

std::string LHAdReport::read_name(uint8_t const * data, uint8_t const data_length) noexcept {
    std::string name, name_short;
    int offset = 0;
    uint8_t elem_len, elem_type;
    uint8_t const *elem_data;

    while( 0 < ( offset = next_data_elem( &elem_len, &elem_type, &elem_data, data, offset, data_length ) ) ) {
        switch( elem_type ) {
            case AD_TYPE_NAME_SHORT:
                name_short = jau::get_string(elem_data, elem_len, MAX_NAME_LEN);
                break;
            case AD_TYPE_NAME_COMPLETE:
                name = jau::get_string(elem_data, elem_len, MAX_NAME_LEN);
                break;
            default:
                break; // skipped
        }
    }
    return name.size() > 0 ? name : name_short;
}

jau::darray<LHAdvertisement> LHAdReport::read_ad_reports(uint8_t const * data, jau::nsize_t const data_length) noexcept {
    jau::darray<LHAdvertisement> ad_reports;
    if( 0 == data_length ) {
        return ad_reports;
    }
    jau::nsize_t const num_reports = (jau::nsize_t) data[0];

    if( 0 == num_reports || num_reports > 0x19 ) {
        DBG_PRINT("AD-Reports: Invalid reports count: %u", num_reports);
        return ad_reports;
    }
    uint8_t const *limes = data + data_length;
    uint8_t const *i_octets = data + 1;

    const int seg4_size = 1 + 1 + 6 + 1;

    for(jau::nsize_t i = 0; i < num_reports && i_octets < limes; i++) {
        if( i_octets + seg4_size > limes ) {
            WARN_PRINT("AD-Reports: Insufficient data length (1) %u: report %u/%u: min_data_len %d > bytes-left %d (Drop)",
                    data_length, i, num_reports, seg4_size, static_cast<int>(limes - i_octets));
            break;
        }
        LHAdvertisement ad;

        // seg 1: event type, unused
        i_octets++;

        // seg 2: address type
        const HCILEPeerAddressType addrType = static_cast<HCILEPeerAddressType>(*i_octets++);

        // seg 3: address
        ad.addressAndType = BDAddressAndType( jau::le_to_cpu( *((jau::EUI48 const *)i_octets) ), to_BDAddressType(addrType) );
        i_octets += 6;

        // seg 4: EIR length
        const uint8_t ad_data_len = *i_octets++;

        // seg 5: ADV Response Data (EIR)
        if( i_octets + ad_data_len + 1 > limes ) {
            WARN_PRINT("AD-Reports: Insufficient data length (2) %u: report %u/%u: eir_data_len + rssi %d > bytes-left %d (Drop)",
                    data_length, i, num_reports, ad_data_len + 1, static_cast<int>(limes - i_octets));
            break;
        }
        if( 0 < ad_data_len ) {
            ad.name = read_name(i_octets, ad_data_len);
            i_octets += ad_data_len;
        }

        // seg 6: RSSI
        ad.rssi = static_cast<int8_t>(*i_octets++);

        ad_reports.push_back( ad );
    }
    return ad_reports;
}
