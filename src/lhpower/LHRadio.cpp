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

#include "LHRadio.hpp"

using namespace lhpower;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define GATTSTATUS_ENUM(X) \
        X(GattStatus,SUCCESS) \
        X(GattStatus,NOT_CONNECTED) \
        X(GattStatus,NOT_FOUND) \
        X(GattStatus,TIMEOUT) \
        X(GattStatus,IO_ERROR) \
        X(GattStatus,PROTOCOL_ERROR)

std::string lhpower::to_string(const GattStatus v) noexcept {
    switch(v) {
        GATTSTATUS_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown GattStatus "+jau::to_hexstring(number(v));
}

std::string LHGattService::toString() const noexcept {
    return "Service[handles "+jau::to_hexstring(start_handle)+".."+jau::to_hexstring(end_handle)+"]";
}

std::string LHGattChar::toString() const noexcept {
    return "Char[handle "+jau::to_hexstring(handle)+", props "+jau::to_hexstring(properties)+
           ", value "+jau::to_hexstring(value_handle)+"]";
}

std::string LHAdvertisement::toString() const noexcept {
    return "Adv["+addressAndType.toString()+", '"+name+"', rssi "+std::to_string(rssi)+"]";
}
