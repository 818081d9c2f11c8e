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

#include "LHTypes.hpp"
#include "LHAddress.hpp"

using namespace lhpower;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_BDADDRESSTYPE_ENUM(X) \
        X(BDAddressType,BDADDR_BREDR) \
        X(BDAddressType,BDADDR_LE_PUBLIC) \
        X(BDAddressType,BDADDR_LE_RANDOM) \
        X(BDAddressType,BDADDR_UNDEFINED)

std::string lhpower::to_string(const BDAddressType type) noexcept {
    switch(type) {
        CHAR_DECL_BDADDRESSTYPE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown BDAddressType "+jau::to_hexstring(number(type));
}

BDAddressType lhpower::to_BDAddressType(const HCILEPeerAddressType hciPeerAddrType) noexcept {
    switch(hciPeerAddrType) {
        case HCILEPeerAddressType::PUBLIC:
            return BDAddressType::BDADDR_LE_PUBLIC;
        case HCILEPeerAddressType::RANDOM:
            [[fallthrough]];
        case HCILEPeerAddressType::PUBLIC_IDENTITY:
            [[fallthrough]];
        case HCILEPeerAddressType::RANDOM_STATIC_IDENTITY:
            return BDAddressType::BDADDR_LE_RANDOM;
        default:
            return BDAddressType::BDADDR_UNDEFINED;
    }
}

const BDAddressAndType lhpower::BDAddressAndType::ANY_DEVICE(jau::EUI48::ANY_DEVICE, BDAddressType::BDADDR_UNDEFINED);

std::string BDAddressAndType::toString() const noexcept {
    return "["+address.toString()+", "+to_string(type)+"]";
}

std::string lhpower::to_string(const PowerState v) noexcept {
    switch(v) {
        case PowerState::UNKNOWN: return "UNKNOWN";
        case PowerState::OFF: return "OFF";
        case PowerState::ON: return "ON";
    }
    return "Unknown PowerState "+std::to_string(number(v));
}

std::string StationInfo::toString() const noexcept {
    std::string n = "'"+name+"'";
    if( name != originalName ) {
        n += " (was '"+originalName+"')";
    }
    return "Station["+address+", "+n+", power "+to_string(powerState)+"]";
}
