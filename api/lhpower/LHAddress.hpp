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

#ifndef LHPOWER_ADDRESS_HPP_
#define LHPOWER_ADDRESS_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <functional>

#include <jau/eui48.hpp>

namespace lhpower {

    /**
     * BT Core Spec v5.2: Vol 3, Part C Generic Access Profile (GAP): 15.1.1.1 Public Bluetooth address
     * and 15.1.1.2 Random Bluetooth address, as used by the kernel socket address `bdaddr_type`.
     */
    enum class BDAddressType : uint8_t {
        /** Bluetooth BREDR address */
        BDADDR_BREDR      = 0x00,
        /** Bluetooth LE public address */
        BDADDR_LE_PUBLIC  = 0x01,
        /** Bluetooth LE random address, see ::BLERandomAddressType */
        BDADDR_LE_RANDOM  = 0x02,
        /** Undefined */
        BDADDR_UNDEFINED  = 0xff
    };
    constexpr uint8_t number(const BDAddressType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const BDAddressType type) noexcept;

    /**
     * HCI LE Advertising Report address type,
     * BT Core Spec v5.2: Vol 4, Part E, 7.7.65.2 LE Advertising Report event.
     */
    enum class HCILEPeerAddressType : uint8_t {
        PUBLIC = 0x00,
        RANDOM = 0x01,
        PUBLIC_IDENTITY = 0x02,
        RANDOM_STATIC_IDENTITY = 0x03,
    };
    constexpr uint8_t number(const HCILEPeerAddressType rhs) noexcept { return static_cast<uint8_t>(rhs); }

    /** Maps the HCI report address type to the kernel socket address type. */
    BDAddressType to_BDAddressType(const HCILEPeerAddressType hciPeerAddrType) noexcept;

    /**
     * Unique Bluetooth EUI48 address and ::BDAddressType tuple.
     */
    class BDAddressAndType {
        public:
            /** Using EUI48::ANY_DEVICE and ::BDAddressType::BDADDR_UNDEFINED. */
            static const BDAddressAndType ANY_DEVICE;

            jau::EUI48 address;
            BDAddressType type;

            BDAddressAndType(const jau::EUI48 & address_, BDAddressType type_) noexcept
            : address(address_), type(type_) {}

            BDAddressAndType() noexcept : address(), type{BDAddressType::BDADDR_UNDEFINED} { }

            constexpr bool isLEAddress() const noexcept {
                return BDAddressType::BDADDR_LE_PUBLIC == type || BDAddressType::BDADDR_LE_RANDOM == type;
            }

            /** Returns true if this address is the null address `00:00:00:00:00:00`. */
            bool isNull() const noexcept { return jau::EUI48::ANY_DEVICE == address; }

            std::string toString() const noexcept;
    };
    inline bool operator==(const BDAddressAndType& lhs, const BDAddressAndType& rhs) noexcept {
        return lhs.address == rhs.address && lhs.type == rhs.type;
    }
    inline bool operator!=(const BDAddressAndType& lhs, const BDAddressAndType& rhs) noexcept
    { return !(lhs == rhs); }

    inline std::string to_string(const BDAddressAndType& a) noexcept { return a.toString(); }

} // namespace lhpower

#endif /* LHPOWER_ADDRESS_HPP_ */
