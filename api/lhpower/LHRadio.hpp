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

#ifndef LHPOWER_RADIO_HPP_
#define LHPOWER_RADIO_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <memory>

#include <jau/basic_types.hpp>
#include <jau/functional.hpp>
#include <jau/octets.hpp>
#include <jau/uuid.hpp>

#include "LHAddress.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module LHRadio:
 *
 * Transport seam between the station logic and a concrete BLE stack,
 * see LinuxRadio for the BlueZ kernel socket implementation.
 */
namespace lhpower {

    /**
     * Result of a GATT procedure on an LHConnection.
     */
    enum class GattStatus : uint8_t {
        SUCCESS        = 0,
        /** Connection is closed. */
        NOT_CONNECTED  = 1,
        /** Requested service or characteristic does not exist, or ATT_ERROR_RSP received. */
        NOT_FOUND      = 2,
        /** No reply within timeout. */
        TIMEOUT        = 3,
        /** Socket read or write failure. */
        IO_ERROR       = 4,
        /** Malformed or unexpected reply. */
        PROTOCOL_ERROR = 5
    };
    constexpr uint8_t number(const GattStatus rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const GattStatus v) noexcept;

    /**
     * Primary service declaration handle range,
     * BT Core Spec v5.2: Vol 3, Part G GATT: 4.4.1 Discover All Primary Services.
     */
    struct LHGattService {
        uint16_t start_handle;
        uint16_t end_handle;

        std::string toString() const noexcept;
    };

    /**
     * Characteristic declaration,
     * BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.1 Characteristic Declaration Attribute Value.
     */
    struct LHGattChar {
        /** Characteristic declaration handle */
        uint16_t handle;
        /** Characteristic properties bit field */
        uint8_t properties;
        /** Characteristic value handle, used for reading and writing */
        uint16_t value_handle;

        std::string toString() const noexcept;
    };
    typedef std::shared_ptr<LHGattChar> LHGattCharRef;

    /**
     * One received advertising report of a remote device.
     */
    struct LHAdvertisement {
        BDAddressAndType addressAndType;
        /** Local name, complete or shortened. Empty if none advertised. */
        std::string name;
        int8_t rssi;

        std::string toString() const noexcept;
    };

    /**
     * Live GATT client connection to one remote device.
     *
     * All methods are blocking and report failures via ::GattStatus.
     * Instances are owned exclusively by their LHStation.
     */
    class LHConnection {
        public:
            virtual ~LHConnection() noexcept {}

            virtual const BDAddressAndType& getAddressAndType() const noexcept = 0;

            /**
             * Find the primary service with the given UUID.
             * @param uuid the service UUID
             * @param res the resulting handle range if ::GattStatus::SUCCESS
             */
            virtual GattStatus discoverPrimaryService(const jau::uuid_t& uuid, LHGattService& res) noexcept = 0;

            /**
             * Find the characteristic with the given UUID within the service's handle range.
             * @param service the enclosing service
             * @param uuid the characteristic UUID
             * @param res the resulting declaration if ::GattStatus::SUCCESS
             */
            virtual GattStatus discoverCharacteristic(const LHGattService& service, const jau::uuid_t& uuid, LHGattChar& res) noexcept = 0;

            /**
             * Reads the characteristic value, appending the received bytes to `res`.
             */
            virtual GattStatus readValue(const LHGattChar& c, jau::POctets& res) noexcept = 0;

            /**
             * Writes the characteristic value without response, i.e. ATT Write Command.
             */
            virtual GattStatus writeValueNoResp(const LHGattChar& c, const jau::TROOctets& value) noexcept = 0;

            /**
             * Closes the connection.
             * @return false on transport error, the connection is unusable either way.
             */
            virtual bool disconnect() noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };

    /**
     * Local BLE adapter, producing LHConnection instances and running LE scans.
     */
    class LHRadio {
        public:
            /** Receives each advertising report during LHRadio::scan(). */
            typedef jau::function<void(const LHAdvertisement&)> scan_callback_t;

            /** Utilized to query for external interruption, i.e. whether a scan shall stop. */
            typedef jau::function<bool(int /* dummy*/)> get_boolean_callback_t;

            virtual ~LHRadio() noexcept {}

            /**
             * Brings up the adapter.
             * @return true if the adapter is usable
             */
            virtual bool enable() noexcept = 0;

            /**
             * Connects to the remote device.
             * @return the live connection or nullptr on failure
             */
            virtual std::unique_ptr<LHConnection> connect(const BDAddressAndType& addressAndType) noexcept = 0;

            /**
             * Runs an LE scan, blocking the caller.
             *
             * Implementations check `shall_stop` at least every 100 ms
             * and return once it yields true.
             *
             * @param cb invoked for each advertising report
             * @param shall_stop out-of-band stop query
             * @return true if stopped via `shall_stop`, false if the scan ended due to a transport error
             */
            virtual bool scan(const scan_callback_t& cb, const get_boolean_callback_t& shall_stop) noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };
    typedef std::shared_ptr<LHRadio> LHRadioRef;

} // namespace lhpower

#endif /* LHPOWER_RADIO_HPP_ */
