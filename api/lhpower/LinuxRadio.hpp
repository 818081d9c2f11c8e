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

#ifndef LHPOWER_LINUX_RADIO_HPP_
#define LHPOWER_LINUX_RADIO_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <memory>
#include <mutex>

#include <jau/basic_types.hpp>
#include <jau/octets.hpp>

#include "LHConst.hpp"
#include "LHRadio.hpp"
#include "LHEnv.hpp"
#include "HCIComm.hpp"
#include "L2CAPComm.hpp"
#include "AttPDU.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module LinuxRadio:
 *
 * LHRadio implementation on top of the Linux kernel Bluetooth sockets,
 * a raw HCI channel for adapter queries and LE scanning
 * and an L2CAP ATT channel per connection for the GATT client procedures.
 */
namespace lhpower {

    /**
     * GATT client on one L2CAP ATT channel.
     * <p>
     * Requests are strictly sequential, one outstanding request at a time,
     * BT Core Spec v5.2: Vol 3, Part F ATT: 3.3.2 Sequential protocol.
     * </p>
     */
    class LinuxConnection : public LHConnection {
        private:
            /** BT Core Spec v5.2: Vol 3, Part G GATT: 3.4 Summary of GATT Profile Attribute Types */
            static const jau::uuid16_t PRIMARY_SERVICE;
            static const jau::uuid16_t CHARACTERISTIC;

            const LHEnv & env;
            L2CAPComm l2cap;
            std::recursive_mutex mtx_request;
            jau::POctets rbuffer;

            bool send(const AttPDUMsg & msg) noexcept;

            /**
             * Sends the request and returns the specialized reply,
             * skipping unsolicited notifications, confirming indications
             * and rejecting requests of the peer.
             * <p>
             * A reply timeout closes the ATT channel, returning ::GattStatus::TIMEOUT.
             * Subsequent requests yield ::GattStatus::NOT_CONNECTED.
             * </p>
             */
            std::unique_ptr<const AttPDUMsg> sendWithReply(const AttPDUMsg & msg, GattStatus & status) noexcept;

            void replyTimeout(const AttPDUMsg & msg, GattStatus & status) noexcept;

            /** Answers a request of the peer with ATT_ERROR_RSP, commands are dropped. */
            bool replyPeerRequest(const AttPDUMsg & req) noexcept;

            static GattStatus toGattStatus(const AttErrorRsp & err) noexcept;

        public:
            LinuxConnection(const uint16_t dev_id, const BDAddressAndType& localAddressAndType, const BDAddressAndType& remoteAddressAndType) noexcept;

            LinuxConnection(const LinuxConnection&) = delete;
            void operator=(const LinuxConnection&) = delete;

            ~LinuxConnection() noexcept override { disconnect(); }

            /** Connects the ATT channel, blocking. */
            bool open() noexcept { return l2cap.open(); }

            const BDAddressAndType& getAddressAndType() const noexcept override { return l2cap.getRemoteAddressAndType(); }

            GattStatus discoverPrimaryService(const jau::uuid_t& uuid, LHGattService& res) noexcept override;

            GattStatus discoverCharacteristic(const LHGattService& service, const jau::uuid_t& uuid, LHGattChar& res) noexcept override;

            GattStatus readValue(const LHGattChar& c, jau::POctets& res) noexcept override;

            GattStatus writeValueNoResp(const LHGattChar& c, const jau::TROOctets& value) noexcept override;

            bool disconnect() noexcept override;

            std::string toString() const noexcept override;
    };

    /**
     * LHRadio on the local adapter `hci<dev_id>`, see LHEnv::HCI_DEV_ID.
     * <p>
     * Requires the `CAP_NET_RAW` and `CAP_NET_ADMIN` capabilities for the raw HCI channel.
     * </p>
     */
    class LinuxRadio : public LHRadio {
        public:
            /** HCI Command opcodes, BT Core Spec v5.2: Vol 4, Part E, 7.4 and 7.8 */
            enum class HCIOpcode : uint16_t {
                READ_BD_ADDR            = 0x1009,
                LE_SET_SCAN_PARAM       = 0x200B,
                LE_SET_SCAN_ENABLE      = 0x200C
            };
            static constexpr uint16_t number(const HCIOpcode rhs) noexcept {
                return static_cast<uint16_t>(rhs);
            }
            static std::string getHCIOpcodeString(const HCIOpcode op) noexcept;

            /** HCI Event codes, BT Core Spec v5.2: Vol 4, Part E, 7.7 */
            static constexpr const uint8_t EVT_CMD_COMPLETE = 0x0E;
            static constexpr const uint8_t EVT_CMD_STATUS   = 0x0F;
            static constexpr const uint8_t EVT_LE_META      = 0x3E;
            static constexpr const uint8_t LE_ADVERTISING_REPORT = 0x02;

            /** HCI read poll period, bounding the reaction time to a scan stop request. */
            static constexpr const jau::fraction_i64 POLL_PERIOD = 100_ms;

        private:
            const LHEnv & env;
            const uint16_t dev_id;
            mutable std::mutex mtx_hci;
            std::unique_ptr<HCIComm> comm;
            BDAddressAndType localAddressAndType;
            jau::POctets rbuffer;

            /**
             * Sends the HCI command and waits for its Command Complete or Command Status event.
             * @param op the command
             * @param param command parameter, may be empty
             * @param ret receives the return parameter excluding status, if any
             * @return HCI status code, or -1 on transport error or timeout
             */
            int sendCommand(const HCIOpcode op, const jau::TROOctets & param, jau::POctets * ret) noexcept;

            bool setScanEnabled(const bool enable) noexcept;

            /** Requires mtx_hci being held. */
            std::string toStringImpl() const noexcept;

        public:
            LinuxRadio() noexcept;

            LinuxRadio(const LinuxRadio&) = delete;
            void operator=(const LinuxRadio&) = delete;

            ~LinuxRadio() noexcept override;

            const BDAddressAndType& getAddressAndType() const noexcept { return localAddressAndType; }

            bool enable() noexcept override;

            std::unique_ptr<LHConnection> connect(const BDAddressAndType& addressAndType) noexcept override;

            bool scan(const scan_callback_t& cb, const get_boolean_callback_t& shall_stop) noexcept override;

            std::string toString() const noexcept override;
    };

} // namespace lhpower

#endif /* LHPOWER_LINUX_RADIO_HPP_ */
