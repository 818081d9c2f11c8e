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

#ifndef LHPOWER_STATION_HPP_
#define LHPOWER_STATION_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <mutex>

#include <jau/basic_types.hpp>
#include <jau/uuid.hpp>

#include "LHTypes.hpp"
#include "LHEnv.hpp"
#include "LHRadio.hpp"
#include "LHSessionRegistry.hpp"

namespace lhpower {

    /**
     * One Lighthouse base station and its GATT session.
     *
     * The station owns its LHConnection and the discovered power control LHGattChar.
     * Both are present while connected and cleared together,
     * i.e. isConnected() holds if and only if both exist.
     *
     * All operations acquire the station's operation lock for their full duration,
     * concurrent callers on the same station are serialized.
     * The field getters only acquire the station's data lock, held briefly while fields are
     * copied or updated, hence they never wait for network I/O.
     *
     * A station registers itself to its LHSessionRegistry once connected
     * and removes itself when disconnected.
     */
    class LHStation : public std::enable_shared_from_this<LHStation> {
        private:
            /** Private class only for private make_shared(). */
            class ctor_cookie { friend LHStation; ctor_cookie(const uint16_t secret) { (void)secret; } };

            const LHRadioRef radio;
            const std::shared_ptr<LHSessionRegistry> registry;
            const LHTiming timing;
            const BDAddressAndType addressAndType;
            const std::string addressString;

            /** Operation lock, held for the full duration of each operation. */
            std::recursive_mutex mtx_operation;
            /** Data lock, guarding the fields below. Acquired after mtx_operation. */
            mutable std::mutex mtx_data;
            std::string name;
            PowerState powerState;
            uint64_t ts_last_update;
            bool has_connection;
            bool has_control_char;

            /** Guarded by mtx_operation, mirrored to has_connection. */
            std::unique_ptr<LHConnection> connection;
            /** Guarded by mtx_operation, mirrored to has_control_char. */
            LHGattCharRef controlChar;

            void setPowerStateImpl(const PowerState v) noexcept;
            void syncHandlesImpl() noexcept;
            void connectAndDiscoverImpl();
            void readPowerStateImpl();
            void disconnectImpl() noexcept;

        public:
            /**
             * Creates a new disconnected station in ::PowerState::UNKNOWN.
             * @param radio the transport used for connecting
             * @param registry the session registry this station joins while connected, must not be nullptr
             * @param timing protocol pacing
             * @param addressAndType the station's unique address
             * @param name the advertised name
             */
            static std::shared_ptr<LHStation> make_shared(const LHRadioRef& radio, const std::shared_ptr<LHSessionRegistry>& registry,
                                                          const LHTiming& timing, const BDAddressAndType& addressAndType, const std::string& name) {
                return std::make_shared<LHStation>(LHStation::ctor_cookie(0), radio, registry, timing, addressAndType, name);
            }

            /** Private ctor for LHStation::make_shared(). */
            LHStation(const LHStation::ctor_cookie& cc, const LHRadioRef& radio_, const std::shared_ptr<LHSessionRegistry>& registry_,
                      const LHTiming& timing_, const BDAddressAndType& addressAndType_, const std::string& name_) noexcept;

            LHStation(const LHStation&) = delete;
            void operator=(const LHStation&) = delete;

            /** Disconnects the station, see disconnect(). */
            ~LHStation() noexcept;

            const BDAddressAndType& getAddressAndType() const noexcept { return addressAndType; }

            /** Returns the EUI48 address string, the station's unique key. */
            const std::string& getAddressString() const noexcept { return addressString; }

            std::string getName() const noexcept;

            /** Updates the advertised name, e.g. after a rescan. */
            void setName(const std::string& n) noexcept;

            PowerState getPowerState() const noexcept;

            /**
             * Returns the monotonic timestamp in milliseconds of the last power state update,
             * 0 if never updated.
             * @see jau::getCurrentMilliseconds()
             */
            uint64_t getLastStateUpdate() const noexcept;

            /** Returns true if both connection and power control characteristic are present. */
            bool isConnected() const noexcept;

            /** Returns true if the connection handle is present. */
            bool hasConnection() const noexcept;

            /** Returns true if the power control characteristic handle is present. */
            bool hasControlChar() const noexcept;

            /**
             * Connects if required and discovers the power control characteristic if required.
             *
             * Discovery is attempted LHTiming::discovery_attempts times,
             * pausing LHTiming::retry_backoff in between.
             *
             * @throws ConnectionException if the connection could not be established
             * @throws DiscoveryException if service or characteristic could not be discovered, the station is disconnected
             */
            void connectAndDiscover();

            /**
             * Reads the power control byte, zero maps to ::PowerState::OFF, any other value to ::PowerState::ON.
             *
             * @throws ReadException if not connected, on transport error or wrong byte count.
             *         The latter two set ::PowerState::UNKNOWN.
             */
            void readPowerState();

            /**
             * connectAndDiscover() and readPowerState() under one lock acquisition.
             */
            void fetchInitialPowerState();

            /**
             * Writes the power command, attempted LHTiming::write_attempts times
             * with a reconnect in between, pausing LHTiming::retry_backoff.
             *
             * On success the power state is set to `target`, then reconciled by a best effort
             * readPowerState() after LHTiming::write_settle.
             *
             * @param target either ::PowerState::OFF or ::PowerState::ON
             * @throws WriteException if the command could not be written
             * @throws jau::IllegalArgumentException if `target` is ::PowerState::UNKNOWN
             */
            void setPowerState(const PowerState target);

            void powerOn() { setPowerState(PowerState::ON); }

            void powerOff() { setPowerState(PowerState::OFF); }

            /**
             * Closes the connection if any, clears both handles,
             * sets ::PowerState::UNKNOWN and leaves the session registry.
             *
             * No-op if not connected.
             */
            void disconnect() noexcept;

            /** Returns the summary with `name` and `originalName` both the advertised name. */
            StationInfo getStationInfo() const noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<LHStation> LHStationRef;

} // namespace lhpower

#endif /* LHPOWER_STATION_HPP_ */
