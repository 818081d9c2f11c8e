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

#ifndef LHPOWER_STATION_MANAGER_HPP_
#define LHPOWER_STATION_MANAGER_HPP_

#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/ordered_atomic.hpp>

#include "LHTypes.hpp"
#include "LHEnv.hpp"
#include "LHRadio.hpp"
#include "LHSessionRegistry.hpp"
#include "LHScanner.hpp"
#include "LHStation.hpp"

namespace lhpower {

    /**
     * Owns all known stations keyed by address and runs the bulk operations on them.
     *
     * Stations are created by scanAndMerge() and kept for the lifetime of this instance.
     * The station map lock only guards insertion, lookup and iteration,
     * station fields are accessed through the LHStation's own locks.
     *
     * Bulk operations fan out via LHTaskGroup. Soft deadlines bound the caller's wait only,
     * tasks still running after the deadline are not cancelled and will update their station later.
     */
    class LHStationManager {
        private:
            const LHRadioRef radio;
            const LHTiming timing;
            const std::shared_ptr<LHSessionRegistry> registry;
            LHScanner scanner;

            mutable std::mutex mtx_stations;
            std::unordered_map<std::string, LHStationRef> stations;

            jau::sc_atomic_bool scanning;

            mutable std::mutex mtx_renamed;
            /** Display name overrides, keyed by the advertised name. */
            std::unordered_map<std::string, std::string> renamedStations;

            jau::darray<LHStationRef> getStations() const noexcept;
            LHStationRef findStation(const std::string& address) const;
            jau::darray<StationInfo> scanAndMergeImpl();
            void powerAll(const PowerState target, const std::string& operation);

        public:
            /**
             * @param radio_ the transport
             * @param timing_ protocol pacing, defaults to LHTiming::fromEnv()
             */
            LHStationManager(const LHRadioRef& radio_, const LHTiming& timing_ = LHTiming::fromEnv()) noexcept;

            LHStationManager(const LHStationManager&) = delete;
            void operator=(const LHStationManager&) = delete;

            /** Calls shutdown(). */
            ~LHStationManager() noexcept;

            /**
             * Enables the radio.
             * @throws ConnectionException if the adapter could not be enabled
             */
            void initialize();

            /**
             * Scans for base stations and merges them into the station map.
             *
             * Pauses LHTiming::scan_settle, scans for LHTiming::scan_window,
             * then fetches the initial power state of all new and all not connected known stations concurrently,
             * waiting at most LHTiming::fetch_deadline.
             *
             * @return snapshot() of all known stations
             * @throws AlreadyScanningException if a scan is already running
             * @throws ScanException if the scan failed without any result
             */
            jau::darray<StationInfo> scanAndMerge();

            /** Returns true while scanAndMerge() is running. */
            bool isScanning() const noexcept { return scanning; }

            /**
             * Reads the power state of connected stations and fetches it for all others,
             * concurrently, waiting at most LHTiming::status_deadline.
             *
             * @return snapshot() of all known stations
             */
            jau::darray<StationInfo> checkAllStatuses();

            /**
             * @throws NotFoundException if the address is unknown
             * @throws WriteException if the command could not be written
             */
            void powerOnStation(const std::string& address);

            /**
             * @throws NotFoundException if the address is unknown
             * @throws WriteException if the command could not be written
             */
            void powerOffStation(const std::string& address);

            /**
             * Powers on all known stations concurrently, waiting for all to complete.
             * @throws AggregateException carrying the number of failed stations, if any
             */
            void powerOnAll();

            /**
             * Powers off all known stations concurrently, waiting for all to complete.
             * @throws AggregateException carrying the number of failed stations, if any
             */
            void powerOffAll();

            /**
             * Returns the summary of all known stations, not waiting for any network I/O.
             *
             * StationInfo::name carries the display name override if any.
             */
            jau::darray<StationInfo> snapshot() const noexcept;

            /**
             * Sets the display name override for the station advertising `originalName`.
             * @param originalName the advertised name
             * @param newName the display name, an empty string removes the override
             */
            void renameStation(const std::string& originalName, const std::string& newName) noexcept;

            /** Returns the display name override for the advertised name, or an empty string. */
            std::string getDisplayName(const std::string& originalName) const noexcept;

            /** Returns the known station or nullptr. */
            LHStationRef getStation(const std::string& address) const noexcept;

            size_t getStationCount() const noexcept;

            const std::shared_ptr<LHSessionRegistry>& getSessionRegistry() const noexcept { return registry; }

            /** Disconnects all connected stations via the session registry. */
            void disconnectAll() noexcept;

            /** Disconnects all stations, the instance stays usable. */
            void shutdown() noexcept;

            std::string toString() const noexcept;
    };

} // namespace lhpower

#endif /* LHPOWER_STATION_MANAGER_HPP_ */
