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
#include <cinttypes>
#include <string>
#include <memory>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "LHStationManager.hpp"
#include "LHTaskGroup.hpp"
#include "LHConst.hpp"

using namespace lhpower;

LHStationManager::LHStationManager(const LHRadioRef& radio_, const LHTiming& timing_) noexcept
: radio(radio_), timing(timing_),
  registry(std::make_shared<LHSessionRegistry>()),
  scanner(radio_),
  scanning(false)
{
    DBG_PRINT("LHStationManager::ctor: %s, %s", radio->toString().c_str(), timing.toString().c_str());
}

LHStationManager::~LHStationManager() noexcept {
    shutdown();
}

void LHStationManager::initialize() {
    if( !radio->enable() ) {
        throw ConnectionException("Could not enable Bluetooth adapter: "+radio->toString(), E_FILE_LINE);
    }
    WORDY_PRINT("LHStationManager::initialize: %s", radio->toString().c_str());
}

jau::darray<LHStationRef> LHStationManager::getStations() const noexcept {
    jau::darray<LHStationRef> res;
    const std::lock_guard<std::mutex> lock(mtx_stations); // RAII-style acquire and relinquish via destructor
    for(const auto& entry : stations) {
        res.push_back(entry.second);
    }
    return res;
}

LHStationRef LHStationManager::getStation(const std::string& address) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_stations); // RAII-style acquire and relinquish via destructor
    auto it = stations.find(address);
    return stations.end() != it ? it->second : nullptr;
}

LHStationRef LHStationManager::findStation(const std::string& address) const {
    LHStationRef s = getStation(address);
    if( nullptr == s ) {
        throw NotFoundException("Station with address "+address+" not found", E_FILE_LINE);
    }
    return s;
}

size_t LHStationManager::getStationCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_stations); // RAII-style acquire and relinquish via destructor
    return stations.size();
}

jau::darray<StationInfo> LHStationManager::scanAndMerge() {
    bool expScanning = false; // C++11, exp as value since C++20
    if( !scanning.compare_exchange_strong(expScanning, true) ) {
        throw AlreadyScanningException("Scan already in progress", E_FILE_LINE);
    }
    try {
        jau::darray<StationInfo> res = scanAndMergeImpl();
        scanning = false;
        return res;
    } catch (...) {
        scanning = false;
        throw;
    }
}

jau::darray<StationInfo> LHStationManager::scanAndMergeImpl() {
    jau::sleep_for( timing.scan_settle );

    const jau::darray<LHAdvertisement> found = scanner.scanForDuration(timing.scan_window);

    jau::darray<LHStationRef> toFetch;
    jau::darray<std::pair<LHStationRef, std::string>> known;
    {
        const std::lock_guard<std::mutex> lock(mtx_stations); // RAII-style acquire and relinquish via destructor
        for(const LHAdvertisement& adv : found) {
            const std::string key = adv.addressAndType.address.toString();
            auto it = stations.find(key);
            if( stations.end() != it ) {
                known.push_back( std::make_pair(it->second, adv.name) );
            } else {
                LHStationRef s = LHStation::make_shared(radio, registry, timing, adv.addressAndType, adv.name);
                stations[key] = s;
                toFetch.push_back(s);
                WORDY_PRINT("LHStationManager::scanAndMerge: New %s", s->toString().c_str());
            }
        }
    }
    // station locks outside of the map lock
    for(auto& k : known) {
        k.first->setName(k.second);
        if( !k.first->isConnected() ) {
            toFetch.push_back(k.first);
        }
    }
    DBG_PRINT("LHStationManager::scanAndMerge: found %zu, new %zu, fetching %zu",
              (size_t)found.size(), (size_t)(found.size()-known.size()), (size_t)toFetch.size());

    if( 0 < toFetch.size() ) {
        LHTaskGroup group("fetch");
        jau::for_each_fidelity(toFetch, [&group](LHStationRef& s) {
            group.spawn(s->getAddressString(), [s]() { s->fetchInitialPowerState(); });
        });
        if( !group.waitFor(timing.fetch_deadline) ) {
            WARN_PRINT("LHStationManager::scanAndMerge: Timed out waiting for state fetches: %s", group.toString().c_str());
        }
    }
    return snapshot();
}

jau::darray<StationInfo> LHStationManager::checkAllStatuses() {
    const jau::darray<LHStationRef> all = getStations();
    if( 0 == all.size() ) {
        return snapshot();
    }
    LHTaskGroup group("status");
    for(const LHStationRef& s : all) {
        if( s->isConnected() ) {
            group.spawn(s->getAddressString(), [s]() { s->readPowerState(); });
        } else {
            group.spawn(s->getAddressString(), [s]() { s->fetchInitialPowerState(); });
        }
    }
    if( !group.waitFor(timing.status_deadline) ) {
        WARN_PRINT("LHStationManager::checkAllStatuses: Timed out waiting for status checks: %s", group.toString().c_str());
    }
    return snapshot();
}

void LHStationManager::powerOnStation(const std::string& address) {
    findStation(address)->setPowerState(PowerState::ON);
}

void LHStationManager::powerOffStation(const std::string& address) {
    findStation(address)->setPowerState(PowerState::OFF);
}

void LHStationManager::powerAll(const PowerState target, const std::string& operation) {
    const jau::darray<LHStationRef> all = getStations();
    LHTaskGroup group(operation);
    for(const LHStationRef& s : all) {
        group.spawn(s->getAddressString(), [s, target]() { s->setPowerState(target); });
    }
    group.waitAll();
    const jau::nsize_t errors = group.failed();
    if( 0 < errors ) {
        throw AggregateException(errors, operation, E_FILE_LINE);
    }
}

void LHStationManager::powerOnAll() {
    powerAll(PowerState::ON, "PowerOnAllStations");
}

void LHStationManager::powerOffAll() {
    powerAll(PowerState::OFF, "PowerOffAllStations");
}

jau::darray<StationInfo> LHStationManager::snapshot() const noexcept {
    const jau::darray<LHStationRef> all = getStations();
    jau::darray<StationInfo> res;
    for(const LHStationRef& s : all) {
        StationInfo info = s->getStationInfo();
        const std::string displayName = getDisplayName(info.originalName);
        if( 0 < displayName.size() ) {
            info.name = displayName;
        }
        res.push_back(info);
    }
    return res;
}

void LHStationManager::renameStation(const std::string& originalName, const std::string& newName) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_renamed); // RAII-style acquire and relinquish via destructor
    if( 0 == newName.size() ) {
        renamedStations.erase(originalName);
        WORDY_PRINT("LHStationManager::renameStation: '%s' reset", originalName.c_str());
    } else {
        renamedStations[originalName] = newName;
        WORDY_PRINT("LHStationManager::renameStation: '%s' -> '%s'", originalName.c_str(), newName.c_str());
    }
}

std::string LHStationManager::getDisplayName(const std::string& originalName) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_renamed); // RAII-style acquire and relinquish via destructor
    auto it = renamedStations.find(originalName);
    return renamedStations.end() != it ? it->second : std::string();
}

void LHStationManager::disconnectAll() noexcept {
    registry->disconnectAll();
}

void LHStationManager::shutdown() noexcept {
    DBG_PRINT("LHStationManager::shutdown: %s", registry->toString().c_str());
    disconnectAll();
}

std::string LHStationManager::toString() const noexcept {
    return "StationManager[stations "+std::to_string(getStationCount())+", scanning "+std::to_string(isScanning())+
           ", "+registry->toString()+", "+radio->toString()+"]";
}
