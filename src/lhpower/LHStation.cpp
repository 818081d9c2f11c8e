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
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>

#include "LHStation.hpp"
#include "LHConst.hpp"

using namespace lhpower;

static const jau::uuid128_t& powerServiceUUID() noexcept {
    static const jau::uuid128_t uuid(POWER_SERVICE_UUID);
    return uuid;
}

static const jau::uuid128_t& powerCharUUID() noexcept {
    static const jau::uuid128_t uuid(POWER_CHAR_UUID);
    return uuid;
}

LHStation::LHStation(const LHStation::ctor_cookie& cc, const LHRadioRef& radio_, const std::shared_ptr<LHSessionRegistry>& registry_,
                     const LHTiming& timing_, const BDAddressAndType& addressAndType_, const std::string& name_) noexcept
: radio(radio_), registry(registry_), timing(timing_),
  addressAndType(addressAndType_), addressString(addressAndType_.address.toString()),
  name(name_), powerState(PowerState::UNKNOWN), ts_last_update(0),
  has_connection(false), has_control_char(false),
  connection(nullptr), controlChar(nullptr)
{
    (void)cc;
}

LHStation::~LHStation() noexcept {
    DBG_PRINT("LHStation::dtor: %s", addressString.c_str());
    disconnect();
}

std::string LHStation::getName() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    return name;
}

void LHStation::setName(const std::string& n) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    if( name != n ) {
        WORDY_PRINT("LHStation::setName: %s: '%s' -> '%s'", addressString.c_str(), name.c_str(), n.c_str());
        name = n;
    }
}

PowerState LHStation::getPowerState() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    return powerState;
}

uint64_t LHStation::getLastStateUpdate() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    return ts_last_update;
}

bool LHStation::isConnected() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    return has_connection && has_control_char;
}

bool LHStation::hasConnection() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    return has_connection;
}

bool LHStation::hasControlChar() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    return has_control_char;
}

void LHStation::setPowerStateImpl(const PowerState v) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    powerState = v;
    ts_last_update = jau::getCurrentMilliseconds();
}

void LHStation::syncHandlesImpl() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    has_connection = nullptr != connection;
    has_control_char = nullptr != controlChar;
}

void LHStation::connectAndDiscoverImpl() {
    if( nullptr != connection && nullptr != controlChar ) {
        return; // already good
    }
    if( nullptr == connection ) {
        DBG_PRINT("LHStation::connect: Start %s", toString().c_str());
        connection = radio->connect(addressAndType);
        if( nullptr == connection ) {
            controlChar = nullptr;
            syncHandlesImpl();
            setPowerStateImpl(PowerState::UNKNOWN);
            throw ConnectionException("Connection failed: "+addressString+", '"+getName()+"'", E_FILE_LINE);
        }
        syncHandlesImpl();
        WORDY_PRINT("LHStation::connect: Connected %s", connection->toString().c_str());
        registry->add(shared_from_this());
    }
    if( nullptr == controlChar ) {
        GattStatus res = GattStatus::NOT_FOUND;
        LHGattChar c { 0, 0, 0 };
        for(int32_t i=0; i<timing.discovery_attempts; ++i) {
            if( 0 < i ) {
                WORDY_PRINT("LHStation::discover: Retry %d/%d after %s: %s",
                            i+1, timing.discovery_attempts, to_string(res).c_str(), addressString.c_str());
                jau::sleep_for( timing.retry_backoff );
            }
            LHGattService s { 0, 0 };
            res = connection->discoverPrimaryService(powerServiceUUID(), s);
            if( GattStatus::SUCCESS != res ) {
                continue;
            }
            res = connection->discoverCharacteristic(s, powerCharUUID(), c);
            if( GattStatus::SUCCESS != res ) {
                continue;
            }
            break;
        }
        if( GattStatus::SUCCESS != res ) {
            disconnectImpl();
            throw DiscoveryException("Power control discovery failed after "+std::to_string(timing.discovery_attempts)+
                                     " attempts: "+to_string(res)+", "+addressString+", '"+getName()+"'", E_FILE_LINE);
        }
        controlChar = std::make_shared<LHGattChar>(c);
        syncHandlesImpl();
        DBG_PRINT("LHStation::discover: %s: %s", addressString.c_str(), controlChar->toString().c_str());
    }
}

void LHStation::connectAndDiscover() {
    const std::lock_guard<std::recursive_mutex> lock(mtx_operation); // RAII-style acquire and relinquish via destructor
    connectAndDiscoverImpl();
}

void LHStation::readPowerStateImpl() {
    if( nullptr == connection || nullptr == controlChar ) {
        throw ReadException("Not connected: "+addressString+", '"+getName()+"'", E_FILE_LINE);
    }
    jau::POctets value(8, 0, jau::lb_endian_t::little);
    const GattStatus res = connection->readValue(*controlChar, value);
    if( GattStatus::SUCCESS != res ) {
        // session unusable, next fetch reconnects
        disconnectImpl();
        throw ReadException("Read failed: "+to_string(res)+", "+addressString+", '"+getName()+"'", E_FILE_LINE);
    }
    if( 1 != value.size() ) {
        setPowerStateImpl(PowerState::UNKNOWN);
        throw ReadException("Read "+std::to_string(value.size())+" bytes, expected 1: "+addressString+", '"+getName()+"'", E_FILE_LINE);
    }
    const uint8_t v = value.get_uint8_nc(0);
    const PowerState newState = to_PowerState(v);
    if( 1 < v ) {
        DBG_PRINT("LHStation::readPowerState: %s: value %s treated as ON", addressString.c_str(), jau::to_hexstring(v).c_str());
    }
    const PowerState oldState = getPowerState();
    if( oldState != newState ) {
        WORDY_PRINT("LHStation::readPowerState: %s, '%s': %s -> %s", addressString.c_str(), getName().c_str(),
                    to_string(oldState).c_str(), to_string(newState).c_str());
    }
    setPowerStateImpl(newState);
}

void LHStation::readPowerState() {
    const std::lock_guard<std::recursive_mutex> lock(mtx_operation); // RAII-style acquire and relinquish via destructor
    readPowerStateImpl();
}

void LHStation::fetchInitialPowerState() {
    const std::lock_guard<std::recursive_mutex> lock(mtx_operation); // RAII-style acquire and relinquish via destructor
    connectAndDiscoverImpl();
    readPowerStateImpl();
    DBG_PRINT("LHStation::fetchInitialPowerState: %s", toString().c_str());
}

void LHStation::setPowerState(const PowerState target) {
    if( PowerState::UNKNOWN == target ) {
        throw jau::IllegalArgumentException("Target power state must be OFF or ON: "+addressString, E_FILE_LINE);
    }
    const std::lock_guard<std::recursive_mutex> lock(mtx_operation); // RAII-style acquire and relinquish via destructor
    const uint8_t cmd = to_command(target);
    const jau::TROOctets cmd_data(&cmd, 1, jau::lb_endian_t::little);

    std::string last_error;
    bool written = false;
    for(int32_t i=0; i<timing.write_attempts && !written; ++i) {
        const bool last_attempt = i == timing.write_attempts-1;
        try {
            connectAndDiscoverImpl();
        } catch (LHException &e) {
            last_error = e.message();
            WARN_PRINT("LHStation::setPowerState(%s): connect/discover failed, attempt %d/%d: %s",
                       to_string(target).c_str(), i+1, timing.write_attempts, last_error.c_str());
            if( !last_attempt ) {
                disconnectImpl();
                jau::sleep_for( timing.retry_backoff );
            }
            continue;
        }
        DBG_PRINT("LHStation::setPowerState(%s): Write %s to %s",
                  to_string(target).c_str(), jau::to_hexstring(cmd).c_str(), addressString.c_str());
        const GattStatus res = connection->writeValueNoResp(*controlChar, cmd_data);
        if( GattStatus::SUCCESS == res ) {
            written = true;
        } else {
            last_error = "Write failed: "+to_string(res);
            WARN_PRINT("LHStation::setPowerState(%s): write failed, attempt %d/%d: %s: %s",
                       to_string(target).c_str(), i+1, timing.write_attempts, to_string(res).c_str(), addressString.c_str());
            disconnectImpl();
            if( !last_attempt ) {
                jau::sleep_for( timing.retry_backoff );
            }
        }
    }
    if( !written ) {
        throw WriteException("Power "+to_string(target)+" not written after "+std::to_string(timing.write_attempts)+
                             " attempts: "+addressString+", '"+getName()+"': "+last_error, E_FILE_LINE);
    }
    setPowerStateImpl(target);

    jau::sleep_for( timing.write_settle );
    try {
        readPowerStateImpl();
    } catch (ReadException &e) {
        WARN_PRINT("LHStation::setPowerState(%s): read back failed, state may be stale: %s",
                   to_string(target).c_str(), e.message().c_str());
    }
}

void LHStation::disconnectImpl() noexcept {
    if( nullptr == connection ) {
        controlChar = nullptr; // should be redundant
        syncHandlesImpl();
        return;
    }
    DBG_PRINT("LHStation::disconnect: %s", connection->toString().c_str());
    if( !connection->disconnect() ) {
        WARN_PRINT("LHStation::disconnect: close failed, ignored: %s", addressString.c_str());
    }
    connection = nullptr;
    controlChar = nullptr;
    syncHandlesImpl();
    setPowerStateImpl(PowerState::UNKNOWN);
    registry->remove(addressString);
}

void LHStation::disconnect() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_operation); // RAII-style acquire and relinquish via destructor
    disconnectImpl();
}

StationInfo LHStation::getStationInfo() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    return StationInfo { name, name, addressString, powerState };
}

std::string LHStation::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_data); // RAII-style acquire and relinquish via destructor
    return "Station["+addressAndType.toString()+", '"+name+"', power "+to_string(powerState)+
           ", connected[conn "+std::to_string(has_connection)+", char "+std::to_string(has_control_char)+"]]";
}
