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

#ifndef LHPOWER_TYPES_HPP_
#define LHPOWER_TYPES_HPP_

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/basic_types.hpp>

#include "LHConst.hpp"

namespace lhpower {

    class LHException : public jau::RuntimeException {
        protected:
            LHException(std::string const type, std::string const m, const char* file, int line) noexcept
            : RuntimeException(type, m, file, line) {}

        public:
            LHException(std::string const m, const char* file, int line) noexcept
            : RuntimeException("LHException", m, file, line) {}
    };

    /** Radio connection to a station could not be established, or the adapter could not be enabled. */
    class ConnectionException : public LHException {
        public:
            ConnectionException(std::string const m, const char* file, int line) noexcept
            : LHException("ConnectionException", m, file, line) {}
    };

    /** Power control service or characteristic not found after all discovery attempts. */
    class DiscoveryException : public LHException {
        public:
            DiscoveryException(std::string const m, const char* file, int line) noexcept
            : LHException("DiscoveryException", m, file, line) {}
    };

    /** Power state read failed: not connected, transport error or wrong byte count. */
    class ReadException : public LHException {
        public:
            ReadException(std::string const m, const char* file, int line) noexcept
            : LHException("ReadException", m, file, line) {}
    };

    /** Power command could not be written after all attempts. */
    class WriteException : public LHException {
        public:
            WriteException(std::string const m, const char* file, int line) noexcept
            : LHException("WriteException", m, file, line) {}
    };

    /** Scan ended with a transport error and no station found. */
    class ScanException : public LHException {
        public:
            ScanException(std::string const m, const char* file, int line) noexcept
            : LHException("ScanException", m, file, line) {}
    };

    class AlreadyScanningException : public LHException {
        public:
            AlreadyScanningException(std::string const m, const char* file, int line) noexcept
            : LHException("AlreadyScanningException", m, file, line) {}
    };

    /** No station known for the given address. */
    class NotFoundException : public LHException {
        public:
            NotFoundException(std::string const m, const char* file, int line) noexcept
            : LHException("NotFoundException", m, file, line) {}
    };

    /**
     * Bulk operation failure, only carrying the number of failed stations.
     */
    class AggregateException : public LHException {
        private:
            jau::nsize_t error_count;

        public:
            AggregateException(const jau::nsize_t error_count_, std::string const operation, const char* file, int line) noexcept
            : LHException("AggregateException",
                          "encountered "+std::to_string(error_count_)+" error(s) during "+operation, file, line),
              error_count(error_count_) {}

            jau::nsize_t errorCount() const noexcept { return error_count; }
    };

    /**
     * Last known power state of a station.
     *
     * ::PowerState::UNKNOWN is the initial value
     * and the value after any failed attempt to determine the state.
     */
    enum class PowerState : int8_t {
        UNKNOWN = -1,
        OFF     =  0,
        ON      =  1
    };
    constexpr int8_t number(const PowerState rhs) noexcept {
        return static_cast<int8_t>(rhs);
    }
    std::string to_string(const PowerState v) noexcept;

    /** Maps a read control byte to ::PowerState, zero is OFF and any other value ON. */
    constexpr PowerState to_PowerState(const uint8_t v) noexcept {
        return 0 == v ? PowerState::OFF : PowerState::ON;
    }

    /** Maps ::PowerState::OFF and ::PowerState::ON to its command byte. */
    constexpr uint8_t to_command(const PowerState v) noexcept {
        return PowerState::ON == v ? POWER_CMD_ON : POWER_CMD_OFF;
    }

    /**
     * Externally visible station summary as returned by LHStationManager::snapshot().
     */
    struct StationInfo {
        /** Display name, i.e. the rename override if any, otherwise the advertised name. */
        std::string name;
        /** Advertised name. */
        std::string originalName;
        /** EUI48 address string, the station's key. */
        std::string address;
        PowerState powerState;

        std::string toString() const noexcept;
    };

} // namespace lhpower

#endif /* LHPOWER_TYPES_HPP_ */
