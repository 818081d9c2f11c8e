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

#ifndef LHPOWER_L2CAP_COMM_HPP_
#define LHPOWER_L2CAP_COMM_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <mutex>
#include <atomic>

#include <jau/basic_types.hpp>
#include <jau/fraction_type.hpp>
#include <jau/ordered_atomic.hpp>

#include "LHAddress.hpp"
#include "LHIoctl.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module L2CAPComm:
 *
 * - BT Core Spec v5.2: Vol 3, Part A: BT Logical Link Control and Adaption Protocol (L2CAP)
 */
namespace lhpower {

    /**
     * L2CAP client socket on the fixed ATT channel of an LE link.
     *
     * Connecting the socket lets the kernel create the LE link itself,
     * closing it tears the link down once no other user holds it.
     */
    class L2CAPComm {
        public:
            /**
             * Exit code for read() and write() operations
             */
            enum class RWExitCode : jau::snsize_t {
                SUCCESS             =  0, /**< SUCCESS */
                NOT_OPEN            = -1, /**< NOT_OPEN */
                INTERRUPTED         = -2, /**< INTERRUPTED */
                INVALID_SOCKET_DD   = -3, /**< INVALID_SOCKET_DD */
                POLL_ERROR          = -10,/**< POLL_ERROR */
                POLL_TIMEOUT        = -11,/**< POLL_TIMEOUT */
                READ_ERROR          = -20,/**< READ_ERROR */
                WRITE_ERROR         = -30 /**< WRITE_ERROR */
            };
            static constexpr jau::snsize_t number(const RWExitCode rhs) noexcept {
                return static_cast<jau::snsize_t>(rhs);
            }
            static constexpr RWExitCode toRWExitCode(const jau::snsize_t rhs) noexcept {
                return rhs >= 0 ? RWExitCode::SUCCESS : static_cast<RWExitCode>(rhs);
            }
            static std::string getRWExitCodeString(const RWExitCode ec) noexcept;
            static std::string getRWExitCodeString(const jau::snsize_t ecn) noexcept {
                return getRWExitCodeString( toRWExitCode( ecn ) );
            }

            /** Maximum ::connect() retries on ETIMEDOUT */
            static constexpr const int CONNECT_MAX_RETRY = 3;

        private:
            static std::string getStateString(bool isOpen, bool hasIOError) noexcept;
            static int l2cap_open_dev(const BDAddressAndType & adapterAddressAndType, const uint16_t cid) noexcept;

            /** Polls for input, returns ::RWExitCode::SUCCESS if readable. */
            RWExitCode waitReadable(const int timeoutMS) noexcept;

            /** Logs a failed read or write, flagging an I/O error unless closed or timed out. */
            void reportError(const char* op, const jau::snsize_t res) noexcept;

            const uint16_t adev_id;
            const BDAddressAndType localAddressAndType;
            const BDAddressAndType remoteAddressAndType;
            const uint16_t cid;

            std::recursive_mutex mtx_write;
            jau::relaxed_atomic_int socket_;
            jau::sc_atomic_bool is_open_;
            jau::sc_atomic_bool has_ioerror;

        public:
            /**
             * Constructing a non connected L2CAP channel instance.
             * @param adev_id adapter index for logging
             * @param adapterAddressAndType local adapter address to bind to
             * @param remoteAddressAndType remote device to connect to
             * @param cid fixed channel, usually ::L2CAP_CID_ATT
             */
            L2CAPComm(const uint16_t adev_id, const BDAddressAndType& adapterAddressAndType,
                      const BDAddressAndType& remoteAddressAndType, const uint16_t cid) noexcept;

            L2CAPComm(const L2CAPComm&) = delete;
            void operator=(const L2CAPComm&) = delete;

            /** Destructor closing the socket, see close(). */
            ~L2CAPComm() noexcept { close(); }

            const BDAddressAndType& getRemoteAddressAndType() const noexcept { return remoteAddressAndType; }

            /**
             * Opens and connects the L2CAP channel, blocking until the LE link is established.
             * @return true if connected
             */
            bool open() noexcept;

            bool is_open() const noexcept { return is_open_; }

            /** Closing the L2CAP channel, locking the write mutex. */
            bool close() noexcept;

            bool hasIOError() const noexcept { return has_ioerror; }

            std::string getStateString() const noexcept { return getStateString(is_open_, has_ioerror); }

            /**
             * Generic read w/o locking, the caller is the only reader.
             * @param timeout poll timeout, zero reads blocking
             * @return number of bytes read if >= 0, otherwise ::RWExitCode error code.
             */
            jau::snsize_t read(uint8_t* buffer, const jau::nsize_t capacity, const jau::fraction_i64& timeout) noexcept;

            /**
             * Generic write, locking the write mutex.
             * @return number of bytes written if >= 0, otherwise ::RWExitCode error code.
             */
            jau::snsize_t write(const uint8_t *buffer, const jau::nsize_t length) noexcept;

            std::string toString() const noexcept;
    };

} // namespace lhpower

#endif /* LHPOWER_L2CAP_COMM_HPP_ */
