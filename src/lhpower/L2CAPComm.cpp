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
#include <cerrno>
#include <string>
#include <memory>
#include <cstdint>
#include <cstdio>

#include <jau/debug.hpp>
#include <jau/byte_util.hpp>

#include "L2CAPComm.hpp"

extern "C" {
    #include <unistd.h>
    #include <strings.h>
    #include <sys/socket.h>
    #include <poll.h>
}

using namespace lhpower;

std::string L2CAPComm::getStateString(bool isOpen, bool hasIOError) noexcept {
    return "State[open "+std::to_string(isOpen)+
            ", ioError "+std::to_string(hasIOError)+
            ", errno "+std::to_string(errno)+" ("+std::string(strerror(errno))+")]";
}

static void set_sockaddr(sockaddr_l2& a, const BDAddressAndType& addressAndType, const uint16_t cid) noexcept {
    bzero((void *)&a, sizeof(a));
    a.l2_family = AF_BLUETOOTH;
    a.l2_psm = 0; // fixed channel, no PSM
    a.l2_bdaddr = jau::cpu_to_le(addressAndType.address);
    a.l2_cid = jau::cpu_to_le(cid);
    a.l2_bdaddr_type = lhpower::number(addressAndType.type);
}

int L2CAPComm::l2cap_open_dev(const BDAddressAndType & adapterAddressAndType, const uint16_t cid) noexcept {
    const int fd = ::socket(AF_BLUETOOTH, SOCK_SEQPACKET | SOCK_CLOEXEC, BTPROTO_L2CAP);
    if( 0 > fd ) {
        ERR_PRINT("L2CAPComm::l2cap_open_dev: socket failed, %s", adapterAddressAndType.toString().c_str());
        return fd;
    }
    sockaddr_l2 local;
    set_sockaddr(local, adapterAddressAndType, cid);
    if( 0 > ::bind(fd, (struct sockaddr *) &local, sizeof(local)) ) {
        ERR_PRINT("L2CAPComm::l2cap_open_dev: bind failed, %s", adapterAddressAndType.toString().c_str());
        const int err = errno;
        ::close(fd);
        errno = err;
        return -1;
    }
    return fd;
}

L2CAPComm::L2CAPComm(const uint16_t adev_id_, const BDAddressAndType& adapterAddressAndType_,
                     const BDAddressAndType& remoteAddressAndType_, const uint16_t cid_) noexcept
: adev_id(adev_id_), localAddressAndType(adapterAddressAndType_),
  remoteAddressAndType(remoteAddressAndType_), cid(cid_),
  socket_(-1), is_open_(false), has_ioerror(false)
{ }

bool L2CAPComm::open() noexcept {
    bool expOpen = false; // C++11, exp as value since C++20
    if( !is_open_.compare_exchange_strong(expOpen, true) ) {
        DBG_PRINT("L2CAPComm::open: Already open: %s", toString().c_str());
        return false;
    }
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    has_ioerror = false;

    DBG_PRINT("L2CAPComm::open: Start Connect: %s", toString().c_str());
    socket_ = l2cap_open_dev(localAddressAndType, cid);

    bool connected = false;
    if( 0 <= socket_ ) {
        sockaddr_l2 remote;
        set_sockaddr(remote, remoteAddressAndType, cid);

        for(int retry=0; !connected && is_open_ && retry < CONNECT_MAX_RETRY; ++retry) {
            // blocking until the LE link is up or the kernel gives up
            if( 0 == ::connect(socket_, (struct sockaddr*)&remote, sizeof(remote)) ) {
                connected = true;
            } else if( ETIMEDOUT == errno ) {
                WORDY_PRINT("L2CAPComm::open: Connect timeout %d/%d: %s", retry+1, CONNECT_MAX_RETRY, toString().c_str());
            } else {
                WARN_PRINT("L2CAPComm::open: Connect failed: %s", toString().c_str());
                break;
            }
        }
    }
    if( !connected || !is_open_ ) {
        const int err = errno;
        close();
        errno = err;
        return false;
    }
    DBG_PRINT("L2CAPComm::open: Connected: %s", toString().c_str());
    return true;
}

bool L2CAPComm::close() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    is_open_ = false;
    has_ioerror = false;
    if( 0 > socket_ ) {
        DBG_PRINT("L2CAPComm::close: Not connected: %s", toString().c_str());
        return true;
    }
    DBG_PRINT("L2CAPComm::close: Start: %s", toString().c_str());
    const int res = ::close(socket_);
    socket_ = -1;
    if( 0 != res ) {
        WARN_PRINT("L2CAPComm::close: close failed: %s", toString().c_str());
        return false;
    }
    DBG_PRINT("L2CAPComm::close: End: %s", toString().c_str());
    return true;
}

#define RWEXITCODE_ENUM(X) \
        X(RWExitCode, SUCCESS) \
        X(RWExitCode, NOT_OPEN) \
        X(RWExitCode, INTERRUPTED) \
        X(RWExitCode, INVALID_SOCKET_DD) \
        X(RWExitCode, POLL_ERROR) \
        X(RWExitCode, POLL_TIMEOUT) \
        X(RWExitCode, READ_ERROR) \
        X(RWExitCode, WRITE_ERROR)

#define CASE2_TO_STRING(U,V) case U::V: return #V;

std::string L2CAPComm::getRWExitCodeString(const RWExitCode ec) noexcept {
    if( number(ec) >= 0 ) {
        return "SUCCESS";
    }
    switch(ec) {
        RWEXITCODE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ExitCode";
}

L2CAPComm::RWExitCode L2CAPComm::waitReadable(const int timeoutMS) noexcept {
    struct pollfd p;
    p.fd = socket_;
    p.events = POLLIN;
    p.revents = 0;
    int n;
    do {
        n = ::poll( &p, 1, timeoutMS );
    } while( 0 > n && is_open_ && ( EAGAIN == errno || EINTR == errno ) );

    if( !is_open_ ) {
        return RWExitCode::NOT_OPEN;
    }
    if( 0 > n ) {
        return RWExitCode::POLL_ERROR;
    }
    if( 0 == n ) {
        errno = ETIMEDOUT;
        return RWExitCode::POLL_TIMEOUT;
    }
    return RWExitCode::SUCCESS;
}

void L2CAPComm::reportError(const char* op, const jau::snsize_t res) noexcept {
    if( !is_open_ ) {
        WORDY_PRINT("L2CAPComm::%s: Closed, %s; %s", op, getRWExitCodeString(res).c_str(), toString().c_str());
    } else if( RWExitCode::POLL_TIMEOUT == toRWExitCode(res) ) {
        DBG_PRINT("L2CAPComm::%s: Timeout, %s; %s", op, getRWExitCodeString(res).c_str(), toString().c_str());
    } else {
        // timeouts and a concurrent close are no I/O errors
        has_ioerror = true;
        IRQ_PRINT("L2CAPComm::%s: Error, %s; %s", op, getRWExitCodeString(res).c_str(), toString().c_str());
    }
}

jau::snsize_t L2CAPComm::read(uint8_t* buffer, const jau::nsize_t capacity, const jau::fraction_i64& timeout) noexcept {
    RWExitCode ec = RWExitCode::SUCCESS;
    ssize_t len = 0;

    if( !is_open_ ) {
        ec = RWExitCode::NOT_OPEN;
    } else if( 0 > socket_ ) {
        ec = RWExitCode::INVALID_SOCKET_DD;
    } else if( 0 < capacity ) {
        const int timeoutMS = static_cast<int>( timeout.to_ms() );
        if( 0 < timeoutMS ) {
            ec = waitReadable(timeoutMS);
        }
        if( RWExitCode::SUCCESS == ec ) {
            do {
                len = ::read(socket_, buffer, capacity);
            } while( 0 > len && is_open_ && ( EAGAIN == errno || EINTR == errno ) );

            if( !is_open_ ) {
                ec = RWExitCode::NOT_OPEN;
            } else if( 0 > len ) {
                ec = RWExitCode::READ_ERROR;
            }
        }
    }
    if( RWExitCode::SUCCESS != ec ) {
        reportError("read", number(ec));
        return number(ec);
    }
    return static_cast<jau::snsize_t>(len);
}

jau::snsize_t L2CAPComm::write(const uint8_t * buffer, const jau::nsize_t length) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    RWExitCode ec = RWExitCode::SUCCESS;
    ssize_t len = 0;

    if( !is_open_ ) {
        ec = RWExitCode::NOT_OPEN;
    } else if( 0 > socket_ ) {
        ec = RWExitCode::INVALID_SOCKET_DD;
    } else if( 0 < length ) {
        do {
            len = ::write(socket_, buffer, length);
        } while( 0 > len && ( EAGAIN == errno || EINTR == errno ) );

        if( 0 > len ) {
            ec = RWExitCode::WRITE_ERROR;
        }
    }
    if( RWExitCode::SUCCESS != ec ) {
        reportError("write", number(ec));
        return number(ec);
    }
    return static_cast<jau::snsize_t>(len);
}

std::string L2CAPComm::toString() const noexcept {
    return "L2CAPComm[dev_id "+std::to_string(adev_id)+", dd "+std::to_string(socket_.load())+
           ", cid "+jau::to_hexstring(cid)+", local "+localAddressAndType.toString()+
           ", remote "+remoteAddressAndType.toString()+", "+getStateString()+"]";
}
