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
#include <cstdio>

#include <jau/debug.hpp>

#include "HCIComm.hpp"

extern "C" {
    #include <unistd.h>
    #include <sys/types.h>
    #include <sys/socket.h>
    #include <poll.h>
}

namespace lhpower {

int HCIComm::hci_open_dev(const uint16_t dev_id, const uint16_t channel) noexcept
{
    static_assert( sizeof(struct sockaddr) > sizeof(sockaddr_hci), "Requirement sizeof(struct sockaddr) > sizeof(sockaddr_hci)" );
    sockaddr addr_holder; // sizeof(struct sockaddr) > sizeof(sockaddr_hci), silent valgrind.
    sockaddr_hci * ptr_hci_addr = (sockaddr_hci*)&addr_holder;
    int fd, err;

    // Create a loose HCI socket
    fd = ::socket(AF_BLUETOOTH, SOCK_RAW | SOCK_CLOEXEC, BTPROTO_HCI);
    if (0 > fd ) {
        ERR_PRINT("HCIComm::hci_open_dev: socket failed, dev_id %u", dev_id);
        return fd;
    }

    // Bind socket to the HCI device
    bzero(&addr_holder, sizeof(addr_holder));
    ptr_hci_addr->hci_family = AF_BLUETOOTH;
    ptr_hci_addr->hci_dev = dev_id;
    ptr_hci_addr->hci_channel = channel;
    if (::bind(fd, &addr_holder, sizeof(sockaddr_hci)) < 0) {
        ERR_PRINT("HCIComm::hci_open_dev: bind failed, dev_id %u, channel %u", dev_id, channel);
        goto failed;
    }
    return fd;

failed:
    err = errno;
    ::close(fd);
    errno = err;

    return -1;
}

HCIComm::HCIComm(const uint16_t dev_id_, const uint16_t channel_) noexcept
: dev_id( dev_id_ ), channel( channel_ ),
  socket_descriptor( hci_open_dev(dev_id_, channel_) ), interrupt_flag(false)
{
}

void HCIComm::close() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    if( 0 > socket_descriptor ) {
        DBG_PRINT("HCIComm::close: Not opened: dev_id %u, dd %d", dev_id, socket_descriptor.load());
        return;
    }
    DBG_PRINT("HCIComm::close: Start: dev_id %u, dd %d", dev_id, socket_descriptor.load());
    interrupt_flag = true; // ends a pending poll loop in read() at its next timeout
    ::close(socket_descriptor);
    socket_descriptor = -1;
    interrupt_flag = false;
    DBG_PRINT("HCIComm::close: End: dev_id %u", dev_id);
}

bool HCIComm::setFilter(const hci_ufilter& f) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    if( 0 > socket_descriptor ) {
        return false;
    }
    if( 0 > ::setsockopt(socket_descriptor, SOL_HCI, HCI_FILTER, &f, sizeof(f)) ) {
        ERR_PRINT("HCIComm::setFilter: setsockopt HCI_FILTER failed, dev_id %u, dd %d", dev_id, socket_descriptor.load());
        return false;
    }
    return true;
}

jau::snsize_t HCIComm::read(uint8_t* buffer, const jau::nsize_t capacity, const jau::fraction_i64& timeout) noexcept {
    if( 0 > socket_descriptor ) {
        return -1;
    }
    if( 0 == capacity ) {
        return 0;
    }
    const int timeoutMS = static_cast<int>( timeout.to_ms() );
    if( 0 < timeoutMS ) {
        struct pollfd p;
        p.fd = socket_descriptor;
        p.events = POLLIN;
        p.revents = 0;
        int n;
        do {
            n = ::poll(&p, 1, timeoutMS);
        } while( 0 > n && !interrupt_flag && ( EAGAIN == errno || EINTR == errno ) );

        if( interrupt_flag || 0 > n ) {
            return -1;
        }
        if( 0 == n ) {
            return 0; // timeout
        }
    }
    ssize_t len;
    do {
        len = ::read(socket_descriptor, buffer, capacity);
    } while( 0 > len && ( EAGAIN == errno || EINTR == errno ) );

    return 0 > len ? -1 : static_cast<jau::snsize_t>(len);
}

jau::snsize_t HCIComm::write(const uint8_t* buffer, const jau::nsize_t size) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    if( 0 > socket_descriptor ) {
        return -1;
    }
    if( 0 == size ) {
        return 0;
    }
    ssize_t len;
    do {
        len = ::write(socket_descriptor, buffer, size);
    } while( 0 > len && ( EAGAIN == errno || EINTR == errno ) );

    return 0 > len ? -1 : static_cast<jau::snsize_t>(len);
}

} // namespace lhpower
