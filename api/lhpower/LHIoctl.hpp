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

#ifndef LHPOWER_IOCTL_HPP_
#define LHPOWER_IOCTL_HPP_

#include <cstdint>

#include <jau/eui48.hpp>

extern "C" {
    #include <sys/socket.h>
}

/**
 * Linux kernel Bluetooth socket ABI as used by HCIComm and L2CAPComm,
 * see linux/include/net/bluetooth/{bluetooth.h,hci_sock.h,l2cap.h}.
 */
namespace lhpower {

#ifndef AF_BLUETOOTH
    #define AF_BLUETOOTH    31
#endif

    #define BTPROTO_L2CAP   0
    #define BTPROTO_HCI     1

    #define SOL_HCI         0
    #define HCI_FILTER      2

    #define HCI_DEV_NONE    0xffff

    #define HCI_CHANNEL_RAW     0

    #define HCI_COMMAND_PKT     0x01
    #define HCI_ACLDATA_PKT     0x02
    #define HCI_EVENT_PKT       0x04
    #define HCI_VENDOR_PKT      0xff

    #define HCI_FLT_TYPE_BITS   31
    #define HCI_FLT_EVENT_BITS  63

    struct sockaddr_hci {
        sa_family_t     hci_family;
        unsigned short  hci_dev;
        unsigned short  hci_channel;
    };

    struct hci_ufilter {
        uint32_t  type_mask;
        uint32_t  event_mask[2];
        uint16_t  opcode;
    };

    /**
     * L2CAP socket address, `l2_psm`, `l2_bdaddr` and `l2_cid` in little endian.
     */
    struct sockaddr_l2 {
        sa_family_t     l2_family;
        unsigned short  l2_psm;
        jau::EUI48      l2_bdaddr;
        unsigned short  l2_cid;
        uint8_t         l2_bdaddr_type;
    };

    /** Fixed L2CAP channel of the Attribute Protocol, BT Core Spec v5.2: Vol 3, Part A, 2.1 Channel Identifiers */
    constexpr const uint16_t L2CAP_CID_ATT = 0x0004;

    /** Default LE ATT_MTU, BT Core Spec v5.2: Vol 3, Part F, 3.2.8 Exchanging MTU size */
    constexpr const uint16_t L2CAP_LE_DEFAULT_MTU = 23;

} // namespace lhpower

#endif /* LHPOWER_IOCTL_HPP_ */
