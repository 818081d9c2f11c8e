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

#ifndef LHPOWER_HCI_COMM_HPP_
#define LHPOWER_HCI_COMM_HPP_

#include <cstring>
#include <string>
#include <cstdint>
#include <memory>
#include <mutex>

#include <jau/basic_types.hpp>
#include <jau/fraction_type.hpp>
#include <jau/ordered_atomic.hpp>

#include "LHIoctl.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module HCIComm:
 *
 * - BT Core Spec v5.2: Vol 4, Part E Host Controller Interface (HCI)
 */
namespace lhpower {

    /**
     * Read/Write raw HCI channel, used by LinuxRadio for adapter setup and LE scanning.
     */
    class HCIComm {
        public:
            const uint16_t dev_id;
            const uint16_t channel;

        private:
            static int hci_open_dev(const uint16_t dev_id, const uint16_t channel) noexcept;

            std::recursive_mutex mtx_write;
            jau::relaxed_atomic_int socket_descriptor; // the hci socket
            jau::sc_atomic_bool interrupt_flag; // for forced read interruption via close()

        public:
            /** Constructing a newly opened HCI communication channel instance */
            HCIComm(const uint16_t dev_id, const uint16_t channel) noexcept;

            HCIComm(const HCIComm&) = delete;
            void operator=(const HCIComm&) = delete;

            /**
             * Releases this instance after issuing {@link #close()}.
             */
            ~HCIComm() noexcept { close(); }

            bool is_open() const noexcept { return 0 <= socket_descriptor; }

            /** Closing the HCI channel, locking the write mutex. */
            void close() noexcept;

            /**
             * Installs the given event filter on the socket.
             * @return false if not open or setsockopt failed
             */
            bool setFilter(const hci_ufilter& f) noexcept;

            /**
             * Generic read w/ own timeout, w/o locking.
             * @return number of bytes read, zero on timeout or a negative value on error
             */
            jau::snsize_t read(uint8_t* buffer, const jau::nsize_t capacity, const jau::fraction_i64& timeout) noexcept;

            /** Generic write, locking the write mutex. */
            jau::snsize_t write(const uint8_t* buffer, const jau::nsize_t size) noexcept;

        private:
            static inline void setu32_bit(int nr, void *addr) noexcept
            {
                *((uint32_t *) addr + (nr >> 5)) |= (1 << (nr & 31));
            }

        public:
            static inline void filter_clear(hci_ufilter *f) noexcept
            {
                bzero(f, sizeof(*f));
            }
            static inline void filter_set_ptype(int t, hci_ufilter *f) noexcept
            {
                setu32_bit((t == HCI_VENDOR_PKT) ? 0 : (t & HCI_FLT_TYPE_BITS), &f->type_mask);
            }
            static inline void filter_set_event(int e, hci_ufilter *f) noexcept
            {
                setu32_bit((e & HCI_FLT_EVENT_BITS), &f->event_mask);
            }
    };

} // namespace lhpower

#endif /* LHPOWER_HCI_COMM_HPP_ */
