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

#ifndef LHPOWER_SESSION_REGISTRY_HPP_
#define LHPOWER_SESSION_REGISTRY_HPP_

#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <jau/darray.hpp>

namespace lhpower {

    class LHStation; // forward

    /**
     * Set of currently connected stations, keyed by address string.
     *
     * Membership only serves the bulk disconnect at shutdown,
     * the station's own LHStation::isConnected() is authoritative.
     *
     * Instances are owned by LHStationManager and shared with its stations.
     */
    class LHSessionRegistry {
        private:
            mutable std::mutex mtx_sessions;
            std::unordered_map<std::string, std::weak_ptr<LHStation>> sessions;

        public:
            LHSessionRegistry() noexcept {}

            LHSessionRegistry(const LHSessionRegistry&) = delete;
            void operator=(const LHSessionRegistry&) = delete;

            /** Adds the station if not yet contained. */
            void add(const std::shared_ptr<LHStation>& station) noexcept;

            /** Removes the station with the given address, if contained. */
            void remove(const std::string& address) noexcept;

            bool contains(const std::string& address) const noexcept;

            size_t size() const noexcept;

            /** Returns a copy of all still alive registered stations. */
            jau::darray<std::shared_ptr<LHStation>> getSessions() const noexcept;

            /**
             * Disconnects all registered stations.
             *
             * The list is copied and released before each LHStation::disconnect(),
             * which takes the station lock and removes itself from this registry.
             */
            void disconnectAll() noexcept;

            std::string toString() const noexcept;
    };

} // namespace lhpower

#endif /* LHPOWER_SESSION_REGISTRY_HPP_ */
