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

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "LHSessionRegistry.hpp"
#include "LHStation.hpp"

using namespace lhpower;

void LHSessionRegistry::add(const std::shared_ptr<LHStation>& station) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    const std::string key = station->getAddressString();
    auto it = sessions.find(key);
    if( sessions.end() == it || it->second.expired() ) {
        sessions[key] = station;
        DBG_PRINT("LHSessionRegistry::add: %s, size %zu", key.c_str(), sessions.size());
    }
}

void LHSessionRegistry::remove(const std::string& address) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    if( 0 < sessions.erase(address) ) {
        DBG_PRINT("LHSessionRegistry::remove: %s, size %zu", address.c_str(), sessions.size());
    }
}

bool LHSessionRegistry::contains(const std::string& address) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    return sessions.end() != sessions.find(address);
}

size_t LHSessionRegistry::size() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    return sessions.size();
}

jau::darray<std::shared_ptr<LHStation>> LHSessionRegistry::getSessions() const noexcept {
    jau::darray<std::shared_ptr<LHStation>> res;
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    for(const auto& entry : sessions) {
        std::shared_ptr<LHStation> s = entry.second.lock();
        if( nullptr != s ) {
            res.push_back(s);
        }
    }
    return res;
}

void LHSessionRegistry::disconnectAll() noexcept {
    jau::darray<std::shared_ptr<LHStation>> stations = getSessions();
    DBG_PRINT("LHSessionRegistry::disconnectAll: %zu stations", (size_t)stations.size());
    jau::for_each_fidelity(stations, [](std::shared_ptr<LHStation>& s) {
        s->disconnect();
    });
    DBG_PRINT("LHSessionRegistry::disconnectAll: done, remaining %zu", size());
}

std::string LHSessionRegistry::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    std::string res = "SessionRegistry[size "+std::to_string(sessions.size());
    for(const auto& entry : sessions) {
        res.append(", ").append(entry.first);
    }
    return res+"]";
}
