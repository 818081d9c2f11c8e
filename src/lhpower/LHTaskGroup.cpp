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
#include <thread>
#include <system_error>

#include <jau/debug.hpp>

#include "LHTaskGroup.hpp"

using namespace lhpower;

LHTaskGroup::LHTaskGroup(const std::string& name_) noexcept
: state(std::make_shared<State>()), name(name_)
{ }

void LHTaskGroup::runTask(std::shared_ptr<State> state, const std::string group_name, const std::string task_name, task_t task) noexcept {
    bool ok = false;
    try {
        task();
        ok = true;
    } catch (jau::RuntimeException &e) {
        WARN_PRINT("LHTaskGroup[%s]: Task %s failed: %s", group_name.c_str(), task_name.c_str(), e.message().c_str());
    } catch (std::exception &e) {
        WARN_PRINT("LHTaskGroup[%s]: Task %s failed: %s", group_name.c_str(), task_name.c_str(), e.what());
    }
    {
        const std::lock_guard<std::mutex> lock(state->mtx); // RAII-style acquire and relinquish via destructor
        --state->pending;
        if( !ok ) {
            ++state->failed;
        }
        DBG_PRINT("LHTaskGroup[%s]: Task %s done, ok %d, pending %zu", group_name.c_str(), task_name.c_str(), ok, (size_t)state->pending);
    }
    state->cv.notify_all();
}

void LHTaskGroup::spawn(const std::string& task_name, task_t task) {
    {
        const std::lock_guard<std::mutex> lock(state->mtx); // RAII-style acquire and relinquish via destructor
        ++state->pending;
    }
    try {
        std::thread t(&LHTaskGroup::runTask, state, name, task_name, task);
        t.detach();
    } catch (std::system_error &e) {
        {
            const std::lock_guard<std::mutex> lock(state->mtx); // RAII-style acquire and relinquish via destructor
            --state->pending;
        }
        state->cv.notify_all();
        throw;
    }
}

bool LHTaskGroup::waitFor(const jau::fraction_i64& timeout) noexcept {
    std::unique_lock<std::mutex> lock(state->mtx); // RAII-style acquire and relinquish via destructor
    const jau::fraction_timespec timeout_time = jau::getMonotonicTime() + jau::fraction_timespec(timeout);
    while( 0 < state->pending ) {
        std::cv_status s = jau::wait_until(state->cv, lock, timeout_time);
        if( std::cv_status::timeout == s && 0 < state->pending ) {
            WARN_PRINT("LHTaskGroup[%s]: Timeout after %" PRIi64 " ms, %zu tasks still running",
                       name.c_str(), timeout.to_ms(), (size_t)state->pending);
            return false;
        }
    }
    return true;
}

void LHTaskGroup::waitAll() noexcept {
    std::unique_lock<std::mutex> lock(state->mtx); // RAII-style acquire and relinquish via destructor
    while( 0 < state->pending ) {
        state->cv.wait(lock);
    }
}

jau::nsize_t LHTaskGroup::pending() const noexcept {
    const std::lock_guard<std::mutex> lock(state->mtx); // RAII-style acquire and relinquish via destructor
    return state->pending;
}

jau::nsize_t LHTaskGroup::failed() const noexcept {
    const std::lock_guard<std::mutex> lock(state->mtx); // RAII-style acquire and relinquish via destructor
    return state->failed;
}

std::string LHTaskGroup::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(state->mtx); // RAII-style acquire and relinquish via destructor
    return "TaskGroup["+name+", pending "+std::to_string(state->pending)+", failed "+std::to_string(state->failed)+"]";
}
