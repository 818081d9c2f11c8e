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

#ifndef LHPOWER_TASK_GROUP_HPP_
#define LHPOWER_TASK_GROUP_HPP_

#include <string>
#include <memory>
#include <mutex>
#include <condition_variable>

#include <jau/basic_types.hpp>
#include <jau/functional.hpp>
#include <jau/fraction_type.hpp>

namespace lhpower {

    /**
     * Fan-out of blocking station operations, one detached thread per task.
     *
     * Waiting is bounded by a soft deadline via waitFor() or unbounded via waitAll().
     * Tasks are never cancelled: a task outliving a deadline keeps running
     * and reports its failure via logging only.
     *
     * The completion state is shared with all spawned threads,
     * hence this instance may be destructed while tasks are still running.
     */
    class LHTaskGroup {
        public:
            typedef jau::function<void()> task_t;

        private:
            struct State {
                std::mutex mtx;
                std::condition_variable cv;
                jau::nsize_t pending = 0;
                jau::nsize_t failed = 0;
            };
            std::shared_ptr<State> state;
            const std::string name;

            static void runTask(std::shared_ptr<State> state, const std::string group_name, const std::string task_name, task_t task) noexcept;

        public:
            explicit LHTaskGroup(const std::string& name_) noexcept;

            LHTaskGroup(const LHTaskGroup&) = delete;
            void operator=(const LHTaskGroup&) = delete;

            /**
             * Runs the task on a new detached thread.
             *
             * An exception escaping the task is logged and counted as failure.
             */
            void spawn(const std::string& task_name, task_t task);

            /**
             * Waits until all tasks completed or the timeout elapsed.
             * @return true if all tasks completed, false on timeout
             */
            bool waitFor(const jau::fraction_i64& timeout) noexcept;

            /** Waits until all tasks completed. */
            void waitAll() noexcept;

            /** Number of still running tasks. */
            jau::nsize_t pending() const noexcept;

            /** Number of completed tasks which threw an exception. */
            jau::nsize_t failed() const noexcept;

            std::string toString() const noexcept;
    };

} // namespace lhpower

#endif /* LHPOWER_TASK_GROUP_HPP_ */
