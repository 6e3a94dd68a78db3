// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <bolt/core/fiber/priority_pool.hpp>

#include <bolt/core/assert.h>
#include <bolt/core/fiber/config.hpp>
#include <bolt/core/fiber/priority_algorithm.hpp>
#include <bolt/core/fiber/priority_queue.hpp>

#include <boost/fiber/channel_op_status.hpp>
#include <boost/fiber/operations.hpp>
#include <boost/fiber/protected_fixedsize_stack.hpp>

#include <cstdio>
#include <memory>
#include <mutex>
#include <utility>

#include <pthread.h>

BOLT_FIBER_NAMESPACE_BEGIN

void PriorityPool::park()
{
    std::unique_lock<boost::fibers::mutex> lock{mutex_};
    cv_.wait(lock, [this] { return done_; });
}

PriorityPool::PriorityPool(unsigned const n_threads, unsigned const n_fibers)
{
    BOLT_ASSERT(n_threads);
    BOLT_ASSERT(n_fibers);

    threads_.reserve(n_threads);
    for (unsigned i = 1; i < n_threads; ++i) {
        threads_.emplace_back([this, i] {
            char name[16];
            std::snprintf(name, sizeof(name), "verifier %u", i);
            pthread_setname_np(pthread_self(), name);
            boost::fibers::use_scheduling_algorithm<PriorityAlgorithm>(queue_);
            park();
        });
    }

    // the fibers are created on thread 0 and migrate from there
    fibers_.reserve(n_fibers);
    threads_.emplace_back([this, n_fibers] {
        pthread_setname_np(pthread_self(), "verifier 0");
        boost::fibers::use_scheduling_algorithm<PriorityAlgorithm>(queue_);
        for (unsigned i = 0; i < n_fibers; ++i) {
            auto *const properties = new PriorityProperties{nullptr};
            fibers_.emplace_back(
                static_cast<boost::fibers::fiber_properties *>(properties),
                std::allocator_arg,
                boost::fibers::protected_fixedsize_stack{1024 * 1024},
                [this, properties] {
                    PriorityTask task;
                    while (channel_.pop(task) ==
                           boost::fibers::channel_op_status::success) {
                        properties->set_priority(task.priority);
                        boost::this_fiber::yield();
                        task.task();
                        properties->set_priority(0);
                    }
                });
        }
        start_.set_value();
        park();
    });
}

PriorityPool::~PriorityPool()
{
    channel_.close();
    start_.get_future().wait();

    while (!fibers_.empty()) {
        fibers_.back().join();
        fibers_.pop_back();
    }

    {
        std::unique_lock<boost::fibers::mutex> const lock{mutex_};
        done_ = true;
    }
    cv_.notify_all();

    while (!threads_.empty()) {
        threads_.back().join();
        threads_.pop_back();
    }
}

BOLT_FIBER_NAMESPACE_END
