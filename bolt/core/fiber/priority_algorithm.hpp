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

#pragma once

#include <bolt/core/fiber/config.hpp>
#include <bolt/core/fiber/priority_queue.hpp>

#include <boost/fiber/algo/algorithm.hpp>
#include <boost/fiber/context.hpp>
#include <boost/fiber/scheduler.hpp>

#include <chrono>

BOLT_FIBER_NAMESPACE_BEGIN

// Work sharing scheduler: unpinned fibers migrate between the threads of a
// pool through the shared PriorityQueue, pinned ones (main and dispatcher
// contexts) stay on a thread local queue.
class PriorityAlgorithm final
    : public boost::fibers::algo::algorithm_with_properties<PriorityProperties>
{
    using lqueue_type = boost::fibers::scheduler::ready_queue_type;

    PriorityQueue &rqueue_;
    lqueue_type lqueue_{};

public:
    explicit PriorityAlgorithm(PriorityQueue &);

    PriorityAlgorithm(PriorityAlgorithm const &) = delete;
    PriorityAlgorithm &operator=(PriorityAlgorithm const &) = delete;

    void awakened(context *, PriorityProperties &) noexcept override;

    context *pick_next() noexcept override;

    bool has_ready_fibers() const noexcept override;

    void suspend_until(
        std::chrono::steady_clock::time_point const &) noexcept override
    {
    }

    void notify() noexcept override {}
};

BOLT_FIBER_NAMESPACE_END
