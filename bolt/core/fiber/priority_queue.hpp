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

#include <bolt/core/assert.h>
#include <bolt/core/fiber/config.hpp>

#include <boost/fiber/context.hpp>
#include <boost/fiber/properties.hpp>

#include <oneapi/tbb/concurrent_priority_queue.h>

#include <cstdint>
#include <functional>

BOLT_FIBER_NAMESPACE_BEGIN

using boost::fibers::context;

class PriorityProperties final : public boost::fibers::fiber_properties
{
    uint64_t priority_ = 0;

public:
    explicit PriorityProperties(context *const ctx) noexcept
        : fiber_properties{ctx}
    {
    }

    [[gnu::always_inline]] uint64_t get_priority() const noexcept
    {
        return priority_;
    }

    [[gnu::always_inline]] void set_priority(uint64_t const priority) noexcept
    {
        priority_ = priority;
        notify();
    }
};

struct PriorityTask
{
    uint64_t priority{0};
    std::function<void()> task{};
};

// Ready queue shared by every worker thread of a pool; lower value runs first.
class PriorityQueue final
{
    struct Compare
    {
        static uint64_t get_priority(context const *const ctx)
        {
            auto const *const properties =
                static_cast<PriorityProperties const *>(ctx->get_properties());
            BOLT_ASSERT(properties);
            return properties->get_priority();
        }

        bool operator()(context const *const lhs, context const *const rhs)
        {
            return get_priority(lhs) > get_priority(rhs);
        }
    };

    oneapi::tbb::concurrent_priority_queue<context *, Compare> queue_;

public:
    bool empty() const;

    context *pop();

    void push(context *);
};

BOLT_FIBER_NAMESPACE_END
