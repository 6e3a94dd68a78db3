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

#include <bolt/core/fiber/priority_queue.hpp>

#include <bolt/core/fiber/config.hpp>

BOLT_FIBER_NAMESPACE_BEGIN

bool PriorityQueue::empty() const
{
    return queue_.empty();
}

context *PriorityQueue::pop()
{
    context *ctx = nullptr;
    queue_.try_pop(ctx);
    return ctx;
}

void PriorityQueue::push(context *const ctx)
{
    queue_.push(ctx);
}

BOLT_FIBER_NAMESPACE_END
