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

#include <bolt/core/fiber/priority_algorithm.hpp>

#include <bolt/core/fiber/config.hpp>
#include <bolt/core/fiber/priority_queue.hpp>
#include <bolt/core/likely.h>

#include <boost/fiber/context.hpp>
#include <boost/fiber/type.hpp>

BOLT_FIBER_NAMESPACE_BEGIN

PriorityAlgorithm::PriorityAlgorithm(PriorityQueue &rqueue)
    : rqueue_{rqueue}
{
}

void PriorityAlgorithm::awakened(
    context *const ctx, PriorityProperties &) noexcept
{
    if (BOLT_UNLIKELY(ctx->is_context(boost::fibers::type::pinned_context))) {
        lqueue_.push_back(*ctx);
        return;
    }
    ctx->detach();
    rqueue_.push(ctx);
}

context *PriorityAlgorithm::pick_next() noexcept
{
    if (context *const ctx = rqueue_.pop(); BOLT_LIKELY(ctx != nullptr)) {
        context::active()->attach(ctx);
        return ctx;
    }
    if (lqueue_.empty()) {
        return nullptr;
    }
    context *const ctx = &lqueue_.front();
    lqueue_.pop_front();
    return ctx;
}

bool PriorityAlgorithm::has_ready_fibers() const noexcept
{
    return !lqueue_.empty() || !rqueue_.empty();
}

BOLT_FIBER_NAMESPACE_END
