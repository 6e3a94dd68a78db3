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
#include <bolt/registry/config.hpp>

#include <utility>
#include <vector>

BOLT_REGISTRY_NAMESPACE_BEGIN

// A value together with the copies taken at each open checkpoint that
// wrote to it. Levels are ordered by strictly increasing version.
template <class T>
class Checkpointed
{
    struct Level
    {
        unsigned version;
        T value;
    };

    std::vector<Level> levels_;

public:
    explicit Checkpointed(T value, unsigned const version = 0)
    {
        levels_.push_back(Level{version, std::move(value)});
    }

    T const &recent() const
    {
        BOLT_ASSERT(!levels_.empty());
        return levels_.back().value;
    }

    // the copy writable at `version`, taken on first write
    T &current(unsigned const version)
    {
        BOLT_ASSERT(!levels_.empty());
        if (levels_.back().version < version) {
            T copy = levels_.back().value;
            levels_.push_back(Level{version, std::move(copy)});
        }
        return levels_.back().value;
    }

    void accept(unsigned const version)
    {
        BOLT_ASSERT(version > 0 && !levels_.empty());
        auto &top = levels_.back();
        if (top.version != version) {
            return;
        }
        if (levels_.size() > 1 &&
            levels_[levels_.size() - 2].version == version - 1) {
            levels_[levels_.size() - 2].value = std::move(top.value);
            levels_.pop_back();
        }
        else {
            top.version = version - 1;
        }
    }

    // true once no level is left, the value was born in the checkpoint
    bool reject(unsigned const version)
    {
        BOLT_ASSERT(version > 0 && !levels_.empty());
        if (levels_.back().version == version) {
            levels_.pop_back();
        }
        return levels_.empty();
    }
};

BOLT_REGISTRY_NAMESPACE_END
