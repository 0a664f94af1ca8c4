/******************************************************************************
 *
 *    This file is part of the Marionette project
 *    Copyright (C) 2024-2026 Marionette contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

// ScheduledEvents.h — (applyAtTime, value) queue consumed by elapsed time
//
// Used by the thinking state to delay head retargets behind the eyes. Entries
// are kept ordered by applyAt; equal times keep insertion order. consume()
// hands every entry whose time has been reached to the callback, oldest first,
// and drops it. Nothing fires twice.

#pragma once

#include <algorithm>
#include <deque>

namespace Marionette {

template <typename T>
class ScheduledEvents {
public:
    struct Entry {
        float applyAt;
        T value;
    };

    inline void schedule(float applyAt, const T &value) {
        auto it = std::upper_bound(
            mEntries.begin(), mEntries.end(), applyAt,
            [](float t, const Entry &e) { return t < e.applyAt; });
        mEntries.insert(it, Entry{applyAt, value});
    }

    /// Apply all entries with applyAt <= now. Returns the number applied.
    template <typename Fn>
    inline int consume(float now, Fn &&fn) {
        int applied = 0;
        while (!mEntries.empty() && mEntries.front().applyAt <= now) {
            Entry e = mEntries.front();
            mEntries.pop_front();
            fn(e.value);
            ++applied;
        }
        return applied;
    }

    inline void clear() { mEntries.clear(); }
    inline bool empty() const { return mEntries.empty(); }
    inline size_t size() const { return mEntries.size(); }

    /// Time of the next entry; only valid when !empty().
    inline float nextAt() const { return mEntries.front().applyAt; }

private:
    std::deque<Entry> mEntries;
};

} // namespace Marionette
