//
// created by : Timothée Feuillet
// date: 2026-10-19
//
//
// Copyright (c) 2026 Timothée Feuillet
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//


#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "concepts.hpp"

namespace dtrack
{
  template<trackable Type, typename Key, typename Hash>
  requires listener_key<Key, Hash>
  class tracker;

  /// \brief Scoped read-only access to the value owned by a tracker
  ///
  /// Created by tracker::begin_read(). While at least one read view is alive,
  /// begin_mutation() (and modify()) throw read_in_progress, so the referenced value
  /// cannot change under the reader. Any number of read views can coexist.
  template<trackable Type, typename Key, typename Hash>
  requires listener_key<Key, Hash>
  class read_view
  {
    public:
      using tracker_t = tracker<Type, Key, Hash>;

      read_view(const read_view&) = delete;
      read_view& operator = (const read_view&) = delete;
      read_view(read_view&&) = delete;
      read_view& operator = (read_view&&) = delete;

      ~read_view()
      {
        owner.reader_count.fetch_sub(1, std::memory_order_release);
      }

      const Type& get() const { return owner.value; }
      const Type& operator *() const { return get(); }
      const Type* operator ->() const { return std::addressof(get()); }

    private:
      explicit read_view(const tracker_t& _owner) : owner(_owner.acquire_for_read()) {}

    private:
      const tracker_t& owner;

      friend tracker_t;
  };
}
