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
#include <exception>
#include <functional>
#include <memory>

#include "../scoped_flag.hpp"
#include "concepts.hpp"
#include "errors.hpp"

namespace dtrack
{
  template<trackable Type, typename Key = uint64_t, typename Hash = std::hash<Key>>
  requires listener_key<Key, Hash>
  class tracker;

  /// \brief Scoped write access to the value owned by a tracker
  ///
  /// Created by tracker::begin_mutation(), which copies the current value (the snapshot).
  /// While the mutation is alive it is the only way to access the tracker (and its value).
  /// When released (explicitly with release() or by the destructor) the snapshot is compared
  /// to the live value and, if they differ, every listener is called once with (snapshot, live value).
  ///
  /// Any number of writes in between collapse into that single comparison.
  ///
  /// \note neither copyable nor movable: a mutation lives in exactly one scope
  /// \note if the scope is left because of an exception, the release still happens.
  ///       An exception thrown by a listener at that point is logged instead of propagated.
  template<trackable Type, typename Key, typename Hash>
  requires listener_key<Key, Hash>
  class mutation
  {
    public:
      using tracker_t = tracker<Type, Key, Hash>;

      mutation(const mutation&) = delete;
      mutation& operator = (const mutation&) = delete;
      mutation(mutation&&) = delete;
      mutation& operator = (mutation&&) = delete;

      ~mutation() noexcept(false)
      {
        if (released)
          return;

        // already unwinding: an exception escaping now would terminate the program
        if (std::uncaught_exceptions() > uncaught_exception_count)
        {
          try
          {
            release();
          }
          DT_CATCH;
          return;
        }

        release();
      }

      /// \brief Compare the snapshot to the live value, notify the listeners if they differ,
      /// then give the exclusive access back to the tracker
      /// \note exceptions thrown by listeners are propagated (the mutation is still released)
      void release()
      {
        if (released)
          DT_THROW(mutation_released, "mutation::release: the mutation has already been released");
        released = true;

        cr::scoped_flag _sf(owner.mutation_active, false, cr::scoped_flag_adopt);

        if (!(snapshot == owner.value))
          owner.listeners.notify_all(snapshot, owner.value);
      }

      bool is_released() const { return released; }

      /// \brief Whether the live value currently differs from the snapshot
      bool has_changed() const
      {
        check_not_released();
        return !(snapshot == owner.value);
      }

      /// \brief The value as it was when the mutation was created
      const Type& get_snapshot() const
      {
        check_not_released();
        return snapshot;
      }

      Type& get()
      {
        check_not_released();
        return owner.value;
      }
      const Type& get() const
      {
        check_not_released();
        return owner.value;
      }

      Type& operator *() { return get(); }
      const Type& operator *() const { return get(); }
      Type* operator ->() { return std::addressof(get()); }
      const Type* operator ->() const { return std::addressof(get()); }

    private:
      explicit mutation(tracker_t& _owner)
       : owner(_owner.acquire_for_mutation())
       , snapshot(take_snapshot(_owner))
      {
      }

      // if the copy fails, there is no mutation: the tracker must go back to idle
      static Type take_snapshot(tracker_t& t)
      {
        try
        {
          return t.value;
        }
        catch (...)
        {
          t.mutation_active.store(false, std::memory_order_release);
          throw;
        }
      }

      void check_not_released() const
      {
        if (released)
          DT_THROW(mutation_released, "mutation: cannot access the value through a released mutation");
      }

    private:
      tracker_t& owner;
      const Type snapshot;
      const int uncaught_exception_count = std::uncaught_exceptions();
      bool released = false;

      friend tracker_t;
  };
}
