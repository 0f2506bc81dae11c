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
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../debug/assert.hpp"
#include "../demangle.hpp"
#include "concepts.hpp"
#include "errors.hpp"
#include "listener_registry.hpp"
#include "mutation.hpp"
#include "read_view.hpp"

namespace dtrack
{
  /// \brief Owns a value and notifies listeners when a mutation changes it
  ///
  /// usage:
  /// \code
  ///   dtrack::tracker<settings> tracked { settings{} };
  ///   tracked.add_listener(0, [](const settings& old_value, const settings& new_value) { ... });
  ///   {
  ///     auto m = tracked.begin_mutation();
  ///     m->volume = 10;
  ///   } // listeners are called here, if the value changed
  /// \endcode
  ///
  /// While a mutation is in progress every other access to the tracker is rejected with
  /// a mutation_in_progress exception (this includes listeners calling back into the tracker).
  /// A reference returned by read() must not be kept across a mutation. Use begin_read() to hold
  /// on to the value: mutations are rejected with read_in_progress while a read view is alive.
  ///
  /// \note listeners are called on the thread that releases the mutation
  template<trackable Type, typename Key, typename Hash>
  requires listener_key<Key, Hash>
  class tracker
  {
    public:
      using value_t = Type;
      using key_t = Key;
      using registry_t = listener_registry<Type, Key, Hash>;
      using callback_t = typename registry_t::callback_t;
      using mutation_t = mutation<Type, Key, Hash>;
      using read_view_t = read_view<Type, Key, Hash>;

      explicit tracker(Type initial_value) : value(std::move(initial_value)) {}

      ~tracker()
      {
        check::debug::n_assert(!mutation_active.load(std::memory_order_acquire),
                               "{}: destructed while a mutation is in progress, the mutation references a destroyed object",
                               demangle<tracker>());
        check::debug::n_assert(reader_count.load(std::memory_order_acquire) == 0,
                               "{}: destructed while {} read views are alive",
                               demangle<tracker>(), reader_count.load(std::memory_order_relaxed));
      }

      tracker(const tracker&) = delete;
      tracker& operator = (const tracker&) = delete;

      /// \brief Read-only access to the value
      const Type& read() const
      {
        check_no_mutation("read");
        return value;
      }

      /// \brief Read-only access to the value, kept stable for the lifetime of the returned view
      [[nodiscard]] read_view_t begin_read() const
      {
        return read_view_t{*this};
      }

      /// \brief Register a listener, replacing the one previously registered under key
      /// \returns the replaced listener, if any
      std::optional<callback_t> add_listener(Key key, callback_t&& callback)
      {
        check_no_mutation("add_listener");
        return listeners.insert(std::move(key), std::move(callback));
      }

      /// \brief Register a member function as a listener
      /// \note self must outlive the registration
      template<typename Class>
      std::optional<callback_t> add_listener(Key key, Class& self, void (Class::*fnc)(const Type&, const Type&))
      {
        return add_listener(std::move(key), [&self, fnc](const Type& old_value, const Type& new_value)
        {
          (self.*fnc)(old_value, new_value);
        });
      }

      /// \brief Unregister the listener registered under key
      /// \returns the removed listener, if any
      std::optional<callback_t> remove_listener(const Key& key)
      {
        check_no_mutation("remove_listener");
        return listeners.remove(key);
      }

      bool has_listener(const Key& key) const
      {
        check_no_mutation("has_listener");
        return listeners.contains(key);
      }

      std::size_t get_number_of_listeners() const
      {
        check_no_mutation("get_number_of_listeners");
        return listeners.size();
      }

      /// \brief Start a mutation. Listeners are notified when it ends, if the value changed.
      [[nodiscard]] mutation_t begin_mutation()
      {
        return mutation_t{*this};
      }

      /// \brief Call fnc(Type&) inside a mutation, returns what fnc returns
      template<typename Fnc>
      decltype(auto) modify(Fnc&& fnc)
      {
        mutation_t m = begin_mutation();
        return std::forward<Fnc>(fnc)(m.get());
      }

      bool is_mutation_in_progress() const
      {
        return mutation_active.load(std::memory_order_acquire);
      }

      uint32_t get_number_of_readers() const
      {
        return reader_count.load(std::memory_order_acquire);
      }

    private:
      void check_no_mutation(const char* operation) const
      {
        if (mutation_active.load(std::memory_order_acquire))
          DT_THROW_STRING(mutation_in_progress, fmt::format("tracker::{}: a mutation is in progress on this tracker", operation));
      }

      // Both acquisitions publish their own state before looking at the other one's.
      // Sequentially consistent ordering guarantees at least one of them sees the other.
      tracker& acquire_for_mutation()
      {
        bool expected = false;
        if (!mutation_active.compare_exchange_strong(expected, true, std::memory_order_seq_cst))
          DT_THROW(mutation_in_progress, "tracker::begin_mutation: a mutation is already in progress on this tracker");
        if (const uint32_t readers = reader_count.load(std::memory_order_seq_cst); readers > 0)
        {
          mutation_active.store(false, std::memory_order_release);
          DT_THROW_STRING(read_in_progress, fmt::format("tracker::begin_mutation: {} read views are alive on this tracker", readers));
        }
        return *this;
      }

      const tracker& acquire_for_read() const
      {
        reader_count.fetch_add(1, std::memory_order_seq_cst);
        if (mutation_active.load(std::memory_order_seq_cst))
        {
          reader_count.fetch_sub(1, std::memory_order_release);
          DT_THROW(mutation_in_progress, "tracker::begin_read: a mutation is in progress on this tracker");
        }
        return *this;
      }

    private:
      Type value;
      registry_t listeners;
      std::atomic<bool> mutation_active = false;
      mutable std::atomic<uint32_t> reader_count = 0;

      friend mutation_t;
      friend read_view_t;
  };
}
