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

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>

#include "../move_only_function/move_only_function.hpp"
#include "concepts.hpp"
#include "errors.hpp"

namespace dtrack
{
  /// \brief Keyed set of change listeners, each called with (old value, new value)
  ///
  /// \note notification order is the iteration order of the underlying hash map:
  ///       unspecified, but every listener is called exactly once per notification round
  /// \note a listener that throws stops the round: the exception reaches the caller of notify_all()
  ///       and the listeners that were not yet called are skipped for this round
  /// \note NOT threadsafe: the owning tracker serializes the accesses
  template<typename Type, typename Key, typename Hash = std::hash<Key>>
  requires listener_key<Key, Hash>
  class listener_registry
  {
    public:
      using callback_t = std::move_only_function<void(const Type&, const Type&)>;
      using key_t = Key;

      /// \brief Add a listener, replacing the one already registered under the same key
      /// \returns the replaced listener, if any
      std::optional<callback_t> insert(Key key, callback_t&& callback)
      {
        if (!callback)
          DT_THROW(invalid_listener, "listener_registry::insert: cannot register an empty callback");

        auto it = entries.find(key);
        if (it == entries.end())
        {
          entries.emplace(std::move(key), std::move(callback));
          return std::nullopt;
        }

        std::optional<callback_t> previous { std::move(it->second) };
        it->second = std::move(callback);
        return previous;
      }

      /// \brief Remove the listener registered under key
      /// \returns the removed listener, if any
      std::optional<callback_t> remove(const Key& key)
      {
        auto it = entries.find(key);
        if (it == entries.end())
          return std::nullopt;

        std::optional<callback_t> previous { std::move(it->second) };
        entries.erase(it);
        return previous;
      }

      /// \brief Call every listener once with (old_value, new_value)
      void notify_all(const Type& old_value, const Type& new_value)
      {
        for_each([&](const Key&, callback_t& callback)
        {
          callback(old_value, new_value);
        });
      }

      /// \brief Call fnc(key, callback) over all the registered entries
      /// \warning fnc must not add or remove listeners
      template<typename Fnc>
      void for_each(Fnc&& fnc)
      {
        for (auto& it : entries)
          fnc(it.first, it.second);
      }

      bool contains(const Key& key) const { return entries.find(key) != entries.end(); }
      std::size_t size() const { return entries.size(); }
      bool empty() const { return entries.empty(); }

    private:
      std::unordered_map<Key, callback_t, Hash> entries;
  };
}
