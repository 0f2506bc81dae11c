//
// created by : Timothée Feuillet
// date: 2021-11-27
//
//
// Copyright (c) 2021-2026 Timothée Feuillet
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

namespace dtrack::cr
{
  static constexpr struct scoped_flag_adopt_t {} scoped_flag_adopt;

  /// \brief scoped flag, set and restore the value of a flag/variable
  template<typename Type, typename ValueType = Type> class scoped_flag;

  /// \brief scoped counter, increment/decrement the value of a counter
  template<typename Type> class scoped_counter;

  /// \brief Atomic variant of scoped_flag, so the set/unset operation is atomic
  /// The adopt variant takes over a flag that has already been set by the caller
  /// and only restores it on destruction.
  template<typename Type>
  class scoped_flag<std::atomic<Type>, Type>
  {
    public:
      scoped_flag(std::atomic<Type>& _ref, Type _set)
       : ref(_ref)
      {
        unset = ref.exchange(_set, std::memory_order_acq_rel);
      }
      scoped_flag(std::atomic<Type>& _ref, Type _unset, scoped_flag_adopt_t)
       : ref(_ref), unset(_unset)
      {
      }

      ~scoped_flag()
      {
        ref.store(unset, std::memory_order_release);
      }

      scoped_flag(const scoped_flag&) = delete;
      scoped_flag& operator = (const scoped_flag&) = delete;

    private:
      std::atomic<Type>& ref;
      Type unset;
  };

  /// \brief Atomic variant of scoped_counter, so the add/sub operation is atomic
  template<typename Type>
  class scoped_counter<std::atomic<Type>>
  {
    public:
      scoped_counter(std::atomic<Type>& _ref, Type _step = 1)
       : ref(_ref), step(_step)
      {
        value = ref.fetch_add(step, std::memory_order_acq_rel);
      }

      ~scoped_counter()
      {
        ref.fetch_sub(step, std::memory_order_release);
      }

      Type get_value() const { return value; }
    private:
      std::atomic<Type>& ref;
      Type step;
      Type value;
  };

  // deduction guides for various types:
  template<typename Type> scoped_flag(std::atomic<Type>&, Type) -> scoped_flag<std::atomic<Type>, Type>;
  template<typename Type> scoped_flag(std::atomic<Type>&, Type, scoped_flag_adopt_t) -> scoped_flag<std::atomic<Type>, Type>;
  template<typename Type> scoped_counter(std::atomic<Type>&) -> scoped_counter<std::atomic<Type>>;
  template<typename Type, typename StepType> scoped_counter(std::atomic<Type>&, StepType) -> scoped_counter<std::atomic<Type>>;
}
