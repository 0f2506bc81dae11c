//
// file : spinlock.hpp
//
// created by : Timothée Feuillet
// date: 19/10/2013 05:02:34
//
//
// Copyright (c) 2013-2026 Timothée Feuillet
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

#pragma once

#include <atomic>

namespace dtrack
{
  /// \brief Lock for very short critical sections (BasicLockable)
  /// \note the logger uses it to keep the lines of a multi-line report together
  class spinlock
  {
    public:
      spinlock() = default;
      spinlock(const spinlock&) = delete;
      spinlock& operator = (const spinlock&) = delete;

      void lock()
      {
        while (!try_lock())
        {
          // spin on a plain load, not on the read-modify-write
          while (flag.test(std::memory_order_relaxed)) {}
        }
      }

      [[nodiscard]] bool try_lock()
      {
        return !flag.test_and_set(std::memory_order_acquire);
      }

      void unlock()
      {
        flag.clear(std::memory_order_release);
      }

      /// \brief Wait until the lock is free, without taking it
      /// \note another thread may take it right after this returns
      void _wait_for_lock() const
      {
        while (flag.test(std::memory_order_acquire)) {}
      }

    private:
      std::atomic_flag flag = ATOMIC_FLAG_INIT;
  };
}
