//
// created by : Timothée Feuillet
// date: 2021-11-24
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
#include <cstdint>
#include <cstdlib>
#include <source_location>

#include "../logger/logger.hpp"
#include "../backtrace.hpp"
#include "../scoped_flag.hpp"

#ifndef DT_ALLOW_DEBUG
  #define DT_ALLOW_DEBUG false
#endif

#ifndef DT_DISABLE_CHECKS
  #define DT_DISABLE_CHECKS 0
#endif


namespace dtrack::debug
{
  class on_error
  {
    public:
      on_error() = delete;

#if !DT_DISABLE_CHECKS
      /// \brief log, print the callstack and break/abort if test is false
      template<typename... Args>
      static void _assert(std::source_location sloc, const bool test, const char* test_str, fmt::format_string<Args...> message, Args&&... args)
      {
        [[unlikely]] if (DT_ALLOW_DEBUG && test && cr::get_global_logger().can_log(cr::logger::severity::debug))
        {
          cr::out().log_fmt(cr::logger::severity::debug, sloc, "[ASSERT PASSED: {0}]", test_str);
          return;
        }
        [[likely]] if (test)
          return;
        {
          cr::scoped_counter _sc(thread_waiting);

          auto _sl = cr::get_global_logger().acquire_lock();
          cr::out(true).log_fmt(cr::logger::severity::critical, sloc, "[ASSERT FAILED: {0}]: {1}", test_str, fmt::format(std::move(message), std::forward<Args>(args)...));
          cr::print_callstack(25, 1, true);
        }

        while (thread_waiting.load(std::memory_order_acquire) > 0) {}

#if defined(__x86_64__) || defined(__i386__)
        asm("int $3"); // break
#endif
        abort();       // abort, just in case
      }

      /// \brief log and print the callstack if test is false. Returns test.
      template<typename... Args>
      static bool _check(std::source_location sloc, const bool test, const char* test_str, fmt::format_string<Args...> message, Args&&... args)
      {
        [[unlikely]] if (DT_ALLOW_DEBUG && test && cr::get_global_logger().can_log(cr::logger::severity::debug))
        {
          cr::out().log_fmt(cr::logger::severity::debug, sloc, "[CHECK  PASSED: {0}]", test_str);
          return test;
        }
        [[likely]] if (test)
          return test;
        {
          cr::scoped_counter _sc(thread_waiting);

          auto _sl = cr::get_global_logger().acquire_lock();
          cr::out(true).log_fmt(cr::logger::severity::error, sloc, "[CHECK  FAILED: {0}]: {1}", test_str, fmt::format(std::move(message), std::forward<Args>(args)...));
          cr::print_callstack(25, 1, true);
        }

        return test;
      }
#endif

      static void _dummy() {}
      static bool _dummy(bool r) { return r; }

    private:
      inline static std::atomic<uint32_t> thread_waiting = 0;
  };
}

#if !DT_DISABLE_CHECKS

#define n_assert(test, ...)       _assert(std::source_location::current(), test, #test, __VA_ARGS__)
#define n_check(test, ...)        _check(std::source_location::current(), test, #test, __VA_ARGS__)

#else // DT_DISABLE_CHECKS

#define n_assert(test, ...)       _dummy()
#define n_check(test, ...)        _dummy(test)

#endif

namespace dtrack::check
{
  using debug = dtrack::debug::on_error;
}
