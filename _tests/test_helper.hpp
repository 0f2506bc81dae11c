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

#include <cstdint>

#include "../exception.hpp"
#include "../debug/assert.hpp"
#include "../logger/logger.hpp"

namespace dtrack
{
  class test_helper_t
  {
    public:
      explicit test_helper_t(const char* _name) : name(_name)
      {
        cr::get_global_logger().min_severity = dtrack::cr::logger::severity::debug;
        cr::get_global_logger().register_callback(dtrack::cr::print_log_to_console, nullptr);
      }

      ~test_helper_t()
      {
        cr::get_global_logger().unregister_callback(dtrack::cr::print_log_to_console, nullptr);
      }

      // A test fails if it returns false or throws
      template<typename Fnc>
      void run(const char* test_name, Fnc&& fnc)
      {
        ++run_count;
        bool success = false;
        try
        {
          success = fnc();
        }
        DT_CATCH_ACTION(success = false)

        if (success)
        {
          cr::out().log("[ OK ] {}: {}", name, test_name);
        }
        else
        {
          ++failure_count;
          cr::out().error("[FAIL] {}: {}", name, test_name);
        }
      }

      // exit code for main()
      int finish() const
      {
        if (failure_count == 0)
          cr::out().log("{}: all {} tests passed", name, run_count);
        else
          cr::out().error("{}: {} of {} tests failed", name, failure_count, run_count);
        return failure_count == 0 ? 0 : 1;
      }

    private:
      const char* name;
      uint32_t run_count = 0;
      uint32_t failure_count = 0;
  };

  /// \brief Run fnc, returns whether it threw an ExceptionType
  template<typename ExceptionType, typename Fnc>
  bool throws(Fnc&& fnc)
  {
    try
    {
      fnc();
    }
    catch (const ExceptionType&)
    {
      return true;
    }
    return false;
  }
}
