//
// file : backtrace.cpp
//
// created by : Timothée Feuillet
// date: 27/01/2016 15:11:02
//
//
// Copyright (c) 2016-2026 Timothée Feuillet
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

#include "backtrace.hpp"

#include <cstdlib>
#include <string>
#include <vector>

#ifdef __linux__
  #include <execinfo.h>
#endif

#include "demangle.hpp"
#include "logger/logger.hpp"

namespace dtrack::cr
{
#ifdef __linux__
  // entries are formatted as: binary(symbol+offset) [address]
  static void print_entry(const char* entry, size_t index, bool has_logger_lock)
  {
    const std::string line = entry;
    const size_t open = line.find('(');
    const size_t plus = line.find('+', open == std::string::npos ? 0 : open);
    const size_t close = line.find(')', plus == std::string::npos ? 0 : plus);

    if (open == std::string::npos || plus == std::string::npos || close == std::string::npos || plus == open + 1)
    {
      out(has_logger_lock).error("  #{:<2} {}", index, line);
      return;
    }

    const std::string binary = line.substr(0, open);
    const std::string symbol = line.substr(open + 1, plus - open - 1);
    const std::string offset = line.substr(plus + 1, close - plus - 1);
    out(has_logger_lock).error("  #{:<2} {} [addr2line -Cfpe {} {}]", index, demangle(symbol), binary, offset);
  }

  void print_callstack(size_t backtrace_size, size_t skip, bool has_logger_lock)
  {
    std::vector<void*> buffer(backtrace_size + skip + 1);
    const int count = backtrace(buffer.data(), (int)buffer.size());
    char** symbols = backtrace_symbols(buffer.data(), count);
    if (symbols == nullptr)
    {
      out(has_logger_lock).error("[could not get the callstack]");
      return;
    }

    out(has_logger_lock).error("callstack:");
    // skip this very function too
    for (size_t i = skip + 1; i < (size_t)count; ++i)
      print_entry(symbols[i], i - skip - 1, has_logger_lock);

    free(symbols);
  }
#else
  void print_callstack(size_t, size_t, bool has_logger_lock)
  {
    out(has_logger_lock).error("[callstack printing is not supported on this platform]");
  }
#endif
} // namespace dtrack::cr

// kate: indent-mode cstyle; indent-width 2; replace-tabs on;
