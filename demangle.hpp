//
// file : demangle.hpp
//
// created by : Timothée Feuillet
// date: 03/08/2014 16:20:59
//
//
// Copyright (c) 2014-2026 Timothée Feuillet
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

#include <string>
#include "compiler_detection.hpp"

#ifndef __has_feature
#define __has_feature(x) false
#endif

#if defined(__GXX_RTTI) || __has_feature(cxx_rtti) || defined(_CPPRTTI)
#define DT_HAS_RTTI 1
#include <typeinfo>
#else
#define DT_HAS_RTTI 0
#endif

// GCC and clang share the itanium ABI
#if defined(DT_COMPILER_GCC) || defined(DT_COMPILER_CLANG)
#include <cxxabi.h>
#include <stdlib.h>

namespace dtrack
{
  static inline std::string demangle(const std::string &symbol)
  {
    int status = 0;
    char *realname = nullptr;

    realname = abi::__cxa_demangle(symbol.data(), 0, 0, &status);
    std::string ret;
    if (status)
      ret = symbol;
    else
    {
      ret = realname;
      free(realname);
    }
    return ret;
  }
} // dtrack
#else
namespace dtrack
{
  static inline std::string demangle(const std::string &symbol)
  {
    return symbol;
  }
} // dtrack
#endif

namespace dtrack
{
  template<typename Type>
  static inline std::string demangle()
  {
#if DT_HAS_RTTI
    return demangle(typeid(Type).name());
#else
    return "[unknow symbol: rtti disabled]";
#endif
  }
} // dtrack

// kate: indent-mode cstyle; indent-width 2; replace-tabs on;
