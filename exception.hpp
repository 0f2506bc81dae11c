//
// file : exception.hpp (2)
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

#include <exception>
#include <string>

#include "macro.hpp"
#include "demangle.hpp"
#include "logger/logger.hpp"

namespace dtrack
{
  // the base dtrack exception class
  class exception : public std::exception
  {
    private:
      std::string msg;

    public:
      explicit exception(const std::string &what_arg) noexcept : msg(what_arg) {}
      explicit exception(std::string &&what_arg) noexcept : msg(std::move(what_arg)) {}
      virtual ~exception() noexcept = default;

      virtual const char *what() const noexcept
      {
        return msg.data();
      }
  };

  // an CRTP exception class that add the type name at the start of the string
  template<typename ExceptionType>
  class typed_exception : public exception
  {
    public:
      typed_exception(const std::string &s) noexcept : exception(dtrack::demangle<ExceptionType>() + ": " + s) {}
      typed_exception(std::string && s) noexcept : exception(dtrack::demangle<ExceptionType>() + ": " + std::move(s)) {}

      virtual ~typed_exception() = default;
  };

// log the line and the file of an exception
// string should be a simple quoted string
// (usage exemple: DT_THROW(dtrack::exception, "this is the exception string !");
#define DT_THROW(exception_class, string)        throw exception_class(__FILE__ ": " DT_EXP_STRINGIFY(__LINE__) ": " string)
// for std::strings
#define DT_THROW_STRING(exception_class, str) throw exception_class(std::string(__FILE__ ": " DT_EXP_STRINGIFY(__LINE__) ": ") + str)

//
// some default catch macros
//
#define DT_PRINT_EXCEPTION(e)            dtrack::cr::out().error("caught exception '{}'", e.what())
#define DT_PRINT_UNKNOW_EXCEPTION        dtrack::cr::out().error("caught unknown exception...")
#define DT_CATCH_ACTION(x)               catch(std::exception &e) { DT_PRINT_EXCEPTION(e); x; } catch(...) { DT_PRINT_UNKNOW_EXCEPTION; x; }
#define DT_CATCH                         DT_CATCH_ACTION( )

} // namespace dtrack

// kate: indent-mode cstyle; indent-width 2; replace-tabs on;
