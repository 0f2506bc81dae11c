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

#include "logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/color.h>

#include "../container_utils.hpp"
#include "../chrono.hpp"

namespace dtrack::cr
{
  logger& get_global_logger()
  {
    static logger out;
    return out;
  }
  logger::log_location_helper out(bool skip_lock, std::source_location loc)
  {
    return get_global_logger()(skip_lock, loc);
  }

  void logger::log_str(severity s, const std::string& str, std::source_location loc)
  {
    if (!can_log(s))
      return;

    const auto lines = split_string(str, "\n");
    for (const auto& line : lines)
    {
      if (callbacks.empty())
        print_log_to_console(nullptr, s, line, loc);
      for (auto&& it : callbacks)
      {
        it.fnc(it.data, s, line, loc);
      }
    }
  }

  void logger::register_callback(callback_t cb, void* data)
  {
    callbacks.push_back({cb, data});
  }

  void logger::unregister_callback(callback_t cb, void* data)
  {
    std::erase_if(callbacks, [cb, data](const callback_context& it)
    {
      return it.fnc == cb && it.data == data;
    });
  }

  std::string format_log_to_string(dtrack::cr::logger::severity s, const std::string& msg, std::source_location loc)
  {
    const std::string path = std::filesystem::path(loc.file_name()).filename().string() + " ";
    return fmt::format("[{:>12.6f}] [{:>4}] {:.<35}:{:>4}: {}", std::max(0.0, chrono::now_relative()), dtrack::cr::logger::severity_abbr(s), path, loc.line(), msg);
  }

  void print_log_to_console(void*, dtrack::cr::logger::severity s, const std::string& msg, std::source_location loc)
  {
    static const fmt::text_style critical = fmt::emphasis::bold | fmt::fg(fmt::color::crimson) | fmt::bg(fmt::color::gainsboro);
    static const fmt::text_style error = fmt::emphasis::bold | fmt::fg(fmt::color::red);
    static const fmt::text_style warn = fmt::emphasis::bold | fmt::fg(fmt::color::orange);
    static const fmt::text_style normal;
    static const fmt::text_style debug = fmt::fg(fmt::color::gray);
    fmt::text_style style;
    switch (s)
    {
      case dtrack::cr::logger::severity::debug: style = debug; break;
      case dtrack::cr::logger::severity::message: style = normal; break;
      case dtrack::cr::logger::severity::warning: style = warn; break;
      case dtrack::cr::logger::severity::error: style = error; break;
      case dtrack::cr::logger::severity::critical: style = critical; break;
    }

    const std::string msg_str = format_log_to_string(s, msg, loc);
    fmt::print(style, "{}", msg_str);
    fmt::print(fmt::text_style{}, "\n"); // reset style to the term default (avoid leaving with red everywhere in case of a critical error)
  }
}
