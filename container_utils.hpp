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

#include <string>
#include <string_view>
#include <vector>

namespace dtrack::cr
{
  /// \brief split a string on every occurence of a separator. Empty parts are kept.
  [[maybe_unused]] static std::vector<std::string> split_string(std::string_view input, std::string_view separator)
  {
    std::vector<std::string> ret;
    if (separator.empty())
    {
      ret.emplace_back(input);
      return ret;
    }
    size_t start = 0;
    while (true)
    {
      const size_t pos = input.find(separator, start);
      if (pos == std::string_view::npos)
      {
        ret.emplace_back(input.substr(start));
        return ret;
      }
      ret.emplace_back(input.substr(start, pos - start));
      start = pos + separator.size();
    }
  }
}
