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

#include "../exception.hpp"

namespace dtrack
{
  /// \brief Thrown when the tracker is accessed while a mutation handle is outstanding
  /// (read, begin_mutation, add/remove listener, including from a listener during notification)
  class mutation_in_progress : public typed_exception<mutation_in_progress>
  {
    public:
      using typed_exception<mutation_in_progress>::typed_exception;
  };

  /// \brief Thrown when a mutation is started while a read view is alive
  class read_in_progress : public typed_exception<read_in_progress>
  {
    public:
      using typed_exception<read_in_progress>::typed_exception;
  };

  /// \brief Thrown when a released mutation handle is used or released again
  class mutation_released : public typed_exception<mutation_released>
  {
    public:
      using typed_exception<mutation_released>::typed_exception;
  };

  /// \brief Thrown when registering an empty callback
  class invalid_listener : public typed_exception<invalid_listener>
  {
    public:
      using typed_exception<invalid_listener>::typed_exception;
  };
}
