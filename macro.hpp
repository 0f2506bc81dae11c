//
// file : macro.hpp (2)
//
// created by : Timothée Feuillet on linux.site
// date: 03/08/2014 18:58:27
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

//
// defines some macros
//

// stringify and expand and stringify
#define DT_STRINGIFY(s) #s
#define DT_EXP_STRINGIFY(s) DT_STRINGIFY(s)

// TOKEN GLUE
#define _DT_GLUE(x, y) x ## y
#define DT_GLUE(x, y) _DT_GLUE(x, y)

// kate: indent-mode cstyle; indent-width 2; replace-tabs on;
