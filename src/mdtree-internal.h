/* mdtree: Markdown tokenizer and block tree builder in C++20.
This software is derived from md5cpp and md4c, and is licensed under the same
terms as md4c, reproduced below:
*/
/*
 * MD4C: Markdown parser for C
 * (http://github.com/mity/md4c)
 *
 * Copyright (c) 2016-2020 Martin Mitas
 *
 * Permission is hereby granted, free of charge, to any person obtaining a
 * copy of this software and associated documentation files (the "Software"),
 * to deal in the Software without restriction, including without limitation
 * the rights to use, copy, modify, merge, publish, distribute, sublicense,
 * and/or sell copies of the Software, and to permit persons to whom the
 * Software is furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
 * OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
 * IN THE SOFTWARE.
 */

#ifndef MDTREE_INTERNAL_H
#define MDTREE_INTERNAL_H

#include <cstdio>
#include <cstdlib>

/* Misc. macros. */
#define STRINGIZE_(x) #x
#define STRINGIZE(x) STRINGIZE_(x)

#ifdef DEBUG
#define MDT_ASSERT(cond)                                                       \
  do {                                                                         \
    if (!(cond)) {                                                             \
      std::fprintf(stderr, "%s\n",                                             \
                   __FILE__ ":" STRINGIZE(__LINE__) ": "                       \
                                                    "Assertion '" STRINGIZE(   \
                                                        cond) "' failed.");    \
      std::exit(1);                                                            \
    }                                                                          \
  } while (0)

#define MDT_UNREACHABLE() MDT_ASSERT(1 == 0)
#else
#ifdef __GNUG__
#define MDT_ASSERT(cond)                                                       \
  do {                                                                         \
    if (!(cond))                                                               \
      __builtin_unreachable();                                                 \
  } while (0)
#define MDT_UNREACHABLE()                                                      \
  do {                                                                         \
    __builtin_unreachable();                                                   \
  } while (0)
#elif defined _MSC_VER && _MSC_VER > 120
#define MDT_ASSERT(cond)                                                       \
  do {                                                                         \
    __assume(cond);                                                            \
  } while (0)
#define MDT_UNREACHABLE()                                                      \
  do {                                                                         \
    __assume(0);                                                               \
  } while (0)
#else
#define MDT_ASSERT(cond)                                                       \
  do {                                                                         \
  } while (0)
#define MDT_UNREACHABLE()                                                      \
  do {                                                                         \
  } while (0)
#endif
#endif

/* Character classification.
 * Note we assume ASCII compatibility of code points < 128 here. */
#define ISIN_(ch, ch_min, ch_max)                                              \
  ((ch_min) <= (unsigned)(ch) && (unsigned)(ch) <= (ch_max))
#define ISANYOF2_(ch, ch1, ch2) ((ch) == (ch1) || (ch) == (ch2))
#define ISBLANK_(ch) (ISANYOF2_((ch), ' ', '\t'))
#define ISNEWLINE_(ch) ((ch) == '\n')
#define ISDIGIT_(ch) (ISIN_(ch, '0', '9'))

#endif /* MDTREE_INTERNAL_H */
