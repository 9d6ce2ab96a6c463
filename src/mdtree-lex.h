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

#ifndef MDTREE_LEX_H
#define MDTREE_LEX_H

#include "mdtree.h"

#include <iterator>
#include <optional>
#include <vector>

/* Pull-based scanner over a source text. Each call to next() classifies one
 * token starting at the cursor and advances the cursor past it. The source
 * must outlive the tokenizer.
 *
 * Tokens produced by one tokenizer are contiguous: the end of one token is the
 * beginning of the next, and together they cover [start, text.size()) exactly
 * once.
 */
class Tokenizer {
public:
  Tokenizer(MDT_OFFSET start, mdstringview text) : off(start), text(text) {}

  /* Returns std::nullopt once the cursor reaches the end of the text. */
  std::optional<Token> next();

  MDT_OFFSET offset() const { return off; }

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Token;
    using difference_type = std::ptrdiff_t;
    using pointer = const Token *;
    using reference = const Token &;

    iterator() = default;
    explicit iterator(Tokenizer *tok) : tok(tok) { ++*this; }

    reference operator*() const { return *current; }
    pointer operator->() const { return &*current; }
    iterator &operator++() {
      current = tok->next();
      return *this;
    }
    void operator++(int) { ++*this; }

    bool operator==(std::default_sentinel_t) const {
      return !current.has_value();
    }

  private:
    Tokenizer *tok = nullptr;
    std::optional<Token> current;
  };

  iterator begin() { return iterator(this); }
  std::default_sentinel_t end() const { return {}; }

private:
  MDT_OFFSET off;
  mdstringview text;
};

/* Runs a fresh tokenizer from start to the end of the text. */
std::vector<Token> md_tokenize(mdstringview text, MDT_OFFSET start = 0);

/* Reads up to n tokens from start into the lookahead slots; slots past the end
 * of the text are left empty. */
void md_lookahead(mdstringview text, MDT_OFFSET start,
                  std::optional<Token> *slots, size_t n);

#endif /* MDTREE_LEX_H */
