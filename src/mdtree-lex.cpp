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

#include "mdtree-lex.h"
#include "mdtree-internal.h"

/*******************
 ***  Tokenizer  ***
 *******************/

enum class Lex_State { unset, whitespace, plaintext, number, hash, done };

std::optional<Token> Tokenizer::next() {
  const MDT_OFFSET beg = off;
  MDT_OFFSET p = off;
  Lex_State state = Lex_State::unset;
  std::optional<Token> result;

  auto close = [&](TokenType type, MDT_OFFSET end) {
    result = Token{type, Slice{beg, end}};
    state = Lex_State::done;
    p = end;
  };

  while (state != Lex_State::done) {
    const bool at_end = (p >= text.size());
    const MDT_CHAR ch = at_end ? '\0' : text[p];

    switch (state) {
    case Lex_State::unset:
      if (at_end) {
        /* Nothing left; no empty token is ever produced. */
        state = Lex_State::done;
        break;
      }
      switch (ch) {
      case '-':
        close(TokenType::dash, p + 1);
        break;
      case '*':
        close(TokenType::asterisk, p + 1);
        break;
      case '+':
        close(TokenType::plus, p + 1);
        break;
      case '\n':
        close(TokenType::newline, p + 1);
        break;
      case '>':
        close(TokenType::right_caret, p + 1);
        break;
      case '#':
        state = Lex_State::hash;
        p++;
        break;
      case ' ':
      case '\t':
        state = Lex_State::whitespace;
        p++;
        break;
      default:
        state = ISDIGIT_(ch) ? Lex_State::number : Lex_State::plaintext;
        p++;
        break;
      }
      break;

    case Lex_State::whitespace:
      if (!at_end && ISBLANK_(ch))
        p++;
      else
        close(TokenType::whitespace, p);
      break;

    case Lex_State::plaintext:
      if (at_end || ISBLANK_(ch) || ISNEWLINE_(ch))
        close(TokenType::plaintext, p);
      else
        p++;
      break;

    case Lex_State::number:
      /* Digits become a list marker only when '.' or ')' follows them;
       * otherwise the run and the character after it are re-read as plain
       * text. A newline still ends the line. */
      if (at_end || ISNEWLINE_(ch)) {
        close(TokenType::plaintext, p);
      } else if (ISDIGIT_(ch)) {
        p++;
      } else if (ch == '.') {
        close(TokenType::num_dot, p + 1);
      } else if (ch == ')') {
        close(TokenType::num_paren, p + 1);
      } else {
        state = Lex_State::plaintext;
        p++;
      }
      break;

    case Lex_State::hash:
      if (!at_end && ch == '#')
        p++;
      else
        close(TokenType::hash, p);
      break;

    case Lex_State::done:
    default:
      MDT_UNREACHABLE();
      break;
    }
  }

  off = p;
  return result;
}

std::vector<Token> md_tokenize(mdstringview text, MDT_OFFSET start) {
  std::vector<Token> tokens;
  for (const Token &token : Tokenizer(start, text))
    tokens.push_back(token);
  return tokens;
}

void md_lookahead(mdstringview text, MDT_OFFSET start,
                  std::optional<Token> *slots, size_t n) {
  Tokenizer tok(start, text);
  for (size_t i = 0; i < n; i++)
    slots[i] = tok.next();
}
