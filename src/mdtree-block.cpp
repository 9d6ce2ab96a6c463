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

#include "mdtree-block.h"
#include "mdtree-lex.h"

/**********************
 ***  Leaf Content  ***
 **********************/

std::optional<MDT_OFFSET> md_leaf_consume(Tree &tree, NodeId node,
                                          MDT_OFFSET start, mdstringview text) {
  Tokenizer tok(start, text);
  std::optional<MDT_OFFSET> end;

  while (const auto token = tok.next()) {
    tree.attach(node, md_token_to_node(*token));
    end = token->slice.end;
    if (token->type == TokenType::newline)
      break;
  }
  return end;
}

bool md_is_blank_line(const Lookahead &a, const Lookahead &b) {
  if (!a)
    return true;
  if (a->type == TokenType::newline)
    return true;
  return a->type == TokenType::whitespace &&
         (!b || b->type == TokenType::newline);
}

/******************
 ***  Headings  ***
 ******************/

std::optional<Link> md_heading_open(const Node &, const Lookahead &a,
                                    const Lookahead &b, const Lookahead &) {
  if (!a || !b || a->type != TokenType::hash ||
      b->type != TokenType::whitespace)
    return std::nullopt;

  const MDT_OFFSET level = a->slice.size();
  if (level > 6)
    return std::nullopt;

  return Link{Node::block(Heading_Kind{static_cast<unsigned short>(level)},
                          a->slice.beg),
              b->slice.end};
}

std::optional<MDT_OFFSET> md_heading_consume(Tree &tree, NodeId node,
                                             MDT_OFFSET start,
                                             mdstringview text) {
  const auto p = md_leaf_consume(tree, node, start, text);

  /* Headings cannot continue onto the next line, so the first consume always
   * closes them. */
  tree[node].end = p.value_or(start);
  return p;
}

/********************
 ***  Paragraphs  ***
 ********************/

std::optional<Link> md_paragraph_open(const Node &, const Lookahead &a,
                                      const Lookahead &b, const Lookahead &) {
  if (md_is_blank_line(a, b))
    return std::nullopt;

  return Link{Node::block(Paragraph_Kind{}, a->slice.beg), a->slice.beg};
}

static std::optional<MDT_OFFSET>
paragraph_consume(Tree &tree, NodeId node, MDT_OFFSET start, mdstringview text,
                  bool headings) {
  const auto p = md_leaf_consume(tree, node, start, text);
  if (!p) {
    tree[node].end = start;
    return std::nullopt;
  }

  Lookahead la[3];
  md_lookahead(text, *p, la, 3);

  if (md_is_blank_line(la[0], la[1]) ||
      (headings && md_heading_open(tree[node], la[0], la[1], la[2])))
    tree[node].end = *p;
  return p;
}

std::optional<MDT_OFFSET> md_paragraph_consume(Tree &tree, NodeId node,
                                               MDT_OFFSET start,
                                               mdstringview text) {
  return paragraph_consume(tree, node, start, text, true);
}

/* Without headings, a line of '#' is ordinary paragraph text. */
static std::optional<MDT_OFFSET>
md_paragraph_consume_noheadings(Tree &tree, NodeId node, MDT_OFFSET start,
                                mdstringview text) {
  return paragraph_consume(tree, node, start, text, false);
}

/********************
 ***  Rule Table  ***
 ********************/

std::vector<BlockRule> md_block_rules(unsigned flags) {
  std::vector<BlockRule> rules;

  if (flags & MDT_FLAG_NOHEADINGS) {
    rules.push_back(BlockRule{"paragraph", md_paragraph_open,
                              md_paragraph_consume_noheadings});
  } else {
    rules.push_back(
        BlockRule{"heading", md_heading_open, md_heading_consume});
    rules.push_back(
        BlockRule{"paragraph", md_paragraph_open, md_paragraph_consume});
  }
  return rules;
}
