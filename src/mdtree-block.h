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

#ifndef MDTREE_BLOCK_H
#define MDTREE_BLOCK_H

#include "mdtree.h"

#include <optional>
#include <vector>

/* A block opened by a rule but not yet attached to the tree, paired with the
 * offset consumed by the opening. The caller decides where to attach it. */
struct Link {
  Node node;
  MDT_OFFSET consumed;
};

using Lookahead = std::optional<Token>;

/* Block rule protocol.
 *
 * open() inspects up to three lookahead tokens at the start of a line and
 * either returns the new block or std::nullopt when the line does not start
 * this kind of block. Slots a rule does not need are ignored.
 *
 * consume() extends the block, already attached as node, from start. It
 * returns the new offset, or std::nullopt if the block closed without
 * advancing past start. A block is closed once its end offset is set.
 */
struct MDT_BLOCK_RULE_tag {
  const char *name;
  std::optional<Link> (*open)(const Node & /*parent*/, const Lookahead & /*a*/,
                              const Lookahead & /*b*/, const Lookahead & /*c*/);
  std::optional<MDT_OFFSET> (*consume)(Tree & /*tree*/, NodeId /*node*/,
                                       MDT_OFFSET /*start*/,
                                       mdstringview /*text*/);
};
using BlockRule = MDT_BLOCK_RULE_tag;

/* Scans the inline content of the line starting at start, attaching one inline
 * child to node per token up to and including the line's newline. Returns the
 * offset after the last token, or std::nullopt if start is at the end of the
 * text. */
std::optional<MDT_OFFSET> md_leaf_consume(Tree &tree, NodeId node,
                                          MDT_OFFSET start, mdstringview text);

/* ATX heading: 1 - 6 '#' followed by whitespace. A heading never continues
 * past its first line. */
std::optional<Link> md_heading_open(const Node &parent, const Lookahead &a,
                                    const Lookahead &b, const Lookahead &c);
std::optional<MDT_OFFSET> md_heading_consume(Tree &tree, NodeId node,
                                             MDT_OFFSET start,
                                             mdstringview text);

/* Paragraph: any line that is not blank. Continues over following lines until
 * a blank line, the end of the text, or a line starting a heading. */
std::optional<Link> md_paragraph_open(const Node &parent, const Lookahead &a,
                                      const Lookahead &b, const Lookahead &c);
std::optional<MDT_OFFSET> md_paragraph_consume(Tree &tree, NodeId node,
                                               MDT_OFFSET start,
                                               mdstringview text);

/* True if the lookahead describes an empty (or whitespace only) line. */
bool md_is_blank_line(const Lookahead &a, const Lookahead &b);

/* The enabled block rules for the MDT_FLAG_xxxx bitmask, in the order they
 * are tried. */
std::vector<BlockRule> md_block_rules(unsigned flags);

#endif /* MDTREE_BLOCK_H */
