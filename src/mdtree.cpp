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

#include "mdtree.h"
#include "mdtree-block.h"
#include "mdtree-internal.h"
#include "mdtree-lex.h"

#include <new>
#include <string>
#include <utility>

/* Context propagated through all the parsing. */
struct Parsing_Context {
  /* Immutable stuff (parameters of md_parse()). */
  mdstringview text;
  MDT_PARSER parser;
  void *userdata;

  /* Block rules in the order they are tried at each line start. */
  std::vector<BlockRule> rules;
};

#define MDT_LOG(msg)                                                           \
  do {                                                                         \
    if (ctx.parser.debug_log != nullptr)                                       \
      ctx.parser.debug_log((msg), ctx.userdata);                               \
  } while (0)

static const auto alloc_failure_str{
    mdstringview("memory allocation failed because:\n")};

/***************
 ***  Kinds  ***
 ***************/

const char *md_token_type_name(TokenType type) {
  switch (type) {
  case TokenType::right_caret:
    return "right_caret";
  case TokenType::hash:
    return "hash";
  case TokenType::dash:
    return "dash";
  case TokenType::asterisk:
    return "asterisk";
  case TokenType::plus:
    return "plus";
  case TokenType::num_dot:
    return "num_dot";
  case TokenType::num_paren:
    return "num_paren";
  case TokenType::plaintext:
    return "plaintext";
  case TokenType::whitespace:
    return "whitespace";
  case TokenType::newline:
    return "newline";
  }
  return "?";
}

namespace {
struct Kind_Info {
  const char *operator()(const Document_Kind &) const { return "document"; }
  const char *operator()(const Heading_Kind &) const { return "heading"; }
  const char *operator()(const Paragraph_Kind &) const { return "paragraph"; }
  const char *operator()(const Plaintext_Kind &) const { return "plaintext"; }
  const char *operator()(const Whitespace_Kind &) const { return "whitespace"; }
};

struct Kind_Is_Container {
  bool operator()(const Document_Kind &) const { return true; }
  bool operator()(const Heading_Kind &) const { return true; }
  bool operator()(const Paragraph_Kind &) const { return true; }
  bool operator()(const Plaintext_Kind &) const { return false; }
  bool operator()(const Whitespace_Kind &) const { return false; }
};
} // namespace

const char *md_kind_name(const Kind &kind) {
  return std::visit(Kind_Info{}, kind);
}

bool md_is_container(const Kind &kind) {
  return std::visit(Kind_Is_Container{}, kind);
}

/**************
 ***  Tree  ***
 **************/

Node Node::block(Kind kind, MDT_OFFSET beg) {
  return Node{std::move(kind), beg, std::nullopt, MDT_NO_NODE, {}};
}

Node Node::leaf(Kind kind, MDT_OFFSET beg, MDT_OFFSET end) {
  return Node{std::move(kind), beg, end, MDT_NO_NODE, {}};
}

Node md_token_to_node(const Token &token) {
  const auto [beg, end] = token.slice;

  switch (token.type) {
  case TokenType::right_caret:
  case TokenType::hash:
  case TokenType::dash:
  case TokenType::asterisk:
  case TokenType::plus:
  case TokenType::num_paren:
  case TokenType::num_dot:
  case TokenType::plaintext:
    return Node::leaf(Plaintext_Kind{}, beg, end);
  case TokenType::whitespace:
  case TokenType::newline:
    return Node::leaf(Whitespace_Kind{}, beg, end);
  }
  MDT_UNREACHABLE();
  return Node::leaf(Plaintext_Kind{}, beg, end);
}

Tree::Tree(MDT_OFFSET beg) { nodes.push_back(Node::block(Document_Kind{}, beg)); }

NodeId Tree::attach(NodeId parent, Node node) {
  const NodeId id = nodes.size();

  node.parent = parent;
  nodes.at(parent).children.push_back(id);
  nodes.push_back(std::move(node));
  return id;
}

unsigned Tree::depth(NodeId id) const {
  unsigned n = 0;
  for (NodeId p = nodes.at(id).parent; p != MDT_NO_NODE; p = nodes.at(p).parent)
    n++;
  return n;
}

/***************************
 ***  Processing Blocks  ***
 ***************************/

/* Opens the block starting at off with the first rule accepting the
 * lookahead, feeds it to the rule's consume() until it closes, and returns
 * the offset following the block. */
static MDT_OFFSET md_process_block(Parsing_Context &ctx, Tree &tree,
                                   MDT_OFFSET off, const Lookahead *la) {
  for (const BlockRule &rule : ctx.rules) {
    auto link = rule.open(tree[tree.root()], la[0], la[1], la[2]);
    if (!link)
      continue;

    MDT_LOG(mdstring("Opened ") + rule.name + " at offset " +
            std::to_string(off) + ".");

    const NodeId id = tree.attach(tree.root(), std::move(link->node));
    MDT_OFFSET p = link->consumed;

    while (tree[id].is_open()) {
      const auto next = rule.consume(tree, id, p, ctx.text);
      if (!next)
        break;
      p = *next;
    }

    MDT_ASSERT(!tree[id].is_open());
    MDT_LOG(mdstring("Closed ") + rule.name + " at offset " +
            std::to_string(*tree[id].end) + ".");
    return p;
  }

  /* The paragraph rule accepts every line that is not blank. */
  MDT_UNREACHABLE();
  return off;
}

static int md_process_doc(Parsing_Context &ctx, Tree &tree) {
  MDT_OFFSET off = 0;

  while (off < ctx.text.size()) {
    Lookahead la[3];
    md_lookahead(ctx.text, off, la, 3);

    /* Skip blank lines; they do not belong to any block. */
    if (md_is_blank_line(la[0], la[1])) {
      if (la[0]->type != TokenType::newline && la[1])
        off = la[1]->slice.end;
      else
        off = la[0]->slice.end;
      continue;
    }

    const MDT_OFFSET next = md_process_block(ctx, tree, off, la);
    MDT_ASSERT(next > off);
    off = next;
  }

  tree[tree.root()].end = ctx.text.size();
  return 0;
}

int md_parse(mdstringview text, const MDT_PARSER &parser, Tree &tree,
             void *userdata) {
  Parsing_Context ctx{text, parser, userdata, {}};

  try {
    ctx.rules = md_block_rules(parser.flags);
    tree = Tree(0);
    return md_process_doc(ctx, tree);
  } catch (const std::bad_alloc &e) {
    MDT_LOG(mdstring(alloc_failure_str) + mdstring(e.what()));
    return -1;
  }
}
