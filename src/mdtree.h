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

#ifndef MDTREE_H
#define MDTREE_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#define MDT_VERSION_MAJOR 0
#define MDT_VERSION_MINOR 1
#define MDT_VERSION_RELEASE 0
#define MDT_VERSION "0.1.0"

typedef char MDT_CHAR;
typedef size_t MDT_OFFSET;

using mdstring = std::basic_string<MDT_CHAR>;
using mdstringview = std::basic_string_view<MDT_CHAR>;

/* Half-open interval [beg, end) of byte offsets into the source text.
 * A slice never owns the characters it refers to. */
struct Slice {
  MDT_OFFSET beg;
  MDT_OFFSET end;

  MDT_OFFSET size() const { return end - beg; }
  mdstringview view(mdstringview text) const {
    return text.substr(beg, end - beg);
  }
  bool operator==(const Slice &) const = default;
};

/* Lexical categories produced by the tokenizer. */
enum class MDT_TOKENTYPE {
  /* '>' */
  right_caret,

  /* One or more consecutive '#'. */
  hash,

  /* '-', '*', '+'. Repeated markers are emitted one token each. */
  dash,
  asterisk,
  plus,

  /* Digits followed by '.' or ')'. The slice includes the trailing char. */
  num_dot,
  num_paren,

  /* Any run of characters not otherwise classified. */
  plaintext,

  /* Run of ' ' and '\t'. */
  whitespace,

  /* Exactly one '\n'. */
  newline
};
using TokenType = MDT_TOKENTYPE;

/* Every token kind carries exactly one slice, so the tag and the slice make
 * up the whole tagged union. */
struct Token {
  TokenType type;
  Slice slice;

  bool operator==(const Token &) const = default;
};

const char *md_token_type_name(TokenType type);

/* Node kinds. Document, Heading and Paragraph are blocks (containers);
 * Plaintext and Whitespace are inline leaves. */
struct Document_Kind {
  bool operator==(const Document_Kind &) const = default;
};
struct Heading_Kind {
  unsigned short level; /* Heading level (1 - 6) */
  bool operator==(const Heading_Kind &) const = default;
};
struct Paragraph_Kind {
  bool operator==(const Paragraph_Kind &) const = default;
};
struct Plaintext_Kind {
  bool operator==(const Plaintext_Kind &) const = default;
};
struct Whitespace_Kind {
  bool operator==(const Whitespace_Kind &) const = default;
};
using Kind = std::variant<Document_Kind, Heading_Kind, Paragraph_Kind,
                          Plaintext_Kind, Whitespace_Kind>;

bool md_is_container(const Kind &kind);
const char *md_kind_name(const Kind &kind);

using NodeId = size_t;
inline constexpr NodeId MDT_NO_NODE = static_cast<NodeId>(-1);

struct Node {
  Kind kind;
  MDT_OFFSET beg;
  /* Unset while the block is open; set exactly once when it closes. */
  std::optional<MDT_OFFSET> end;
  NodeId parent = MDT_NO_NODE;
  std::vector<NodeId> children;

  /* A block node, still open. */
  static Node block(Kind kind, MDT_OFFSET beg);
  /* A closed inline node over [beg, end). */
  static Node leaf(Kind kind, MDT_OFFSET beg, MDT_OFFSET end);

  bool is_open() const { return !end.has_value(); }
};

/* Maps a token onto the inline node covering the same slice. Marker, number
 * and text tokens become Plaintext; whitespace and newlines become Whitespace.
 */
Node md_token_to_node(const Token &token);

/* Arena of nodes addressed by index. Node 0 is always the document root. */
class Tree {
public:
  explicit Tree(MDT_OFFSET beg = 0);

  NodeId root() const { return 0; }
  size_t size() const { return nodes.size(); }

  Node &operator[](NodeId id) { return nodes.at(id); }
  const Node &operator[](NodeId id) const { return nodes.at(id); }

  /* Moves the node into the arena as the last child of parent. */
  NodeId attach(NodeId parent, Node node);

  /* Number of levels from the root down to id (root is 0). */
  unsigned depth(NodeId id) const;

private:
  std::vector<Node> nodes;
};

/* Flags adjusting the dialect recognized by md_parse(). */
#define MDT_FLAG_NOHEADINGS 0x0001 /* Disable ATX headings. */

struct MDT_PARSER_tag {
  /* Bitmask of MDT_FLAG_xxxx values. */
  unsigned flags;

  /* Debug callback. Optional (may be nullptr).
   *
   * Receives a trace of block rule decisions and any runtime failure. This is
   * intended for developers, not as an error report for end users.
   */
  void (*debug_log)(mdstringview /*msg*/, void * /*userdata*/);
};
using MDT_PARSER = MDT_PARSER_tag;

/* Builds the block tree of the text into tree, whose root becomes the
 * document node.
 *
 * Zero is returned on success. If a runtime error occurs (e.g. a memory
 * allocation fails), -1 is returned.
 */
int md_parse(mdstringview text, const MDT_PARSER &parser, Tree &tree,
             void *userdata);

#endif /* MDTREE_H */
