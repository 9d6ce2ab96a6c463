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

#include <cxxopts.hpp>

#include "mdtree-lex.h"
#include "mdtree.h"

#include <array>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/* cxxopts 3.1 moved its exceptions into cxxopts::exceptions. */
#if CXXOPTS__VERSION_MAJOR > 3 ||                                              \
    (CXXOPTS__VERSION_MAJOR == 3 && CXXOPTS__VERSION_MINOR >= 1)
using Option_Error = cxxopts::exceptions::exception;
#else
using Option_Error = cxxopts::OptionException;
#endif

/* Global options. */
static unsigned parser_flags = 0;
static bool want_tokens;
static bool want_debug;
static bool want_stat;

static std::filesystem::path input_path, output_path;

/*************************
 ***  Dumping Results  ***
 *************************/

/* We render to a memory buffer instead of directly outputting the dump, so
 * that --stat measures just the time of the parser, without the I/O. */
static std::string out_buf{};

static void process_output(mdstringview text) { out_buf += text; }

static void render_quoted(mdstringview text) {
    process_output("\"");
    for (const char ch: text) {
        switch (ch) {
            case '\n':
                process_output("\\n");
                break;
            case '\t':
                process_output("\\t");
                break;
            case '"':
                process_output("\\\"");
                break;
            case '\\':
                process_output("\\\\");
                break;
            default:
                process_output(mdstringview(&ch, 1));
                break;
        }
    }
    process_output("\"");
}

static void render_range(MDT_OFFSET beg, MDT_OFFSET end) {
    process_output("[" + std::to_string(beg) + ", " + std::to_string(end) + ")");
}

static void render_tokens(const std::vector<Token> &tokens, mdstringview text) {
    for (const Token &token: tokens) {
        process_output(md_token_type_name(token.type));
        process_output(" ");
        render_range(token.slice.beg, token.slice.end);
        process_output(" ");
        render_quoted(token.slice.view(text));
        process_output("\n");
    }
}

static void render_node(const Tree &tree, NodeId id, mdstringview text) {
    const Node &node = tree[id];

    process_output(std::string(2 * tree.depth(id), ' '));
    process_output(md_kind_name(node.kind));
    if (const auto *h = std::get_if<Heading_Kind>(&node.kind))
        process_output(" level=" + std::to_string(h->level));
    process_output(" ");
    render_range(node.beg, node.end.value_or(node.beg));
    if (!md_is_container(node.kind)) {
        process_output(" ");
        render_quoted(text.substr(node.beg, *node.end - node.beg));
    }
    process_output("\n");

    for (const NodeId child: node.children)
        render_node(tree, child, text);
}

static void debug_log_callback(mdstringview msg, void *) {
    std::clog << "md2tree: " << msg << '\n';
}

/**********************
 ***  Main program  ***
 **********************/

static int process_file(std::istream &in, std::ostream &out) {
    const mdstring in_buf{std::istreambuf_iterator<char>(in),
                          std::istreambuf_iterator<char>()};
    if (in.bad()) {
        std::cerr << "Reading input failed.\n";
        return 1;
    }

    out_buf.reserve(in_buf.size() * 4 + 64);

    const auto t0 = std::chrono::steady_clock::now();

    int ret = 0;
    Tree tree;
    std::vector<Token> tokens;
    if (want_tokens) {
        tokens = md_tokenize(in_buf);
    } else {
        const MDT_PARSER parser{parser_flags,
                                want_debug ? debug_log_callback : nullptr};
        ret = md_parse(in_buf, parser, tree, nullptr);
    }

    const auto t1 = std::chrono::steady_clock::now();
    if (ret != 0) {
        std::cerr << "Parsing failed.\n";
        return ret;
    }

    if (want_tokens)
        render_tokens(tokens, in_buf);
    else
        render_node(tree, tree.root(), in_buf);

    out << out_buf;
    if (!out) {
        std::cerr << "Writing output failed.\n";
        return 1;
    }

    if (want_stat) {
        using std::chrono::duration_cast, std::chrono::microseconds;
        const auto elapsed{duration_cast<microseconds>(t1 - t0)};
        std::cerr << "Time spent on parsing: " << elapsed.count() << " us.\n";
    }

    return 0;
}

struct Opt {
    char short_opt;
    std::string long_opt, description;
    bool takes_value = false;
};

struct Option_Group {
    std::string name;
    std::vector<Opt> options;
};

static const std::array cmdline_options{
        Option_Group{"General", {
                Opt{'o', "output", "Output file (default is stdout)", true},
                Opt{'t', "tokens", "Dump the token stream instead of the block tree"},
                Opt{'d', "debug", "Print the parser's debug log to stderr"},
                Opt{'s', "stat", "Measure time of input parsing"},
                Opt{'h', "help", "Print this help message"},
                Opt{'v', "version", "Display version"},
        }},
        Option_Group{"Markdown suppression", {
                Opt{'H', "fno-headings", "Disable ATX headings"},
        }},
};

static cxxopts::ParseResult parse_opts(int argc, char **argv) {
    cxxopts::Options options(
            "md2tree",
            "Dump the block tree (or tokens) of input FILE (or standard input) in Markdown format.");
    options.positional_help("[ input file ]").show_positional_help();

    std::vector<std::string> groups{};
    for (const auto &group: cmdline_options) {
        groups.emplace_back(group.name);
        auto &&adder = options.add_options(group.name);
        for (const auto &opt: group.options) {
            const std::string names = std::string(1, opt.short_opt) + "," + opt.long_opt;
            if (opt.takes_value)
                adder(names, opt.description, cxxopts::value<std::string>());
            else
                adder(names, opt.description);
        }
    }
    options.add_options()("input", "Input file", cxxopts::value<std::string>());
    options.parse_positional({"input"});

    try {
        auto res = options.parse(argc, argv);
        if (res.count("help")) {
            std::cout << options.help(groups);
            std::exit(0);
        }
        return res;
    } catch (const Option_Error &e) {
        std::cerr << e.what() << '\n'
                  << "Use --help for more info.\n";
        std::exit(1);
    }
}

static void apply_opts(const cxxopts::ParseResult &res) {
    if (res.count("version")) {
        std::cout << MDT_VERSION << '\n';
        std::exit(0);
    }
    want_tokens = res.count("tokens") > 0;
    want_debug = res.count("debug") > 0;
    want_stat = res.count("stat") > 0;
    if (res.count("fno-headings"))
        parser_flags |= MDT_FLAG_NOHEADINGS;
    if (res.count("output"))
        output_path = res["output"].as<std::string>();
    if (res.count("input"))
        input_path = res["input"].as<std::string>();
}

int main(int argc, char **argv) {
    apply_opts(parse_opts(argc, argv));

    const bool use_stdin = input_path.empty() || input_path == "-";
    const bool use_stdout = output_path.empty() || output_path == "-";

    std::ifstream input_file;
    if (!use_stdin) {
        input_file.open(input_path, std::ios_base::binary);
        if (!input_file) {
            std::cerr << "Cannot open " << input_path.string() << ".\n";
            return 1;
        }
    }
    std::ofstream output_file;
    if (!use_stdout) {
        output_file.open(output_path, std::ios_base::trunc);
        if (!output_file) {
            std::cerr << "Cannot open " << output_path.string() << ".\n";
            return 1;
        }
    }

    std::istream &in{use_stdin ? std::cin : input_file};
    std::ostream &out{use_stdout ? std::cout : output_file};
    return process_file(in, out);
}
