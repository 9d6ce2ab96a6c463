#ifndef MDTREE_TEST_HELPERS_HPP
#define MDTREE_TEST_HELPERS_HPP

#include "../src/mdtree.h"

#include <ostream>

// Readable gtest failure messages for tokens and slices.
inline void PrintTo(const Slice& slice, std::ostream* os) {
    *os << "[" << slice.beg << ", " << slice.end << ")";
}

inline void PrintTo(const Token& token, std::ostream* os) {
    *os << md_token_type_name(token.type) << "(" << token.slice.beg << ", "
        << token.slice.end << ")";
}

inline Token tok(TokenType type, MDT_OFFSET beg, MDT_OFFSET end) {
    return Token{type, Slice{beg, end}};
}

#endif // MDTREE_TEST_HELPERS_HPP
