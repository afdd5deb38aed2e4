#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace stackpp::syntax {

// Split source text into raw tokens. A brace-delimited block or a quoted
// string is always a single token, whitespace inside included. Content left
// open at end of input (unbalanced '{' or '"') is dropped.
std::vector<std::string> tokenize(std::string_view source);

// Space, tab, CR, LF, and U+3000 IDEOGRAPHIC SPACE (UTF-8: E3 80 80).
// Returns the byte length of the separator at `pos`, 0 if there is none.
std::size_t separatorLength(std::string_view text, std::size_t pos);

} // namespace stackpp::syntax
