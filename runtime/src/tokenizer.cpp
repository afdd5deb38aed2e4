#include "stackpp/syntax/tokenizer.hpp"

namespace stackpp::syntax {

std::size_t separatorLength(std::string_view text, std::size_t pos) {
    switch (text[pos]) {
        case ' ': case '\t': case '\n': case '\r':
            return 1;
        case '\xE3':
            if (pos + 2 < text.size() && text[pos + 1] == '\x80' && text[pos + 2] == '\x80')
                return 3;
            return 0;
        default:
            return 0;
    }
}

std::vector<std::string> tokenize(std::string_view source) {
    std::vector<std::string> tokens;
    std::string current;
    std::size_t depth = 0;
    bool inQuote = false;

    auto emit = [&]() {
        tokens.push_back(current);
        current.clear();
    };

    for (std::size_t i = 0; i < source.size(); ++i) {
        char c = source[i];

        if (c == '{' && !inQuote) {
            ++depth;
            current.push_back(c);
            continue;
        }
        if (c == '}' && !inQuote) {
            // a stray '}' at top level is discarded
            if (depth != 0) {
                current.push_back(c);
                if (--depth == 0) emit();
            }
            continue;
        }
        if (c == '"') {
            if (depth != 0) {
                current.push_back(c);
            } else if (inQuote) {
                current.push_back(c);
                inQuote = false;
                emit();
            } else {
                inQuote = true;
                current.push_back(c);
            }
            continue;
        }

        std::size_t sep = separatorLength(source, i);
        if (sep != 0) {
            if (depth != 0 || inQuote) {
                current.append(source.substr(i, sep));
            } else if (!current.empty()) {
                emit();
            }
            i += sep - 1;
            continue;
        }

        current.push_back(c);
    }

    if (depth == 0 && !inQuote && !current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

} // namespace stackpp::syntax
