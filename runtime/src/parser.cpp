// stackpp/syntax/parser.cpp
#include "stackpp/syntax/parser.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "stackpp/syntax/tokenizer.hpp"

namespace stackpp::syntax {

// ============================================================================
// Token helpers
// ============================================================================
static bool isTrimmable(std::string_view s, std::size_t pos) {
    switch (s[pos]) {
        case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
            return true;
        default:
            return false;
    }
}

// U+3000 is three bytes; check whether it ends at `end`
static bool endsWithWideSpace(std::string_view s, std::size_t end) {
    return end >= 3 && s.substr(end - 3, 3) == "\xE3\x80\x80";
}

static std::string_view trim(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end) {
        if (isTrimmable(s, begin)) { ++begin; continue; }
        if (s.substr(begin, 3) == "\xE3\x80\x80") { begin += 3; continue; }
        break;
    }
    while (end > begin) {
        if (isTrimmable(s, end - 1)) { --end; continue; }
        if (end - begin >= 3 && endsWithWideSpace(s, end)) { end -= 3; continue; }
        break;
    }
    return s.substr(begin, end - begin);
}

static bool enclosedBy(std::string_view s, char open, char close) {
    return s.size() >= 2 && s.front() == open && s.back() == close;
}

std::optional<double> parseNumber(std::string_view token) {
    std::string_view body = token;
    if (!body.empty() && body.front() == '+') {
        body.remove_prefix(1);
        if (!body.empty() && (body.front() == '+' || body.front() == '-')) return std::nullopt;
    }
    if (body.empty()) return std::nullopt;
    // from_chars also takes nan(n-char-sequence)
    if (body.find('(') != std::string_view::npos) return std::nullopt;

    double value = 0;
    const char* first = body.data();
    const char* last = body.data() + body.size();
    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
    if (ptr != last) return std::nullopt;
    if (ec == std::errc::result_out_of_range) {
        // overflow reads as +-inf, underflow as 0
        return std::strtod(std::string(body).c_str(), nullptr);
    }
    if (ec != std::errc()) return std::nullopt;
    return value;
}

// ============================================================================
// Classification, in priority order
// ============================================================================
std::optional<vm::Value> parseToken(std::string_view raw) {
    std::string_view token = trim(raw);

    if (auto n = parseNumber(token)) {
        return vm::Value::number(*n);
    }
    if (enclosedBy(token, '"', '"')) {
        return vm::Value::string(std::string(token.substr(1, token.size() - 2)));
    }
    if (enclosedBy(token, '{', '}')) {
        return vm::Value::block(parse(token.substr(1, token.size() - 2)));
    }
    if (!token.empty() && token.front() == '$') {
        return vm::Value::variable(std::string(token.substr(1)));
    }
    if (auto op = vm::lookupKeyword(token)) {
        return vm::Value::instruction(*op);
    }
    return std::nullopt;
}

vm::Program parse(const std::vector<std::string>& tokens) {
    vm::Program program;
    program.reserve(tokens.size());
    for (const auto& t : tokens) {
        if (auto v = parseToken(t)) program.push_back(std::move(*v));
    }
    return program;
}

vm::Program parse(std::string_view source) {
    return parse(tokenize(source));
}

vm::Program loadProgramFromFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Stack++ loader: cannot open file: " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw std::runtime_error("Stack++ loader: read error: " + path);

    return parse(buffer.str());
}

} // namespace stackpp::syntax
